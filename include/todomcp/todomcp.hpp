// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

/// @file todomcp.hpp
/// @brief Master include for the todo-mcp server library
///
/// This header includes all public API headers for convenience.
/// You can also include individual headers for finer-grained control.

#include <todomcp/config.hpp>
#include <todomcp/dispatcher.hpp>
#include <todomcp/jsonrpc.hpp>
#include <todomcp/logging.hpp>
#include <todomcp/server.hpp>
#include <todomcp/sqlite_store.hpp>
#include <todomcp/store.hpp>
#include <todomcp/tool_builder.hpp>
#include <todomcp/tools.hpp>
#include <todomcp/transport.hpp>
#include <todomcp/transport_stdio.hpp>
#include <todomcp/types.hpp>
