// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

/// @file dispatcher.hpp
/// @brief Routes JSON-RPC methods to protocol results

#include <todomcp/tools.hpp>
#include <todomcp/types.hpp>

namespace todomcp
{

/// Stateless JSON-RPC method router
///
/// Methods:
/// - `initialize`  → server descriptor
/// - `tools/list`  → registry contents with input schemas
/// - `tools/call`  → handler result, or `{"error": ...}`
/// - anything else → `{"error": "Unknown method: <method>"}`
///
/// The returned object is the bare result; framing it with `jsonrpc` and `id`
/// is the server's job.
class Dispatcher
{
  public:
    explicit Dispatcher(const ToolRegistry& registry) : registry_(registry) {}

    /// Handle one parsed request object
    /// @throws DispatchError when `params` is present but not an object
    json handle(const json& request) const;

    json initialize() const;
    json list_tools() const;
    json call_tool(const json& params) const;

  private:
    const ToolRegistry& registry_;
};

} // namespace todomcp
