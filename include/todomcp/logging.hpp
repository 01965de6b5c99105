// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

/// @file logging.hpp
/// @brief Process logger (stderr only; stdout carries protocol frames)

#include <memory>
#include <spdlog/spdlog.h>

namespace todomcp
{

/// Name of the process-wide logger
inline constexpr const char* kLoggerName = "todo-mcp";

/// Get the server logger, creating a stderr logger on first use
std::shared_ptr<spdlog::logger> logger();

/// Set the server logger's level (creates the logger if needed)
void init_logging(spdlog::level::level_enum level);

} // namespace todomcp
