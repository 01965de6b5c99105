// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

/// @file config.hpp
/// @brief Server options resolved from the environment

#include <spdlog/common.h>
#include <string>

namespace todomcp
{

/// Options for the todo-mcp server process
struct ServerOptions
{
    std::string db_path;
    spdlog::level::level_enum log_level = spdlog::level::warn;

    // ─────────────────────────────────────────────────────────────────────────
    // Environment Variable Support
    // ─────────────────────────────────────────────────────────────────────────

    static constexpr const char* ENV_DB_PATH = "TODO_MCP_DB";
    static constexpr const char* ENV_LOG_LEVEL = "TODO_MCP_LOG_LEVEL";

    /// `$HOME/.local/share/nvim/todo-mcp.db` (relative when HOME is unset)
    static std::string default_db_path();

    /// Parse a level name (trace, debug, info, warn, error, critical, off)
    /// @return `fallback` for an unknown name
    static spdlog::level::level_enum parse_log_level(
        const std::string& name, spdlog::level::level_enum fallback
    );

    /// Load options from TODO_MCP_* environment variables, with defaults
    static ServerOptions from_env();
};

} // namespace todomcp
