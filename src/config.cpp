// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include <cstdlib>
#include <filesystem>
#include <spdlog/spdlog.h>
#include <todomcp/config.hpp>

namespace todomcp
{

std::string ServerOptions::default_db_path()
{
    std::filesystem::path base;
    const char* home = std::getenv("HOME");
    if (home != nullptr && home[0] != '\0')
        base = home;
    return (base / ".local" / "share" / "nvim" / "todo-mcp.db").string();
}

spdlog::level::level_enum ServerOptions::parse_log_level(
    const std::string& name, spdlog::level::level_enum fallback
)
{
    // from_str maps unknown names to off, so only trust it for "off" itself
    auto level = spdlog::level::from_str(name);
    if (level == spdlog::level::off && name != "off")
        return fallback;
    return level;
}

ServerOptions ServerOptions::from_env()
{
    ServerOptions options;

    const char* db = std::getenv(ENV_DB_PATH);
    if (db != nullptr && db[0] != '\0')
        options.db_path = db;
    else
        options.db_path = default_db_path();

    if (const char* level = std::getenv(ENV_LOG_LEVEL))
        options.log_level = parse_log_level(level, options.log_level);

    return options;
}

} // namespace todomcp
