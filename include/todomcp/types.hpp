// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <functional>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace todomcp
{

// =============================================================================
// Type Aliases
// =============================================================================

/// JSON type alias for cleaner API
using json = nlohmann::json;

// =============================================================================
// Protocol Constants
// =============================================================================

/// MCP protocol revision reported by `initialize`
inline constexpr const char* kProtocolVersion = "2024-11-05";

/// Server identity reported by `initialize`
inline constexpr const char* kServerName = "todo-mcp";
inline constexpr const char* kServerVersion = "1.0.0";

// =============================================================================
// Todo Record
// =============================================================================

/// A persisted todo item
///
/// Timestamps are UTC text in the layout `YYYY-MM-DD HH:MM:SS.ffffff`, so that
/// lexical order equals chronological order.
struct Todo
{
    int64_t id = 0;
    std::string content;
    bool done = false;
    std::string created_at;
    std::string updated_at;
};

inline void to_json(json& j, const Todo& t)
{
    j = json{
        {"id", t.id},
        {"content", t.content},
        {"done", t.done},
        {"created_at", t.created_at},
        {"updated_at", t.updated_at},
    };
}

inline void from_json(const json& j, Todo& t)
{
    j.at("id").get_to(t.id);
    j.at("content").get_to(t.content);
    j.at("done").get_to(t.done);
    j.at("created_at").get_to(t.created_at);
    j.at("updated_at").get_to(t.updated_at);
}

// =============================================================================
// Tool Types
// =============================================================================

/// Outcome of a tool invocation: either a result value or an error message
///
/// Handlers never raise to signal failure; the dispatcher inspects this object.
struct ToolResult
{
    json value;
    std::optional<std::string> error;

    static ToolResult success(json value)
    {
        ToolResult r;
        r.value = std::move(value);
        return r;
    }

    static ToolResult failure(std::string message)
    {
        ToolResult r;
        r.error = std::move(message);
        return r;
    }

    bool is_error() const
    {
        return error.has_value();
    }

    /// Result payload as sent on the wire (`{"error": ...}` on failure)
    json to_json() const
    {
        if (error)
            return json{{"error", *error}};
        return value;
    }
};

/// Tool handler function type (receives the raw `arguments` value)
using ToolHandler = std::function<ToolResult(const json& arguments)>;

/// A named operation exposed through `tools/list` and `tools/call`
struct Tool
{
    std::string name;
    std::string description;
    json input_schema;
    ToolHandler handler;
};

// =============================================================================
// Timestamps
// =============================================================================

namespace detail
{

/// Format a time point as `YYYY-MM-DD HH:MM:SS.ffffff` (UTC)
inline std::string format_timestamp(std::chrono::system_clock::time_point tp)
{
    using namespace std::chrono;

    auto us = floor<microseconds>(tp);
    auto day = floor<days>(us);
    year_month_day ymd{day};
    hh_mm_ss<microseconds> hms{us - day};

    char buf[32];
    std::snprintf(
        buf,
        sizeof(buf),
        "%04d-%02u-%02u %02d:%02d:%02d.%06lld",
        static_cast<int>(ymd.year()),
        static_cast<unsigned>(ymd.month()),
        static_cast<unsigned>(ymd.day()),
        static_cast<int>(hms.hours().count()),
        static_cast<int>(hms.minutes().count()),
        static_cast<int>(hms.seconds().count()),
        static_cast<long long>(hms.subseconds().count())
    );
    return buf;
}

} // namespace detail

} // namespace todomcp
