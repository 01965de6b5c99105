// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <todomcp/types.hpp>

namespace todomcp
{

// =============================================================================
// JSON-RPC 2.0 Errors
// =============================================================================

/// JSON-RPC error codes (standard)
enum class JsonRpcErrorCode : int
{
    ParseError = -32700,
    InvalidRequest = -32600,
    MethodNotFound = -32601,
    InvalidParams = -32602,
    InternalError = -32603,
};

/// JSON-RPC 2.0 Error object
struct JsonRpcErrorObject
{
    int code;
    std::string message;
    json data;

    json to_json() const
    {
        json j = {{"code", code}, {"message", message}};
        if (!data.is_null())
            j["data"] = data;
        return j;
    }

    static JsonRpcErrorObject from_json(const json& j)
    {
        JsonRpcErrorObject err;
        err.code = j.at("code").get<int>();
        err.message = j.at("message").get<std::string>();
        if (j.contains("data"))
            err.data = j.at("data");
        return err;
    }
};

/// Raised when a request frame has a shape the dispatcher cannot route
///
/// Not attributable to a single tool call; the server reports it as an
/// internal error frame.
class DispatchError : public std::runtime_error
{
  public:
    explicit DispatchError(const std::string& message) : std::runtime_error(message) {}
};

// =============================================================================
// Envelope Helpers
// =============================================================================

/// The JSON-RPC version tag carried by every response frame
inline constexpr const char* kJsonRpcVersion = "2.0";

/// Wrap a result object into a response frame
///
/// The result's own fields are merged at the top level next to `jsonrpc`.
/// When the request carried an `id` (any JSON value, null included) it is
/// copied verbatim.
inline json make_response(const json& result, const std::optional<json>& id)
{
    json j = result.is_object() ? result : json::object();
    j["jsonrpc"] = kJsonRpcVersion;
    if (id)
        j["id"] = *id;
    return j;
}

/// Build the -32603 internal error frame
inline json make_internal_error(const std::string& detail, const std::optional<json>& id)
{
    JsonRpcErrorObject err{
        static_cast<int>(JsonRpcErrorCode::InternalError), "Internal error", json(detail)
    };
    json j = {{"jsonrpc", kJsonRpcVersion}, {"error", err.to_json()}};
    if (id)
        j["id"] = *id;
    return j;
}

/// Extract the request id, if the frame carried one
inline std::optional<json> request_id(const json& request)
{
    if (request.is_object() && request.contains("id"))
        return request.at("id");
    return std::nullopt;
}

} // namespace todomcp
