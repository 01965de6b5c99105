// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include <todomcp/dispatcher.hpp>
#include <todomcp/jsonrpc.hpp>
#include <todomcp/logging.hpp>

namespace todomcp
{

namespace
{

/// Render a method or tool name for an error message
std::string describe_name(const json& value)
{
    if (value.is_string())
        return value.get<std::string>();
    return value.dump();
}

json params_object(const json& request)
{
    auto it = request.find("params");
    if (it == request.end() || it->is_null())
        return json::object();
    if (!it->is_object())
        throw DispatchError("Invalid params: expected object, got " + std::string(it->type_name()));
    return *it;
}

} // namespace

json Dispatcher::handle(const json& request) const
{
    const json method = request.value("method", json());

    if (method == "initialize")
        return initialize();
    if (method == "tools/list")
        return list_tools();
    if (method == "tools/call")
        return call_tool(params_object(request));

    logger()->debug("Unknown method: {}", describe_name(method));
    return {{"error", "Unknown method: " + describe_name(method)}};
}

json Dispatcher::initialize() const
{
    return {
        {"protocolVersion", kProtocolVersion},
        {"capabilities", {{"tools", json::object()}}},
        {"serverInfo", {{"name", kServerName}, {"version", kServerVersion}}},
    };
}

json Dispatcher::list_tools() const
{
    json tools = json::array();
    for (const auto& tool : registry_.tools())
    {
        tools.push_back({
            {"name", tool.name},
            {"description", tool.description},
            {"inputSchema", tool.input_schema},
        });
    }
    return {{"tools", tools}};
}

json Dispatcher::call_tool(const json& params) const
{
    const json name = params.value("name", json());
    json arguments = params.value("arguments", json::object());
    if (arguments.is_null())
        arguments = json::object();

    const Tool* tool = name.is_string() ? registry_.find(name.get<std::string>()) : nullptr;
    if (!tool)
    {
        logger()->debug("Tool not found: {}", describe_name(name));
        return {{"error", "Tool not found: " + describe_name(name)}};
    }

    if (logger()->should_log(spdlog::level::debug))
        logger()->debug("Calling tool {} with {}", tool->name, arguments.dump());
    ToolResult result = tool->handler(arguments);
    if (result.is_error())
        logger()->info("Tool {} failed: {}", tool->name, *result.error);
    return result.to_json();
}

} // namespace todomcp
