// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

/// @file tool_builder.hpp
/// @brief Struct-based tool builder with schema generation and argument validation
///
/// Each tool declares a plain argument struct. Every described field becomes a
/// schema property; `std::optional` fields are optional, everything else is
/// required. Before the handler runs, the raw `arguments` value is checked
/// against the declared fields and decoded into the struct, so handlers only
/// ever see well-typed input.
///
/// Example:
/// @code
/// struct RenameArgs {
///     int64_t id = 0;
///     std::optional<std::string> title;
/// };
///
/// auto rename = todomcp::ToolBuilder::create<RenameArgs>("rename", "Rename an item")
///     .describe(&RenameArgs::id, "id", "Item ID")
///     .describe(&RenameArgs::title, "title", "New title (optional)")
///     .handler([](const RenameArgs& args) {
///         return todomcp::ToolResult::success({{"id", args.id}});
///     });
/// @endcode

#include <todomcp/types.hpp>

#include <cstdint>
#include <functional>
#include <limits>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace todomcp
{

// =============================================================================
// Type Traits for JSON Schema Generation
// =============================================================================

namespace detail
{

/// Primary template for JSON schema type names
template<typename T, typename Enable = void>
struct schema_type
{
    static constexpr const char* type_name = "object";
    static json schema() { return {{"type", type_name}}; }
};

template<>
struct schema_type<bool>
{
    static constexpr const char* type_name = "boolean";
    static json schema() { return {{"type", type_name}}; }
};

template<>
struct schema_type<int>
{
    static constexpr const char* type_name = "integer";
    static json schema() { return {{"type", type_name}}; }
};

template<>
struct schema_type<long>
{
    static constexpr const char* type_name = "integer";
    static json schema() { return {{"type", type_name}}; }
};

template<>
struct schema_type<long long>
{
    static constexpr const char* type_name = "integer";
    static json schema() { return {{"type", type_name}}; }
};

template<>
struct schema_type<double>
{
    static constexpr const char* type_name = "number";
    static json schema() { return {{"type", type_name}}; }
};

template<>
struct schema_type<std::string>
{
    static constexpr const char* type_name = "string";
    static json schema() { return {{"type", type_name}}; }
};

/// Optional specialization - uses underlying type
template<typename T>
struct schema_type<std::optional<T>>
{
    static constexpr const char* type_name = schema_type<T>::type_name;
    static json schema() { return schema_type<T>::schema(); }
};

template<typename T>
struct is_optional : std::false_type
{
};

template<typename T>
struct is_optional<std::optional<T>> : std::true_type
{
};

/// Check a JSON value against a schema type name
inline bool matches_type(const json& value, const std::string& type_name)
{
    if (type_name == "integer")
    {
        if (value.is_number_unsigned())
            return value.get<uint64_t>() <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max());
        return value.is_number_integer();
    }
    if (type_name == "number")
        return value.is_number();
    if (type_name == "string")
        return value.is_string();
    if (type_name == "boolean")
        return value.is_boolean();
    return value.is_object();
}

} // namespace detail

// =============================================================================
// Parameter Descriptor
// =============================================================================

/// Describes a single tool parameter
struct ParamDescriptor
{
    std::string name;
    std::string description;
    json type_schema;
    bool required = true;
};

/// Check `arguments` against the declared parameters
/// @return The first problem found, or nullopt when the arguments are usable
///
/// A null value counts as absent. Keys that are not declared are ignored.
inline std::optional<std::string> validate_arguments(
    const json& arguments, const std::vector<ParamDescriptor>& params
)
{
    if (!arguments.is_object())
        return std::string("Invalid arguments: expected object");

    for (const auto& p : params)
    {
        auto it = arguments.find(p.name);
        if (it == arguments.end() || it->is_null())
        {
            if (p.required)
                return "Missing required argument: " + p.name;
            continue;
        }

        const std::string type_name = p.type_schema.at("type").get<std::string>();
        if (!detail::matches_type(*it, type_name))
            return "Invalid argument '" + p.name + "': expected " + type_name;
    }
    return std::nullopt;
}

// =============================================================================
// ToolBuilder
// =============================================================================

/// Entry point for tool building
class ToolBuilder
{
  public:
    /// Builder for struct-based tool arguments
    template<typename ArgsStruct>
    class StructBuilder;

    template<typename ArgsStruct>
    static StructBuilder<ArgsStruct> create(std::string name, std::string description)
    {
        return StructBuilder<ArgsStruct>(std::move(name), std::move(description));
    }
};

template<typename ArgsStruct>
class ToolBuilder::StructBuilder
{
  public:
    StructBuilder(std::string name, std::string description)
        : name_(std::move(name)), description_(std::move(description))
    {
    }

    /// Describe a field and bind it to a JSON key
    template<typename FieldType>
    StructBuilder& describe(FieldType ArgsStruct::*member, std::string field_name, std::string description)
    {
        ParamDescriptor p;
        p.name = field_name;
        p.description = std::move(description);
        p.type_schema = detail::schema_type<FieldType>::schema();
        p.required = !detail::is_optional<FieldType>::value;
        params_.push_back(std::move(p));

        setters_.push_back(
            [member, key = std::move(field_name)](ArgsStruct& args, const json& arguments)
            {
                auto it = arguments.find(key);
                if (it == arguments.end() || it->is_null())
                    return;
                if constexpr (detail::is_optional<FieldType>::value)
                    args.*member = it->get<typename FieldType::value_type>();
                else
                    args.*member = it->get<FieldType>();
            }
        );
        return *this;
    }

    /// Set handler and finalize (returns Tool)
    ///
    /// The handler takes `const ArgsStruct&` and returns a ToolResult. Any
    /// exception it lets escape is reported as a ToolResult failure.
    template<typename Func>
    Tool handler(Func&& fn)
    {
        Tool tool;
        tool.name = name_;
        tool.description = description_;
        tool.input_schema = generate_schema();

        tool.handler = [fn = std::forward<Func>(fn), params = params_, setters = setters_](
                           const json& arguments
                       ) -> ToolResult
        {
            if (auto problem = validate_arguments(arguments, params))
                return ToolResult::failure(*problem);

            try
            {
                ArgsStruct parsed{};
                for (const auto& set : setters)
                    set(parsed, arguments);
                return fn(parsed);
            }
            catch (const std::exception& e)
            {
                return ToolResult::failure(e.what());
            }
        };

        return tool;
    }

  private:
    json generate_schema() const
    {
        json props = json::object();
        json required = json::array();

        for (const auto& p : params_)
        {
            json prop = p.type_schema;
            prop["description"] = p.description;
            props[p.name] = prop;

            if (p.required)
                required.push_back(p.name);
        }

        return {{"type", "object"}, {"properties", props}, {"required", required}};
    }

    std::string name_;
    std::string description_;
    std::vector<ParamDescriptor> params_;
    std::vector<std::function<void(ArgsStruct&, const json&)>> setters_;
};

} // namespace todomcp
