// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

/// @file test_tool_builder.cpp
/// @brief Tests for the struct-based tool builder and argument validation

#include <gtest/gtest.h>

#include <stdexcept>
#include <todomcp/tool_builder.hpp>

using namespace todomcp;

namespace
{

struct RenameArgs
{
    int64_t id = 0;
    std::string title;
    std::optional<bool> pinned;
};

Tool make_rename_tool()
{
    return ToolBuilder::create<RenameArgs>("rename", "Rename an item")
        .describe(&RenameArgs::id, "id", "Item ID")
        .describe(&RenameArgs::title, "title", "New title")
        .describe(&RenameArgs::pinned, "pinned", "Pin the item (optional)")
        .handler(
            [](const RenameArgs& args)
            {
                json out = {{"id", args.id}, {"title", args.title}};
                out["pinned"] = args.pinned.has_value() ? json(*args.pinned) : json(nullptr);
                return ToolResult::success(out);
            }
        );
}

} // namespace

// =============================================================================
// Schema Generation Tests
// =============================================================================

TEST(ToolBuilderTest, SchemaTypeTraits)
{
    EXPECT_STREQ(detail::schema_type<int>::type_name, "integer");
    EXPECT_STREQ(detail::schema_type<int64_t>::type_name, "integer");
    EXPECT_STREQ(detail::schema_type<double>::type_name, "number");
    EXPECT_STREQ(detail::schema_type<bool>::type_name, "boolean");
    EXPECT_STREQ(detail::schema_type<std::string>::type_name, "string");
    EXPECT_STREQ(detail::schema_type<std::optional<std::string>>::type_name, "string");
}

TEST(ToolBuilderTest, SchemaListsPropertiesAndRequired)
{
    auto tool = make_rename_tool();

    EXPECT_EQ(tool.name, "rename");
    EXPECT_EQ(tool.description, "Rename an item");

    const auto& schema = tool.input_schema;
    EXPECT_EQ(schema["type"], "object");
    EXPECT_EQ(schema["properties"]["id"]["type"], "integer");
    EXPECT_EQ(schema["properties"]["id"]["description"], "Item ID");
    EXPECT_EQ(schema["properties"]["title"]["type"], "string");
    EXPECT_EQ(schema["properties"]["pinned"]["type"], "boolean");

    EXPECT_EQ(schema["required"], (json{"id", "title"}));
}

TEST(ToolBuilderTest, NoParamsGivesEmptyRequired)
{
    struct NoArgs
    {
    };
    auto tool = ToolBuilder::create<NoArgs>("ping", "Ping")
                    .handler([](const NoArgs&) { return ToolResult::success({{"pong", true}}); });

    EXPECT_TRUE(tool.input_schema["properties"].empty());
    EXPECT_TRUE(tool.input_schema["required"].is_array());
    EXPECT_TRUE(tool.input_schema["required"].empty());
    EXPECT_EQ(tool.handler(json::object()).to_json(), (json{{"pong", true}}));
}

// =============================================================================
// Handler Invocation Tests
// =============================================================================

TEST(ToolBuilderTest, DecodesArgumentsIntoStruct)
{
    auto tool = make_rename_tool();

    auto result = tool.handler(json{{"id", 5}, {"title", "new"}, {"pinned", true}});
    ASSERT_FALSE(result.is_error());
    EXPECT_EQ(result.value["id"], 5);
    EXPECT_EQ(result.value["title"], "new");
    EXPECT_EQ(result.value["pinned"], true);
}

TEST(ToolBuilderTest, OptionalArgumentMayBeAbsentOrNull)
{
    auto tool = make_rename_tool();

    auto absent = tool.handler(json{{"id", 5}, {"title", "t"}});
    ASSERT_FALSE(absent.is_error());
    EXPECT_TRUE(absent.value["pinned"].is_null());

    auto null_value = tool.handler(json{{"id", 5}, {"title", "t"}, {"pinned", nullptr}});
    ASSERT_FALSE(null_value.is_error());
    EXPECT_TRUE(null_value.value["pinned"].is_null());
}

TEST(ToolBuilderTest, UnknownArgumentsAreIgnored)
{
    auto tool = make_rename_tool();

    auto result = tool.handler(json{{"id", 1}, {"title", "t"}, {"color", "red"}});
    EXPECT_FALSE(result.is_error());
}

TEST(ToolBuilderTest, HandlerExceptionBecomesFailure)
{
    struct NoArgs
    {
    };
    auto tool = ToolBuilder::create<NoArgs>("explode", "Always fails")
                    .handler([](const NoArgs&) -> ToolResult { throw std::runtime_error("kaboom"); });

    auto result = tool.handler(json::object());
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(*result.error, "kaboom");
}

// =============================================================================
// Validation Tests
// =============================================================================

TEST(ToolBuilderTest, MissingRequiredArgument)
{
    auto tool = make_rename_tool();

    auto result = tool.handler(json{{"title", "t"}});
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(*result.error, "Missing required argument: id");
}

TEST(ToolBuilderTest, NullRequiredArgumentCountsAsMissing)
{
    auto tool = make_rename_tool();

    auto result = tool.handler(json{{"id", nullptr}, {"title", "t"}});
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(*result.error, "Missing required argument: id");
}

TEST(ToolBuilderTest, WrongArgumentType)
{
    auto tool = make_rename_tool();

    auto as_string = tool.handler(json{{"id", "5"}, {"title", "t"}});
    ASSERT_TRUE(as_string.is_error());
    EXPECT_EQ(*as_string.error, "Invalid argument 'id': expected integer");

    auto as_float = tool.handler(json{{"id", 5.5}, {"title", "t"}});
    ASSERT_TRUE(as_float.is_error());
    EXPECT_EQ(*as_float.error, "Invalid argument 'id': expected integer");

    auto bad_bool = tool.handler(json{{"id", 5}, {"title", "t"}, {"pinned", "yes"}});
    ASSERT_TRUE(bad_bool.is_error());
    EXPECT_EQ(*bad_bool.error, "Invalid argument 'pinned': expected boolean");
}

TEST(ToolBuilderTest, ArgumentsMustBeAnObject)
{
    auto tool = make_rename_tool();

    auto result = tool.handler(json::array({1, 2}));
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(*result.error, "Invalid arguments: expected object");
}

TEST(ToolBuilderTest, IntegerOutOfRangeIsRejected)
{
    EXPECT_TRUE(detail::matches_type(json(int64_t{-3}), "integer"));
    EXPECT_TRUE(detail::matches_type(json(uint64_t{42}), "integer"));
    EXPECT_FALSE(detail::matches_type(json(uint64_t{18446744073709551615ull}), "integer"));
    EXPECT_FALSE(detail::matches_type(json(true), "integer"));
}

TEST(ToolBuilderTest, SchemaTypeMatching)
{
    EXPECT_TRUE(detail::matches_type(json("x"), "string"));
    EXPECT_TRUE(detail::matches_type(json(1.5), "number"));
    EXPECT_TRUE(detail::matches_type(json(false), "boolean"));
    EXPECT_TRUE(detail::matches_type(json::object(), "object"));
    EXPECT_FALSE(detail::matches_type(json::array(), "object"));
    EXPECT_FALSE(detail::matches_type(json(1), "boolean"));
}

TEST(ToolBuilderTest, ValidateArgumentsReportsFirstProblemInDeclarationOrder)
{
    std::vector<ParamDescriptor> params = {
        {"a", "first", {{"type", "integer"}}, true},
        {"b", "second", {{"type", "string"}}, true},
    };

    EXPECT_EQ(*validate_arguments(json::object(), params), "Missing required argument: a");
    EXPECT_EQ(*validate_arguments(json{{"a", 1}}, params), "Missing required argument: b");
    EXPECT_FALSE(validate_arguments(json{{"a", 1}, {"b", "x"}}, params).has_value());
}
