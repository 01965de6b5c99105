// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include "test_support.hpp"

#include <gtest/gtest.h>
#include <memory>
#include <spdlog/sinks/ostream_sink.h>
#include <sstream>
#include <todomcp/dispatcher.hpp>
#include <todomcp/jsonrpc.hpp>
#include <todomcp/logging.hpp>
#include <todomcp/sqlite_store.hpp>

using namespace todomcp;
using todomcp::testing::FailingStore;
using todomcp::testing::TempDir;

class DispatcherTest : public ::testing::Test
{
  protected:
    DispatcherTest()
        : store_(dir_.db_path()), registry_(make_todo_tools(store_)), dispatcher_(registry_)
    {
    }

    json call(const std::string& tool, const json& arguments)
    {
        return dispatcher_.handle(
            {{"jsonrpc", "2.0"},
             {"id", 1},
             {"method", "tools/call"},
             {"params", {{"name", tool}, {"arguments", arguments}}}}
        );
    }

    std::vector<std::string> listed_contents()
    {
        std::vector<std::string> out;
        json listed = call("list_todos", json::object());
        for (const auto& todo : listed["todos"])
            out.push_back(todo["content"].get<std::string>());
        return out;
    }

    TempDir dir_;
    SqliteTodoStore store_;
    ToolRegistry registry_;
    Dispatcher dispatcher_;
};

// =============================================================================
// initialize / tools/list
// =============================================================================

TEST_F(DispatcherTest, InitializeDescribesServer)
{
    json expected = {
        {"protocolVersion", "2024-11-05"},
        {"capabilities", {{"tools", json::object()}}},
        {"serverInfo", {{"name", "todo-mcp"}, {"version", "1.0.0"}}},
    };

    EXPECT_EQ(dispatcher_.handle({{"method", "initialize"}, {"id", 1}}), expected);
}

TEST_F(DispatcherTest, InitializeIgnoresParams)
{
    auto result = dispatcher_.handle(
        {{"method", "initialize"}, {"params", {{"protocolVersion", "1999-01-01"}}}}
    );
    EXPECT_EQ(result["protocolVersion"], "2024-11-05");
}

TEST_F(DispatcherTest, ListToolsInDeclarationOrder)
{
    auto result = dispatcher_.handle({{"method", "tools/list"}});

    ASSERT_TRUE(result["tools"].is_array());
    ASSERT_EQ(result["tools"].size(), 4u);

    std::vector<std::string> names;
    for (const auto& tool : result["tools"])
    {
        names.push_back(tool["name"].get<std::string>());
        EXPECT_TRUE(tool.contains("description"));
        EXPECT_EQ(tool["inputSchema"]["type"], "object");
    }
    EXPECT_EQ(names, (std::vector<std::string>{"list_todos", "add_todo", "update_todo", "delete_todo"}));

    EXPECT_EQ(result["tools"][1]["inputSchema"]["required"], (json{"content"}));
}

// =============================================================================
// tools/call
// =============================================================================

TEST_F(DispatcherTest, AddUpdateDeleteCycle)
{
    auto added = call("add_todo", {{"content", "buy milk"}});
    ASSERT_TRUE(added.contains("id"));
    EXPECT_EQ(added["success"], true);
    int64_t id = added["id"].get<int64_t>();

    EXPECT_EQ(call("update_todo", {{"id", id}, {"done", true}}), (json{{"success", true}}));

    auto todos = call("list_todos", json::object())["todos"];
    ASSERT_EQ(todos.size(), 1u);
    EXPECT_EQ(todos[0]["done"], true);

    EXPECT_EQ(call("delete_todo", {{"id", id}}), (json{{"success", true}}));
    EXPECT_TRUE(call("list_todos", json::object())["todos"].empty());
}

TEST_F(DispatcherTest, ListOrdersOpenBeforeDone)
{
    call("add_todo", {{"content", "A"}});
    auto b = call("add_todo", {{"content", "B"}});
    call("update_todo", {{"id", b["id"]}, {"done", true}});
    call("add_todo", {{"content", "C"}});

    EXPECT_EQ(listed_contents(), (std::vector<std::string>{"A", "C", "B"}));
}

TEST_F(DispatcherTest, UnknownToolLeavesStorageUnchanged)
{
    call("add_todo", {{"content", "keep"}});

    auto result = call("nonexistent", {{"id", 1}});
    EXPECT_EQ(result, (json{{"error", "Tool not found: nonexistent"}}));

    EXPECT_EQ(listed_contents(), (std::vector<std::string>{"keep"}));
}

TEST_F(DispatcherTest, MissingToolName)
{
    auto result = dispatcher_.handle({{"method", "tools/call"}, {"params", json::object()}});
    EXPECT_EQ(result, (json{{"error", "Tool not found: null"}}));
}

TEST_F(DispatcherTest, AbsentOrNullArgumentsActAsEmptyObject)
{
    auto absent = dispatcher_.handle({{"method", "tools/call"}, {"params", {{"name", "list_todos"}}}});
    EXPECT_EQ(absent, (json{{"todos", json::array()}}));

    auto null_args = dispatcher_.handle(
        {{"method", "tools/call"}, {"params", {{"name", "list_todos"}, {"arguments", nullptr}}}}
    );
    EXPECT_EQ(null_args, (json{{"todos", json::array()}}));

    auto missing_content =
        dispatcher_.handle({{"method", "tools/call"}, {"params", {{"name", "add_todo"}}}});
    EXPECT_EQ(missing_content, (json{{"error", "Missing required argument: content"}}));
}

TEST_F(DispatcherTest, AbsentParamsActAsEmptyObject)
{
    auto result = dispatcher_.handle({{"method", "tools/call"}});
    EXPECT_EQ(result, (json{{"error", "Tool not found: null"}}));
}

TEST_F(DispatcherTest, NonObjectParamsThrows)
{
    EXPECT_THROW(
        dispatcher_.handle({{"method", "tools/call"}, {"params", json::array({1})}}), DispatchError
    );
    EXPECT_THROW(dispatcher_.handle({{"method", "tools/call"}, {"params", "oops"}}), DispatchError);
}

TEST_F(DispatcherTest, ArgumentErrorsAreToolErrors)
{
    auto bad_id = call("delete_todo", {{"id", "seven"}});
    EXPECT_EQ(bad_id, (json{{"error", "Invalid argument 'id': expected integer"}}));

    auto not_object = call("add_todo", json::array({"x"}));
    EXPECT_EQ(not_object, (json{{"error", "Invalid arguments: expected object"}}));
}

// =============================================================================
// Unknown methods
// =============================================================================

TEST_F(DispatcherTest, UnknownMethod)
{
    EXPECT_EQ(
        dispatcher_.handle({{"method", "resources/list"}, {"id", 2}}),
        (json{{"error", "Unknown method: resources/list"}})
    );
}

TEST_F(DispatcherTest, MissingOrNonStringMethod)
{
    EXPECT_EQ(dispatcher_.handle({{"id", 2}}), (json{{"error", "Unknown method: null"}}));
    EXPECT_EQ(dispatcher_.handle({{"method", 42}}), (json{{"error", "Unknown method: 42"}}));
}

TEST_F(DispatcherTest, NotificationsGetNoSpecialTreatment)
{
    auto result = dispatcher_.handle({{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}});
    EXPECT_EQ(result, (json{{"error", "Unknown method: notifications/initialized"}}));
}

// =============================================================================
// Logging
// =============================================================================

TEST_F(DispatcherTest, ArgumentsOnlyLoggedAtDebugLevel)
{
    std::ostringstream captured;
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(captured);
    auto log = logger();
    const auto saved_level = log->level();
    log->sinks().push_back(sink);

    log->set_level(spdlog::level::info);
    call("add_todo", {{"content", "quiet"}});
    EXPECT_EQ(captured.str().find("Calling tool"), std::string::npos);

    log->set_level(spdlog::level::debug);
    call("add_todo", {{"content", "loud"}});
    EXPECT_NE(captured.str().find(R"(Calling tool add_todo with {"content":"loud"})"), std::string::npos);

    log->sinks().pop_back();
    log->set_level(saved_level);
}

// =============================================================================
// Store failures
// =============================================================================

TEST(DispatcherFailureTest, StoreFailureSurfacesAsToolError)
{
    FailingStore store;
    ToolRegistry registry(make_todo_tools(store));
    Dispatcher dispatcher(registry);

    auto result = dispatcher.handle(
        {{"method", "tools/call"}, {"params", {{"name", "delete_todo"}, {"arguments", {{"id", 1}}}}}}
    );
    EXPECT_EQ(result, (json{{"error", "database is locked"}}));
}
