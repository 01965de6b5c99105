// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

/// @file tools.hpp
/// @brief Tool registry and the todo tool set

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <todomcp/store.hpp>
#include <todomcp/types.hpp>
#include <vector>

namespace todomcp
{

// =============================================================================
// Tool Registry
// =============================================================================

/// Immutable name → Tool mapping, kept in declaration order
///
/// Built once at startup and handed to the Dispatcher by reference.
class ToolRegistry
{
  public:
    /// @throws std::invalid_argument on an empty or duplicate name, or a tool
    ///         without a handler
    explicit ToolRegistry(std::vector<Tool> tools);

    /// @return The tool, or nullptr if no tool has that name
    const Tool* find(const std::string& name) const;

    /// All tools in declaration order
    const std::vector<Tool>& tools() const
    {
        return tools_;
    }

    size_t size() const
    {
        return tools_.size();
    }

  private:
    std::vector<Tool> tools_;
    std::map<std::string, size_t> index_;
};

// =============================================================================
// Todo Tools
// =============================================================================

struct ListTodosArgs
{
};

struct AddTodoArgs
{
    std::string content;
};

struct UpdateTodoArgs
{
    int64_t id = 0;
    std::optional<std::string> content;
    std::optional<bool> done;
};

struct DeleteTodoArgs
{
    int64_t id = 0;
};

/// Build list_todos, add_todo, update_todo and delete_todo over `store`
/// @note The store must outlive the returned tools
std::vector<Tool> make_todo_tools(TodoStore& store);

} // namespace todomcp
