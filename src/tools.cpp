// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include <stdexcept>
#include <todomcp/tool_builder.hpp>
#include <todomcp/tools.hpp>

namespace todomcp
{

// =============================================================================
// ToolRegistry
// =============================================================================

ToolRegistry::ToolRegistry(std::vector<Tool> tools) : tools_(std::move(tools))
{
    for (size_t i = 0; i < tools_.size(); ++i)
    {
        const auto& tool = tools_[i];
        if (tool.name.empty())
            throw std::invalid_argument("Tool name cannot be empty");
        if (!tool.handler)
            throw std::invalid_argument("Tool handler cannot be null: " + tool.name);
        if (!index_.emplace(tool.name, i).second)
            throw std::invalid_argument("Duplicate tool name: " + tool.name);
    }
}

const Tool* ToolRegistry::find(const std::string& name) const
{
    auto it = index_.find(name);
    if (it == index_.end())
        return nullptr;
    return &tools_[it->second];
}

// =============================================================================
// Todo Tools
// =============================================================================

std::vector<Tool> make_todo_tools(TodoStore& store)
{
    std::vector<Tool> tools;

    tools.push_back(
        ToolBuilder::create<ListTodosArgs>("list_todos", "List all todo items")
            .handler([&store](const ListTodosArgs&)
                     { return ToolResult::success({{"todos", store.list_all()}}); })
    );

    tools.push_back(
        ToolBuilder::create<AddTodoArgs>("add_todo", "Add a new todo item")
            .describe(&AddTodoArgs::content, "content", "The todo item content")
            .handler(
                [&store](const AddTodoArgs& args)
                {
                    int64_t id = store.add(args.content);
                    return ToolResult::success({{"id", id}, {"success", true}});
                }
            )
    );

    tools.push_back(
        ToolBuilder::create<UpdateTodoArgs>("update_todo", "Update a todo item")
            .describe(&UpdateTodoArgs::id, "id", "The todo item ID")
            .describe(&UpdateTodoArgs::content, "content", "New content (optional)")
            .describe(&UpdateTodoArgs::done, "done", "Mark as done/undone (optional)")
            .handler(
                [&store](const UpdateTodoArgs& args)
                {
                    bool ok = store.update(args.id, args.content, args.done);
                    return ToolResult::success({{"success", ok}});
                }
            )
    );

    tools.push_back(
        ToolBuilder::create<DeleteTodoArgs>("delete_todo", "Delete a todo item")
            .describe(&DeleteTodoArgs::id, "id", "The todo item ID to delete")
            .handler([&store](const DeleteTodoArgs& args)
                     { return ToolResult::success({{"success", store.remove(args.id)}}); })
    );

    return tools;
}

} // namespace todomcp
