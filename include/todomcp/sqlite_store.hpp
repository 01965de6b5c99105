// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

/// @file sqlite_store.hpp
/// @brief SQLite-backed TodoStore

#include <chrono>
#include <functional>
#include <string>
#include <todomcp/store.hpp>

namespace todomcp
{

/// TodoStore over a single SQLite database file
///
/// Each operation opens its own connection, runs one transaction (BEGIN
/// IMMEDIATE for writes) and closes the connection again. A busy timeout
/// makes a database locked by another process surface as a StoreError
/// instead of blocking forever.
///
/// Example usage:
/// @code
/// SqliteTodoStore store("/tmp/todos.db");
/// auto id = store.add("write tests");
/// store.update(id, std::nullopt, true);
/// for (const auto& todo : store.list_all())
///     std::cout << todo.content << "\n";
/// @endcode
class SqliteTodoStore : public TodoStore
{
  public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    /// Lock wait before a busy database is reported as an error
    static constexpr int kBusyTimeoutMs = 5000;

    /// Open (creating if needed) the database at `path`
    /// @param path Database file; parent directories are created if absent
    /// @param clock Time source for timestamps (defaults to the system clock)
    /// @throws StoreError if the directory or table cannot be created
    explicit SqliteTodoStore(std::string path, Clock clock = {});

    // Non-copyable, non-movable (handed out by reference to tool handlers)
    SqliteTodoStore(const SqliteTodoStore&) = delete;
    SqliteTodoStore& operator=(const SqliteTodoStore&) = delete;
    SqliteTodoStore(SqliteTodoStore&&) = delete;
    SqliteTodoStore& operator=(SqliteTodoStore&&) = delete;

    std::vector<Todo> list_all() override;
    int64_t add(const std::string& content) override;
    bool update(
        int64_t id, const std::optional<std::string>& content, std::optional<bool> done
    ) override;
    bool remove(int64_t id) override;

  private:
    /// Next timestamp; strictly later than any stamp this store issued before
    std::string next_timestamp();

    void create_schema();

    std::string path_;
    Clock clock_;
    std::chrono::sys_time<std::chrono::microseconds> last_stamp_{};
};

} // namespace todomcp
