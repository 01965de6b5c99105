// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include <filesystem>
#include <memory>
#include <sqlite3.h>
#include <todomcp/logging.hpp>
#include <todomcp/sqlite_store.hpp>

namespace todomcp
{

namespace
{

// =============================================================================
// SQLite RAII helpers
// =============================================================================

using DbHandle = std::unique_ptr<sqlite3, int (*)(sqlite3*)>;
using StmtHandle = std::unique_ptr<sqlite3_stmt, int (*)(sqlite3_stmt*)>;

[[noreturn]] void throw_sqlite(sqlite3* db, const std::string& what)
{
    std::string message = what;
    if (db)
        message += ": " + std::string(sqlite3_errmsg(db));
    throw StoreError(message);
}

/// One connection per store operation
class Connection
{
  public:
    explicit Connection(const std::string& path) : db_(nullptr, &sqlite3_close)
    {
        sqlite3* raw = nullptr;
        int rc = sqlite3_open_v2(
            path.c_str(), &raw, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr
        );
        db_.reset(raw);
        if (rc != SQLITE_OK)
            throw_sqlite(raw, "Failed to open database '" + path + "'");
        sqlite3_busy_timeout(raw, SqliteTodoStore::kBusyTimeoutMs);
    }

    sqlite3* get() const
    {
        return db_.get();
    }

    void exec(const char* sql)
    {
        char* err_msg = nullptr;
        int rc = sqlite3_exec(db_.get(), sql, nullptr, nullptr, &err_msg);
        if (rc != SQLITE_OK)
        {
            std::string message = err_msg ? err_msg : sqlite3_errstr(rc);
            sqlite3_free(err_msg);
            throw StoreError(std::string("SQL error: ") + message);
        }
    }

    StmtHandle prepare(const std::string& sql)
    {
        sqlite3_stmt* raw = nullptr;
        if (sqlite3_prepare_v2(db_.get(), sql.c_str(), -1, &raw, nullptr) != SQLITE_OK)
            throw_sqlite(db_.get(), "Failed to prepare statement");
        return StmtHandle(raw, &sqlite3_finalize);
    }

    /// Run a statement that returns no rows
    void step_done(sqlite3_stmt* stmt)
    {
        if (sqlite3_step(stmt) != SQLITE_DONE)
            throw_sqlite(db_.get(), "Statement failed");
    }

    int changes() const
    {
        return sqlite3_changes(db_.get());
    }

  private:
    DbHandle db_;
};

/// Rolls back unless commit() was reached
class Transaction
{
  public:
    Transaction(Connection& conn, bool immediate) : conn_(conn)
    {
        conn_.exec(immediate ? "BEGIN IMMEDIATE" : "BEGIN");
    }

    ~Transaction()
    {
        if (!committed_)
        {
            // Already unwinding; a failed rollback leaves nothing to recover
            sqlite3_exec(conn_.get(), "ROLLBACK", nullptr, nullptr, nullptr);
        }
    }

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    void commit()
    {
        conn_.exec("COMMIT");
        committed_ = true;
    }

  private:
    Connection& conn_;
    bool committed_ = false;
};

void bind_text(sqlite3* db, sqlite3_stmt* stmt, int index, const std::string& value)
{
    if (sqlite3_bind_text(stmt, index, value.data(), static_cast<int>(value.size()), SQLITE_TRANSIENT) !=
        SQLITE_OK)
        throw_sqlite(db, "Failed to bind parameter");
}

void bind_int64(sqlite3* db, sqlite3_stmt* stmt, int index, int64_t value)
{
    if (sqlite3_bind_int64(stmt, index, value) != SQLITE_OK)
        throw_sqlite(db, "Failed to bind parameter");
}

std::string column_text(sqlite3_stmt* stmt, int col)
{
    const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
    if (!text)
        return {};
    return std::string(text, static_cast<size_t>(sqlite3_column_bytes(stmt, col)));
}

} // namespace

// =============================================================================
// SqliteTodoStore
// =============================================================================

SqliteTodoStore::SqliteTodoStore(std::string path, Clock clock)
    : path_(std::move(path)), clock_(std::move(clock))
{
    if (!clock_)
        clock_ = [] { return std::chrono::system_clock::now(); };

    std::filesystem::path parent = std::filesystem::path(path_).parent_path();
    if (!parent.empty())
    {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec)
        {
            throw StoreError(
                "Failed to create directory '" + parent.string() + "': " + ec.message()
            );
        }
    }

    create_schema();
    logger()->info("Todo database ready at {}", path_);
}

void SqliteTodoStore::create_schema()
{
    Connection conn(path_);
    conn.exec(
        "CREATE TABLE IF NOT EXISTS todos ("
        "  id INTEGER PRIMARY KEY AUTOINCREMENT,"
        "  content TEXT NOT NULL,"
        "  done INTEGER NOT NULL DEFAULT 0,"
        "  created_at TEXT NOT NULL,"
        "  updated_at TEXT NOT NULL"
        ")"
    );
}

std::string SqliteTodoStore::next_timestamp()
{
    auto now = std::chrono::floor<std::chrono::microseconds>(clock_());
    if (now <= last_stamp_)
        now = last_stamp_ + std::chrono::microseconds{1};
    last_stamp_ = now;
    return detail::format_timestamp(now);
}

std::vector<Todo> SqliteTodoStore::list_all()
{
    Connection conn(path_);
    Transaction tx(conn, false);

    auto stmt = conn.prepare(
        "SELECT id, content, done, created_at, updated_at FROM todos "
        "ORDER BY done ASC, created_at ASC, id ASC"
    );

    std::vector<Todo> todos;
    int rc;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW)
    {
        Todo todo;
        todo.id = sqlite3_column_int64(stmt.get(), 0);
        todo.content = column_text(stmt.get(), 1);
        todo.done = sqlite3_column_int(stmt.get(), 2) != 0;
        todo.created_at = column_text(stmt.get(), 3);
        todo.updated_at = column_text(stmt.get(), 4);
        todos.push_back(std::move(todo));
    }
    if (rc != SQLITE_DONE)
        throw_sqlite(conn.get(), "Failed to read todos");

    stmt.reset();
    tx.commit();
    return todos;
}

int64_t SqliteTodoStore::add(const std::string& content)
{
    if (content.empty())
        throw ValidationError("Todo content must not be empty");

    Connection conn(path_);
    Transaction tx(conn, true);

    const std::string now = next_timestamp();
    auto stmt = conn.prepare(
        "INSERT INTO todos (content, done, created_at, updated_at) VALUES (?, 0, ?, ?)"
    );
    bind_text(conn.get(), stmt.get(), 1, content);
    bind_text(conn.get(), stmt.get(), 2, now);
    bind_text(conn.get(), stmt.get(), 3, now);
    conn.step_done(stmt.get());

    int64_t id = sqlite3_last_insert_rowid(conn.get());
    stmt.reset();
    tx.commit();

    logger()->debug("Added todo {}", id);
    return id;
}

bool SqliteTodoStore::update(
    int64_t id, const std::optional<std::string>& content, std::optional<bool> done
)
{
    if (!content && !done)
        return false;
    if (content && content->empty())
        throw ValidationError("Todo content must not be empty");

    std::string sql = "UPDATE todos SET ";
    if (content)
        sql += "content = ?, ";
    if (done)
        sql += "done = ?, ";
    sql += "updated_at = ? WHERE id = ?";

    Connection conn(path_);
    Transaction tx(conn, true);

    auto stmt = conn.prepare(sql);
    int index = 1;
    if (content)
        bind_text(conn.get(), stmt.get(), index++, *content);
    if (done)
        bind_int64(conn.get(), stmt.get(), index++, *done ? 1 : 0);
    bind_text(conn.get(), stmt.get(), index++, next_timestamp());
    bind_int64(conn.get(), stmt.get(), index, id);
    conn.step_done(stmt.get());

    bool modified = conn.changes() > 0;
    stmt.reset();
    tx.commit();

    logger()->debug("Update of todo {}: {}", id, modified ? "applied" : "no such row");
    return modified;
}

bool SqliteTodoStore::remove(int64_t id)
{
    Connection conn(path_);
    Transaction tx(conn, true);

    auto stmt = conn.prepare("DELETE FROM todos WHERE id = ?");
    bind_int64(conn.get(), stmt.get(), 1, id);
    conn.step_done(stmt.get());

    bool removed = conn.changes() > 0;
    stmt.reset();
    tx.commit();

    logger()->debug("Delete of todo {}: {}", id, removed ? "removed" : "no such row");
    return removed;
}

} // namespace todomcp
