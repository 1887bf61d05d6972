#pragma once
#include "utilities.hpp"

#include <sqlite3.h>

#include <absl/cleanup/cleanup.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>

namespace notestore
{
class SQLiteStatement;

struct SQLiteTraits
{
    static sqlite3* invalid() { return nullptr; }
    static void cleanup(sqlite3* db) { sqlite3_close(db); }
};

/// @brief A shared handle to one SQLite connection. Copies refer to the same connection.
///
/// A connection must not be used by more than one thread at a time. Concurrent writers each open
/// their own connection to the same file and serialize on the database lock.
class SQLiteDB
{
public:
    SQLiteDB() {}
    SQLiteDB(const char* filename, int flags, const char* vfs = nullptr);

    void exec(const char* sql);
    SQLiteStatement statement(std::string_view sql);

    void set_busy_timeout(int milliseconds);

    /// @brief Postpone every foreign key check of the current transaction until commit. Reset
    /// automatically when the transaction ends.
    void defer_foreign_keys();

    sqlite3* get() noexcept { return ptr_->get(); }
    explicit operator bool() const noexcept { return ptr_ && ptr_->get(); }
    int64_t last_changes() noexcept { return sqlite3_changes64(ptr_->get()); }
    int64_t last_insert_rowid() noexcept { return sqlite3_last_insert_rowid(ptr_->get()); }

private:
    std::shared_ptr<RAII<sqlite3*, SQLiteTraits>> ptr_;
};

struct SQLiteStatementTraits
{
    static sqlite3_stmt* invalid() { return nullptr; }
    static void cleanup(sqlite3_stmt* stmt) { sqlite3_finalize(stmt); }
};

class SQLiteStatement
{
public:
    SQLiteStatement() {}
    SQLiteStatement(SQLiteDB db, std::string_view sql);

    void reset();
    bool step();

    /// @brief Reset now, and once more when the returned guard goes out of scope, so that no
    /// statement is left in progress when the enclosing transaction ends.
    [[nodiscard]] auto scoped_reset()
    {
        reset();
        return absl::MakeCleanup(
            [stmt = holder_.get()]()
            {
                // The return value repeats the error of the last step, which step() has thrown.
                (void)sqlite3_reset(stmt);
            });
    }

    // Bound text and blobs are not copied. They must outlive the next call to step().
    void bind_int(int column, int64_t value);
    void bind_text(int column, std::string_view value);
    void bind_blob(int column, std::string_view value);
    void bind_null(int column);

    int64_t get_int(int column);
    std::string_view get_text(int column);
    std::string_view get_blob(int column);
    bool is_null(int column);

    explicit operator bool() const noexcept { return holder_.get(); }

private:
    SQLiteDB db_;
    RAII<sqlite3_stmt*, SQLiteStatementTraits> holder_;
};

class SQLiteException : public std::runtime_error
{
public:
    explicit SQLiteException(int code);
    explicit SQLiteException(sqlite3* db, int code);

    /// @brief The extended result code.
    int code() const noexcept { return code_; }

    bool is_unique_violation() const noexcept;
    bool is_foreign_key_violation() const noexcept;

private:
    int code_;
};

void check_sqlite_call(int code);
void check_sqlite_call(sqlite3* db, int code);

/// @brief A write transaction. Rolled back on destruction unless committed.
///
/// `BEGIN IMMEDIATE` takes the database write lock up front, so a transaction never fails halfway
/// on lock upgrade. Waiting for the lock is governed by the connection's busy timeout.
class SQLiteTransaction
{
public:
    explicit SQLiteTransaction(SQLiteDB db);
    ~SQLiteTransaction();

    SQLiteTransaction(const SQLiteTransaction&) = delete;
    SQLiteTransaction& operator=(const SQLiteTransaction&) = delete;

    void commit();
    void rollback();

private:
    SQLiteDB db_;
    bool finished_ = false;
};

/// @brief A nested savepoint inside the current transaction. Rolled back to and released on
/// destruction unless released.
class SQLiteSavepoint
{
public:
    SQLiteSavepoint(SQLiteDB db, const char* name);
    ~SQLiteSavepoint();

    SQLiteSavepoint(const SQLiteSavepoint&) = delete;
    SQLiteSavepoint& operator=(const SQLiteSavepoint&) = delete;

    void release();

    // Undo everything since the savepoint was taken. The savepoint stays open.
    void rollback();

private:
    SQLiteDB db_;
    std::string name_;
    bool released_ = false;
};

/// @brief Run `cb` inside a fresh transaction on `db` and commit if it returns normally.
template <typename Callback>
auto with_transaction(SQLiteDB db, Callback&& cb) -> decltype(cb())
{
    SQLiteTransaction txn(std::move(db));
    if constexpr (std::is_void_v<decltype(cb())>)
    {
        cb();
        txn.commit();
    }
    else
    {
        auto result = cb();
        txn.commit();
        return result;
    }
}
}    // namespace notestore
