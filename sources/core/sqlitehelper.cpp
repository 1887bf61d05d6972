#include "sqlitehelper.hpp"
#include "exceptions.hpp"

#include <absl/strings/str_format.h>
#include <boost/numeric/conversion/cast.hpp>

#include <exception>

namespace notestore
{

SQLiteException::SQLiteException(int code)
    : runtime_error(absl::StrFormat("SQLite error %d: %s", code, sqlite3_errstr(code)))
    , code_(code)
{
}

SQLiteException::SQLiteException(sqlite3* db, int code)
    : runtime_error(absl::StrFormat("SQLite error %d: %s", code, sqlite3_errmsg(db)))
    , code_(code)
{
}

bool SQLiteException::is_unique_violation() const noexcept
{
    return code_ == SQLITE_CONSTRAINT_UNIQUE || code_ == SQLITE_CONSTRAINT_PRIMARYKEY;
}

bool SQLiteException::is_foreign_key_violation() const noexcept
{
    return code_ == SQLITE_CONSTRAINT_FOREIGNKEY;
}

void check_sqlite_call(int code)
{
    if (code != SQLITE_OK)
        throw SQLiteException(code);
}
void check_sqlite_call(sqlite3* db, int code)
{
    if (code != SQLITE_OK)
        throw SQLiteException(db, code);
}

SQLiteDB::SQLiteDB(const char* filename, int flags, const char* vfs)
{
    ptr_ = std::make_shared<RAII<sqlite3*, SQLiteTraits>>();
    check_sqlite_call(sqlite3_open_v2(filename, &ptr_->get(), flags, vfs));
    check_sqlite_call(get(), sqlite3_extended_result_codes(get(), 1));
}

void SQLiteDB::exec(const char* sql)
{
    check_sqlite_call(get(), sqlite3_exec(get(), sql, nullptr, nullptr, nullptr));
}

SQLiteStatement SQLiteDB::statement(std::string_view sql) { return SQLiteStatement(*this, sql); }

void SQLiteDB::set_busy_timeout(int milliseconds)
{
    check_sqlite_call(get(), sqlite3_busy_timeout(get(), milliseconds));
}

void SQLiteDB::defer_foreign_keys()
{
    VALIDATE_CONSTRAINT(!sqlite3_get_autocommit(get()));
    exec("PRAGMA defer_foreign_keys = ON");
}

SQLiteStatement::SQLiteStatement(SQLiteDB db, std::string_view sql) : db_(std::move(db))
{
    check_sqlite_call(
        db_.get(),
        sqlite3_prepare_v2(
            db_.get(), sql.data(), boost::numeric_cast<int>(sql.size()), &holder_.get(), nullptr));
}

void SQLiteStatement::reset() { check_sqlite_call(db_.get(), sqlite3_reset(holder_.get())); }

bool SQLiteStatement::step()
{
    int rc = sqlite3_step(holder_.get());

    switch (rc)
    {
    case SQLITE_ROW:
        return true;
    case SQLITE_DONE:
    case SQLITE_OK:
        return false;
    default:
        throw SQLiteException(db_.get(), rc);
    }
}

void SQLiteStatement::bind_int(int column, int64_t value)
{
    check_sqlite_call(db_.get(), sqlite3_bind_int64(holder_.get(), column, value));
}

void SQLiteStatement::bind_text(int column, std::string_view value)
{
    check_sqlite_call(
        db_.get(),
        sqlite3_bind_text64(
            holder_.get(), column, value.data(), value.size(), SQLITE_STATIC, SQLITE_UTF8));
}

void SQLiteStatement::bind_blob(int column, std::string_view value)
{
    // A null pointer would bind NULL instead of an empty blob.
    static const char empty = 0;
    const char* data = value.empty() ? &empty : value.data();
    check_sqlite_call(
        db_.get(), sqlite3_bind_blob64(holder_.get(), column, data, value.size(), SQLITE_STATIC));
}

void SQLiteStatement::bind_null(int column)
{
    check_sqlite_call(db_.get(), sqlite3_bind_null(holder_.get(), column));
}

int64_t SQLiteStatement::get_int(int column) { return sqlite3_column_int64(holder_.get(), column); }

std::string_view SQLiteStatement::get_text(int column)
{
    auto text = reinterpret_cast<const char*>(sqlite3_column_text(holder_.get(), column));
    if (!text)
        return {};
    return {text, boost::numeric_cast<size_t>(sqlite3_column_bytes(holder_.get(), column))};
}

std::string_view SQLiteStatement::get_blob(int column)
{
    auto blob = static_cast<const char*>(sqlite3_column_blob(holder_.get(), column));
    if (!blob)
        return {};
    return {blob, boost::numeric_cast<size_t>(sqlite3_column_bytes(holder_.get(), column))};
}

bool SQLiteStatement::is_null(int column)
{
    return sqlite3_column_type(holder_.get(), column) == SQLITE_NULL;
}

SQLiteTransaction::SQLiteTransaction(SQLiteDB db) : db_(std::move(db))
{
    db_.exec("BEGIN IMMEDIATE");
}

SQLiteTransaction::~SQLiteTransaction()
{
    if (finished_)
        return;
    try
    {
        rollback();
    }
    catch (const std::exception& e)
    {
        warn_on_rollback_error(e);
    }
}

void SQLiteTransaction::commit()
{
    VALIDATE_CONSTRAINT(!finished_);
    db_.exec("COMMIT");
    finished_ = true;
}

void SQLiteTransaction::rollback()
{
    VALIDATE_CONSTRAINT(!finished_);
    finished_ = true;
    // Some errors (SQLITE_FULL, SQLITE_IOERR and the like) already rolled the transaction back.
    if (!sqlite3_get_autocommit(db_.get()))
        db_.exec("ROLLBACK");
}

SQLiteSavepoint::SQLiteSavepoint(SQLiteDB db, const char* name)
    : db_(std::move(db)), name_(name)
{
    db_.exec(absl::StrFormat("SAVEPOINT %s", name_).c_str());
}

SQLiteSavepoint::~SQLiteSavepoint()
{
    if (released_)
        return;
    try
    {
        rollback();
        release();
    }
    catch (const std::exception& e)
    {
        warn_on_rollback_error(e);
    }
}

void SQLiteSavepoint::release()
{
    VALIDATE_CONSTRAINT(!released_);
    released_ = true;
    db_.exec(absl::StrFormat("RELEASE SAVEPOINT %s", name_).c_str());
}

void SQLiteSavepoint::rollback()
{
    VALIDATE_CONSTRAINT(!released_);
    db_.exec(absl::StrFormat("ROLLBACK TO SAVEPOINT %s", name_).c_str());
}

}    // namespace notestore
