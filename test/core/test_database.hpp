#pragma once

#include "core/sqlitehelper.hpp"

#include <cstdint>
#include <string>

namespace notestore
{
/// @brief A fresh database file with all tables created. The file is removed on destruction.
class TestDatabase
{
public:
    TestDatabase();
    ~TestDatabase();

    TestDatabase(const TestDatabase&) = delete;
    TestDatabase& operator=(const TestDatabase&) = delete;

    const std::string& filename() const noexcept { return filename_; }

    // The connection opened at construction.
    SQLiteDB& db() noexcept { return db_; }

    // Another connection to the same file.
    SQLiteDB connect() const;

private:
    std::string filename_;
    SQLiteDB db_;
};

/// @brief The single integer produced by `sql`.
int64_t query_int(SQLiteDB db, const char* sql);
}    // namespace notestore
