#pragma once

#include "core/sqlitehelper.hpp"
#include "protos/params.pb.h"

namespace notestore
{
constexpr int kSchemaVersion = 1;
constexpr size_t kMaxUserIdLength = 30;

/// @brief Open a connection with foreign keys enforced and the configured busy timeout.
SQLiteDB open_database(const DatabaseParams& params);

/// @brief Create the users, directories, files and remote_checkpoints tables if absent, and stamp
/// the schema version.
void initialize_tables(SQLiteDB db);

/// @brief Throws `std::runtime_error` unless the database was initialized with this schema version.
void check_schema_version(SQLiteDB db);
}    // namespace notestore
