#include "core/schema.hpp"

#include <absl/log/log.h>
#include <absl/strings/str_format.h>

#include <stdexcept>

namespace notestore
{
namespace
{
    constexpr int kDefaultBusyTimeoutMs = 5000;

    // Directory names start and end with '/', and the root is exactly '/'. A non root directory
    // points at its parent, whose name is a strict prefix of its own with one '/' less. The
    // parent reference is checked per statement, except inside a rename where
    // `PRAGMA defer_foreign_keys` postpones it to commit. The CHECK constraints are always
    // evaluated per row, so a rename must move a whole subtree in one statement.
    //
    // Files reference their directory with ON UPDATE CASCADE, so renaming a directory relocates
    // its files. Checkpoints reference no directory or file, and survive both being deleted.
    constexpr const char* kCreateTables = R"(
        CREATE TABLE IF NOT EXISTS users (
            id TEXT PRIMARY KEY NOT NULL CHECK (length(id) BETWEEN 1 AND 30)
        );

        CREATE TABLE IF NOT EXISTS directories (
            user_id TEXT NOT NULL REFERENCES users (id),
            name TEXT NOT NULL,
            parent_user_id TEXT,
            parent_name TEXT,
            PRIMARY KEY (user_id, name),
            FOREIGN KEY (parent_user_id, parent_name) REFERENCES directories (user_id, name)
                DEFERRABLE INITIALLY IMMEDIATE,
            CONSTRAINT directories_match_user_id CHECK (user_id = parent_user_id),
            CONSTRAINT directories_parent_name_prefix CHECK (
                substr(name, 1, length(parent_name)) = parent_name
                AND length(name) > length(parent_name)),
            CONSTRAINT directories_startwith_slash CHECK (substr(name, 1, 1) = '/'),
            CONSTRAINT directories_endwith_slash CHECK (substr(name, -1, 1) = '/'),
            CONSTRAINT directories_slash_count CHECK (
                length(name) - length(replace(name, '/', ''))
                = length(parent_name) - length(replace(parent_name, '/', '')) + 1),
            CONSTRAINT directories_null_user_id_match CHECK (
                (parent_name IS NULL) = (parent_user_id IS NULL)),
            CONSTRAINT directories_null_iff_root CHECK ((name = '/') = (parent_name IS NULL))
        );

        CREATE INDEX IF NOT EXISTS directories_parent
            ON directories (parent_user_id, parent_name);

        CREATE TABLE IF NOT EXISTS files (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            name TEXT NOT NULL,
            user_id TEXT NOT NULL REFERENCES users (id),
            parent_name TEXT NOT NULL,
            content BLOB NOT NULL,
            created_at INTEGER NOT NULL,
            CONSTRAINT uix_filepath_username UNIQUE (user_id, parent_name, name),
            FOREIGN KEY (user_id, parent_name) REFERENCES directories (user_id, name)
                ON UPDATE CASCADE
        );

        CREATE INDEX IF NOT EXISTS files_created_at ON files (created_at);

        CREATE TABLE IF NOT EXISTS remote_checkpoints (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            user_id TEXT NOT NULL REFERENCES users (id),
            path TEXT NOT NULL,
            content BLOB NOT NULL,
            last_modified INTEGER NOT NULL
        );

        CREATE INDEX IF NOT EXISTS remote_checkpoints_user_path
            ON remote_checkpoints (user_id, path);
        CREATE INDEX IF NOT EXISTS remote_checkpoints_last_modified
            ON remote_checkpoints (last_modified);
    )";

    int read_user_version(SQLiteDB& db)
    {
        auto st = db.statement("PRAGMA user_version");
        if (!st.step())
        {
            throw std::runtime_error("PRAGMA user_version returned no row");
        }
        return static_cast<int>(st.get_int(0));
    }
}    // namespace

SQLiteDB open_database(const DatabaseParams& params)
{
    if (params.path().empty())
    {
        throw std::invalid_argument("Database path must not be empty");
    }
    SQLiteDB db(params.path().c_str(), SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE);
    db.set_busy_timeout(params.has_busy_timeout_ms() ? params.busy_timeout_ms()
                                                     : kDefaultBusyTimeoutMs);
    db.exec("PRAGMA foreign_keys = ON");
    if (params.wal())
    {
        db.exec("PRAGMA journal_mode = WAL");
    }
    return db;
}

void initialize_tables(SQLiteDB db)
{
    with_transaction(db,
                     [&]()
                     {
                         int version = read_user_version(db);
                         if (version != 0 && version != kSchemaVersion)
                         {
                             throw std::runtime_error(absl::StrFormat(
                                 "Database has schema version %d, expected %d",
                                 version,
                                 kSchemaVersion));
                         }
                         db.exec(kCreateTables);
                         db.exec(absl::StrFormat("PRAGMA user_version = %d", kSchemaVersion)
                                     .c_str());
                     });
    LOG(INFO) << "Tables initialized at schema version " << kSchemaVersion;
}

void check_schema_version(SQLiteDB db)
{
    int version = read_user_version(db);
    if (version != kSchemaVersion)
    {
        throw std::runtime_error(
            absl::StrFormat("Database has schema version %d, expected %d. Run `notestore init` "
                            "on a fresh database first.",
                            version,
                            kSchemaVersion));
    }
}
}    // namespace notestore
