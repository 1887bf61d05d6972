#pragma once

#include "core/records.hpp"
#include "core/sqlitehelper.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace notestore
{
/// @brief The directory tree of each user.
///
/// All paths are API paths. The caller owns the transaction.
class DirectoryStore
{
public:
    explicit DirectoryStore(SQLiteDB db) : db_(std::move(db)) {}

    /// @brief Throws `DirectoryExists` if present, `NoSuchDirectory` if the parent is absent.
    void create_directory(std::string_view user_id, std::string_view api_path);

    /// @brief Like `create_directory`, but an existing directory is fine.
    void ensure_directory(std::string_view user_id, std::string_view api_path);

    bool dir_exists(std::string_view user_id, std::string_view api_dirname);

    /// @brief The direct children of a directory, each side queried on its own.
    std::vector<FileRecord> files_in_directory(std::string_view user_id,
                                               std::string_view db_dirname);
    std::vector<std::string> directories_in_directory(std::string_view user_id,
                                                      std::string_view db_dirname);

    /// @brief Throws `NoSuchDirectory` if absent.
    DirectoryRecord
    get_directory(std::string_view user_id, std::string_view api_dirname, bool with_content);

    /// @brief Throws `NoSuchDirectory` if absent and `DirectoryNotEmpty` if anything is inside.
    void delete_directory(std::string_view user_id, std::string_view api_path);

    /// @brief Move a directory together with its whole subtree.
    ///
    /// Files follow through the cascading foreign key, so no file row is written here. Checkpoints
    /// are not touched. Must run inside a transaction, since the parent links stay broken between
    /// statements until commit.
    void rename_directory(std::string_view user_id,
                          std::string_view old_api_path,
                          std::string_view new_api_path);

private:
    SQLiteDB db_;
    SQLiteStatement insert_, exists_, list_files_, list_subdirs_, delete_, rename_self_,
        rename_descendants_;

    bool db_dir_exists(std::string_view user_id, std::string_view db_dirname);
};
}    // namespace notestore
