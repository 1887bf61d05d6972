#pragma once

#include "core/crypto.hpp"
#include "core/records.hpp"
#include "core/sqlitehelper.hpp"

#include <cstdint>
#include <string_view>
#include <vector>

namespace notestore
{
/// @brief The current content of every file, one row per path.
///
/// All paths are API paths. The caller owns the transaction.
class FileStore
{
public:
    explicit FileStore(SQLiteDB db) : db_(std::move(db)) {}

    /// @brief Throws `NoSuchFile` if absent. The content is left empty.
    FileRecord get_file(std::string_view user_id, std::string_view api_path);

    /// @brief Throws `NoSuchFile` if absent, and `CorruptedFile` if `decrypt` does.
    FileRecord get_file(std::string_view user_id, std::string_view api_path, DecryptFunc decrypt);

    /// @brief The surrogate id, which is kept across renames. Throws `NoSuchFile`.
    int64_t get_file_id(std::string_view user_id, std::string_view api_path);

    bool file_exists(std::string_view user_id, std::string_view api_path);

    /// @brief Insert the file, or overwrite it if it exists.
    ///
    /// The size limit applies to the encrypted bytes, and is checked before anything is written.
    /// Throws `FileTooLarge`, or `NoSuchDirectory` when the parent directory is absent.
    void save_file(std::string_view user_id,
                   std::string_view api_path,
                   std::string_view content,
                   EncryptFunc encrypt,
                   uint64_t max_size_bytes);

    /// @brief Throws `NoSuchFile` if absent.
    void delete_file(std::string_view user_id, std::string_view api_path);

    /// @brief Move the row in place, keeping its id. Throws `FileExists` if the destination is
    /// taken and `NoSuchFile` if the source is absent.
    void rename_file(std::string_view user_id,
                     std::string_view old_api_path,
                     std::string_view new_api_path);

    std::vector<int64_t> select_file_ids(std::string_view user_id);

    /// @brief Replace the content of one row by what `rewrite` makes of it. Returns whether the
    /// row was written.
    bool rewrite_content(int64_t id, ContentRewriter rewrite);

private:
    SQLiteDB db_;
    SQLiteStatement select_, select_with_content_, insert_, update_, delete_, rename_, select_ids_,
        select_content_by_id_, update_content_by_id_;

    FileRecord select_file(std::string_view user_id,
                           std::string_view api_path,
                           std::optional<DecryptFunc> decrypt);
};
}    // namespace notestore
