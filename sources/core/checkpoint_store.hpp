#pragma once

#include "core/crypto.hpp"
#include "core/records.hpp"
#include "core/sqlitehelper.hpp"

#include <cstdint>
#include <string_view>
#include <vector>

namespace notestore
{
/// @brief Append-only snapshots of file content, keyed by the full file path.
///
/// Checkpoints are not linked to the files table: they survive deletion of the file, and renames
/// must be applied to them explicitly with `move_file` or `move_directory`. All paths are API
/// paths.
class CheckpointStore
{
public:
    explicit CheckpointStore(SQLiteDB db) : db_(std::move(db)) {}

    /// @brief Always inserts a new row. The returned record has no content.
    CheckpointRecord save(std::string_view user_id,
                          std::string_view api_path,
                          std::string_view content,
                          EncryptFunc encrypt,
                          uint64_t max_size_bytes);

    /// @brief Throws `NoSuchCheckpoint`, or `CorruptedFile` if `decrypt` does.
    CheckpointRecord
    get(std::string_view user_id, std::string_view api_path, int64_t id, DecryptFunc decrypt);

    /// @brief Newest first.
    std::vector<CheckpointRecord> list(std::string_view user_id, std::string_view api_path);

    /// @brief The newest checkpoint of every path of the user, ordered by path.
    std::vector<CheckpointRecord> latest_per_path(std::string_view user_id);

    void delete_one(std::string_view user_id, std::string_view api_path, int64_t id);
    void delete_all(std::string_view user_id, std::string_view api_path);
    void purge_user(std::string_view user_id);

    void move_one(std::string_view user_id,
                  std::string_view src_api_path,
                  std::string_view dest_api_path,
                  int64_t id);

    /// @brief Follow a file rename. Checkpoints below a directory of the same name stay.
    void move_file(std::string_view user_id,
                   std::string_view src_api_path,
                   std::string_view dest_api_path);

    /// @brief Follow a directory rename. Checkpoints of a file of the same name stay.
    void move_directory(std::string_view user_id,
                        std::string_view src_api_path,
                        std::string_view dest_api_path);

    /// @brief Both `move_file` and `move_directory`, for a path of unknown kind.
    void move_all(std::string_view user_id,
                  std::string_view src_api_path,
                  std::string_view dest_api_path);

    std::vector<int64_t> select_checkpoint_ids(std::string_view user_id);
    /// @brief Replace the content of one row by what `rewrite` makes of it. Returns whether the
    /// row was written.
    bool rewrite_content(int64_t id, ContentRewriter rewrite);

private:
    SQLiteDB db_;
    SQLiteStatement insert_, select_, list_, latest_, delete_one_, delete_all_, purge_, move_one_,
        move_exact_, move_prefix_, select_ids_, select_content_by_id_, update_content_by_id_;
};
}    // namespace notestore
