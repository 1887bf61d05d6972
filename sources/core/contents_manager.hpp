#pragma once

#include "core/checkpoint_store.hpp"
#include "core/crypto.hpp"
#include "core/directory_store.hpp"
#include "core/file_store.hpp"
#include "core/sqlitehelper.hpp"
#include "core/user_store.hpp"
#include "protos/params.pb.h"

#include <absl/time/time.h>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace notestore
{
enum class EntryType
{
    FILE,
    DIRECTORY
};

enum class ContentFormat
{
    TEXT,
    BASE64
};

/// @brief A file or directory as seen by the host application.
struct Model
{
    // Last path segment, "" for the root.
    std::string name;
    // Normalized API path.
    std::string path;
    EntryType type = EntryType::FILE;
    absl::Time created = absl::UnixEpoch();
    absl::Time last_modified = absl::UnixEpoch();

    // For files, the content encoded as `format` says. Unset when fetched without content.
    std::optional<std::string> content;
    std::optional<ContentFormat> format;

    // For directories fetched with content, the direct children without their content.
    std::vector<Model> children;
};

struct CheckpointModel
{
    int64_t id = 0;
    absl::Time last_modified;
};

/// @brief The store of one user, offered to the host application.
///
/// Every public operation normalizes its paths and runs in exactly one transaction. An instance
/// owns prepared statements on its connection and must not be shared across threads.
class ContentsManager
{
public:
    /// @brief Throws if the schema version does not match. With `create_user_on_startup`, the
    /// user and its root directory are created if missing.
    ContentsManager(SQLiteDB db, std::string user_id, Crypto crypto, const StoreParams& params);

    ContentsManager(const ContentsManager&) = delete;
    ContentsManager& operator=(const ContentsManager&) = delete;

    const std::string& user_id() const noexcept { return user_id_; }

    bool dir_exists(std::string_view path);
    bool file_exists(std::string_view path);

    /// @brief Fetch a file or a directory.
    ///
    /// Without `type`, the path is looked up as a file first and as a directory second. Without
    /// `format`, file content is returned as text when it is valid UTF-8 and as base64 otherwise.
    /// Asking for text on content that is not UTF-8 throws `std::invalid_argument`.
    Model get(std::string_view path,
              bool with_content = true,
              std::optional<EntryType> type = std::nullopt,
              std::optional<ContentFormat> format = std::nullopt);

    /// @brief Create a directory (idempotent) or write a file. Returns the model without content.
    Model save(const Model& model, std::string_view path);

    /// @brief Rename a file or a directory, and move the checkpoints along.
    Model rename(std::string_view old_path, std::string_view new_path);

    /// @brief Delete a file together with its checkpoints, or an empty directory.
    void delete_entry(std::string_view path);

    /// @brief Snapshot the current content of a file.
    CheckpointModel create_checkpoint(std::string_view path);
    std::vector<CheckpointModel> list_checkpoints(std::string_view path);

    /// @brief Overwrite the file with the content of the checkpoint.
    void restore_checkpoint(int64_t checkpoint_id, std::string_view path);

    void delete_checkpoint(int64_t checkpoint_id, std::string_view path);
    void delete_all_checkpoints(std::string_view path);
    void rename_all_checkpoints(std::string_view old_path, std::string_view new_path);

    /// @brief Remove the user and everything it owns. The instance is unusable afterwards.
    void purge_user();

    /// @brief Write the latest checkpoint of every path into `target`, creating the parent
    /// directories on the way. Returns the number of files written.
    size_t dump_latest_checkpoints(ContentsManager& target);

private:
    SQLiteDB db_;
    std::string user_id_;
    Crypto crypto_;
    uint64_t max_file_size_bytes_;
    UserStore users_;
    DirectoryStore directories_;
    FileStore files_;
    CheckpointStore checkpoints_;

    std::string encrypt_content(std::string_view plaintext) const;
    std::string decrypt_content(std::string_view ciphertext) const;

    // The helpers below expect a normalized path and an open transaction.
    bool file_exists_unlocked(const std::string& path);
    Model get_file_model(const std::string& path,
                         bool with_content,
                         std::optional<ContentFormat> format);
    Model get_directory_model(const std::string& path, bool with_content);
    void write_file(const std::string& path, std::string_view content);
};

/// @brief Decode model content into the bytes to store. Throws `std::invalid_argument`.
std::string decode_content(std::string_view content, ContentFormat format);

/// @brief Encode stored bytes for a model. Throws `std::invalid_argument` when text is asked for
/// bytes that are not UTF-8.
std::pair<std::string, ContentFormat> encode_content(std::string content,
                                                     std::optional<ContentFormat> format);
}    // namespace notestore
