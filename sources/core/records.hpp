#pragma once

#include "core/crypto.hpp"

#include <absl/functional/function_ref.h>
#include <absl/time/time.h>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace notestore
{
/// 0 disables the size limit.
constexpr uint64_t kUnlimitedSize = 0;

struct FileRecord
{
    int64_t id = 0;
    std::string name;
    // Canonical directory name, such as "/a/b/".
    std::string parent_name;
    absl::Time created_at;
    std::optional<std::string> content;

    std::string api_path() const;
};

struct DirectoryRecord
{
    // Canonical directory name.
    std::string name;
    // Both filled only when the directory was fetched with content.
    std::optional<std::vector<FileRecord>> files;
    std::optional<std::vector<std::string>> subdirs;
};

struct CheckpointRecord
{
    int64_t id = 0;
    // API path of the file.
    std::string path;
    absl::Time last_modified;
    std::optional<std::string> content;
};

/// @brief Maps stored content to its replacement, or to nothing when the row is to stay as is.
using ContentRewriter = absl::FunctionRef<std::optional<std::string>(std::string_view)>;

/// @brief Encrypt content on its way into the database.
///
/// Throws `FileTooLarge` if the encrypted size exceeds `max_size_bytes`.
std::string preprocess_incoming_content(std::string_view content,
                                        EncryptFunc encrypt,
                                        uint64_t max_size_bytes,
                                        std::string_view api_path);
}    // namespace notestore
