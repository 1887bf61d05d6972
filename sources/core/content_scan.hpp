#pragma once

#include "core/crypto.hpp"
#include "core/sqlitehelper.hpp"

#include <absl/functional/function_ref.h>
#include <absl/time/time.h>

#include <cstdint>
#include <optional>
#include <string>

namespace notestore
{
/// @brief One decrypted row, as handed to a scan callback.
struct ScannedContent
{
    int64_t id = 0;
    std::string user_id;
    // API path of the file.
    std::string path;
    // Creation time for files, snapshot time for checkpoints.
    absl::Time last_modified;
    std::string content;
};

struct ScanOptions
{
    // Inclusive lower bound.
    std::optional<absl::Time> min_time;
    // Exclusive upper bound.
    std::optional<absl::Time> max_time;
    // Only paths ending with this. Empty matches everything.
    std::string suffix;
};

struct ScanSummary
{
    size_t delivered = 0;
    size_t skipped_corrupted = 0;
};

using ScanCallback = absl::FunctionRef<void(const ScannedContent&)>;

/// @brief Stream the decrypted content of every user's files, in ascending timestamp order.
///
/// The crypto of each user is built once from `crypto_factory`. Rows that fail to decrypt are
/// logged and skipped. The callback must not write to the database through `db`.
ScanSummary generate_files(SQLiteDB db,
                           const CryptoFactory& crypto_factory,
                           const ScanOptions& options,
                           ScanCallback callback);

/// @brief Same as `generate_files`, over checkpoints.
ScanSummary generate_checkpoints(SQLiteDB db,
                                 const CryptoFactory& crypto_factory,
                                 const ScanOptions& options,
                                 ScanCallback callback);
}    // namespace notestore
