#include "core/content_scan.hpp"
#include "core/api_path.hpp"
#include "core/exceptions.hpp"
#include "core/utilities.hpp"

#include <absl/container/flat_hash_map.h>
#include <absl/log/log.h>

#include <limits>

namespace notestore
{
namespace
{
    // Columns: id, user_id, full database path, timestamp, content.
    ScanSummary scan(SQLiteDB db,
                     const char* sql,
                     const CryptoFactory& crypto_factory,
                     const ScanOptions& options,
                     ScanCallback callback)
    {
        auto st = db.statement(sql);
        // Missing bounds bind the int64 extremes. No row is stamped with INT64_MAX.
        st.bind_int(1,
                    options.min_time ? to_db_time(*options.min_time)
                                     : std::numeric_limits<int64_t>::min());
        st.bind_int(2,
                    options.max_time ? to_db_time(*options.max_time)
                                     : std::numeric_limits<int64_t>::max());
        st.bind_text(3, options.suffix);

        absl::flat_hash_map<std::string, Crypto> cryptos;
        ScanSummary summary;
        while (st.step())
        {
            ScannedContent item;
            item.id = st.get_int(0);
            item.user_id = st.get_text(1);
            item.path = to_api_path(st.get_text(2));
            item.last_modified = from_db_time(st.get_int(3));

            auto it = cryptos.find(item.user_id);
            if (it == cryptos.end())
            {
                it = cryptos.emplace(item.user_id, crypto_factory(item.user_id)).first;
            }
            try
            {
                item.content = decrypt(it->second, st.get_blob(4));
            }
            catch (const CorruptedFile& e)
            {
                LOG(WARNING) << "Skipping row " << item.id << " of user " << item.user_id
                             << " at " << item.path << ": " << e.what();
                ++summary.skipped_corrupted;
                continue;
            }
            callback(item);
            ++summary.delivered;
        }
        return summary;
    }
}    // namespace

ScanSummary generate_files(SQLiteDB db,
                           const CryptoFactory& crypto_factory,
                           const ScanOptions& options,
                           ScanCallback callback)
{
    return scan(std::move(db),
                R"(
                    select id, user_id, parent_name || name, created_at, content from files
                        where created_at >= ?1 and created_at < ?2
                            and (?3 = '' or substr(parent_name || name, -length(?3)) = ?3)
                        order by created_at, id;
                )",
                crypto_factory,
                options,
                callback);
}

ScanSummary generate_checkpoints(SQLiteDB db,
                                 const CryptoFactory& crypto_factory,
                                 const ScanOptions& options,
                                 ScanCallback callback)
{
    return scan(std::move(db),
                R"(
                    select id, user_id, path, last_modified, content from remote_checkpoints
                        where last_modified >= ?1 and last_modified < ?2
                            and (?3 = '' or substr(path, -length(?3)) = ?3)
                        order by last_modified, id;
                )",
                crypto_factory,
                options,
                callback);
}
}    // namespace notestore
