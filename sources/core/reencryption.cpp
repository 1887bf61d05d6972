#include "core/reencryption.hpp"
#include "core/checkpoint_store.hpp"
#include "core/exceptions.hpp"
#include "core/file_store.hpp"
#include "core/user_store.hpp"

#include <absl/log/log.h>

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace notestore
{
namespace
{
    // The member of a fallback chain that `encrypt` goes through.
    const Crypto& writing_crypto(const Crypto& crypto)
    {
        if (auto fallback = std::get_if<FallbackEncryption>(&crypto))
        {
            return writing_crypto(fallback->cryptos().front());
        }
        return crypto;
    }
}    // namespace

bool writes_plaintext(const Crypto& crypto) { return is_no_encryption(writing_crypto(crypto)); }

void reencrypt_user_content(SQLiteDB db, std::string_view user_id, ContentRewriter rewrite)
{
    LOG(INFO) << "Begin re-encryption for user " << user_id;
    with_transaction(
        db,
        [&]()
        {
            // Checkpoints are always written from content passed in by the application, never
            // copied from the files table inside the database. That is what makes one transaction
            // for both tables correct. Were checkpoints ever copied in the database, the files
            // would have to be committed first, or a checkpoint copied from a file not yet
            // migrated could be missed here.
            FileStore files(db);
            LOG(INFO) << "Re-encrypting files for " << user_id;
            for (int64_t id : files.select_file_ids(user_id))
            {
                if (files.rewrite_content(id, rewrite))
                    LOG(INFO) << "Done encrypting files row " << id;
                else
                    LOG(INFO) << "Files row " << id << " is up to date";
            }

            CheckpointStore checkpoints(db);
            LOG(INFO) << "Re-encrypting checkpoints for " << user_id;
            for (int64_t id : checkpoints.select_checkpoint_ids(user_id))
            {
                if (checkpoints.rewrite_content(id, rewrite))
                    LOG(INFO) << "Done encrypting remote_checkpoints row " << id;
                else
                    LOG(INFO) << "Remote_checkpoints row " << id << " is up to date";
            }
        });
    LOG(INFO) << "Finished re-encryption for user " << user_id;
}

void reencrypt_user(SQLiteDB db,
                    std::string_view user_id,
                    const Crypto& old_crypto,
                    const Crypto& new_crypto)
{
    if (writes_plaintext(new_crypto))
    {
        throw std::invalid_argument(
            "Cannot re-encrypt to a crypto that stores plaintext; unencrypt instead");
    }
    reencrypt_user_content(std::move(db),
                           user_id,
                           [&](std::string_view stored) -> std::optional<std::string>
                           {
                               try
                               {
                                   decrypt(writing_crypto(new_crypto), stored);
                                   // Migrated by an earlier run.
                                   return std::nullopt;
                               }
                               catch (const CorruptedFile&)
                               {
                                   // Not under the new key yet.
                               }
                               std::string plaintext;
                               try
                               {
                                   plaintext = decrypt(new_crypto, stored);
                               }
                               catch (const CorruptedFile&)
                               {
                                   plaintext = decrypt(old_crypto, stored);
                               }
                               return encrypt(new_crypto, plaintext);
                           });
}

void unencrypt_user(SQLiteDB db, std::string_view user_id, const Crypto& old_crypto)
{
    if (is_no_encryption(old_crypto))
    {
        throw std::invalid_argument("Content stored without encryption needs no unencrypt");
    }
    reencrypt_user_content(std::move(db),
                           user_id,
                           [&](std::string_view stored) -> std::optional<std::string>
                           {
                               try
                               {
                                   return decrypt(old_crypto, stored);
                               }
                               catch (const CorruptedFile&)
                               {
                                   // Plaintext left by an earlier partial run.
                                   return std::nullopt;
                               }
                           });
}

void reencrypt_all_users(SQLiteDB db,
                         const CryptoFactory& old_crypto_factory,
                         const CryptoFactory& new_crypto_factory)
{
    std::vector<std::string> users = UserStore(db).list_users();
    for (const auto& user_id : users)
    {
        reencrypt_user(db, user_id, old_crypto_factory(user_id), new_crypto_factory(user_id));
    }
    LOG(INFO) << "Re-encrypted " << users.size() << " users";
}

void unencrypt_all_users(SQLiteDB db, const CryptoFactory& old_crypto_factory)
{
    std::vector<std::string> users = UserStore(db).list_users();
    for (const auto& user_id : users)
    {
        unencrypt_user(db, user_id, old_crypto_factory(user_id));
    }
    LOG(INFO) << "Unencrypted " << users.size() << " users";
}
}    // namespace notestore
