#pragma once

#include "core/crypto.hpp"
#include "core/records.hpp"
#include "core/sqlitehelper.hpp"

#include <string_view>

namespace notestore
{
/// @brief Pass every file and then every checkpoint of one user through `rewrite`, in one
/// transaction.
///
/// The transaction holds the database write lock, so writers of every user wait until this user
/// is done. SQLite has no row locks.
void reencrypt_user_content(SQLiteDB db, std::string_view user_id, ContentRewriter rewrite);

/// @brief Move all content of a user to `new_crypto`.
///
/// Rows that the new crypto opens already are left untouched. The others are decrypted with the
/// old crypto and encrypted with the new one. A rerun after a partial or complete run therefore
/// neither fails nor changes anything it need not. Throws `std::invalid_argument` before touching
/// anything if `new_crypto` writes plaintext.
void reencrypt_user(SQLiteDB db,
                    std::string_view user_id,
                    const Crypto& old_crypto,
                    const Crypto& new_crypto);

/// @brief Store all content of a user as plaintext.
///
/// Rows the old crypto cannot open are taken to be plaintext already and are kept. Throws
/// `std::invalid_argument` if `old_crypto` is no encryption at all.
void unencrypt_user(SQLiteDB db, std::string_view user_id, const Crypto& old_crypto);

void reencrypt_all_users(SQLiteDB db,
                         const CryptoFactory& old_crypto_factory,
                         const CryptoFactory& new_crypto_factory);
void unencrypt_all_users(SQLiteDB db, const CryptoFactory& old_crypto_factory);

/// @brief Whether the crypto stores content unchanged.
bool writes_plaintext(const Crypto& crypto);
}    // namespace notestore
