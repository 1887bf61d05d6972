#pragma once

#include <absl/functional/function_ref.h>

#include <array>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace notestore
{
using EncryptFunc = absl::FunctionRef<std::string(std::string_view)>;
using DecryptFunc = absl::FunctionRef<std::string(std::string_view)>;

/// @brief Stores content as is.
class NoEncryption
{
public:
    std::string encrypt(std::string_view plaintext) const { return std::string(plaintext); }
    std::string decrypt(std::string_view ciphertext) const { return std::string(ciphertext); }
};

/// @brief AES-256-GCM with a fresh random IV per message.
///
/// The stored layout is `iv || ciphertext || mac`.
class AesGcmEncryption
{
public:
    static constexpr size_t KEY_SIZE = 32, IV_SIZE = 12, MAC_SIZE = 16,
                            OVERHEAD = IV_SIZE + MAC_SIZE;
    using Key = std::array<unsigned char, KEY_SIZE>;

    explicit AesGcmEncryption(const Key& key) : key_(key) {}

    std::string encrypt(std::string_view plaintext) const;

    /// @brief Throws `CorruptedFile` if the input fails authentication.
    std::string decrypt(std::string_view ciphertext) const;

private:
    Key key_;
};

class FallbackEncryption;

using Crypto = std::variant<NoEncryption, AesGcmEncryption, FallbackEncryption>;

/// @brief Encrypts with the first crypto, decrypts with the first one that succeeds.
///
/// Used for key rotation. `NoEncryption` accepts any input, so it may only appear last.
class FallbackEncryption
{
public:
    /// @brief Throws `std::invalid_argument` if the list is empty or has a `NoEncryption` anywhere
    /// but last.
    explicit FallbackEncryption(std::vector<Crypto> cryptos);
    FallbackEncryption(const FallbackEncryption&);
    FallbackEncryption(FallbackEncryption&&) noexcept;
    FallbackEncryption& operator=(const FallbackEncryption&);
    FallbackEncryption& operator=(FallbackEncryption&&) noexcept;
    ~FallbackEncryption();

    std::string encrypt(std::string_view plaintext) const;
    std::string decrypt(std::string_view ciphertext) const;

    const std::vector<Crypto>& cryptos() const noexcept { return cryptos_; }

private:
    std::vector<Crypto> cryptos_;
};

std::string encrypt(const Crypto& crypto, std::string_view plaintext);
std::string decrypt(const Crypto& crypto, std::string_view ciphertext);

inline bool is_no_encryption(const Crypto& crypto)
{
    return std::holds_alternative<NoEncryption>(crypto);
}

/// @brief PBKDF2-HMAC-SHA256 of `password`, salted with the user id, 100000 rounds.
AesGcmEncryption::Key derive_single_key(std::string_view password, std::string_view user_id);

/// @brief `derive_single_key` over a list. Missing passwords are forwarded as missing keys.
std::vector<std::optional<AesGcmEncryption::Key>>
derive_fallback_keys(const std::vector<std::optional<std::string>>& passwords,
                     std::string_view user_id);

/// @brief Builds the crypto of one user from the user id.
using CryptoFactory = std::function<Crypto(std::string_view)>;

CryptoFactory no_password_crypto_factory();
CryptoFactory single_password_crypto_factory(std::string password);

/// @brief A factory of `FallbackEncryption` over one key per password. A missing password stands
/// for `NoEncryption` and may only appear last.
CryptoFactory fallback_password_crypto_factory(std::vector<std::optional<std::string>> passwords);
}    // namespace notestore
