#include "core/crypto.hpp"
#include "core/exceptions.hpp"
#include "core/rng.hpp"

#include <cryptopp/aes.h>
#include <cryptopp/gcm.h>
#include <cryptopp/pwdbased.h>
#include <cryptopp/sha.h>
#include <fmt/format.h>
#include <fmt/ranges.h>

#include <stdexcept>

namespace notestore
{
namespace
{
    constexpr unsigned kKeyDerivationRounds = 100000;

    const unsigned char* as_uchar(std::string_view view)
    {
        return reinterpret_cast<const unsigned char*>(view.data());
    }
}    // namespace

std::string AesGcmEncryption::encrypt(std::string_view plaintext) const
{
    std::string result(plaintext.size() + OVERHEAD, '\0');
    auto iv = reinterpret_cast<unsigned char*>(result.data());
    auto ciphertext = iv + IV_SIZE;
    auto mac = ciphertext + plaintext.size();

    generate_random(iv, IV_SIZE);

    CryptoPP::GCM<CryptoPP::AES>::Encryption enc;
    enc.SetKeyWithIV(key_.data(), key_.size(), iv, IV_SIZE);
    enc.EncryptAndAuthenticate(
        ciphertext, mac, MAC_SIZE, iv, IV_SIZE, nullptr, 0, as_uchar(plaintext), plaintext.size());
    return result;
}

std::string AesGcmEncryption::decrypt(std::string_view ciphertext) const
{
    if (ciphertext.size() < OVERHEAD)
    {
        throw CorruptedFile(
            fmt::format("ciphertext of {} bytes is shorter than the {} bytes overhead",
                        ciphertext.size(),
                        OVERHEAD));
    }
    auto iv = as_uchar(ciphertext);
    auto body = iv + IV_SIZE;
    auto body_size = ciphertext.size() - OVERHEAD;
    auto mac = body + body_size;

    std::string result(body_size, '\0');
    CryptoPP::GCM<CryptoPP::AES>::Decryption dec;
    dec.SetKeyWithIV(key_.data(), key_.size(), iv, IV_SIZE);
    bool success = dec.DecryptAndVerify(reinterpret_cast<unsigned char*>(result.data()),
                                        mac,
                                        MAC_SIZE,
                                        iv,
                                        IV_SIZE,
                                        nullptr,
                                        0,
                                        body,
                                        body_size);
    if (!success)
    {
        throw CorruptedFile("message authentication failed");
    }
    return result;
}

FallbackEncryption::FallbackEncryption(std::vector<Crypto> cryptos) : cryptos_(std::move(cryptos))
{
    if (cryptos_.empty())
    {
        throw std::invalid_argument("FallbackEncryption needs at least one crypto");
    }
    for (size_t i = 0; i + 1 < cryptos_.size(); ++i)
    {
        if (is_no_encryption(cryptos_[i]))
        {
            throw std::invalid_argument("NoEncryption is only supported as the last fallback");
        }
    }
}

FallbackEncryption::FallbackEncryption(const FallbackEncryption&) = default;
FallbackEncryption::FallbackEncryption(FallbackEncryption&&) noexcept = default;
FallbackEncryption& FallbackEncryption::operator=(const FallbackEncryption&) = default;
FallbackEncryption& FallbackEncryption::operator=(FallbackEncryption&&) noexcept = default;
FallbackEncryption::~FallbackEncryption() = default;

std::string FallbackEncryption::encrypt(std::string_view plaintext) const
{
    return notestore::encrypt(cryptos_.front(), plaintext);
}

std::string FallbackEncryption::decrypt(std::string_view ciphertext) const
{
    std::vector<std::string> errors;
    for (const Crypto& c : cryptos_)
    {
        try
        {
            return notestore::decrypt(c, ciphertext);
        }
        catch (const CorruptedFile& e)
        {
            errors.emplace_back(e.what());
        }
    }
    throw CorruptedFile(
        fmt::format("none of the {} keys works ({})", cryptos_.size(), fmt::join(errors, "; ")));
}

std::string encrypt(const Crypto& crypto, std::string_view plaintext)
{
    return std::visit([&](const auto& c) { return c.encrypt(plaintext); }, crypto);
}

std::string decrypt(const Crypto& crypto, std::string_view ciphertext)
{
    return std::visit([&](const auto& c) { return c.decrypt(ciphertext); }, crypto);
}

AesGcmEncryption::Key derive_single_key(std::string_view password, std::string_view user_id)
{
    AesGcmEncryption::Key key{};
    CryptoPP::PKCS5_PBKDF2_HMAC<CryptoPP::SHA256> kdf;
    kdf.DeriveKey(key.data(),
                  key.size(),
                  0,
                  as_uchar(password),
                  password.size(),
                  as_uchar(user_id),
                  user_id.size(),
                  kKeyDerivationRounds,
                  0.0);
    return key;
}

std::vector<std::optional<AesGcmEncryption::Key>>
derive_fallback_keys(const std::vector<std::optional<std::string>>& passwords,
                     std::string_view user_id)
{
    std::vector<std::optional<AesGcmEncryption::Key>> keys;
    keys.reserve(passwords.size());
    for (const auto& password : passwords)
    {
        if (password)
        {
            keys.emplace_back(derive_single_key(*password, user_id));
        }
        else
        {
            keys.emplace_back(std::nullopt);
        }
    }
    return keys;
}

CryptoFactory no_password_crypto_factory()
{
    return [](std::string_view) -> Crypto { return NoEncryption(); };
}

CryptoFactory single_password_crypto_factory(std::string password)
{
    return [password = std::move(password)](std::string_view user_id) -> Crypto
    { return AesGcmEncryption(derive_single_key(password, user_id)); };
}

CryptoFactory fallback_password_crypto_factory(std::vector<std::optional<std::string>> passwords)
{
    // Checked eagerly, so that a bad list fails before any user is touched.
    if (passwords.empty())
    {
        throw std::invalid_argument("FallbackEncryption needs at least one crypto");
    }
    for (size_t i = 0; i + 1 < passwords.size(); ++i)
    {
        if (!passwords[i])
        {
            throw std::invalid_argument("NoEncryption is only supported as the last fallback");
        }
    }
    return [passwords = std::move(passwords)](std::string_view user_id) -> Crypto
    {
        std::vector<Crypto> cryptos;
        for (auto& key : derive_fallback_keys(passwords, user_id))
        {
            if (key)
            {
                cryptos.emplace_back(AesGcmEncryption(*key));
            }
            else
            {
                cryptos.emplace_back(NoEncryption());
            }
        }
        return FallbackEncryption(std::move(cryptos));
    };
}
}    // namespace notestore
