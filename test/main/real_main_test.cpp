#include "main/real_main.hpp"
#include "core/exceptions.hpp"
#include "core/reencryption.hpp"

#include <doctest/doctest.h>

#include <stdexcept>
#include <variant>

namespace notestore
{
TEST_CASE("Parse time options")
{
    CHECK(!parse_time_option(""));
    auto parsed = parse_time_option("2024-01-02T03:04:05Z");
    REQUIRE(parsed);
    CHECK(*parsed == absl::FromUnixSeconds(1704164645));
    CHECK(*parse_time_option("2024-01-02T04:04:05.5+01:00")
          == absl::FromUnixSeconds(1704164645) + absl::Milliseconds(500));
    CHECK_THROWS_AS(parse_time_option("yesterday"), std::invalid_argument);
    CHECK_THROWS_AS(parse_time_option("2024-01-02"), std::invalid_argument);
}

TEST_CASE("Crypto from command line options")
{
    CryptoParams params;
    CHECK(is_no_encryption(make_crypto_factory(params)("alice")));

    params.add_passwords("new");
    params.add_passwords("old");
    auto strict = make_crypto_factory(params)("alice");
    auto old_only = AesGcmEncryption(derive_single_key("old", "alice"));
    CHECK(decrypt(strict, old_only.encrypt("hello")) == "hello");
    CHECK_THROWS_AS(decrypt(strict, "plaintext"), CorruptedFile);

    params.set_allow_unencrypted(true);
    auto lenient = make_crypto_factory(params)("alice");
    CHECK(decrypt(lenient, "plaintext") == "plaintext");
    CHECK(!writes_plaintext(lenient));
    CHECK(std::get<FallbackEncryption>(lenient).cryptos().size() == 3);
}

TEST_CASE("Old crypto of a rotation")
{
    ReencryptCmd cmd;
    CHECK_THROWS_AS(make_old_crypto_factory(cmd), std::invalid_argument);

    cmd.set_old_unencrypted(true);
    CHECK(writes_plaintext(make_old_crypto_factory(cmd)("alice")));

    cmd.add_old_passwords("old");
    auto crypto = make_old_crypto_factory(cmd)("alice");
    CHECK(!writes_plaintext(crypto));
    CHECK(decrypt(crypto, "plaintext") == "plaintext");
    CHECK(decrypt(crypto, encrypt(crypto, "secret")) == "secret");
}
}    // namespace notestore
