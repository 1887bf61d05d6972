#pragma once

#include "core/crypto.hpp"
#include "protos/cmdline.pb.h"

#include <absl/time/time.h>

#include <optional>
#include <string_view>

namespace notestore
{
int real_main(int argc, char** argv);

/// @brief The per user crypto described by the crypto options.
///
/// No password means no encryption. With `allow_unencrypted`, plaintext is accepted on read after
/// every password failed.
CryptoFactory make_crypto_factory(const CryptoParams& params);

/// @brief The crypto content currently stored under, as given to `reencrypt`.
///
/// Throws `std::invalid_argument` if the command names neither an old password nor plaintext.
CryptoFactory make_old_crypto_factory(const ReencryptCmd& cmd);

/// @brief Empty means unbounded. Throws `std::invalid_argument` on anything but RFC 3339.
std::optional<absl::Time> parse_time_option(std::string_view value);
}    // namespace notestore
