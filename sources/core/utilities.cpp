#include "utilities.hpp"
#include "rng.hpp"

#include <absl/log/log.h>
#include <absl/strings/escaping.h>
#include <absl/strings/str_format.h>
#include <utf8proc.h>

#include <typeinfo>
#include <vector>

namespace notestore
{
std::string hexify(ConstByteBuffer buffer)
{
    return absl::BytesToHexString({reinterpret_cast<const char*>(buffer.data()), buffer.size()});
}

std::string random_hex_string(size_t num_bytes)
{
    std::vector<unsigned char> bytes(num_bytes);
    generate_random(bytes.data(), bytes.size());
    return hexify(absl::MakeConstSpan(bytes));
}

bool is_valid_utf8(std::string_view text) noexcept
{
    auto data = reinterpret_cast<const utf8proc_uint8_t*>(text.data());
    auto remaining = static_cast<utf8proc_ssize_t>(text.size());
    while (remaining > 0)
    {
        utf8proc_int32_t codepoint = 0;
        auto consumed = utf8proc_iterate(data, remaining, &codepoint);
        if (consumed <= 0 || codepoint < 0)
        {
            return false;
        }
        data += consumed;
        remaining -= consumed;
    }
    return true;
}

void warn_on_rollback_error(const std::exception& e) noexcept
{
    LOG(WARNING) << absl::StreamFormat(
        "Exception encountered in rollback operation (%s): %s", typeid(e).name(), e.what());
}

}    // namespace notestore
