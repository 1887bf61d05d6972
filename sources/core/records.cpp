#include "core/records.hpp"
#include "core/api_path.hpp"
#include "core/exceptions.hpp"

#include <absl/strings/str_cat.h>

namespace notestore
{
std::string FileRecord::api_path() const { return to_api_path(absl::StrCat(parent_name, name)); }

std::string preprocess_incoming_content(std::string_view content,
                                        EncryptFunc encrypt,
                                        uint64_t max_size_bytes,
                                        std::string_view api_path)
{
    std::string encrypted = encrypt(content);
    if (max_size_bytes != kUnlimitedSize && encrypted.size() > max_size_bytes)
    {
        throw FileTooLarge(api_path);
    }
    return encrypted;
}
}    // namespace notestore
