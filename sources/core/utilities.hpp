#pragma once

#include <absl/time/time.h>
#include <absl/types/span.h>

#include <cstdint>
#include <exception>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace notestore
{
using ConstByteBuffer = absl::Span<const unsigned char>;

std::string hexify(ConstByteBuffer buffer);

template <typename Resource, typename ResourceTraits>
class RAII
{
private:
    Resource r_;

public:
    explicit RAII(Resource r) noexcept : r_(r)
    {
        static_assert(std::is_trivially_copyable_v<Resource>);
    }

    RAII() noexcept : r_(ResourceTraits::invalid()) {}

    ~RAII()
    {
        if (r_ != ResourceTraits::invalid())
        {
            ResourceTraits::cleanup(r_);
        }
    }

    RAII(RAII&& other) noexcept : r_(other.r_) { other.r_ = ResourceTraits::invalid(); }

    RAII& operator=(RAII&& other) noexcept
    {
        std::swap(r_, other.r_);
        return *this;
    }

    Resource& get() noexcept { return r_; }

    const Resource& get() const noexcept { return r_; }

    Resource release() noexcept
    {
        Resource r = r_;
        r_ = ResourceTraits::invalid();
        return r;
    }
};

std::string random_hex_string(size_t num_bytes);

/// @brief Whether `text` is a well formed UTF-8 sequence.
bool is_valid_utf8(std::string_view text) noexcept;

void warn_on_rollback_error(const std::exception& e) noexcept;

// Timestamps are stored as integer microseconds since the Unix epoch.
inline int64_t to_db_time(absl::Time t) { return absl::ToUnixMicros(t); }
inline absl::Time from_db_time(int64_t micros) { return absl::FromUnixMicros(micros); }
}    // namespace notestore
