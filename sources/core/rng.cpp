#include "core/rng.hpp"

#include <cryptopp/osrng.h>

namespace notestore
{
void generate_random(void* buffer, size_t size)
{
    // One pool per thread, so concurrent savers never contend on it.
    static thread_local CryptoPP::AutoSeededRandomPool rng;
    rng.GenerateBlock(static_cast<CryptoPP::byte*>(buffer), size);
}
}    // namespace notestore
