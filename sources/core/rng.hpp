#pragma once

#include <cstddef>

namespace notestore
{
void generate_random(void* buffer, size_t size);
}    // namespace notestore
