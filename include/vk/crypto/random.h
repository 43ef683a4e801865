#pragma once

#include <cstdint>
#include <span>

namespace vk::crypto {

// Fills |out| from the operating system CSPRNG. Throws vk::Error (Crypto) when
// no entropy source is usable.
void SystemRandomBytes(std::span<uint8_t> out);

}  // namespace vk::crypto
