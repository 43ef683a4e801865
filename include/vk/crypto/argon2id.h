#pragma once

#include <cstdint>
#include <span>

namespace vk::crypto {

struct Argon2Params {
  uint32_t memory_kib{65536};
  uint32_t time_cost{3};
  uint32_t parallelism{1};
};

bool Argon2idAvailable() noexcept;

// Argon2id (RFC 9106, version 0x13). Throws vk::Error in the Dependency domain
// when the build has no Argon2 support, Crypto on library failure.
void Argon2idDerive(std::span<const uint8_t> password,
                    std::span<const uint8_t> salt,
                    const Argon2Params& params,
                    std::span<uint8_t> output);

}  // namespace vk::crypto
