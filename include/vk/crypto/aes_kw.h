#pragma once
#include <cstdint>
#include <span>
#include <vector>

#include "vk/security/secure_buffer.h"

namespace vk::crypto {

// AES-256 key wrap (RFC 3394). Input must be a multiple of 8 bytes and at
// least 16 bytes long; output is 8 bytes longer than the input.
struct AES256_KW {
  static constexpr size_t KEY_SIZE = 32;
  static constexpr size_t BLOCK_SIZE = 8;
  static constexpr size_t OVERHEAD = 8;
};

std::vector<uint8_t> AES256_KeyWrap(std::span<const uint8_t, AES256_KW::KEY_SIZE> kek,
                                    std::span<const uint8_t> key_data);

// Throws AuthenticationFailureError when the integrity check fails.
security::SecureBuffer<uint8_t> AES256_KeyUnwrap(std::span<const uint8_t, AES256_KW::KEY_SIZE> kek,
                                                 std::span<const uint8_t> wrapped);

} // namespace vk::crypto
