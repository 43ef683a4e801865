#pragma once

#include <cstdint>
#include <functional>
#include <span>

namespace vk::crypto {

using PBKDF2ProgressCallback = std::function<void(uint32_t current, uint32_t total)>;

// RFC 8018 PBKDF2 with HMAC-SHA256. |output| may be any length; every 32-byte
// block costs |iterations| HMAC invocations.
void PBKDF2_HMAC_SHA256(std::span<const uint8_t> password,
                        std::span<const uint8_t> salt,
                        uint32_t iterations,
                        std::span<uint8_t> output,
                        PBKDF2ProgressCallback progress = {});

}  // namespace vk::crypto
