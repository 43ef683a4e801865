#pragma once

#include <array>
#include <cstdint>
#include <span>

namespace vk::crypto {

std::array<uint8_t, 32> HKDF_SHA256(std::span<const uint8_t> ikm,
                                    std::span<const uint8_t> salt,
                                    std::span<const uint8_t> info);

}  // namespace vk::crypto
