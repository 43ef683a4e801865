#pragma once
#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <span>

namespace vk::crypto::ct {

template <size_t N>
inline bool CompareEqual(const std::array<uint8_t, N>& a,
                         const std::array<uint8_t, N>& b) noexcept {
  volatile uint8_t diff = 0;
  for (size_t i = 0; i < N; ++i)
    diff |= (a[i] ^ b[i]);
  return diff == 0;
}

// Length is not secret; contents are compared without early exit.
inline bool CompareEqual(std::span<const uint8_t> a, std::span<const uint8_t> b) noexcept {
  if (a.size() != b.size()) {
    return false;
  }
  volatile uint8_t diff = 0;
  for (size_t i = 0; i < a.size(); ++i)
    diff |= (a[i] ^ b[i]);
  std::atomic_signal_fence(std::memory_order_seq_cst);
  return diff == 0;
}

} // namespace vk::crypto::ct
