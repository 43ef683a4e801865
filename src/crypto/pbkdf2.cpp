#include "vk/crypto/pbkdf2.h"

#include <algorithm>
#include <array>
#include <vector>

#include "vk/crypto/provider.h"
#include "vk/security/zeroizer.h"

namespace vk::crypto {

void PBKDF2_HMAC_SHA256(std::span<const uint8_t> password,
                        std::span<const uint8_t> salt,
                        uint32_t iterations,
                        std::span<uint8_t> output,
                        PBKDF2ProgressCallback progress) {
  iterations = std::max<uint32_t>(iterations, 1u);
  if (output.empty()) {
    return;
  }
  auto provider = GetCryptoProviderShared();

  constexpr size_t kBlockSize = 32;
  const uint32_t block_count = static_cast<uint32_t>((output.size() + kBlockSize - 1) / kBlockSize);
  const uint32_t total_work = iterations * block_count;

  std::vector<uint8_t> block(salt.begin(), salt.end());
  block.resize(salt.size() + 4u, 0);
  security::Zeroizer::ScopeWiper block_guard(std::span<uint8_t>(block.data(), block.size()));

  for (uint32_t block_index = 1; block_index <= block_count; ++block_index) {
    block[block.size() - 4] = static_cast<uint8_t>((block_index >> 24) & 0xFF);
    block[block.size() - 3] = static_cast<uint8_t>((block_index >> 16) & 0xFF);
    block[block.size() - 2] = static_cast<uint8_t>((block_index >> 8) & 0xFF);
    block[block.size() - 1] = static_cast<uint8_t>(block_index & 0xFF);

    auto u = provider->HMACSHA256(password, std::span<const uint8_t>(block.data(), block.size()));
    security::Zeroizer::ScopeWiper u_guard(std::span<uint8_t>(u.data(), u.size()));
    std::array<uint8_t, kBlockSize> accumulator = u;
    security::Zeroizer::ScopeWiper acc_guard(std::span<uint8_t>(accumulator.data(), accumulator.size()));

    const uint32_t done_before = (block_index - 1) * iterations;
    for (uint32_t i = 1; i < iterations; ++i) {
      u = provider->HMACSHA256(password, std::span<const uint8_t>(u.data(), u.size()));
      for (size_t j = 0; j < accumulator.size(); ++j) {
        accumulator[j] ^= u[j];
      }
      if (progress && ((i + 1) % 10'000 == 0)) {
        progress(done_before + i + 1, total_work);
      }
    }

    const size_t offset = static_cast<size_t>(block_index - 1) * kBlockSize;
    const size_t take = std::min(kBlockSize, output.size() - offset);
    std::copy_n(accumulator.begin(), take, output.begin() + static_cast<std::ptrdiff_t>(offset));
  }

  if (progress) {
    progress(total_work, total_work);
  }
}

}  // namespace vk::crypto
