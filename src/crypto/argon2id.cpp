#include "vk/crypto/argon2id.h"

#include <string>

#if defined(VK_HAVE_ARGON2) && VK_HAVE_ARGON2
#include <argon2.h>
#endif

#include "vk/error.h"
#include "vk/errors.h"

namespace vk::crypto {

bool Argon2idAvailable() noexcept {
#if defined(VK_HAVE_ARGON2) && VK_HAVE_ARGON2
  return true;
#else
  return false;
#endif
}

void Argon2idDerive(std::span<const uint8_t> password,
                    std::span<const uint8_t> salt,
                    const Argon2Params& params,
                    std::span<uint8_t> output) {
#if defined(VK_HAVE_ARGON2) && VK_HAVE_ARGON2
  if (output.size() < 4) {
    throw vk::Error{vk::ErrorDomain::Validation, 0,
                    std::string(vk::errors::msg::kUnsupportedArgon2HashLength)};
  }
  int rc = argon2id_hash_raw(params.time_cost, params.memory_kib, params.parallelism,
                             password.data(), password.size(), salt.data(), salt.size(),
                             output.data(), output.size());
  if (rc != ARGON2_OK) {
    throw vk::Error{vk::ErrorDomain::Crypto, rc,
                    std::string(vk::errors::msg::kArgon2DerivationFailed) + ": " +
                        argon2_error_message(rc)};
  }
#else
  (void)password;
  (void)salt;
  (void)params;
  (void)output;
  throw vk::Error{vk::ErrorDomain::Dependency, vk::errors::dependency::kArgon2Unavailable,
                  std::string(vk::errors::msg::kArgon2Unavailable)};
#endif
}

}  // namespace vk::crypto
