#include "vk/orchestrator/config.h"

#include <charconv>
#include <cstdlib>
#include <limits>
#include <string>

#include "vk/crypto/argon2id.h"
#include "vk/error.h"
#include "vk/errors.h"

namespace vk::orchestrator {
namespace {

[[noreturn]] void ThrowConfigError(std::string_view name, std::string_view text, std::string_view reason) {
  throw Error{ErrorDomain::Config, errors::config::kInvalidValue,
              std::string(name) + "=" + std::string(text) + ": " + std::string(reason)};
}

std::filesystem::path DefaultHome(const EnvLookup& lookup) {
  if (auto home = lookup("HOME"); home && !home->empty()) {
    return std::filesystem::path(*home) / ".vaultkey";
  }
  return std::filesystem::path(".vaultkey");
}

}  // namespace

std::optional<std::string> ProcessEnvironment(std::string_view name) {
  const std::string key(name);
  if (const char* value = std::getenv(key.c_str()); value != nullptr) {
    return std::string(value);
  }
  return std::nullopt;
}

uint32_t ParseBoundedU32(std::string_view name, std::string_view text, uint32_t min, uint32_t max) {
  uint64_t parsed = 0;
  const auto* begin = text.data();
  const auto* end = text.data() + text.size();
  auto [ptr, ec] = std::from_chars(begin, end, parsed);
  if (text.empty() || ec != std::errc{} || ptr != end) {
    ThrowConfigError(name, text, "expected a decimal number");
  }
  if (parsed < min || parsed > max) {
    ThrowConfigError(name, text,
                     "must be between " + std::to_string(min) + " and " + std::to_string(max));
  }
  return static_cast<uint32_t>(parsed);
}

void ApplyKdfAlgorithm(core::KdfParams& kdf, std::string_view name) {
  const auto algorithm = core::ParseKdfAlgorithm(name);
  if (!algorithm) {
    ThrowConfigError("VK_KDF", name, errors::msg::kUnknownKdfAlgorithm);
  }
  if (*algorithm == core::KdfAlgorithm::kArgon2id && !crypto::Argon2idAvailable()) {
    throw Error{ErrorDomain::Dependency, errors::dependency::kArgon2Unavailable,
                std::string(errors::msg::kArgon2Unavailable)};
  }
  kdf.algorithm = *algorithm;
}

RuntimeConfig LoadRuntimeConfig(const EnvLookup& lookup) {
  RuntimeConfig config;
  if (auto home = lookup("VK_HOME"); home && !home->empty()) {
    config.home = *home;
  } else {
    config.home = DefaultHome(lookup);
  }
  if (auto keyring = lookup("VK_KEYRING_DIR"); keyring && !keyring->empty()) {
    config.keyring_dir = *keyring;
  } else {
    config.keyring_dir = config.home / "keyring";
  }

  config.kdf.algorithm =
      crypto::Argon2idAvailable() ? core::KdfAlgorithm::kArgon2id : core::KdfAlgorithm::kPbkdf2;
  config.kdf.pbkdf2_iterations = kDefaultPbkdf2Iterations;
  if (auto kdf = lookup("VK_KDF"); kdf && !kdf->empty()) {
    ApplyKdfAlgorithm(config.kdf, *kdf);
  }
  if (auto value = lookup("VK_PBKDF2_ITERATIONS"); value) {
    config.kdf.pbkdf2_iterations = ParseBoundedU32("VK_PBKDF2_ITERATIONS", *value,
                                                   kMinPbkdf2Iterations, kMaxPbkdf2Iterations);
  }
  if (auto value = lookup("VK_ARGON2_MEMORY_KIB"); value) {
    config.kdf.argon2.memory_kib = ParseBoundedU32("VK_ARGON2_MEMORY_KIB", *value, kMinArgon2MemoryKib,
                                                   std::numeric_limits<uint32_t>::max());
  }
  if (auto value = lookup("VK_ARGON2_TIME_COST"); value) {
    config.kdf.argon2.time_cost =
        ParseBoundedU32("VK_ARGON2_TIME_COST", *value, 1, std::numeric_limits<uint32_t>::max());
  }
  if (auto value = lookup("VK_ARGON2_PARALLELISM"); value) {
    config.kdf.argon2.parallelism =
        ParseBoundedU32("VK_ARGON2_PARALLELISM", *value, 1, kMaxArgon2Parallelism);
  }

  if (auto log_file = lookup("VK_LOG_FILE"); log_file && !log_file->empty()) {
    config.log_file = std::filesystem::path(*log_file);
  }
  if (auto level = lookup("VK_LOG_LEVEL"); level && !level->empty()) {
    const auto parsed = ParseSeverity(*level);
    if (!parsed) {
      ThrowConfigError("VK_LOG_LEVEL", *level, "expected debug, info, warning, error or critical");
    }
    config.log_level = *parsed;
  }
  return config;
}

}  // namespace vk::orchestrator
