#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

#include "vk/core/info_file.h"
#include "vk/orchestrator/event_bus.h"

namespace vk::orchestrator {

inline constexpr uint32_t kMinPbkdf2Iterations = 1000;
inline constexpr uint32_t kMaxPbkdf2Iterations = 10'000'000;
inline constexpr uint32_t kDefaultPbkdf2Iterations = 600000;
inline constexpr uint32_t kMinArgon2MemoryKib = 8;
inline constexpr uint32_t kMaxArgon2Parallelism = 16;

struct RuntimeConfig {
  std::filesystem::path home;
  std::filesystem::path keyring_dir;
  core::KdfParams kdf;
  std::optional<std::filesystem::path> log_file;
  EventSeverity log_level{EventSeverity::kInfo};
};

// Returns the value of an environment variable, or nullopt when unset.
using EnvLookup = std::function<std::optional<std::string>(std::string_view)>;

std::optional<std::string> ProcessEnvironment(std::string_view name);

// Reads VK_* variables. Throws vk::Error (Config) on malformed or out-of-range
// values and (Dependency) when argon2id is requested without Argon2 support.
RuntimeConfig LoadRuntimeConfig(const EnvLookup& lookup = ProcessEnvironment);

// Parses a decimal value for |name| within [min, max].
uint32_t ParseBoundedU32(std::string_view name, std::string_view text, uint32_t min, uint32_t max);

// Selects the algorithm while keeping the configured costs.
void ApplyKdfAlgorithm(core::KdfParams& kdf, std::string_view name);

}  // namespace vk::orchestrator
