#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <span>
#include <vector>

#include "vk/error.h"

namespace vk::orchestrator {

struct AtomicReplaceHooks {
  // Test seam for crash simulation between the temp write and the rename.
  std::function<void(const std::filesystem::path&, const std::filesystem::path&)> before_rename;
};

// Replaces |target| by writing |payload| to a 0600 temporary file in the same
// directory, syncing it, renaming it into place and syncing the directory.
// On failure the previous contents of |target| are left untouched.
void AtomicReplace(const std::filesystem::path& target, std::span<const uint8_t> payload,
                   const AtomicReplaceHooks& hooks = {});

// Reads a whole file. Throws vk::Error (IO) with |missing_code| when the file
// does not exist and |read_code| on any other failure.
std::vector<uint8_t> ReadFileBytes(const std::filesystem::path& path, int missing_code,
                                   int read_code);

}  // namespace vk::orchestrator
