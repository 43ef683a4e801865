#pragma once

#include <array>
#include <cstdint>
#include <filesystem>
#include <span>
#include <vector>

#include "vk/core/info_file.h"

namespace vk::core {

inline constexpr std::array<uint8_t, 4> kInfoFileMagic{'V', 'K', 'I', 'F'};
inline constexpr const char* kDefaultInfoFileName = "vaultkey.info";

// "VKIF" followed by TLV records. Entries are written in list order.
std::vector<uint8_t> EncodeInfoFile(const InfoFile& info);
// Throws vk::Error (Validation) on bad magic, truncation, unknown or repeated
// singleton records and out-of-range field sizes.
InfoFile DecodeInfoFile(std::span<const uint8_t> bytes);

InfoFile LoadInfoFile(const std::filesystem::path& path);
void SaveInfoFile(const std::filesystem::path& path, const InfoFile& info);

}  // namespace vk::core
