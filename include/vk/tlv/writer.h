#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <utility>
#include <vector>

namespace vk::tlv {

// Appends records in the layout tlv::Parser reads back. Throws vk::Error
// (Validation) when a value exceeds the 16-bit length field.
class Writer {
 public:
  void Add(uint16_t type, std::span<const uint8_t> value);
  void AddString(uint16_t type, std::string_view value);
  void AddU8(uint16_t type, uint8_t value);
  void AddU32(uint16_t type, uint32_t value);

  [[nodiscard]] const std::vector<uint8_t>& bytes() const noexcept { return buffer_; }
  [[nodiscard]] std::vector<uint8_t> Take() noexcept { return std::move(buffer_); }

 private:
  std::vector<uint8_t> buffer_;
};

}  // namespace vk::tlv
