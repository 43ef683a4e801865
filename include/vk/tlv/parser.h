#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace vk::tlv {

struct Record {
  uint16_t type{0};
  std::span<const uint8_t> value{};
};

// Splits a buffer of little-endian (u16 type, u16 length, value) records.
// valid() is false when a record is truncated, exceeds |max_payload|, the
// record count exceeds |max_records|, or trailing bytes remain.
class Parser {
 public:
  Parser(std::span<const uint8_t> buffer, std::size_t max_records = 64,
         std::size_t max_payload = 64 * 1024 - 1);

  [[nodiscard]] bool valid() const noexcept { return valid_; }
  [[nodiscard]] std::size_t consumed() const noexcept { return consumed_; }
  [[nodiscard]] std::size_t size() const noexcept { return records_.size(); }

  [[nodiscard]] auto begin() const noexcept { return records_.begin(); }
  [[nodiscard]] auto end() const noexcept { return records_.end(); }

 private:
  bool valid_{false};
  std::size_t consumed_{0};
  std::vector<Record> records_{};
};

}  // namespace vk::tlv
