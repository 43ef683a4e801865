#include "vk/tlv/writer.h"

#include <array>
#include <cstring>
#include <limits>
#include <string>

#include "vk/common.h"
#include "vk/error.h"

namespace vk::tlv {

void Writer::Add(uint16_t type, std::span<const uint8_t> value) {
  if (value.size() > std::numeric_limits<uint16_t>::max()) {
    throw Error{ErrorDomain::Validation, errors::validation::kInfoFileMalformed,
                "TLV value too large for record type " + std::to_string(type)};
  }
  const uint16_t type_le = ToLittleEndian16(type);
  const uint16_t length_le = ToLittleEndian16(static_cast<uint16_t>(value.size()));
  std::array<uint8_t, 4> header{};
  std::memcpy(header.data(), &type_le, sizeof(type_le));
  std::memcpy(header.data() + sizeof(type_le), &length_le, sizeof(length_le));
  buffer_.insert(buffer_.end(), header.begin(), header.end());
  buffer_.insert(buffer_.end(), value.begin(), value.end());
}

void Writer::AddString(uint16_t type, std::string_view value) {
  Add(type, AsBytes(value));
}

void Writer::AddU8(uint16_t type, uint8_t value) {
  Add(type, std::span<const uint8_t>(&value, 1));
}

void Writer::AddU32(uint16_t type, uint32_t value) {
  const uint32_t le = ToLittleEndian32(value);
  Add(type, AsBytesConst(le));
}

}  // namespace vk::tlv
