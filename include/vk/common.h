#pragma once
#include <array>
#include <bit>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

#if defined(_MSC_VER)
#include <intrin.h>
#endif

namespace vk {
namespace detail {
// Portable byte swapping helpers.
template <class T>
[[nodiscard]] constexpr T ManualByteSwap(T value) noexcept {
  static_assert(std::is_trivially_copyable_v<T>, "ManualByteSwap requires trivially copyable types");
  auto source = std::bit_cast<std::array<std::uint8_t, sizeof(T)>>(value);
  std::array<std::uint8_t, sizeof(T)> reversed{};
  for (std::size_t i = 0; i < source.size(); ++i) {
    reversed[i] = source[source.size() - 1U - i];
  }
  return std::bit_cast<T>(reversed);
}

[[nodiscard]] constexpr std::uint16_t ByteSwap16(std::uint16_t value) noexcept {
  if (std::is_constant_evaluated()) {
    return ManualByteSwap(value);
  }
#if defined(_MSC_VER)
  return _byteswap_ushort(value);
#elif defined(__clang__) || defined(__GNUC__)
  return __builtin_bswap16(value);
#else
  return ManualByteSwap(value);
#endif
}

[[nodiscard]] constexpr std::uint32_t ByteSwap32(std::uint32_t value) noexcept {
  if (std::is_constant_evaluated()) {
    return ManualByteSwap(value);
  }
#if defined(_MSC_VER)
  return _byteswap_ulong(value);
#elif defined(__clang__) || defined(__GNUC__)
  return __builtin_bswap32(value);
#else
  return ManualByteSwap(value);
#endif
}
}  // namespace detail

inline constexpr bool kIsLittleEndian = std::endian::native == std::endian::little;

inline constexpr std::uint16_t ToLittleEndian16(std::uint16_t value) noexcept {
  return kIsLittleEndian ? value : detail::ByteSwap16(value);
}

inline constexpr std::uint32_t ToLittleEndian32(std::uint32_t value) noexcept {
  return kIsLittleEndian ? value : detail::ByteSwap32(value);
}

inline constexpr std::uint16_t FromLittleEndian16(std::uint16_t value) noexcept {
  return ToLittleEndian16(value);
}

inline constexpr std::uint32_t FromLittleEndian32(std::uint32_t value) noexcept {
  return ToLittleEndian32(value);
}

template <class T>
  requires std::is_trivially_copyable_v<T>
inline std::span<const std::uint8_t> AsBytesConst(const T& object) noexcept {
  const auto* data = reinterpret_cast<const std::uint8_t*>(std::addressof(object));
  return {data, sizeof(T)};
}

inline std::span<const std::uint8_t> AsBytes(std::string_view text) noexcept {
  return {reinterpret_cast<const std::uint8_t*>(text.data()), text.size()};
}

// Lowercase hex, two characters per byte.
inline std::string HexEncode(std::span<const std::uint8_t> bytes) {
  static constexpr char kDigits[] = "0123456789abcdef";
  std::string out;
  out.reserve(bytes.size() * 2);
  for (std::uint8_t byte : bytes) {
    out.push_back(kDigits[byte >> 4]);
    out.push_back(kDigits[byte & 0x0F]);
  }
  return out;
}

// Accepts either case. Returns nullopt on odd length or a non-hex character.
inline std::optional<std::vector<std::uint8_t>> HexDecode(std::string_view text) {
  if (text.size() % 2 != 0) {
    return std::nullopt;
  }
  auto nibble = [](char ch) -> int {
    if (ch >= '0' && ch <= '9') {
      return ch - '0';
    }
    if (ch >= 'a' && ch <= 'f') {
      return 10 + (ch - 'a');
    }
    if (ch >= 'A' && ch <= 'F') {
      return 10 + (ch - 'A');
    }
    return -1;
  };
  std::vector<std::uint8_t> out(text.size() / 2);
  for (std::size_t i = 0; i < out.size(); ++i) {
    const int hi = nibble(text[2 * i]);
    const int lo = nibble(text[2 * i + 1]);
    if (hi < 0 || lo < 0) {
      return std::nullopt;
    }
    out[i] = static_cast<std::uint8_t>((hi << 4) | lo);
  }
  return out;
}

inline std::string ToLowerAscii(std::string_view text) {
  std::string out(text);
  for (auto& ch : out) {
    if (ch >= 'A' && ch <= 'Z') {
      ch = static_cast<char>(ch - 'A' + 'a');
    }
  }
  return out;
}

inline bool EqualsIgnoreCase(std::string_view a, std::string_view b) noexcept {
  if (a.size() != b.size()) {
    return false;
  }
  for (std::size_t i = 0; i < a.size(); ++i) {
    char ca = a[i];
    char cb = b[i];
    if (ca >= 'A' && ca <= 'Z') {
      ca = static_cast<char>(ca - 'A' + 'a');
    }
    if (cb >= 'A' && cb <= 'Z') {
      cb = static_cast<char>(cb - 'A' + 'a');
    }
    if (ca != cb) {
      return false;
    }
  }
  return true;
}

inline std::string PathToUtf8String(const std::filesystem::path& path) {
#if defined(_WIN32)
  const std::u8string u8 = path.u8string();
  std::string result;
  result.reserve(u8.size());
  for (auto ch : u8) {
    result.push_back(static_cast<char>(ch));
  }
  return result;
#else
  return path.string();
#endif
}
}  // namespace vk
