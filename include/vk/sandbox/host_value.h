#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace vk::sandbox {

// Dynamically typed value exchanged with the sandbox host. Records keep their
// fields in insertion order; names are unique.
class HostValue {
 public:
  enum class Kind { kUndefined, kNull, kBool, kNumber, kString, kBytes, kRecord };
  struct Field;

  HostValue();
  HostValue(const HostValue& other);
  HostValue(HostValue&& other) noexcept;
  HostValue& operator=(const HostValue& other);
  HostValue& operator=(HostValue&& other) noexcept;
  ~HostValue();

  static HostValue Undefined() { return HostValue(); }
  static HostValue Null();
  static HostValue Bool(bool value);
  static HostValue Number(double value);
  static HostValue String(std::string value);
  static HostValue Bytes(std::vector<uint8_t> value);
  static HostValue Bytes(std::span<const uint8_t> value);
  static HostValue Record();

  [[nodiscard]] Kind kind() const noexcept { return kind_; }
  [[nodiscard]] bool IsUndefined() const noexcept { return kind_ == Kind::kUndefined; }
  [[nodiscard]] bool IsRecord() const noexcept { return kind_ == Kind::kRecord; }

  // Typed accessors throw vk::Error (Validation) on a kind mismatch.
  [[nodiscard]] bool AsBool() const;
  [[nodiscard]] double AsNumber() const;
  [[nodiscard]] const std::string& AsString() const;
  [[nodiscard]] const std::vector<uint8_t>& AsBytes() const;
  [[nodiscard]] const std::vector<Field>& fields() const;

  // nullptr when this is not a record or the field is absent.
  [[nodiscard]] const HostValue* Get(std::string_view name) const noexcept;
  // Converts an undefined value into a record; replaces an existing field.
  HostValue& Set(std::string name, HostValue value);

  bool operator==(const HostValue& other) const;

 private:
  explicit HostValue(Kind kind);

  Kind kind_{Kind::kUndefined};
  bool bool_{false};
  double number_{0.0};
  std::string string_;
  std::vector<uint8_t> bytes_;
  std::vector<Field> fields_;
};

struct HostValue::Field {
  std::string name;
  HostValue value;
};

std::string_view HostValueKindName(HostValue::Kind kind) noexcept;

}  // namespace vk::sandbox
