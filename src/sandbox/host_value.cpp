#include "vk/sandbox/host_value.h"

#include <algorithm>

#include "vk/error.h"
#include "vk/security/zeroizer.h"

namespace vk::sandbox {
namespace {

[[noreturn]] void ThrowKindMismatch(HostValue::Kind expected, HostValue::Kind actual) {
  throw Error{ErrorDomain::Validation, errors::validation::kHostValueMismatch,
              "Expected " + std::string(HostValueKindName(expected)) + " host value, got " +
                  std::string(HostValueKindName(actual))};
}

}  // namespace

std::string_view HostValueKindName(HostValue::Kind kind) noexcept {
  switch (kind) {
    case HostValue::Kind::kUndefined:
      return "undefined";
    case HostValue::Kind::kNull:
      return "null";
    case HostValue::Kind::kBool:
      return "bool";
    case HostValue::Kind::kNumber:
      return "number";
    case HostValue::Kind::kString:
      return "string";
    case HostValue::Kind::kBytes:
      return "bytes";
    case HostValue::Kind::kRecord:
      return "record";
  }
  return "unknown";
}

HostValue::HostValue() = default;
HostValue::HostValue(Kind kind) : kind_(kind) {}
HostValue::HostValue(const HostValue& other) = default;
HostValue::HostValue(HostValue&& other) noexcept = default;
HostValue& HostValue::operator=(const HostValue& other) = default;
HostValue& HostValue::operator=(HostValue&& other) noexcept = default;

// Byte payloads may carry key material.
HostValue::~HostValue() {
  security::Zeroizer::WipeVector(bytes_);
}

HostValue HostValue::Null() { return HostValue(Kind::kNull); }

HostValue HostValue::Bool(bool value) {
  HostValue out(Kind::kBool);
  out.bool_ = value;
  return out;
}

HostValue HostValue::Number(double value) {
  HostValue out(Kind::kNumber);
  out.number_ = value;
  return out;
}

HostValue HostValue::String(std::string value) {
  HostValue out(Kind::kString);
  out.string_ = std::move(value);
  return out;
}

HostValue HostValue::Bytes(std::vector<uint8_t> value) {
  HostValue out(Kind::kBytes);
  out.bytes_ = std::move(value);
  return out;
}

HostValue HostValue::Bytes(std::span<const uint8_t> value) {
  return Bytes(std::vector<uint8_t>(value.begin(), value.end()));
}

HostValue HostValue::Record() { return HostValue(Kind::kRecord); }

bool HostValue::AsBool() const {
  if (kind_ != Kind::kBool) {
    ThrowKindMismatch(Kind::kBool, kind_);
  }
  return bool_;
}

double HostValue::AsNumber() const {
  if (kind_ != Kind::kNumber) {
    ThrowKindMismatch(Kind::kNumber, kind_);
  }
  return number_;
}

const std::string& HostValue::AsString() const {
  if (kind_ != Kind::kString) {
    ThrowKindMismatch(Kind::kString, kind_);
  }
  return string_;
}

const std::vector<uint8_t>& HostValue::AsBytes() const {
  if (kind_ != Kind::kBytes) {
    ThrowKindMismatch(Kind::kBytes, kind_);
  }
  return bytes_;
}

const std::vector<HostValue::Field>& HostValue::fields() const {
  if (kind_ != Kind::kRecord) {
    ThrowKindMismatch(Kind::kRecord, kind_);
  }
  return fields_;
}

const HostValue* HostValue::Get(std::string_view name) const noexcept {
  if (kind_ != Kind::kRecord) {
    return nullptr;
  }
  auto it = std::find_if(fields_.begin(), fields_.end(),
                         [&](const Field& field) { return field.name == name; });
  return it == fields_.end() ? nullptr : &it->value;
}

HostValue& HostValue::Set(std::string name, HostValue value) {
  if (kind_ == Kind::kUndefined) {
    kind_ = Kind::kRecord;
  }
  if (kind_ != Kind::kRecord) {
    ThrowKindMismatch(Kind::kRecord, kind_);
  }
  auto it = std::find_if(fields_.begin(), fields_.end(),
                         [&](const Field& field) { return field.name == name; });
  if (it != fields_.end()) {
    it->value = std::move(value);
  } else {
    fields_.push_back(Field{std::move(name), std::move(value)});
  }
  return *this;
}

bool HostValue::operator==(const HostValue& other) const {
  if (kind_ != other.kind_) {
    return false;
  }
  switch (kind_) {
    case Kind::kUndefined:
    case Kind::kNull:
      return true;
    case Kind::kBool:
      return bool_ == other.bool_;
    case Kind::kNumber:
      return number_ == other.number_;
    case Kind::kString:
      return string_ == other.string_;
    case Kind::kBytes:
      return bytes_ == other.bytes_;
    case Kind::kRecord:
      if (fields_.size() != other.fields_.size()) {
        return false;
      }
      for (const auto& field : fields_) {
        const auto* theirs = other.Get(field.name);
        if (theirs == nullptr || !(field.value == *theirs)) {
          return false;
        }
      }
      return true;
  }
  return false;
}

}  // namespace vk::sandbox
