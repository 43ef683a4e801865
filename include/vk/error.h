#pragma once
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace vk {
  enum class ErrorDomain : std::uint16_t {
    Security = 0x01,
    IO = 0x02,
    Crypto = 0x03,
    Validation = 0x04,
    Config = 0x05,
    Dependency = 0x06,
    State = 0x07,
    Internal = 0x7F
  };

  // Each domain reserves a span of codes so framework codes never collide with
  // propagated platform error numbers. Codes inside the reserved range are
  // stable across releases.
  inline constexpr int kErrorDomainSpan = 0x0100;

  inline constexpr int ErrorDomainBase(ErrorDomain domain) {
    switch (domain) {
    case ErrorDomain::Security:
      return 0x0100;
    case ErrorDomain::IO:
      return 0x0200;
    case ErrorDomain::Crypto:
      return 0x0300;
    case ErrorDomain::Validation:
      return 0x0400;
    case ErrorDomain::Config:
      return 0x0500;
    case ErrorDomain::Dependency:
      return 0x0600;
    case ErrorDomain::State:
      return 0x0700;
    case ErrorDomain::Internal:
      return 0x7F00;
    }
    return 0;
  }

  inline constexpr int ErrorDomainMax(ErrorDomain domain) {
    return ErrorDomainBase(domain) + kErrorDomainSpan - 1;
  }

  inline constexpr bool IsFrameworkErrorCode(ErrorDomain domain, int code) {
    return code >= ErrorDomainBase(domain) && code <= ErrorDomainMax(domain);
  }

  enum class Retryability : std::uint8_t {
    kFatal = 0,
    kTransient,
    kRetryable
  };

  namespace errors {
    inline constexpr int Make(ErrorDomain domain, int offset) {
      return ErrorDomainBase(domain) + offset;
    }

    namespace io {
      inline constexpr int kConsoleModeQueryFailed = Make(ErrorDomain::IO, 0x02);
      inline constexpr int kConsoleEchoDisableFailed = Make(ErrorDomain::IO, 0x03);
      inline constexpr int kPasswordReadFailed = Make(ErrorDomain::IO, 0x04);
      inline constexpr int kPasswordPromptNeedsTty = Make(ErrorDomain::IO, 0x05);
      inline constexpr int kInfoFileMissing = Make(ErrorDomain::IO, 0x06);
      inline constexpr int kInfoFileReadFailed = Make(ErrorDomain::IO, 0x07);
      inline constexpr int kKeyringAccessFailed = Make(ErrorDomain::IO, 0x08);
      inline constexpr int kAtomicReplaceFailed = Make(ErrorDomain::IO, 0x09);
    } // namespace io

    namespace validation {
      inline constexpr int kInfoFileExists = Make(ErrorDomain::Validation, 0x01);
      inline constexpr int kInfoFileMalformed = Make(ErrorDomain::Validation, 0x02);
      inline constexpr int kInvalidRecipient = Make(ErrorDomain::Validation, 0x03);
      inline constexpr int kInvalidKeyMaterial = Make(ErrorDomain::Validation, 0x04);
      inline constexpr int kVersionRegression = Make(ErrorDomain::Validation, 0x05);
      inline constexpr int kPassphraseTooLong = Make(ErrorDomain::Validation, 0x06);
      inline constexpr int kHostValueMismatch = Make(ErrorDomain::Validation, 0x07);
    } // namespace validation

    namespace config {
      inline constexpr int kInvalidValue = Make(ErrorDomain::Config, 0x01);
    } // namespace config

    namespace dependency {
      inline constexpr int kArgon2Unavailable = Make(ErrorDomain::Dependency, 0x01);
    } // namespace dependency

    namespace state {
      inline constexpr int kUpgradeRequired = Make(ErrorDomain::State, 0x01);
    } // namespace state

    // Codes carried by KeyError, one per FactorErrorKind.
    namespace key {
      inline constexpr int kPrimitiveFailure = Make(ErrorDomain::Crypto, 0x40);
      inline constexpr int kInvalidCredentials = Make(ErrorDomain::Security, 0x40);
      inline constexpr int kDuplicateFactor = Make(ErrorDomain::Validation, 0x40);
      inline constexpr int kUnsupportedVersion = Make(ErrorDomain::State, 0x40);
      inline constexpr int kCancelled = Make(ErrorDomain::IO, 0x40);
      inline constexpr int kNotFound = Make(ErrorDomain::Validation, 0x41);
      inline constexpr int kFactorInUse = Make(ErrorDomain::State, 0x41);
    } // namespace key

  } // namespace errors

  struct Error : public std::runtime_error {
    ErrorDomain domain;
    int code;
    std::optional<int> native_code;
    Retryability retryability{Retryability::kFatal};
    std::vector<std::string> context;
    explicit Error(ErrorDomain d, int c, std::string msg,
                   std::optional<int> native = std::nullopt,
                   Retryability retry = Retryability::kFatal,
                   std::vector<std::string> ctx = {})
        : std::runtime_error(std::move(msg)),
          domain(d),
          code(c),
          native_code(native),
          retryability(retry),
          context(std::move(ctx)) {}
  };

  struct AuthenticationFailureError : public std::runtime_error {
    explicit AuthenticationFailureError(const std::string& msg) : std::runtime_error(msg) {}
  };

  enum class FactorErrorKind : std::uint8_t {
    kPrimitiveFailure,
    kInvalidCredentials,
    kDuplicateFactor,
    kUnsupportedVersion,
    kCancelled,
    kNotFound,
    kFactorInUse
  };

  std::string_view FactorErrorKindName(FactorErrorKind kind) noexcept;

  // Failure of a key orchestration operation. what() is the short user-facing
  // message; detail is diagnostic text for logs and never holds secret material.
  struct KeyError : public Error {
    FactorErrorKind kind;
    std::string detail;

    KeyError(FactorErrorKind k, std::string user_message, std::string diagnostic = {});
  };
} // namespace vk
