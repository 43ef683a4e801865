#include "vk/error.h"

namespace vk {
namespace {

struct KindTraits {
  ErrorDomain domain;
  int code;
  Retryability retryability;
};

KindTraits TraitsFor(FactorErrorKind kind) noexcept {
  switch (kind) {
  case FactorErrorKind::kPrimitiveFailure:
    return {ErrorDomain::Crypto, errors::key::kPrimitiveFailure, Retryability::kFatal};
  case FactorErrorKind::kInvalidCredentials:
    return {ErrorDomain::Security, errors::key::kInvalidCredentials, Retryability::kRetryable};
  case FactorErrorKind::kDuplicateFactor:
    return {ErrorDomain::Validation, errors::key::kDuplicateFactor, Retryability::kFatal};
  case FactorErrorKind::kUnsupportedVersion:
    return {ErrorDomain::State, errors::key::kUnsupportedVersion, Retryability::kFatal};
  case FactorErrorKind::kCancelled:
    return {ErrorDomain::IO, errors::key::kCancelled, Retryability::kRetryable};
  case FactorErrorKind::kNotFound:
    return {ErrorDomain::Validation, errors::key::kNotFound, Retryability::kFatal};
  case FactorErrorKind::kFactorInUse:
    return {ErrorDomain::State, errors::key::kFactorInUse, Retryability::kFatal};
  }
  return {ErrorDomain::Internal, errors::Make(ErrorDomain::Internal, 0x01), Retryability::kFatal};
}

}  // namespace

std::string_view FactorErrorKindName(FactorErrorKind kind) noexcept {
  switch (kind) {
  case FactorErrorKind::kPrimitiveFailure:
    return "PrimitiveFailure";
  case FactorErrorKind::kInvalidCredentials:
    return "InvalidCredentials";
  case FactorErrorKind::kDuplicateFactor:
    return "DuplicateFactor";
  case FactorErrorKind::kUnsupportedVersion:
    return "UnsupportedVersion";
  case FactorErrorKind::kCancelled:
    return "Cancelled";
  case FactorErrorKind::kNotFound:
    return "NotFound";
  case FactorErrorKind::kFactorInUse:
    return "FactorInUse";
  }
  return "Unknown";
}

KeyError::KeyError(FactorErrorKind k, std::string user_message, std::string diagnostic)
    : Error(TraitsFor(k).domain, TraitsFor(k).code, std::move(user_message), std::nullopt,
            TraitsFor(k).retryability),
      kind(k),
      detail(std::move(diagnostic)) {}

}  // namespace vk
