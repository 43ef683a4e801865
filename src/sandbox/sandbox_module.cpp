#include "vk/sandbox/sandbox_module.h"

#include "vk/core/info_file_io.h"
#include "vk/error.h"
#include "vk/errors.h"
#include "vk/orchestrator/unlock_service.h"

namespace vk::sandbox {
namespace {

constexpr std::string_view kMasterKeyField{"masterKey"};

std::string_view DomainName(ErrorDomain domain) noexcept {
  switch (domain) {
    case ErrorDomain::Security:
      return "Security";
    case ErrorDomain::IO:
      return "IO";
    case ErrorDomain::Crypto:
      return "Crypto";
    case ErrorDomain::Validation:
      return "Validation";
    case ErrorDomain::Config:
      return "Config";
    case ErrorDomain::Dependency:
      return "Dependency";
    case ErrorDomain::State:
      return "State";
    case ErrorDomain::Internal:
      return "Internal";
  }
  return "Internal";
}

const HostValue& RequireField(const HostValue& args, std::string_view name, HostValue::Kind kind) {
  const auto* value = args.Get(name);
  if (value == nullptr || value->kind() != kind) {
    throw Error{ErrorDomain::Validation, errors::validation::kHostValueMismatch,
                "Argument '" + std::string(name) + "' must be " + std::string(HostValueKindName(kind))};
  }
  return *value;
}

std::span<const uint8_t> RequireMasterKey(const HostValue& args) {
  const auto& bytes = RequireField(args, kMasterKeyField, HostValue::Kind::kBytes).AsBytes();
  if (bytes.size() != core::kMasterKeySize) {
    throw Error{ErrorDomain::Validation, errors::validation::kInvalidKeyMaterial,
                std::string(errors::msg::kMalformedKeyMaterial)};
  }
  return bytes;
}

}  // namespace

SandboxModule::SandboxModule(orchestrator::PrimitiveProvider& primitives, ContentDecryptor& decryptor,
                             IndexProvider& index)
    : primitives_(primitives), decryptor_(decryptor), index_(index) {
  entry_points_.emplace(std::string(kEntryUnlock), [this](const HostValue& args) { return Unlock(args); });
  entry_points_.emplace(std::string(kEntryDecryptRequest),
                        [this](const HostValue& args) { return DecryptRequest(args); });
  entry_points_.emplace(std::string(kEntryGetIndex), [this](const HostValue& args) { return GetIndex(args); });
}

std::vector<std::string> SandboxModule::EntryPointNames() const {
  std::vector<std::string> names;
  names.reserve(entry_points_.size());
  for (const auto& [name, entry] : entry_points_) {
    names.push_back(name);
  }
  return names;
}

HostValue SandboxModule::ErrorRecord(std::string_view message, std::string_view kind) {
  auto record = HostValue::Record();
  record.Set("error", HostValue::String(std::string(message)));
  record.Set("kind", HostValue::String(std::string(kind)));
  return record;
}

HostValue SandboxModule::Call(std::string_view entry_point, const HostValue& args) {
  auto it = entry_points_.find(entry_point);
  if (it == entry_points_.end()) {
    return ErrorRecord("Unknown entry point " + std::string(kModuleNamespace) + "." +
                           std::string(entry_point),
                       FactorErrorKindName(FactorErrorKind::kNotFound));
  }
  try {
    return it->second(args);
  } catch (const KeyError& err) {
    return ErrorRecord(err.what(), FactorErrorKindName(err.kind));
  } catch (const Error& err) {
    return ErrorRecord(err.what(), DomainName(err.domain));
  } catch (const AuthenticationFailureError& err) {
    return ErrorRecord(err.what(), FactorErrorKindName(FactorErrorKind::kPrimitiveFailure));
  } catch (const std::exception& err) {
    return ErrorRecord(err.what(), DomainName(ErrorDomain::Internal));
  }
}

HostValue SandboxModule::Unlock(const HostValue& args) {
  const auto& info_bytes = RequireField(args, "info", HostValue::Kind::kBytes).AsBytes();
  const auto& passphrase = RequireField(args, "passphrase", HostValue::Kind::kString).AsString();
  const auto info = core::DecodeInfoFile(info_bytes);

  orchestrator::UnlockService service(primitives_);
  auto outcome = service.HandleUnlockRequest(
      info, orchestrator::UnlockRequest{orchestrator::kUnlockRequestTypePassphrase, passphrase});
  if (!outcome) {
    return HostValue::Undefined();
  }
  auto result = HostValue::Record();
  result.Set(std::string(kMasterKeyField), HostValue::Bytes(outcome->master_key.AsU8Span()));
  result.Set("keyId", HostValue::String(outcome->response.key_id));
  result.Set("type", HostValue::String(outcome->response.type));
  return result;
}

HostValue SandboxModule::DecryptRequest(const HostValue& args) {
  return decryptor_.DecryptRequest(RequireMasterKey(args), args);
}

HostValue SandboxModule::GetIndex(const HostValue& args) {
  return index_.GetIndex(RequireMasterKey(args));
}

void SandboxModule::ServeUntilShutdown() {
  std::unique_lock<std::mutex> lock(shutdown_mutex_);
  shutdown_cv_.wait(lock, [this] { return shutdown_; });
}

void SandboxModule::RequestShutdown() {
  {
    std::lock_guard<std::mutex> guard(shutdown_mutex_);
    shutdown_ = true;
  }
  shutdown_cv_.notify_all();
}

bool SandboxModule::shutdown_requested() const {
  std::lock_guard<std::mutex> guard(shutdown_mutex_);
  return shutdown_;
}

}  // namespace vk::sandbox
