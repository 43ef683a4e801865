#include "vk/orchestrator/key_orchestrator.h"

#include <algorithm>
#include <string>
#include <type_traits>
#include <utility>

#include "vk/common.h"
#include "vk/crypto/ct.h"
#include "vk/error.h"
#include "vk/errors.h"
#include "vk/orchestrator/event_bus.h"
#include "vk/security/zeroizer.h"

namespace vk::orchestrator {
namespace {

constexpr std::string_view kUnlockPrompt{"Enter passphrase: "};
constexpr std::string_view kNewPassphrasePrompt{"Enter new passphrase: "};

// Runs one primitive step. KeyError passes through; anything else becomes
// PrimitiveFailure with |user_message| and the original text as detail.
template <typename Fn>
auto Guarded(std::string_view user_message, Fn&& fn) -> std::invoke_result_t<Fn&> {
  try {
    return fn();
  } catch (const KeyError&) {
    throw;
  } catch (const Error& err) {
    throw KeyError(FactorErrorKind::kPrimitiveFailure, std::string(user_message), err.what());
  } catch (const AuthenticationFailureError& err) {
    throw KeyError(FactorErrorKind::kPrimitiveFailure, std::string(user_message), err.what());
  } catch (const std::exception& err) {
    throw KeyError(FactorErrorKind::kPrimitiveFailure, std::string(user_message), err.what());
  }
}

void PublishEvent(EventCategory category, EventSeverity severity, std::string event_id,
                  std::string message, std::vector<EventField> fields = {}) {
  Event event;
  event.category = category;
  event.severity = severity;
  event.event_id = std::move(event_id);
  event.message = std::move(message);
  event.fields = std::move(fields);
  EventBus::Instance().Publish(event);
}

std::vector<EventField> FactorFields(const core::InfoFile& info) {
  std::vector<EventField> fields;
  fields.emplace_back("passphrase_factors", std::to_string(info.PassphraseCount()),
                      FieldPrivacy::kPublic, true);
  fields.emplace_back("asymmetric_factors", std::to_string(info.AsymmetricCount()),
                      FieldPrivacy::kPublic, true);
  return fields;
}

void PublishUnlockSucceeded(const core::InfoFile& info, FactorKind kind) {
  auto fields = FactorFields(info);
  fields.emplace_back("factor_kind", std::string(FactorKindName(kind)));
  PublishEvent(EventCategory::kSecurity, EventSeverity::kInfo, "unlock_succeeded",
               "Repository unlocked", std::move(fields));
}

}  // namespace

std::string_view FactorKindName(FactorKind kind) noexcept {
  switch (kind) {
    case FactorKind::kPassphrase:
      return "passphrase";
    case FactorKind::kAsymmetric:
      return "asymmetric";
  }
  return "unknown";
}

KeyOrchestrator::KeyOrchestrator(PrimitiveProvider& primitives, PassphraseSource& passphrases)
    : primitives_(primitives), passphrases_(passphrases) {}

std::string KeyOrchestrator::AcquirePassphrase(std::string_view prompt) {
  auto passphrase = Guarded(errors::msg::kErrorGettingPassphrase,
                            [&] { return passphrases_.Acquire(prompt); });
  if (!passphrase) {
    throw KeyError(FactorErrorKind::kCancelled, std::string(errors::msg::kPassphraseCancelled));
  }
  return std::move(*passphrase);
}

core::PassphraseEntry KeyOrchestrator::BuildPassphraseEntry(std::span<const uint8_t> master_key,
                                                            std::string_view passphrase) {
  core::PassphraseEntry entry;
  entry.kdf = primitives_.DefaultKdfParams();
  entry.salt = Guarded(errors::msg::kErrorGeneratingSalt, [&] { return primitives_.GenerateSalt(); });
  auto derived = Guarded(errors::msg::kErrorDerivingWrappingKey,
                         [&] { return primitives_.DeriveKey(passphrase, entry.salt, entry.kdf); });
  entry.confirmation_hash = derived.confirmation_hash;
  entry.wrapped_master_key = Guarded(errors::msg::kErrorWrappingMasterKey, [&] {
    return primitives_.Wrap(derived.wrapping_key.AsU8Span(), master_key);
  });
  return entry;
}

CreateResult KeyOrchestrator::CreateRepository(const FactorSpec& initial_factor) {
  core::InfoFile info(core::kCurrentInfoFileVersion);
  auto master_key = Guarded(errors::msg::kErrorGeneratingMasterKey,
                            [&] { return primitives_.GenerateMasterKey(); });
  AddFactor(info, master_key, initial_factor);

  auto fields = FactorFields(info);
  fields.emplace_back("version", std::to_string(info.version()), FieldPrivacy::kPublic, true);
  PublishEvent(EventCategory::kLifecycle, EventSeverity::kInfo, "repository_created",
               "Repository created", std::move(fields));
  return CreateResult{std::move(info), std::move(master_key)};
}

void KeyOrchestrator::AddFactor(core::InfoFile& info, const MasterKey& master_key,
                                const FactorSpec& spec) {
  if (spec.kind == FactorKind::kAsymmetric) {
    if (info.HasRecipient(spec.recipient_id)) {
      throw KeyError(FactorErrorKind::kDuplicateFactor, std::string(errors::msg::kRecipientAlreadyAdded),
                     "recipient " + spec.recipient_id);
    }
    auto wrapped = Guarded(errors::msg::kErrorAsymmetricWrap, [&] {
      return primitives_.AsymmetricWrap(master_key.AsU8Span(), spec.recipient_id);
    });
    info.AddAsymmetric(core::AsymmetricEntry{spec.recipient_id, std::move(wrapped)});
  } else {
    auto passphrase = AcquirePassphrase(kNewPassphrasePrompt);
    security::Zeroizer::ScopeWiper<char> passphrase_guard(passphrase.data(), passphrase.size());
    if (UnlockWithPassphrase(info, passphrase)) {
      throw KeyError(FactorErrorKind::kDuplicateFactor, std::string(errors::msg::kPassphraseAlreadyAdded));
    }
    info.AddPassphrase(BuildPassphraseEntry(master_key.AsU8Span(), passphrase));
  }

  std::vector<EventField> fields;
  fields.emplace_back("factor_kind", std::string(FactorKindName(spec.kind)));
  fields.emplace_back("factor_count", std::to_string(info.keys().size()), FieldPrivacy::kPublic, true);
  PublishEvent(EventCategory::kLifecycle, EventSeverity::kInfo, "factor_added", "Unlock factor added",
               std::move(fields));
}

std::optional<UnlockResult> KeyOrchestrator::UnlockWithPassphrase(const core::InfoFile& info,
                                                                  std::string_view passphrase) {
  for (const auto& entry : info.keys()) {
    const auto* candidate = std::get_if<core::PassphraseEntry>(&entry);
    if (candidate == nullptr) {
      continue;
    }
    auto derived = Guarded(errors::msg::kErrorDerivingWrappingKey, [&] {
      return primitives_.DeriveKey(passphrase, candidate->salt, candidate->kdf);
    });
    if (!crypto::ct::CompareEqual(derived.confirmation_hash, candidate->confirmation_hash)) {
      continue;
    }
    // The confirmation hash matched, so an unwrap failure means a corrupt entry.
    auto master_key = Guarded(errors::msg::kErrorUnwrappingMasterKey, [&] {
      return primitives_.Unwrap(derived.wrapping_key.AsU8Span(), candidate->wrapped_master_key);
    });
    return UnlockResult{std::move(master_key), core::PassphraseFactorId(candidate->salt),
                        FactorKind::kPassphrase};
  }
  return std::nullopt;
}

UnlockResult KeyOrchestrator::Unlock(const core::InfoFile& info) {
  for (const auto& entry : info.keys()) {
    const auto* candidate = std::get_if<core::AsymmetricEntry>(&entry);
    if (candidate == nullptr) {
      continue;
    }
    try {
      auto master_key = primitives_.AsymmetricUnwrap(candidate->wrapped_master_key);
      if (master_key && master_key->size() == core::kMasterKeySize) {
        PublishUnlockSucceeded(info, FactorKind::kAsymmetric);
        return UnlockResult{std::move(*master_key), candidate->recipient_id, FactorKind::kAsymmetric};
      }
    } catch (const KeyError&) {
      throw;
    } catch (const std::exception& ex) {
      std::vector<EventField> fields;
      fields.emplace_back("recipient", candidate->recipient_id);
      fields.emplace_back("reason", ex.what());
      PublishEvent(EventCategory::kDiagnostics, EventSeverity::kWarning, "asymmetric_unwrap_fault",
                   "Skipping asymmetric factor that failed to unwrap", std::move(fields));
    }
  }

  auto passphrase = AcquirePassphrase(kUnlockPrompt);
  security::Zeroizer::ScopeWiper<char> passphrase_guard(passphrase.data(), passphrase.size());
  if (auto result = UnlockWithPassphrase(info, passphrase)) {
    PublishUnlockSucceeded(info, FactorKind::kPassphrase);
    return std::move(*result);
  }

  PublishEvent(EventCategory::kSecurity, EventSeverity::kWarning, "unlock_failed",
               "No factor unlocked the repository", FactorFields(info));
  throw KeyError(FactorErrorKind::kInvalidCredentials, std::string(errors::msg::kInvalidCredentials));
}

UpgradeOutcome KeyOrchestrator::UpgradeFormat(core::InfoFile& info) {
  const int from = info.version();
  if (from == core::kCurrentInfoFileVersion) {
    return UpgradeOutcome::kAlreadyCurrent;
  }
  if (from != 1 && from != 2) {
    throw KeyError(FactorErrorKind::kUnsupportedVersion, std::string(errors::msg::kUnsupportedVersion),
                   "version " + std::to_string(from));
  }

  core::InfoFile working = info;
  if (from < 2) {
    if (working.HasLegacy()) {
      auto passphrase = AcquirePassphrase(kUnlockPrompt);
      security::Zeroizer::ScopeWiper<char> passphrase_guard(passphrase.data(), passphrase.size());
      const auto legacy_kdf = working.legacy_kdf.value_or(core::LegacyKdfParams());
      // At version 1 the derived key is the master key itself.
      auto legacy = Guarded(errors::msg::kErrorDerivingWrappingKey, [&] {
        return primitives_.DeriveKey(passphrase, *working.legacy_salt, legacy_kdf);
      });
      if (!crypto::ct::CompareEqual(legacy.confirmation_hash, *working.legacy_confirmation_hash)) {
        throw KeyError(FactorErrorKind::kInvalidCredentials,
                       std::string(errors::msg::kCannotUnlockToMigrate), "legacy confirmation hash mismatch");
      }
      working.AddPassphrase(BuildPassphraseEntry(legacy.wrapping_key.AsU8Span(), passphrase));
      working.ClearLegacy();
    }
    Guarded(errors::msg::kErrorAddingKey, [&] { working.AdvanceVersion(2); });
  }
  Guarded(errors::msg::kErrorAddingKey, [&] { working.AdvanceVersion(core::kCurrentInfoFileVersion); });
  info = std::move(working);

  std::vector<EventField> fields;
  fields.emplace_back("from_version", std::to_string(from), FieldPrivacy::kPublic, true);
  fields.emplace_back("to_version", std::to_string(info.version()), FieldPrivacy::kPublic, true);
  PublishEvent(EventCategory::kLifecycle, EventSeverity::kInfo, "repository_upgraded",
               "Repository format upgraded", std::move(fields));
  return UpgradeOutcome::kUpgraded;
}

std::vector<FactorDescriptor> KeyOrchestrator::ListFactors(const core::InfoFile& info) const {
  std::vector<FactorDescriptor> factors;
  if (info.version() == 1 && info.HasLegacy()) {
    const auto kdf = info.legacy_kdf ? core::KdfAlgorithmName(info.legacy_kdf->algorithm)
                                     : std::string_view("unknown");
    factors.push_back(FactorDescriptor{std::string(kLegacyFactorId), FactorKind::kPassphrase,
                                       std::string(kdf)});
  }
  for (const auto& entry : info.keys()) {
    if (const auto* passphrase = std::get_if<core::PassphraseEntry>(&entry)) {
      factors.push_back(FactorDescriptor{core::PassphraseFactorId(passphrase->salt),
                                         FactorKind::kPassphrase,
                                         std::string(core::KdfAlgorithmName(passphrase->kdf.algorithm))});
    } else {
      const auto& asymmetric = std::get<core::AsymmetricEntry>(entry);
      factors.push_back(FactorDescriptor{asymmetric.recipient_id, FactorKind::kAsymmetric,
                                         asymmetric.recipient_id});
    }
  }
  return factors;
}

void KeyOrchestrator::RemoveFactor(core::InfoFile& info, std::string_view factor_id,
                                   std::string_view unlocked_with) {
  const bool known = std::any_of(info.keys().begin(), info.keys().end(), [&](const core::KeyEntry& entry) {
    return EqualsIgnoreCase(core::FactorIdFor(entry), factor_id);
  });
  if (!known) {
    throw KeyError(FactorErrorKind::kNotFound, std::string(errors::msg::kFactorNotFound),
                   "factor " + std::string(factor_id));
  }
  if (EqualsIgnoreCase(factor_id, unlocked_with)) {
    throw KeyError(FactorErrorKind::kFactorInUse, std::string(errors::msg::kFactorInUse),
                   "factor " + std::string(factor_id));
  }
  info.RemoveFactor(factor_id);

  std::vector<EventField> fields;
  fields.emplace_back("factor_count", std::to_string(info.keys().size()), FieldPrivacy::kPublic, true);
  PublishEvent(EventCategory::kLifecycle, EventSeverity::kInfo, "factor_removed", "Unlock factor removed",
               std::move(fields));
}

}  // namespace vk::orchestrator
