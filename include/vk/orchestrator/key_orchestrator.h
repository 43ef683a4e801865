#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "vk/core/info_file.h"
#include "vk/orchestrator/passphrase_source.h"
#include "vk/orchestrator/primitives.h"

namespace vk::orchestrator {

enum class FactorKind { kPassphrase, kAsymmetric };

std::string_view FactorKindName(FactorKind kind) noexcept;

struct FactorSpec {
  FactorKind kind{FactorKind::kPassphrase};
  std::string recipient_id;

  static FactorSpec Passphrase() { return FactorSpec{}; }
  static FactorSpec Recipient(std::string id) {
    return FactorSpec{FactorKind::kAsymmetric, std::move(id)};
  }
};

struct UnlockResult {
  MasterKey master_key;
  std::string factor_id;
  FactorKind kind{FactorKind::kPassphrase};
};

struct CreateResult {
  core::InfoFile info;
  MasterKey master_key;
};

enum class UpgradeOutcome { kUpgraded, kAlreadyCurrent };

struct FactorDescriptor {
  std::string id;
  FactorKind kind{FactorKind::kPassphrase};
  std::string detail;
};

inline constexpr std::string_view kLegacyFactorId{"legacy"};

// Manages the unlock factors protecting a repository master key. Every call
// works on the InfoFile it is given; nothing is cached between calls. All
// failures surface as vk::KeyError.
class KeyOrchestrator {
 public:
  KeyOrchestrator(PrimitiveProvider& primitives, PassphraseSource& passphrases);

  CreateResult CreateRepository(const FactorSpec& initial_factor);

  // On failure |info| is left unchanged.
  void AddFactor(core::InfoFile& info, const MasterKey& master_key, const FactorSpec& spec);

  // Asymmetric entries are tried first, in order, then one passphrase prompt
  // is checked against every passphrase entry.
  UnlockResult Unlock(const core::InfoFile& info);
  std::optional<UnlockResult> UnlockWithPassphrase(const core::InfoFile& info,
                                                   std::string_view passphrase);

  // Migrates versions 1 and 2 to the current version. Already current files are
  // left alone. Any failure leaves |info| untouched.
  UpgradeOutcome UpgradeFormat(core::InfoFile& info);

  [[nodiscard]] std::vector<FactorDescriptor> ListFactors(const core::InfoFile& info) const;

  // |unlocked_with| is the factor id that authorised the change; it can never
  // be removed.
  void RemoveFactor(core::InfoFile& info, std::string_view factor_id, std::string_view unlocked_with);

 private:
  std::string AcquirePassphrase(std::string_view prompt);
  core::PassphraseEntry BuildPassphraseEntry(std::span<const uint8_t> master_key,
                                             std::string_view passphrase);

  PrimitiveProvider& primitives_;
  PassphraseSource& passphrases_;
};

}  // namespace vk::orchestrator
