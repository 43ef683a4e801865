#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "vk/crypto/argon2id.h"

namespace vk::core {

inline constexpr int kCurrentInfoFileVersion = 3;
inline constexpr size_t kSaltSize = 16;
inline constexpr size_t kMasterKeySize = 32;
inline constexpr size_t kConfirmationHashSize = 32;

using Salt = std::array<uint8_t, kSaltSize>;
using ConfirmationHash = std::array<uint8_t, kConfirmationHashSize>;

enum class KdfAlgorithm : uint8_t { kPbkdf2 = 1, kArgon2id = 2 };

std::string_view KdfAlgorithmName(KdfAlgorithm algorithm) noexcept;
std::optional<KdfAlgorithm> ParseKdfAlgorithm(std::string_view name) noexcept;

// Cost parameters of one passphrase derivation. Persisted beside every entry
// so defaults can change without invalidating existing factors.
struct KdfParams {
  KdfAlgorithm algorithm{KdfAlgorithm::kPbkdf2};
  uint32_t pbkdf2_iterations{600000};
  crypto::Argon2Params argon2{};

  static KdfParams Pbkdf2(uint32_t iterations) {
    KdfParams params;
    params.algorithm = KdfAlgorithm::kPbkdf2;
    params.pbkdf2_iterations = iterations;
    return params;
  }

  static KdfParams Argon2id(const crypto::Argon2Params& argon2) {
    KdfParams params;
    params.algorithm = KdfAlgorithm::kArgon2id;
    params.argon2 = argon2;
    return params;
  }

  bool operator==(const KdfParams& other) const noexcept;
};

// Version 1 files written before KDF parameters were recorded.
inline constexpr uint32_t kLegacyPbkdf2Iterations = 100000;

inline KdfParams LegacyKdfParams() { return KdfParams::Pbkdf2(kLegacyPbkdf2Iterations); }

struct PassphraseEntry {
  Salt salt{};
  ConfirmationHash confirmation_hash{};
  std::vector<uint8_t> wrapped_master_key;
  KdfParams kdf{};
};

struct AsymmetricEntry {
  std::string recipient_id;
  std::vector<uint8_t> wrapped_master_key;
};

using KeyEntry = std::variant<PassphraseEntry, AsymmetricEntry>;

// "p:" followed by the hex of the first eight salt bytes.
std::string PassphraseFactorId(const Salt& salt);
std::string FactorIdFor(const KeyEntry& entry);

// Repository metadata. Entries keep insertion order; the version only moves
// forward. The legacy fields belong to version 1 repositories whose
// passphrase-derived key is the master key itself.
class InfoFile {
 public:
  InfoFile() = default;
  explicit InfoFile(int version) : version_(version) {}

  [[nodiscard]] int version() const noexcept { return version_; }
  void AdvanceVersion(int version);

  [[nodiscard]] const std::vector<KeyEntry>& keys() const noexcept { return keys_; }
  [[nodiscard]] size_t PassphraseCount() const noexcept;
  [[nodiscard]] size_t AsymmetricCount() const noexcept;
  [[nodiscard]] bool HasRecipient(std::string_view recipient_id) const noexcept;

  void AddPassphrase(PassphraseEntry entry);
  // Throws KeyError(kDuplicateFactor) when the recipient is already present.
  void AddAsymmetric(AsymmetricEntry entry);
  // Returns false when no entry has the id.
  bool RemoveFactor(std::string_view factor_id);

  [[nodiscard]] bool HasLegacy() const noexcept {
    return legacy_salt.has_value() && legacy_confirmation_hash.has_value();
  }
  void ClearLegacy() noexcept;

  std::optional<Salt> legacy_salt;
  std::optional<ConfirmationHash> legacy_confirmation_hash;
  std::optional<KdfParams> legacy_kdf;

 private:
  int version_{kCurrentInfoFileVersion};
  std::vector<KeyEntry> keys_;
};

}  // namespace vk::core
