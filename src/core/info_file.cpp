#include "vk/core/info_file.h"

#include <algorithm>
#include <string>

#include "vk/common.h"
#include "vk/error.h"
#include "vk/errors.h"

namespace vk::core {

std::string_view KdfAlgorithmName(KdfAlgorithm algorithm) noexcept {
  switch (algorithm) {
    case KdfAlgorithm::kPbkdf2:
      return "pbkdf2";
    case KdfAlgorithm::kArgon2id:
      return "argon2id";
  }
  return "unknown";
}

std::optional<KdfAlgorithm> ParseKdfAlgorithm(std::string_view name) noexcept {
  if (EqualsIgnoreCase(name, "pbkdf2")) {
    return KdfAlgorithm::kPbkdf2;
  }
  if (EqualsIgnoreCase(name, "argon2id")) {
    return KdfAlgorithm::kArgon2id;
  }
  return std::nullopt;
}

bool KdfParams::operator==(const KdfParams& other) const noexcept {
  if (algorithm != other.algorithm) {
    return false;
  }
  if (algorithm == KdfAlgorithm::kPbkdf2) {
    return pbkdf2_iterations == other.pbkdf2_iterations;
  }
  return argon2.memory_kib == other.argon2.memory_kib &&
         argon2.time_cost == other.argon2.time_cost &&
         argon2.parallelism == other.argon2.parallelism;
}

std::string PassphraseFactorId(const Salt& salt) {
  return "p:" + HexEncode(std::span<const uint8_t>(salt.data(), 8));
}

std::string FactorIdFor(const KeyEntry& entry) {
  if (const auto* passphrase = std::get_if<PassphraseEntry>(&entry)) {
    return PassphraseFactorId(passphrase->salt);
  }
  return std::get<AsymmetricEntry>(entry).recipient_id;
}

void InfoFile::AdvanceVersion(int version) {
  if (version < version_) {
    throw Error{ErrorDomain::Validation, errors::validation::kVersionRegression,
                std::string(errors::msg::kVersionRegression) + " (" + std::to_string(version_) +
                    " -> " + std::to_string(version) + ")"};
  }
  version_ = version;
}

size_t InfoFile::PassphraseCount() const noexcept {
  return static_cast<size_t>(std::count_if(keys_.begin(), keys_.end(), [](const KeyEntry& entry) {
    return std::holds_alternative<PassphraseEntry>(entry);
  }));
}

size_t InfoFile::AsymmetricCount() const noexcept {
  return keys_.size() - PassphraseCount();
}

bool InfoFile::HasRecipient(std::string_view recipient_id) const noexcept {
  return std::any_of(keys_.begin(), keys_.end(), [&](const KeyEntry& entry) {
    const auto* asymmetric = std::get_if<AsymmetricEntry>(&entry);
    return asymmetric != nullptr && EqualsIgnoreCase(asymmetric->recipient_id, recipient_id);
  });
}

void InfoFile::AddPassphrase(PassphraseEntry entry) {
  keys_.emplace_back(std::move(entry));
}

void InfoFile::AddAsymmetric(AsymmetricEntry entry) {
  if (HasRecipient(entry.recipient_id)) {
    throw KeyError(FactorErrorKind::kDuplicateFactor, std::string(errors::msg::kRecipientAlreadyAdded),
                   "recipient " + entry.recipient_id);
  }
  keys_.emplace_back(std::move(entry));
}

bool InfoFile::RemoveFactor(std::string_view factor_id) {
  auto it = std::find_if(keys_.begin(), keys_.end(), [&](const KeyEntry& entry) {
    return EqualsIgnoreCase(FactorIdFor(entry), factor_id);
  });
  if (it == keys_.end()) {
    return false;
  }
  keys_.erase(it);
  return true;
}

void InfoFile::ClearLegacy() noexcept {
  legacy_salt.reset();
  legacy_confirmation_hash.reset();
  legacy_kdf.reset();
}

}  // namespace vk::core
