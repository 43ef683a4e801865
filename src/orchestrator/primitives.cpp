#include "vk/orchestrator/primitives.h"

#include <algorithm>
#include <array>
#include <string>

#include "vk/common.h"
#include "vk/crypto/aes_kw.h"
#include "vk/crypto/argon2id.h"
#include "vk/crypto/random.h"
#include "vk/crypto/sealed_box.h"
#include "vk/error.h"
#include "vk/errors.h"
#include "vk/orchestrator/keyring.h"
#include "vk/security/zeroizer.h"

namespace vk::orchestrator {
namespace {

constexpr size_t kDerivedBytes = core::kMasterKeySize + core::kConfirmationHashSize;

std::span<const uint8_t, crypto::AES256_KW::KEY_SIZE> AsKek(std::span<const uint8_t> key) {
  if (key.size() != crypto::AES256_KW::KEY_SIZE) {
    throw Error{ErrorDomain::Validation, errors::validation::kInvalidKeyMaterial,
                std::string(errors::msg::kMalformedKeyMaterial)};
  }
  return key.first<crypto::AES256_KW::KEY_SIZE>();
}

}  // namespace

DefaultPrimitiveProvider::DefaultPrimitiveProvider(core::KdfParams defaults, const Keyring* keyring)
    : defaults_(defaults), keyring_(keyring) {}

MasterKey DefaultPrimitiveProvider::GenerateMasterKey() {
  MasterKey key(core::kMasterKeySize);
  crypto::SystemRandomBytes(key.AsSpan());
  return key;
}

core::Salt DefaultPrimitiveProvider::GenerateSalt() {
  core::Salt salt{};
  crypto::SystemRandomBytes(salt);
  return salt;
}

DerivedKey DefaultPrimitiveProvider::DeriveKey(std::string_view passphrase, const core::Salt& salt,
                                               const core::KdfParams& params) {
  std::array<uint8_t, kDerivedBytes> output{};
  security::Zeroizer::ScopeWiper<uint8_t> output_guard(std::span<uint8_t>(output.data(), output.size()));
  switch (params.algorithm) {
    case core::KdfAlgorithm::kPbkdf2:
      crypto::PBKDF2_HMAC_SHA256(AsBytes(passphrase), salt, params.pbkdf2_iterations, output, progress_);
      break;
    case core::KdfAlgorithm::kArgon2id:
      crypto::Argon2idDerive(AsBytes(passphrase), salt, params.argon2, output);
      break;
    default:
      throw Error{ErrorDomain::Validation, errors::validation::kInfoFileMalformed,
                  std::string(errors::msg::kUnknownKdfAlgorithm)};
  }

  DerivedKey derived;
  std::copy_n(output.begin(), core::kMasterKeySize, derived.wrapping_key.data());
  std::copy_n(output.begin() + core::kMasterKeySize, core::kConfirmationHashSize,
              derived.confirmation_hash.begin());
  return derived;
}

std::vector<uint8_t> DefaultPrimitiveProvider::Wrap(std::span<const uint8_t> wrapping_key,
                                                    std::span<const uint8_t> master_key) {
  return crypto::AES256_KeyWrap(AsKek(wrapping_key), master_key);
}

MasterKey DefaultPrimitiveProvider::Unwrap(std::span<const uint8_t> wrapping_key,
                                           std::span<const uint8_t> wrapped) {
  auto key = crypto::AES256_KeyUnwrap(AsKek(wrapping_key), wrapped);
  if (key.size() != core::kMasterKeySize) {
    throw Error{ErrorDomain::Validation, errors::validation::kInvalidKeyMaterial,
                std::string(errors::msg::kMalformedKeyMaterial)};
  }
  return key;
}

std::vector<uint8_t> DefaultPrimitiveProvider::AsymmetricWrap(std::span<const uint8_t> master_key,
                                                              std::string_view recipient_id) {
  std::optional<PublicKey> recipient;
  if (keyring_ != nullptr) {
    recipient = keyring_->FindPublic(recipient_id);
  }
  if (!recipient) {
    throw Error{ErrorDomain::Validation, errors::validation::kInvalidRecipient,
                std::string(errors::msg::kRecipientUnknown) + " (" + std::string(recipient_id) + ")"};
  }
  return crypto::SealedBoxSeal(master_key, *recipient);
}

std::optional<MasterKey> DefaultPrimitiveProvider::AsymmetricUnwrap(std::span<const uint8_t> blob) {
  if (keyring_ == nullptr) {
    return std::nullopt;
  }
  const auto addressed_to = crypto::SealedBoxRecipient(blob);
  if (!addressed_to) {
    throw Error{ErrorDomain::Validation, errors::validation::kInvalidKeyMaterial,
                "Wrapped key is not a sealed box"};
  }
  for (auto& identity : keyring_->PrivateIdentities()) {
    if (crypto::FingerprintForPublicKey(identity.public_key) != *addressed_to) {
      continue;
    }
    auto opened = crypto::SealedBoxOpen(
        blob,
        std::span<const uint8_t, crypto::kX25519KeySize>(identity.private_key.data(),
                                                         crypto::kX25519KeySize),
        identity.public_key);
    if (!opened) {
      continue;
    }
    if (opened->size() != core::kMasterKeySize) {
      throw Error{ErrorDomain::Validation, errors::validation::kInvalidKeyMaterial,
                  std::string(errors::msg::kMalformedKeyMaterial)};
    }
    return opened;
  }
  return std::nullopt;
}

}  // namespace vk::orchestrator
