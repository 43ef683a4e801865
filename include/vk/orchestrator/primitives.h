#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string_view>
#include <utility>
#include <vector>

#include "vk/core/info_file.h"
#include "vk/crypto/pbkdf2.h"
#include "vk/security/secure_buffer.h"

namespace vk::orchestrator {

class Keyring;

using MasterKey = security::SecureBuffer<uint8_t>;

struct DerivedKey {
  security::SecureBuffer<uint8_t> wrapping_key{core::kMasterKeySize};
  core::ConfirmationHash confirmation_hash{};
};

// Cryptographic operations the key orchestrator depends on. Implementations
// report failures by throwing vk::Error or AuthenticationFailureError.
class PrimitiveProvider {
 public:
  virtual ~PrimitiveProvider() = default;

  virtual MasterKey GenerateMasterKey() = 0;
  virtual core::Salt GenerateSalt() = 0;
  // 64 bytes of KDF output split into wrapping key and confirmation hash.
  virtual DerivedKey DeriveKey(std::string_view passphrase, const core::Salt& salt,
                               const core::KdfParams& params) = 0;
  virtual std::vector<uint8_t> Wrap(std::span<const uint8_t> wrapping_key,
                                    std::span<const uint8_t> master_key) = 0;
  virtual MasterKey Unwrap(std::span<const uint8_t> wrapping_key,
                           std::span<const uint8_t> wrapped) = 0;
  virtual std::vector<uint8_t> AsymmetricWrap(std::span<const uint8_t> master_key,
                                              std::string_view recipient_id) = 0;
  // nullopt when no locally held private key can open |blob|.
  virtual std::optional<MasterKey> AsymmetricUnwrap(std::span<const uint8_t> blob) = 0;
  [[nodiscard]] virtual core::KdfParams DefaultKdfParams() const = 0;
};

// OpenSSL-backed primitives. Asymmetric operations use |keyring| when set;
// without one every asymmetric unwrap yields nullopt.
class DefaultPrimitiveProvider : public PrimitiveProvider {
 public:
  explicit DefaultPrimitiveProvider(core::KdfParams defaults, const Keyring* keyring = nullptr);

  void SetProgressCallback(crypto::PBKDF2ProgressCallback progress) { progress_ = std::move(progress); }

  MasterKey GenerateMasterKey() override;
  core::Salt GenerateSalt() override;
  DerivedKey DeriveKey(std::string_view passphrase, const core::Salt& salt,
                       const core::KdfParams& params) override;
  std::vector<uint8_t> Wrap(std::span<const uint8_t> wrapping_key,
                            std::span<const uint8_t> master_key) override;
  MasterKey Unwrap(std::span<const uint8_t> wrapping_key,
                   std::span<const uint8_t> wrapped) override;
  std::vector<uint8_t> AsymmetricWrap(std::span<const uint8_t> master_key,
                                      std::string_view recipient_id) override;
  std::optional<MasterKey> AsymmetricUnwrap(std::span<const uint8_t> blob) override;
  [[nodiscard]] core::KdfParams DefaultKdfParams() const override { return defaults_; }

 private:
  core::KdfParams defaults_;
  const Keyring* keyring_;
  crypto::PBKDF2ProgressCallback progress_;
};

}  // namespace vk::orchestrator
