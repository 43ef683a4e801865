#pragma once

#include <array>
#include <memory>
#include <span>
#include <vector>

#include "vk/crypto/aes_gcm.h"
#include "vk/crypto/aes_kw.h"
#include "vk/security/secure_buffer.h"

namespace vk::crypto {

inline constexpr size_t kX25519KeySize = 32;

struct X25519KeyPair {
  std::array<uint8_t, kX25519KeySize> public_key{};
  security::SecureBuffer<uint8_t> private_key{kX25519KeySize};
};

class CryptoProvider {
public:
  virtual ~CryptoProvider() = default;

  virtual AES256_GCM::EncryptionResult EncryptAES256GCM(
      std::span<const uint8_t> plaintext,
      std::span<const uint8_t> aad,
      std::span<const uint8_t, AES256_GCM::NONCE_SIZE> nonce,
      std::span<const uint8_t, AES256_GCM::KEY_SIZE> key) = 0;

  // Decrypts into |destination| and returns the number of bytes written.
  // Throws AuthenticationFailureError on tag mismatch.
  virtual size_t DecryptAES256GCM(
      std::span<const uint8_t> ciphertext,
      std::span<const uint8_t> aad,
      std::span<const uint8_t, AES256_GCM::NONCE_SIZE> nonce,
      std::span<const uint8_t, AES256_GCM::TAG_SIZE> tag,
      std::span<const uint8_t, AES256_GCM::KEY_SIZE> key,
      std::span<uint8_t> destination) = 0;

  virtual std::vector<uint8_t> WrapKeyAES256(
      std::span<const uint8_t, AES256_KW::KEY_SIZE> kek,
      std::span<const uint8_t> key_data) = 0;

  // Throws AuthenticationFailureError when the RFC 3394 integrity check fails.
  virtual security::SecureBuffer<uint8_t> UnwrapKeyAES256(
      std::span<const uint8_t, AES256_KW::KEY_SIZE> kek,
      std::span<const uint8_t> wrapped) = 0;

  virtual std::array<uint8_t, 32> HMACSHA256(
      std::span<const uint8_t> key,
      std::span<const uint8_t> message) = 0;

  virtual std::array<uint8_t, 32> SHA256(
      std::span<const uint8_t> data) = 0;

  virtual X25519KeyPair GenerateX25519() = 0;

  virtual std::array<uint8_t, kX25519KeySize> X25519PublicFromPrivate(
      std::span<const uint8_t, kX25519KeySize> private_key) = 0;

  // Raw X25519 shared secret. The caller wipes the result.
  virtual std::array<uint8_t, kX25519KeySize> X25519Agree(
      std::span<const uint8_t, kX25519KeySize> private_key,
      std::span<const uint8_t, kX25519KeySize> peer_public) = 0;
};

class OpenSSLCryptoProvider : public CryptoProvider {
public:
  AES256_GCM::EncryptionResult EncryptAES256GCM(
      std::span<const uint8_t> plaintext,
      std::span<const uint8_t> aad,
      std::span<const uint8_t, AES256_GCM::NONCE_SIZE> nonce,
      std::span<const uint8_t, AES256_GCM::KEY_SIZE> key) override;

  size_t DecryptAES256GCM(
      std::span<const uint8_t> ciphertext,
      std::span<const uint8_t> aad,
      std::span<const uint8_t, AES256_GCM::NONCE_SIZE> nonce,
      std::span<const uint8_t, AES256_GCM::TAG_SIZE> tag,
      std::span<const uint8_t, AES256_GCM::KEY_SIZE> key,
      std::span<uint8_t> destination) override;

  std::vector<uint8_t> WrapKeyAES256(
      std::span<const uint8_t, AES256_KW::KEY_SIZE> kek,
      std::span<const uint8_t> key_data) override;

  security::SecureBuffer<uint8_t> UnwrapKeyAES256(
      std::span<const uint8_t, AES256_KW::KEY_SIZE> kek,
      std::span<const uint8_t> wrapped) override;

  std::array<uint8_t, 32> HMACSHA256(
      std::span<const uint8_t> key,
      std::span<const uint8_t> message) override;

  std::array<uint8_t, 32> SHA256(
      std::span<const uint8_t> data) override;

  X25519KeyPair GenerateX25519() override;

  std::array<uint8_t, kX25519KeySize> X25519PublicFromPrivate(
      std::span<const uint8_t, kX25519KeySize> private_key) override;

  std::array<uint8_t, kX25519KeySize> X25519Agree(
      std::span<const uint8_t, kX25519KeySize> private_key,
      std::span<const uint8_t, kX25519KeySize> peer_public) override;
};

std::shared_ptr<CryptoProvider> GetCryptoProviderShared();
CryptoProvider& GetCryptoProvider();
void SetCryptoProvider(std::shared_ptr<CryptoProvider> provider);
void EnsureCryptoProviderInitialized();
void ResetCryptoProviderForTesting();

std::array<uint8_t, 32> SHA256_Hash(std::span<const uint8_t> data);

}  // namespace vk::crypto
