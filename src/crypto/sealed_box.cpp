#include "vk/crypto/sealed_box.h"

#include <algorithm>
#include <string_view>

#include "vk/common.h"
#include "vk/crypto/ct.h"
#include "vk/crypto/hkdf.h"
#include "vk/crypto/random.h"
#include "vk/error.h"
#include "vk/errors.h"
#include "vk/security/zeroizer.h"

namespace vk::crypto {
namespace {

constexpr std::string_view kHkdfInfo{"vaultkey sealed box v1"};
constexpr size_t kFingerprintOffset = SealedBox::kMagic.size();
constexpr size_t kEphemeralOffset = kFingerprintOffset + SealedBox::kFingerprintSize;
constexpr size_t kNonceOffset = kEphemeralOffset + kX25519KeySize;
constexpr size_t kTagOffset = kNonceOffset + AES256_GCM::NONCE_SIZE;

std::array<uint8_t, 32> DeriveBoxKey(std::span<const uint8_t, kX25519KeySize> shared,
                                     std::span<const uint8_t, kX25519KeySize> ephemeral_public,
                                     std::span<const uint8_t, kX25519KeySize> recipient_public) {
  std::array<uint8_t, 2 * kX25519KeySize> salt{};
  std::copy(ephemeral_public.begin(), ephemeral_public.end(), salt.begin());
  std::copy(recipient_public.begin(), recipient_public.end(), salt.begin() + kX25519KeySize);
  return HKDF_SHA256(shared, std::span<const uint8_t>(salt.data(), salt.size()), AsBytes(kHkdfInfo));
}

bool HasMagic(std::span<const uint8_t> box) {
  return box.size() >= SealedBox::kMinimumSize &&
         std::equal(SealedBox::kMagic.begin(), SealedBox::kMagic.end(), box.begin());
}

}  // namespace

RecipientFingerprint FingerprintForPublicKey(std::span<const uint8_t, kX25519KeySize> public_key) {
  const auto digest = SHA256_Hash(public_key);
  RecipientFingerprint fingerprint{};
  std::copy_n(digest.begin(), fingerprint.size(), fingerprint.begin());
  return fingerprint;
}

std::vector<uint8_t> SealedBoxSeal(std::span<const uint8_t> payload,
                                   std::span<const uint8_t, kX25519KeySize> recipient_public) {
  auto& provider = GetCryptoProvider();
  auto ephemeral = provider.GenerateX25519();
  auto shared = provider.X25519Agree(
      std::span<const uint8_t, kX25519KeySize>(ephemeral.private_key.data(), kX25519KeySize),
      recipient_public);
  security::Zeroizer::ScopeWiper shared_guard(std::span<uint8_t>(shared.data(), shared.size()));
  auto key = DeriveBoxKey(shared, ephemeral.public_key, recipient_public);
  security::Zeroizer::ScopeWiper key_guard(std::span<uint8_t>(key.data(), key.size()));

  std::vector<uint8_t> box(SealedBox::kHeaderSize);
  std::copy(SealedBox::kMagic.begin(), SealedBox::kMagic.end(), box.begin());
  const auto fingerprint = FingerprintForPublicKey(recipient_public);
  std::copy(fingerprint.begin(), fingerprint.end(), box.begin() + kFingerprintOffset);
  std::copy(ephemeral.public_key.begin(), ephemeral.public_key.end(), box.begin() + kEphemeralOffset);
  std::array<uint8_t, AES256_GCM::NONCE_SIZE> nonce{};
  SystemRandomBytes(nonce);
  std::copy(nonce.begin(), nonce.end(), box.begin() + kNonceOffset);

  auto sealed = provider.EncryptAES256GCM(
      payload, std::span<const uint8_t>(box.data(), SealedBox::kHeaderSize),
      std::span<const uint8_t, AES256_GCM::NONCE_SIZE>(nonce),
      std::span<const uint8_t, AES256_GCM::KEY_SIZE>(key));
  box.insert(box.end(), sealed.tag.begin(), sealed.tag.end());
  box.insert(box.end(), sealed.ciphertext.begin(), sealed.ciphertext.end());
  return box;
}

std::optional<RecipientFingerprint> SealedBoxRecipient(std::span<const uint8_t> box) {
  if (!HasMagic(box)) {
    return std::nullopt;
  }
  RecipientFingerprint fingerprint{};
  std::copy_n(box.begin() + kFingerprintOffset, fingerprint.size(), fingerprint.begin());
  return fingerprint;
}

std::optional<security::SecureBuffer<uint8_t>> SealedBoxOpen(
    std::span<const uint8_t> box,
    std::span<const uint8_t, kX25519KeySize> recipient_private,
    std::span<const uint8_t, kX25519KeySize> recipient_public) {
  if (!HasMagic(box)) {
    throw Error{ErrorDomain::Validation, errors::validation::kInvalidKeyMaterial,
                "Wrapped key is not a sealed box"};
  }
  const auto expected = FingerprintForPublicKey(recipient_public);
  RecipientFingerprint recorded{};
  std::copy_n(box.begin() + kFingerprintOffset, recorded.size(), recorded.begin());
  if (!ct::CompareEqual(expected, recorded)) {
    return std::nullopt;
  }

  auto& provider = GetCryptoProvider();
  const auto ephemeral_public = box.subspan<kEphemeralOffset, kX25519KeySize>();
  auto shared = provider.X25519Agree(recipient_private, ephemeral_public);
  security::Zeroizer::ScopeWiper shared_guard(std::span<uint8_t>(shared.data(), shared.size()));
  auto key = DeriveBoxKey(shared, ephemeral_public, recipient_public);
  security::Zeroizer::ScopeWiper key_guard(std::span<uint8_t>(key.data(), key.size()));

  const auto ciphertext = box.subspan(SealedBox::kMinimumSize);
  security::SecureBuffer<uint8_t> plaintext(ciphertext.size());
  try {
    const size_t written = provider.DecryptAES256GCM(
        ciphertext, box.first(SealedBox::kHeaderSize),
        box.subspan<kNonceOffset, AES256_GCM::NONCE_SIZE>(),
        box.subspan<kTagOffset, AES256_GCM::TAG_SIZE>(),
        std::span<const uint8_t, AES256_GCM::KEY_SIZE>(key),
        plaintext.AsSpan());
    if (written != plaintext.size()) {
      return std::nullopt;
    }
  } catch (const AuthenticationFailureError&) {
    return std::nullopt;
  }
  return plaintext;
}

}  // namespace vk::crypto
