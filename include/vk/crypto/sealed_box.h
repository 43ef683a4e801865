#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

#include "vk/crypto/provider.h"
#include "vk/security/secure_buffer.h"

namespace vk::crypto {

// Anonymous-sender box for one X25519 recipient.
//
// Layout: "VKS1" | fingerprint(20) | ephemeral public key(32) | nonce(12) |
//         tag(16) | ciphertext
//
// The AES-256-GCM key is HKDF-SHA256 over the X25519 shared secret, salted
// with ephemeral_pub || recipient_pub. Everything before the tag is bound as
// associated data.
struct SealedBox {
  static constexpr std::array<uint8_t, 4> kMagic{'V', 'K', 'S', '1'};
  static constexpr size_t kFingerprintSize = 20;
  static constexpr size_t kHeaderSize =
      kMagic.size() + kFingerprintSize + kX25519KeySize + AES256_GCM::NONCE_SIZE;
  static constexpr size_t kMinimumSize = kHeaderSize + AES256_GCM::TAG_SIZE;
};

using RecipientFingerprint = std::array<uint8_t, SealedBox::kFingerprintSize>;

// First 20 bytes of SHA-256 over the raw public key.
RecipientFingerprint FingerprintForPublicKey(std::span<const uint8_t, kX25519KeySize> public_key);

std::vector<uint8_t> SealedBoxSeal(std::span<const uint8_t> payload,
                                   std::span<const uint8_t, kX25519KeySize> recipient_public);

// Returns the recipient fingerprint recorded in the box header, or nullopt when
// the input is not a sealed box.
std::optional<RecipientFingerprint> SealedBoxRecipient(std::span<const uint8_t> box);

// Returns nullopt when the box is addressed to another key or fails
// authentication. Throws vk::Error (Validation) on a structurally invalid box.
std::optional<security::SecureBuffer<uint8_t>> SealedBoxOpen(
    std::span<const uint8_t> box,
    std::span<const uint8_t, kX25519KeySize> recipient_private,
    std::span<const uint8_t, kX25519KeySize> recipient_public);

}  // namespace vk::crypto
