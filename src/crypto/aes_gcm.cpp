#include "vk/crypto/aes_gcm.h"

#include "vk/crypto/aes_kw.h"
#include "vk/crypto/provider.h"

namespace vk::crypto {

AES256_GCM::EncryptionResult AES256_GCM_Encrypt(
    std::span<const uint8_t> plaintext,
    std::span<const uint8_t> aad,
    std::span<const uint8_t, AES256_GCM::NONCE_SIZE> nonce,
    std::span<const uint8_t, AES256_GCM::KEY_SIZE> key) {
  auto provider = GetCryptoProviderShared();
  return provider->EncryptAES256GCM(plaintext, aad, nonce, key);
}

size_t AES256_GCM_Decrypt(
    std::span<const uint8_t> ciphertext,
    std::span<const uint8_t> aad,
    std::span<const uint8_t, AES256_GCM::NONCE_SIZE> nonce,
    std::span<const uint8_t, AES256_GCM::TAG_SIZE> tag,
    std::span<const uint8_t, AES256_GCM::KEY_SIZE> key,
    std::span<uint8_t> destination) {
  auto provider = GetCryptoProviderShared();
  return provider->DecryptAES256GCM(ciphertext, aad, nonce, tag, key, destination);
}

std::vector<uint8_t> AES256_KeyWrap(std::span<const uint8_t, AES256_KW::KEY_SIZE> kek,
                                    std::span<const uint8_t> key_data) {
  auto provider = GetCryptoProviderShared();
  return provider->WrapKeyAES256(kek, key_data);
}

security::SecureBuffer<uint8_t> AES256_KeyUnwrap(std::span<const uint8_t, AES256_KW::KEY_SIZE> kek,
                                                 std::span<const uint8_t> wrapped) {
  auto provider = GetCryptoProviderShared();
  return provider->UnwrapKeyAES256(kek, wrapped);
}

} // namespace vk::crypto
