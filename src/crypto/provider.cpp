#include "vk/crypto/provider.h"

#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

#if VK_HAVE_SODIUM
#include <sodium.h>
#endif

#include <algorithm>
#include <array>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

#include "vk/crypto/ct.h"
#include "vk/error.h"
#include "vk/security/zeroizer.h"

namespace vk::crypto {

namespace {

[[noreturn]] void ThrowCryptoError(const std::string& message, int code = 0) {
  throw vk::Error(vk::ErrorDomain::Crypto, code, message);
}

std::string BuildOpenSSLErrorMessage(const char* context) {
  unsigned long err = ERR_get_error();
  if (err == 0) {
    return std::string(context) + ": unknown OpenSSL error";
  }

  char buf[256] = {0};
  ERR_error_string_n(err, buf, sizeof(buf));
  std::string message(context);
  message.append(": ");
  message.append(buf);
  return message;
}

class EVPContextDeleter {
public:
  void operator()(EVP_CIPHER_CTX* ctx) const noexcept { EVP_CIPHER_CTX_free(ctx); }
  void operator()(EVP_PKEY_CTX* ctx) const noexcept { EVP_PKEY_CTX_free(ctx); }
  void operator()(EVP_PKEY* key) const noexcept { EVP_PKEY_free(key); }
};

using CipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, EVPContextDeleter>;
using PkeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, EVPContextDeleter>;
using PkeyPtr = std::unique_ptr<EVP_PKEY, EVPContextDeleter>;

struct RuntimeState {
  std::once_flag once;
  bool self_test_passed{false};
};

RuntimeState& MutableRuntimeState() {
  static RuntimeState state{};
  return state;
}

std::mutex& ProviderMutex() {
  static std::mutex mutex;
  return mutex;
}

std::shared_ptr<CryptoProvider>& ProviderInstance() {
  static std::shared_ptr<CryptoProvider> instance;
  return instance;
}

// Encrypt/decrypt and wrap/unwrap consistency check run once per process.
// Published vectors are exercised by the test suite.
void RunSelfTest() {
  static constexpr std::array<uint8_t, 32> kKey{
      0x60, 0x3d, 0xeb, 0x10, 0x15, 0xca, 0x71, 0xbe, 0x2b, 0x73, 0xae, 0xf0, 0x85, 0x7d, 0x77, 0x81,
      0x1f, 0x35, 0x2c, 0x07, 0x3b, 0x61, 0x08, 0xd7, 0x2d, 0x98, 0x10, 0xa3, 0x09, 0x14, 0xdf, 0xf4};
  static constexpr std::array<uint8_t, AES256_GCM::NONCE_SIZE> kNonce{
      0xca, 0xfe, 0xba, 0xbe, 0xfa, 0xce, 0xdb, 0xad, 0xde, 0xca, 0xf8, 0x88};
  static constexpr std::array<uint8_t, 32> kPayload{
      0x00, 0x11, 0x22, 0x33, 0x44, 0x55, 0x66, 0x77, 0x88, 0x99, 0xaa, 0xbb, 0xcc, 0xdd, 0xee, 0xff,
      0x00, 0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07, 0x08, 0x09, 0x0a, 0x0b, 0x0c, 0x0d, 0x0e, 0x0f};
  static constexpr std::array<uint8_t, 4> kAad{0x76, 0x6b, 0x00, 0x01};

  OpenSSLCryptoProvider provider;
  const auto enc = provider.EncryptAES256GCM(
      std::span<const uint8_t>(kPayload.data(), kPayload.size()),
      std::span<const uint8_t>(kAad.data(), kAad.size()),
      std::span<const uint8_t, AES256_GCM::NONCE_SIZE>(kNonce),
      std::span<const uint8_t, AES256_GCM::KEY_SIZE>(kKey));
  std::array<uint8_t, kPayload.size()> plain{};
  security::Zeroizer::ScopeWiper plain_guard(std::span<uint8_t>(plain.data(), plain.size()));
  const size_t written = provider.DecryptAES256GCM(
      std::span<const uint8_t>(enc.ciphertext.data(), enc.ciphertext.size()),
      std::span<const uint8_t>(kAad.data(), kAad.size()),
      std::span<const uint8_t, AES256_GCM::NONCE_SIZE>(kNonce),
      std::span<const uint8_t, AES256_GCM::TAG_SIZE>(enc.tag),
      std::span<const uint8_t, AES256_GCM::KEY_SIZE>(kKey),
      std::span<uint8_t>(plain.data(), plain.size()));
  uint32_t gcm_mask = 0;
  gcm_mask |= written == kPayload.size() ? 0u : 1u;
  gcm_mask |= ct::CompareEqual(plain, kPayload) ? 0u : 2u;
  if (gcm_mask != 0u) {
    ThrowCryptoError("AES-GCM self-test mismatch");
  }

  const auto wrapped = provider.WrapKeyAES256(
      std::span<const uint8_t, AES256_KW::KEY_SIZE>(kKey),
      std::span<const uint8_t>(kPayload.data(), kPayload.size()));
  if (wrapped.size() != kPayload.size() + AES256_KW::OVERHEAD) {
    ThrowCryptoError("AES key wrap self-test length mismatch");
  }
  auto unwrapped = provider.UnwrapKeyAES256(
      std::span<const uint8_t, AES256_KW::KEY_SIZE>(kKey),
      std::span<const uint8_t>(wrapped.data(), wrapped.size()));
  if (!ct::CompareEqual(unwrapped.AsSpan(), std::span<const uint8_t>(kPayload.data(), kPayload.size()))) {
    ThrowCryptoError("AES key wrap self-test mismatch");
  }
}

void EnsureCryptoRuntimeConfigured() {
  auto& state = MutableRuntimeState();
  std::call_once(state.once, [&state]() {
#if VK_HAVE_SODIUM
    if (sodium_init() < 0) {
      ThrowCryptoError("sodium_init failed");
    }
#endif
    RunSelfTest();
    state.self_test_passed = true;
    std::clog << "[crypto] self-test passed" << std::endl;
  });
}

PkeyPtr LoadX25519Private(std::span<const uint8_t, kX25519KeySize> private_key) {
  PkeyPtr key(EVP_PKEY_new_raw_private_key(EVP_PKEY_X25519, nullptr, private_key.data(),
                                           private_key.size()));
  if (!key) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_PKEY_new_raw_private_key(X25519)"));
  }
  return key;
}

}  // namespace

void EnsureCryptoProviderInitialized() {
  EnsureCryptoRuntimeConfigured();
}

AES256_GCM::EncryptionResult OpenSSLCryptoProvider::EncryptAES256GCM(
    std::span<const uint8_t> plaintext,
    std::span<const uint8_t> aad,
    std::span<const uint8_t, AES256_GCM::NONCE_SIZE> nonce,
    std::span<const uint8_t, AES256_GCM::KEY_SIZE> key) {
  CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
  if (!ctx) {
    ThrowCryptoError("Failed to allocate AES-GCM context");
  }

  if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_EncryptInit_ex"));
  }
  if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                          static_cast<int>(nonce.size()), nullptr) != 1) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_CTRL_GCM_SET_IVLEN"));
  }
  if (EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data()) != 1) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_EncryptInit_ex key/iv"));
  }

  int len = 0;
  if (!aad.empty()) {
    if (EVP_EncryptUpdate(ctx.get(), nullptr, &len, aad.data(),
                          static_cast<int>(aad.size())) != 1) {
      ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_EncryptUpdate aad"));
    }
  }

  AES256_GCM::EncryptionResult result;
  result.ciphertext.resize(plaintext.size());
  int total = 0;
  if (!plaintext.empty()) {
    if (EVP_EncryptUpdate(ctx.get(), result.ciphertext.data(), &len,
                          plaintext.data(), static_cast<int>(plaintext.size())) != 1) {
      ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_EncryptUpdate plaintext"));
    }
    total = len;
  }

  if (EVP_EncryptFinal_ex(ctx.get(), result.ciphertext.data() + total, &len) != 1) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_EncryptFinal_ex"));
  }
  total += len;
  result.ciphertext.resize(static_cast<size_t>(total));

  if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG,
                          AES256_GCM::TAG_SIZE, result.tag.data()) != 1) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_CTRL_GCM_GET_TAG"));
  }

  return result;
}

size_t OpenSSLCryptoProvider::DecryptAES256GCM(
    std::span<const uint8_t> ciphertext,
    std::span<const uint8_t> aad,
    std::span<const uint8_t, AES256_GCM::NONCE_SIZE> nonce,
    std::span<const uint8_t, AES256_GCM::TAG_SIZE> tag,
    std::span<const uint8_t, AES256_GCM::KEY_SIZE> key,
    std::span<uint8_t> destination) {
  if (destination.size() < ciphertext.size()) {
    ThrowCryptoError("AES-GCM destination buffer too small");
  }
  CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
  if (!ctx) {
    ThrowCryptoError("Failed to allocate AES-GCM context");
  }

  if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_DecryptInit_ex"));
  }
  if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                          static_cast<int>(nonce.size()), nullptr) != 1) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_CTRL_GCM_SET_IVLEN"));
  }
  if (EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data()) != 1) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_DecryptInit_ex key/iv"));
  }

  int len = 0;
  if (!aad.empty()) {
    if (EVP_DecryptUpdate(ctx.get(), nullptr, &len, aad.data(),
                          static_cast<int>(aad.size())) != 1) {
      ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_DecryptUpdate aad"));
    }
  }

  int total = 0;
  if (!ciphertext.empty()) {
    if (EVP_DecryptUpdate(ctx.get(), destination.data(), &len, ciphertext.data(),
                          static_cast<int>(ciphertext.size())) != 1) {
      ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_DecryptUpdate ciphertext"));
    }
    total = len;
  }

  if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG,
                          AES256_GCM::TAG_SIZE, const_cast<uint8_t*>(tag.data())) != 1) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_CTRL_GCM_SET_TAG"));
  }

  int final_len = 0;
  int ret = EVP_DecryptFinal_ex(ctx.get(), destination.data() + total, &final_len);
  if (ret <= 0) {
    security::Zeroizer::Wipe(destination.first(static_cast<size_t>(total)));
    ERR_clear_error();
    throw vk::AuthenticationFailureError("AES-GCM authentication failed");
  }
  total += final_len;
  return static_cast<size_t>(total);
}

std::vector<uint8_t> OpenSSLCryptoProvider::WrapKeyAES256(
    std::span<const uint8_t, AES256_KW::KEY_SIZE> kek,
    std::span<const uint8_t> key_data) {
  if (key_data.size() < 2 * AES256_KW::BLOCK_SIZE || key_data.size() % AES256_KW::BLOCK_SIZE != 0) {
    ThrowCryptoError("AES key wrap input must be a multiple of 8 bytes and at least 16 bytes");
  }
  CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
  if (!ctx) {
    ThrowCryptoError("Failed to allocate AES key wrap context");
  }
  EVP_CIPHER_CTX_set_flags(ctx.get(), EVP_CIPHER_CTX_FLAG_WRAP_ALLOW);
  if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_wrap(), nullptr, kek.data(), nullptr) != 1) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_EncryptInit_ex(aes-256-wrap)"));
  }
  std::vector<uint8_t> out(key_data.size() + AES256_KW::OVERHEAD);
  int len = 0;
  if (EVP_EncryptUpdate(ctx.get(), out.data(), &len, key_data.data(),
                        static_cast<int>(key_data.size())) != 1) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_EncryptUpdate(aes-256-wrap)"));
  }
  int final_len = 0;
  if (EVP_EncryptFinal_ex(ctx.get(), out.data() + len, &final_len) != 1) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_EncryptFinal_ex(aes-256-wrap)"));
  }
  if (static_cast<size_t>(len + final_len) != out.size()) {
    ThrowCryptoError("Unexpected AES key wrap output length", len + final_len);
  }
  return out;
}

security::SecureBuffer<uint8_t> OpenSSLCryptoProvider::UnwrapKeyAES256(
    std::span<const uint8_t, AES256_KW::KEY_SIZE> kek,
    std::span<const uint8_t> wrapped) {
  if (wrapped.size() < 3 * AES256_KW::BLOCK_SIZE || wrapped.size() % AES256_KW::BLOCK_SIZE != 0) {
    throw vk::AuthenticationFailureError("AES key unwrap input has an invalid length");
  }
  CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
  if (!ctx) {
    ThrowCryptoError("Failed to allocate AES key wrap context");
  }
  EVP_CIPHER_CTX_set_flags(ctx.get(), EVP_CIPHER_CTX_FLAG_WRAP_ALLOW);
  if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_wrap(), nullptr, kek.data(), nullptr) != 1) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_DecryptInit_ex(aes-256-wrap)"));
  }
  // OpenSSL may write up to the input length before trimming the IV block.
  security::SecureBuffer<uint8_t> scratch(wrapped.size());
  int len = 0;
  if (EVP_DecryptUpdate(ctx.get(), scratch.data(), &len, wrapped.data(),
                        static_cast<int>(wrapped.size())) != 1 ||
      len <= 0) {
    ERR_clear_error();
    throw vk::AuthenticationFailureError("AES key unwrap integrity check failed");
  }
  int final_len = 0;
  if (EVP_DecryptFinal_ex(ctx.get(), scratch.data() + len, &final_len) != 1) {
    ERR_clear_error();
    throw vk::AuthenticationFailureError("AES key unwrap integrity check failed");
  }
  const size_t produced = static_cast<size_t>(len + final_len);
  if (produced != wrapped.size() - AES256_KW::OVERHEAD) {
    throw vk::AuthenticationFailureError("AES key unwrap produced unexpected length");
  }
  return security::SecureBuffer<uint8_t>(
      std::span<const uint8_t>(scratch.data(), produced));
}

std::array<uint8_t, 32> OpenSSLCryptoProvider::HMACSHA256(
    std::span<const uint8_t> key,
    std::span<const uint8_t> message) {
  std::array<uint8_t, 32> out{};
  unsigned int len = 0;
  if (HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()), message.data(),
           message.size(), out.data(), &len) == nullptr) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("HMAC(EVP_sha256)"));
  }
  if (len != out.size()) {
    ThrowCryptoError("Unexpected HMAC-SHA256 length", static_cast<int>(len));
  }
  return out;
}

std::array<uint8_t, 32> OpenSSLCryptoProvider::SHA256(
    std::span<const uint8_t> data) {
  std::array<uint8_t, 32> out{};
  unsigned int len = 0;
  if (EVP_Digest(data.data(), data.size(), out.data(), &len, EVP_sha256(), nullptr) != 1) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_Digest(EVP_sha256)"));
  }
  if (len != out.size()) {
    ThrowCryptoError("Unexpected SHA-256 length", static_cast<int>(len));
  }
  return out;
}

X25519KeyPair OpenSSLCryptoProvider::GenerateX25519() {
  PkeyCtxPtr ctx(EVP_PKEY_CTX_new_id(EVP_PKEY_X25519, nullptr));
  if (!ctx) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_PKEY_CTX_new_id(X25519)"));
  }
  if (EVP_PKEY_keygen_init(ctx.get()) != 1) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_PKEY_keygen_init"));
  }
  EVP_PKEY* raw = nullptr;
  if (EVP_PKEY_keygen(ctx.get(), &raw) != 1) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_PKEY_keygen"));
  }
  PkeyPtr key(raw);

  X25519KeyPair pair;
  size_t priv_len = pair.private_key.size();
  if (EVP_PKEY_get_raw_private_key(key.get(), pair.private_key.data(), &priv_len) != 1 ||
      priv_len != kX25519KeySize) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_PKEY_get_raw_private_key"));
  }
  size_t pub_len = pair.public_key.size();
  if (EVP_PKEY_get_raw_public_key(key.get(), pair.public_key.data(), &pub_len) != 1 ||
      pub_len != kX25519KeySize) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_PKEY_get_raw_public_key"));
  }
  return pair;
}

std::array<uint8_t, kX25519KeySize> OpenSSLCryptoProvider::X25519PublicFromPrivate(
    std::span<const uint8_t, kX25519KeySize> private_key) {
  auto key = LoadX25519Private(private_key);
  std::array<uint8_t, kX25519KeySize> out{};
  size_t len = out.size();
  if (EVP_PKEY_get_raw_public_key(key.get(), out.data(), &len) != 1 || len != out.size()) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_PKEY_get_raw_public_key"));
  }
  return out;
}

std::array<uint8_t, kX25519KeySize> OpenSSLCryptoProvider::X25519Agree(
    std::span<const uint8_t, kX25519KeySize> private_key,
    std::span<const uint8_t, kX25519KeySize> peer_public) {
  auto own = LoadX25519Private(private_key);
  PkeyPtr peer(EVP_PKEY_new_raw_public_key(EVP_PKEY_X25519, nullptr, peer_public.data(),
                                           peer_public.size()));
  if (!peer) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_PKEY_new_raw_public_key(X25519)"));
  }
  PkeyCtxPtr ctx(EVP_PKEY_CTX_new(own.get(), nullptr));
  if (!ctx) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_PKEY_CTX_new"));
  }
  if (EVP_PKEY_derive_init(ctx.get()) != 1) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_PKEY_derive_init"));
  }
  if (EVP_PKEY_derive_set_peer(ctx.get(), peer.get()) != 1) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_PKEY_derive_set_peer"));
  }
  std::array<uint8_t, kX25519KeySize> shared{};
  size_t len = shared.size();
  if (EVP_PKEY_derive(ctx.get(), shared.data(), &len) != 1 || len != shared.size()) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_PKEY_derive(X25519)"));
  }
  return shared;
}

std::shared_ptr<CryptoProvider> GetCryptoProviderShared() {
  EnsureCryptoRuntimeConfigured();
  std::lock_guard<std::mutex> lock(ProviderMutex());
  auto& provider = ProviderInstance();
  if (!provider) {
    provider = std::make_shared<OpenSSLCryptoProvider>();
  }
  return provider;
}

CryptoProvider& GetCryptoProvider() {
  return *GetCryptoProviderShared();
}

void SetCryptoProvider(std::shared_ptr<CryptoProvider> provider) {
  std::lock_guard<std::mutex> lock(ProviderMutex());
  ProviderInstance() = std::move(provider);
}

void ResetCryptoProviderForTesting() {
  std::lock_guard<std::mutex> lock(ProviderMutex());
  ProviderInstance().reset();
}

std::array<uint8_t, 32> SHA256_Hash(std::span<const uint8_t> data) {
  return GetCryptoProviderShared()->SHA256(data);
}

}  // namespace vk::crypto
