#include <algorithm>
#include <array>
#include <cassert>
#include <cstdint>
#include <iostream>
#include <memory>
#include <span>
#include <string>
#include <vector>

#include "vk/common.h"
#include "vk/crypto/aes_kw.h"
#include "vk/crypto/hkdf.h"
#include "vk/crypto/pbkdf2.h"
#include "vk/crypto/provider.h"
#include "vk/crypto/sealed_box.h"
#include "vk/error.h"
#include "vk/orchestrator/key_orchestrator.h"
#include "vk/orchestrator/passphrase_source.h"
#include "vk/orchestrator/primitives.h"
#include "test_helpers.h"

namespace {

std::vector<uint8_t> FromHex(std::string_view hex) {
  auto decoded = vk::HexDecode(hex);
  assert(decoded && "test vector must be valid hex");
  return *decoded;
}

void TestPbkdf2Vector() {
  // PBKDF2-HMAC-SHA256("password", "salt", 1, 32)
  std::array<uint8_t, 32> out{};
  vk::crypto::PBKDF2_HMAC_SHA256(vk::AsBytes(std::string_view("password")), vk::AsBytes(std::string_view("salt")),
                                 1, out);
  assert(vk::HexEncode(out) == "120fb6cffcf8b32c43e7225256c4f837a86548c92ccc35480805987cb70be17b");

  // Multi-block output: the first block must match the single-block result.
  std::array<uint8_t, 64> wide{};
  vk::crypto::PBKDF2_HMAC_SHA256(vk::AsBytes(std::string_view("password")), vk::AsBytes(std::string_view("salt")),
                                 1, wide);
  assert(std::equal(out.begin(), out.end(), wide.begin()));
  assert(!std::equal(out.begin(), out.end(), wide.begin() + 32));
}

void TestHkdfVector() {
  // RFC 5869 test case 1, first 32 bytes of OKM.
  std::vector<uint8_t> ikm(22, 0x0b);
  auto salt = FromHex("000102030405060708090a0b0c");
  auto info = FromHex("f0f1f2f3f4f5f6f7f8f9");
  auto okm = vk::crypto::HKDF_SHA256(ikm, salt, info);
  assert(vk::HexEncode(okm) == "3cb25f25faacd57a90434f64d0362f2a2d2d0a90cf1a5a4c5db02d56ecc4c5bf");
}

void TestKeyWrapVector() {
  // RFC 3394 section 4.6: 256-bit key data with a 256-bit KEK.
  auto kek = FromHex("000102030405060708090a0b0c0d0e0f101112131415161718191a1b1c1d1e1f");
  auto key_data = FromHex("00112233445566778899aabbccddeeff000102030405060708090a0b0c0d0e0f");
  auto wrapped = vk::crypto::AES256_KeyWrap(std::span<const uint8_t, 32>(kek.data(), 32), key_data);
  assert(vk::HexEncode(wrapped) ==
         "28c9f404c4b810f4cbccb35cfb87f8263f5786e2d80ed326cbc7f0e71a99f43bfb988b9b7a02dd21");
  auto unwrapped = vk::crypto::AES256_KeyUnwrap(std::span<const uint8_t, 32>(kek.data(), 32), wrapped);
  assert(std::equal(key_data.begin(), key_data.end(), unwrapped.data(), unwrapped.data() + unwrapped.size()));
}

void TestDeriveKeySplitsOutput() {
  vk::orchestrator::DefaultPrimitiveProvider primitives(vk::testing::FastKdf());
  const auto salt = primitives.GenerateSalt();
  auto first = primitives.DeriveKey("correct horse", salt, vk::testing::FastKdf());
  auto second = primitives.DeriveKey("correct horse", salt, vk::testing::FastKdf());
  assert(std::equal(first.wrapping_key.data(), first.wrapping_key.data() + first.wrapping_key.size(),
                    second.wrapping_key.data()) && "derivation must be deterministic");
  assert(first.confirmation_hash == second.confirmation_hash);
  assert(!std::equal(first.confirmation_hash.begin(), first.confirmation_hash.end(), first.wrapping_key.data()) &&
         "wrapping key and confirmation hash come from different halves");

  auto other_salt = salt;
  other_salt[0] ^= 0x01;
  auto salted = primitives.DeriveKey("correct horse", other_salt, vk::testing::FastKdf());
  assert(salted.confirmation_hash != first.confirmation_hash);

  auto other_passphrase = primitives.DeriveKey("correct horse!", salt, vk::testing::FastKdf());
  assert(other_passphrase.confirmation_hash != first.confirmation_hash);
}

void TestWrapRoundTripAndTamper() {
  vk::orchestrator::DefaultPrimitiveProvider primitives(vk::testing::FastKdf());
  auto master = primitives.GenerateMasterKey();
  assert(master.size() == 32);
  auto derived = primitives.DeriveKey("wrap me", primitives.GenerateSalt(), vk::testing::FastKdf());

  auto wrapped = primitives.Wrap(derived.wrapping_key.AsU8Span(), master.AsU8Span());
  assert(wrapped.size() == 40);
  auto unwrapped = primitives.Unwrap(derived.wrapping_key.AsU8Span(), wrapped);
  assert(std::equal(master.data(), master.data() + master.size(), unwrapped.data()));

  wrapped[5] ^= 0x80;
  bool threw = false;
  try {
    (void)primitives.Unwrap(derived.wrapping_key.AsU8Span(), wrapped);
  } catch (const vk::AuthenticationFailureError&) {
    threw = true;
  }
  assert(threw && "tampered wrap must fail the integrity check");
}

void TestSealedBox() {
  auto& provider = vk::crypto::GetCryptoProvider();
  auto recipient = provider.GenerateX25519();
  auto stranger = provider.GenerateX25519();
  const std::vector<uint8_t> payload(32, 0x42);

  auto box = vk::crypto::SealedBoxSeal(payload, recipient.public_key);
  assert(box.size() == vk::crypto::SealedBox::kMinimumSize + payload.size());
  auto addressed = vk::crypto::SealedBoxRecipient(box);
  assert(addressed && *addressed == vk::crypto::FingerprintForPublicKey(recipient.public_key));

  auto opened = vk::crypto::SealedBoxOpen(
      box, std::span<const uint8_t, 32>(recipient.private_key.data(), 32), recipient.public_key);
  assert(opened && "recipient must open the box");
  assert(std::equal(payload.begin(), payload.end(), opened->data(), opened->data() + opened->size()));

  auto wrong = vk::crypto::SealedBoxOpen(
      box, std::span<const uint8_t, 32>(stranger.private_key.data(), 32), stranger.public_key);
  assert(!wrong && "box addressed to another key must not open");

  box.back() ^= 0x01;
  auto tampered = vk::crypto::SealedBoxOpen(
      box, std::span<const uint8_t, 32>(recipient.private_key.data(), 32), recipient.public_key);
  assert(!tampered && "tampered ciphertext must fail authentication");

  const std::vector<uint8_t> garbage(8, 0x00);
  assert(!vk::crypto::SealedBoxRecipient(garbage));
  bool threw = false;
  try {
    (void)vk::crypto::SealedBoxOpen(
        garbage, std::span<const uint8_t, 32>(recipient.private_key.data(), 32), recipient.public_key);
  } catch (const vk::Error& err) {
    threw = err.domain == vk::ErrorDomain::Validation;
  }
  assert(threw && "non-box input is a validation error");
}

// OpenSSL provider whose key wrap reports a library failure.
class FailingWrapProvider : public vk::crypto::OpenSSLCryptoProvider {
public:
  std::vector<uint8_t> WrapKeyAES256(std::span<const uint8_t, vk::crypto::AES256_KW::KEY_SIZE>,
                                     std::span<const uint8_t>) override {
    ++wrap_calls;
    throw vk::Error(vk::ErrorDomain::Crypto, 0, "EVP_CipherFinal_ex failed");
  }

  int wrap_calls{0};
};

void TestProviderFailureSurfacesAsPrimitiveFailure() {
  auto failing = std::make_shared<FailingWrapProvider>();
  vk::crypto::SetCryptoProvider(failing);

  vk::orchestrator::DefaultPrimitiveProvider primitives(vk::testing::FastKdf());
  vk::orchestrator::StaticPassphraseSource source("provider failure");
  vk::orchestrator::KeyOrchestrator orchestrator(primitives, source);
  bool surfaced = false;
  try {
    (void)orchestrator.CreateRepository(vk::orchestrator::FactorSpec::Passphrase());
  } catch (const vk::KeyError& err) {
    surfaced = err.kind == vk::FactorErrorKind::kPrimitiveFailure &&
               err.detail.find("EVP_CipherFinal_ex") != std::string::npos;
  }
  assert(surfaced && "provider errors reach callers as PrimitiveFailure");
  assert(failing->wrap_calls == 1);

  vk::crypto::ResetCryptoProviderForTesting();
  vk::orchestrator::StaticPassphraseSource retry("provider failure");
  auto created = vk::orchestrator::KeyOrchestrator(primitives, retry)
                     .CreateRepository(vk::orchestrator::FactorSpec::Passphrase());
  assert(created.info.PassphraseCount() == 1 && "reset restores the OpenSSL provider");
  assert(failing->wrap_calls == 1);
}

}  // namespace

int main() {
  TestPbkdf2Vector();
  TestHkdfVector();
  TestKeyWrapVector();
  TestDeriveKeySplitsOutput();
  TestWrapRoundTripAndTamper();
  TestSealedBox();
  TestProviderFailureSurfacesAsPrimitiveFailure();
  std::cout << "crypto primitives test ok\n";
  return 0;
}
