#include "vk/core/info_file.h"
#include "vk/core/info_file_io.h"

#include <algorithm>
#include <cassert>
#include <cstddef>
#include <cstdint>
#include <iostream>
#include <string>
#include <variant>
#include <vector>

#include "vk/error.h"
#include "vk/tlv/writer.h"
#include "test_helpers.h"

namespace {

vk::core::PassphraseEntry MakePassphraseEntry(uint8_t seed) {
  vk::core::PassphraseEntry entry;
  entry.salt.fill(seed);
  entry.confirmation_hash.fill(static_cast<uint8_t>(seed + 1));
  entry.wrapped_master_key.assign(40, static_cast<uint8_t>(seed + 2));
  entry.kdf = vk::testing::FastKdf();
  return entry;
}

vk::core::AsymmetricEntry MakeAsymmetricEntry(std::string id) {
  return vk::core::AsymmetricEntry{std::move(id), std::vector<uint8_t>(92, 0x5A)};
}

bool ThrowsValidation(const std::vector<uint8_t>& bytes) {
  try {
    (void)vk::core::DecodeInfoFile(bytes);
  } catch (const vk::Error& err) {
    return err.domain == vk::ErrorDomain::Validation;
  }
  return false;
}

void TestInvariants() {
  vk::core::InfoFile info(2);
  info.AdvanceVersion(3);
  assert(info.version() == 3);
  bool threw = false;
  try {
    info.AdvanceVersion(2);
  } catch (const vk::Error& err) {
    threw = err.code == vk::errors::validation::kVersionRegression;
  }
  assert(threw && "version must never decrease");
  assert(info.version() == 3);

  info.AddAsymmetric(MakeAsymmetricEntry("ABC"));
  threw = false;
  try {
    info.AddAsymmetric(MakeAsymmetricEntry("abc"));
  } catch (const vk::KeyError& err) {
    threw = err.kind == vk::FactorErrorKind::kDuplicateFactor;
  }
  assert(threw && "recipient ids compare case-insensitively");
  assert(info.HasRecipient("aBc"));
  assert(info.AsymmetricCount() == 1);

  info.AddPassphrase(MakePassphraseEntry(0x10));
  assert(info.PassphraseCount() == 1);
  const auto id = vk::core::PassphraseFactorId(std::get<vk::core::PassphraseEntry>(info.keys()[1]).salt);
  assert(id == "p:1010101010101010");
  assert(info.RemoveFactor(id));
  assert(!info.RemoveFactor(id));
  assert(info.keys().size() == 1);
}

void TestCodecPreservesOrder() {
  vk::core::InfoFile info(3);
  info.AddPassphrase(MakePassphraseEntry(0x01));
  info.AddAsymmetric(MakeAsymmetricEntry("00aa"));
  info.AddPassphrase(MakePassphraseEntry(0x02));

  auto bytes = vk::core::EncodeInfoFile(info);
  assert(std::equal(vk::core::kInfoFileMagic.begin(), vk::core::kInfoFileMagic.end(), bytes.begin()));
  auto decoded = vk::core::DecodeInfoFile(bytes);
  assert(decoded.version() == 3);
  assert(decoded.keys().size() == 3);
  assert(std::holds_alternative<vk::core::PassphraseEntry>(decoded.keys()[0]));
  assert(std::holds_alternative<vk::core::AsymmetricEntry>(decoded.keys()[1]));
  assert(std::holds_alternative<vk::core::PassphraseEntry>(decoded.keys()[2]));
  const auto& first = std::get<vk::core::PassphraseEntry>(decoded.keys()[0]);
  assert(first.salt[0] == 0x01);
  assert(first.kdf == vk::testing::FastKdf());
  assert(first.wrapped_master_key.size() == 40);
  assert(std::get<vk::core::AsymmetricEntry>(decoded.keys()[1]).recipient_id == "00aa");
  assert(std::get<vk::core::PassphraseEntry>(decoded.keys()[2]).salt[0] == 0x02);
  assert(!decoded.HasLegacy());
}

void TestLegacyFieldsSurvive() {
  vk::core::InfoFile info(1);
  vk::core::Salt salt{};
  salt.fill(0x33);
  vk::core::ConfirmationHash hash{};
  hash.fill(0x44);
  info.legacy_salt = salt;
  info.legacy_confirmation_hash = hash;
  info.legacy_kdf = vk::core::KdfParams::Pbkdf2(4096);

  auto decoded = vk::core::DecodeInfoFile(vk::core::EncodeInfoFile(info));
  assert(decoded.version() == 1);
  assert(decoded.HasLegacy());
  assert(*decoded.legacy_salt == salt);
  assert(*decoded.legacy_confirmation_hash == hash);
  assert(decoded.legacy_kdf && decoded.legacy_kdf->pbkdf2_iterations == 4096);
}

void TestMalformedInputs() {
  vk::core::InfoFile info(3);
  info.AddPassphrase(MakePassphraseEntry(0x07));
  const auto good = vk::core::EncodeInfoFile(info);

  auto bad_magic = good;
  bad_magic[0] = 'X';
  assert(ThrowsValidation(bad_magic));

  auto truncated = good;
  truncated.pop_back();
  assert(ThrowsValidation(truncated));

  assert(ThrowsValidation(std::vector<uint8_t>{'V', 'K'}));

  vk::tlv::Writer extra;
  extra.AddU8(0x7777, 1);
  auto unknown = good;
  unknown.insert(unknown.end(), extra.bytes().begin(), extra.bytes().end());
  assert(ThrowsValidation(unknown));

  vk::tlv::Writer version;
  version.AddU32(0x0001, 3);
  auto repeated = good;
  repeated.insert(repeated.end(), version.bytes().begin(), version.bytes().end());
  assert(ThrowsValidation(repeated) && "version record must appear once");

  vk::core::InfoFile dup(3);
  dup.AddAsymmetric(MakeAsymmetricEntry("00bb"));
  auto one = vk::core::EncodeInfoFile(dup);
  vk::core::InfoFile other(3);
  other.AddAsymmetric(MakeAsymmetricEntry("00BB"));
  auto two = vk::core::EncodeInfoFile(other);
  // Splice the second file's entry record (everything after its version record) onto the first.
  const size_t header = vk::core::kInfoFileMagic.size() + 2 + 2 + 4;
  one.insert(one.end(), two.begin() + static_cast<std::ptrdiff_t>(header), two.end());
  assert(ThrowsValidation(one) && "duplicate recipients are rejected on load");
}

void TestSaveAndLoad() {
  vk::testing::TempDir dir("vk_info_file_");
  const auto path = dir.path() / vk::core::kDefaultInfoFileName;

  bool threw = false;
  try {
    (void)vk::core::LoadInfoFile(path);
  } catch (const vk::Error& err) {
    threw = err.domain == vk::ErrorDomain::IO && err.code == vk::errors::io::kInfoFileMissing;
  }
  assert(threw && "missing info file is an IO error");

  vk::core::InfoFile info(3);
  info.AddPassphrase(MakePassphraseEntry(0x21));
  vk::core::SaveInfoFile(path, info);
  info.AddAsymmetric(MakeAsymmetricEntry("00cc"));
  vk::core::SaveInfoFile(path, info);

  auto loaded = vk::core::LoadInfoFile(path);
  assert(loaded.keys().size() == 2);
  assert(loaded.HasRecipient("00CC"));
}

}  // namespace

int main() {
  TestInvariants();
  TestCodecPreservesOrder();
  TestLegacyFieldsSurvive();
  TestMalformedInputs();
  TestSaveAndLoad();
  std::cout << "info file test ok\n";
  return 0;
}
