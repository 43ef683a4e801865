#include "vk/orchestrator/key_orchestrator.h"

#include <algorithm>
#include <cassert>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "vk/core/info_file_io.h"
#include "vk/error.h"
#include "vk/orchestrator/event_bus.h"
#include "vk/orchestrator/passphrase_source.h"
#include "vk/orchestrator/primitives.h"
#include "test_helpers.h"

namespace {

using vk::orchestrator::KeyOrchestrator;
using vk::orchestrator::StaticPassphraseSource;
using vk::orchestrator::UpgradeOutcome;

StaticPassphraseSource Answers(std::initializer_list<std::optional<std::string>> answers) {
  return StaticPassphraseSource(std::vector<std::optional<std::string>>(answers));
}

struct LegacyRepository {
  vk::core::InfoFile info{1};
  vk::orchestrator::MasterKey master_key{vk::core::kMasterKeySize};
};

// At version 1 the key derived from the passphrase is the master key.
LegacyRepository MakeLegacy(vk::orchestrator::PrimitiveProvider& primitives, std::string_view passphrase,
                            bool record_kdf) {
  LegacyRepository legacy;
  const auto salt = primitives.GenerateSalt();
  const auto kdf = record_kdf ? vk::testing::FastKdf() : vk::core::LegacyKdfParams();
  auto derived = primitives.DeriveKey(passphrase, salt, kdf);
  legacy.info.legacy_salt = salt;
  legacy.info.legacy_confirmation_hash = derived.confirmation_hash;
  if (record_kdf) {
    legacy.info.legacy_kdf = kdf;
  }
  std::copy_n(derived.wrapping_key.data(), vk::core::kMasterKeySize, legacy.master_key.data());
  return legacy;
}

template <typename Fn>
std::optional<vk::FactorErrorKind> KindOf(Fn&& fn) {
  try {
    fn();
  } catch (const vk::KeyError& err) {
    return err.kind;
  }
  return std::nullopt;
}

void TestCurrentVersionIsUntouched() {
  vk::orchestrator::DefaultPrimitiveProvider primitives(vk::testing::FastKdf());
  auto create = Answers({"current"});
  auto created = KeyOrchestrator(primitives, create).CreateRepository(vk::orchestrator::FactorSpec::Passphrase());
  const auto before = vk::core::EncodeInfoFile(created.info);

  auto none = Answers({});
  KeyOrchestrator orchestrator(primitives, none);
  assert(orchestrator.UpgradeFormat(created.info) == UpgradeOutcome::kAlreadyCurrent);
  assert(orchestrator.UpgradeFormat(created.info) == UpgradeOutcome::kAlreadyCurrent);
  assert(none.prompts() == 0);
  assert(vk::core::EncodeInfoFile(created.info) == before);
}

void TestUnsupportedVersions() {
  vk::orchestrator::DefaultPrimitiveProvider primitives(vk::testing::FastKdf());
  auto none = Answers({});
  KeyOrchestrator orchestrator(primitives, none);
  for (int version : {0, 4, 99, -1}) {
    vk::core::InfoFile info(version);
    assert(KindOf([&] { (void)orchestrator.UpgradeFormat(info); }) == vk::FactorErrorKind::kUnsupportedVersion);
    assert(info.version() == version);
  }
}

void TestLegacyRotation() {
  vk::orchestrator::ResetEventBusForTesting();
  auto upgraded_events = std::make_shared<int>(0);
  vk::orchestrator::EventBus::Instance().Subscribe([upgraded_events](const vk::orchestrator::Event& event) {
    if (event.event_id == "repository_upgraded") {
      ++*upgraded_events;
    }
  });

  vk::orchestrator::DefaultPrimitiveProvider primitives(vk::testing::FastKdf());
  auto legacy = MakeLegacy(primitives, "old secret", true);
  const auto legacy_salt = *legacy.info.legacy_salt;

  auto source = Answers({"old secret"});
  KeyOrchestrator orchestrator(primitives, source);
  assert(orchestrator.UpgradeFormat(legacy.info) == UpgradeOutcome::kUpgraded);
  assert(legacy.info.version() == vk::core::kCurrentInfoFileVersion);
  assert(!legacy.info.HasLegacy());
  assert(!legacy.info.legacy_kdf);
  assert(legacy.info.PassphraseCount() == 1);
  const auto& entry = std::get<vk::core::PassphraseEntry>(legacy.info.keys().front());
  assert(entry.salt != legacy_salt && "migration rotates the salt");
  assert(*upgraded_events == 1);

  auto unlock_source = Answers({"old secret"});
  KeyOrchestrator unlocker(primitives, unlock_source);
  auto unlocked = unlocker.Unlock(vk::core::DecodeInfoFile(vk::core::EncodeInfoFile(legacy.info)));
  assert(std::equal(unlocked.master_key.data(), unlocked.master_key.data() + unlocked.master_key.size(),
                    legacy.master_key.data()) &&
         "the master key survives migration");
  vk::orchestrator::ResetEventBusForTesting();
}

void TestLegacyWithoutRecordedKdf() {
  vk::orchestrator::DefaultPrimitiveProvider writer(vk::testing::FastKdf());
  auto legacy = MakeLegacy(writer, "implicit kdf", false);
  assert(!legacy.info.legacy_kdf);

  // The configured defaults differ from the legacy ones and must not matter.
  const auto configured = vk::core::KdfParams::Pbkdf2(2000);
  assert(!(configured == vk::core::LegacyKdfParams()));
  vk::orchestrator::DefaultPrimitiveProvider primitives(configured);
  auto source = Answers({"implicit kdf"});
  KeyOrchestrator orchestrator(primitives, source);
  assert(orchestrator.UpgradeFormat(legacy.info) == UpgradeOutcome::kUpgraded);
  assert(legacy.info.PassphraseCount() == 1);
  const auto& entry = std::get<vk::core::PassphraseEntry>(legacy.info.keys().front());
  assert(entry.kdf == configured && "the rotated entry uses the configured defaults");

  auto unlock_source = Answers({"implicit kdf"});
  auto unlocked = KeyOrchestrator(primitives, unlock_source).Unlock(legacy.info);
  assert(std::equal(unlocked.master_key.data(), unlocked.master_key.data() + unlocked.master_key.size(),
                    legacy.master_key.data()));
}

void TestWrongPassphraseLeavesInfoUntouched() {
  vk::orchestrator::DefaultPrimitiveProvider primitives(vk::testing::FastKdf());
  auto legacy = MakeLegacy(primitives, "old secret", true);
  const auto before = vk::core::EncodeInfoFile(legacy.info);

  auto wrong = Answers({"not it"});
  KeyOrchestrator orchestrator(primitives, wrong);
  assert(KindOf([&] { (void)orchestrator.UpgradeFormat(legacy.info); }) ==
         vk::FactorErrorKind::kInvalidCredentials);
  assert(vk::core::EncodeInfoFile(legacy.info) == before);

  auto cancelled = Answers({std::nullopt});
  KeyOrchestrator cancelling(primitives, cancelled);
  assert(KindOf([&] { (void)cancelling.UpgradeFormat(legacy.info); }) == vk::FactorErrorKind::kCancelled);
  assert(vk::core::EncodeInfoFile(legacy.info) == before);
}

void TestVersionOneWithoutLegacyFields() {
  vk::orchestrator::DefaultPrimitiveProvider primitives(vk::testing::FastKdf());
  vk::core::InfoFile info(1);
  auto none = Answers({});
  KeyOrchestrator orchestrator(primitives, none);
  assert(orchestrator.UpgradeFormat(info) == UpgradeOutcome::kUpgraded);
  assert(info.version() == vk::core::kCurrentInfoFileVersion);
  assert(info.keys().empty());
  assert(none.prompts() == 0);
}

void TestVersionTwoKeepsEntries() {
  vk::orchestrator::DefaultPrimitiveProvider primitives(vk::testing::FastKdf());
  auto create = Answers({"v2 phrase"});
  auto created = KeyOrchestrator(primitives, create).CreateRepository(vk::orchestrator::FactorSpec::Passphrase());
  vk::core::InfoFile info(2);
  for (const auto& entry : created.info.keys()) {
    info.AddPassphrase(std::get<vk::core::PassphraseEntry>(entry));
  }

  auto none = Answers({});
  KeyOrchestrator orchestrator(primitives, none);
  assert(orchestrator.UpgradeFormat(info) == UpgradeOutcome::kUpgraded);
  assert(info.version() == 3);
  assert(info.PassphraseCount() == 1);
  assert(none.prompts() == 0);
}

}  // namespace

int main() {
  TestCurrentVersionIsUntouched();
  TestUnsupportedVersions();
  TestLegacyRotation();
  TestLegacyWithoutRecordedKdf();
  TestWrongPassphraseLeavesInfoUntouched();
  TestVersionOneWithoutLegacyFields();
  TestVersionTwoKeepsEntries();
  std::cout << "migration test ok\n";
  return 0;
}
