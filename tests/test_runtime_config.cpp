#include "vk/orchestrator/config.h"

#include <cassert>
#include <iostream>
#include <map>
#include <optional>
#include <string>

#include "vk/crypto/argon2id.h"
#include "vk/error.h"

namespace {

vk::orchestrator::EnvLookup FakeEnv(std::map<std::string, std::string> values) {
  return [values = std::move(values)](std::string_view name) -> std::optional<std::string> {
    auto it = values.find(std::string(name));
    if (it == values.end()) {
      return std::nullopt;
    }
    return it->second;
  };
}

std::optional<vk::ErrorDomain> FailureDomain(std::map<std::string, std::string> values) {
  try {
    (void)vk::orchestrator::LoadRuntimeConfig(FakeEnv(std::move(values)));
  } catch (const vk::Error& err) {
    return err.domain;
  }
  return std::nullopt;
}

void TestDefaults() {
  auto config = vk::orchestrator::LoadRuntimeConfig(FakeEnv({{"HOME", "/home/tester"}}));
  assert(config.home == std::filesystem::path("/home/tester") / ".vaultkey");
  assert(config.keyring_dir == config.home / "keyring");
  assert(config.kdf.pbkdf2_iterations == vk::orchestrator::kDefaultPbkdf2Iterations);
  const auto expected = vk::crypto::Argon2idAvailable() ? vk::core::KdfAlgorithm::kArgon2id
                                                        : vk::core::KdfAlgorithm::kPbkdf2;
  assert(config.kdf.algorithm == expected);
  assert(config.kdf.argon2.memory_kib == 65536);
  assert(config.kdf.argon2.time_cost == 3);
  assert(config.kdf.argon2.parallelism == 1);
  assert(!config.log_file);
  assert(config.log_level == vk::orchestrator::EventSeverity::kInfo);
}

void TestOverrides() {
  auto config = vk::orchestrator::LoadRuntimeConfig(FakeEnv({
      {"VK_HOME", "/srv/vk"},
      {"VK_KEYRING_DIR", "/srv/keys"},
      {"VK_KDF", "PBKDF2"},
      {"VK_PBKDF2_ITERATIONS", "250000"},
      {"VK_ARGON2_MEMORY_KIB", "1024"},
      {"VK_ARGON2_TIME_COST", "2"},
      {"VK_ARGON2_PARALLELISM", "4"},
      {"VK_LOG_FILE", "/var/log/vk.jsonl"},
      {"VK_LOG_LEVEL", "warning"},
  }));
  assert(config.home == std::filesystem::path("/srv/vk"));
  assert(config.keyring_dir == std::filesystem::path("/srv/keys"));
  assert(config.kdf.algorithm == vk::core::KdfAlgorithm::kPbkdf2);
  assert(config.kdf.pbkdf2_iterations == 250000);
  assert(config.kdf.argon2.memory_kib == 1024);
  assert(config.kdf.argon2.time_cost == 2);
  assert(config.kdf.argon2.parallelism == 4);
  assert(config.log_file && *config.log_file == std::filesystem::path("/var/log/vk.jsonl"));
  assert(config.log_level == vk::orchestrator::EventSeverity::kWarning);

  auto home_only = vk::orchestrator::LoadRuntimeConfig(FakeEnv({{"VK_HOME", "/srv/vk"}}));
  assert(home_only.keyring_dir == std::filesystem::path("/srv/vk") / "keyring");
}

void TestMalformedValues() {
  using vk::ErrorDomain;
  assert(FailureDomain({{"VK_PBKDF2_ITERATIONS", "abc"}}) == ErrorDomain::Config);
  assert(FailureDomain({{"VK_PBKDF2_ITERATIONS", "12x"}}) == ErrorDomain::Config);
  assert(FailureDomain({{"VK_PBKDF2_ITERATIONS", ""}}) == ErrorDomain::Config);
  assert(FailureDomain({{"VK_PBKDF2_ITERATIONS", "999"}}) == ErrorDomain::Config);
  assert(FailureDomain({{"VK_PBKDF2_ITERATIONS", "10000001"}}) == ErrorDomain::Config);
  assert(FailureDomain({{"VK_PBKDF2_ITERATIONS", "-5"}}) == ErrorDomain::Config);
  assert(FailureDomain({{"VK_ARGON2_MEMORY_KIB", "7"}}) == ErrorDomain::Config);
  assert(FailureDomain({{"VK_ARGON2_TIME_COST", "0"}}) == ErrorDomain::Config);
  assert(FailureDomain({{"VK_ARGON2_PARALLELISM", "17"}}) == ErrorDomain::Config);
  assert(FailureDomain({{"VK_KDF", "scrypt"}}) == ErrorDomain::Config);
  assert(FailureDomain({{"VK_LOG_LEVEL", "loud"}}) == ErrorDomain::Config);
  assert(!FailureDomain({{"VK_PBKDF2_ITERATIONS", "1000"}}));

  if (vk::crypto::Argon2idAvailable()) {
    assert(!FailureDomain({{"VK_KDF", "argon2id"}}));
  } else {
    assert(FailureDomain({{"VK_KDF", "argon2id"}}) == ErrorDomain::Dependency);
  }
}

void TestApplyKdfAlgorithmKeepsCosts() {
  auto kdf = vk::core::KdfParams::Pbkdf2(4321);
  kdf.algorithm = vk::core::KdfAlgorithm::kArgon2id;
  vk::orchestrator::ApplyKdfAlgorithm(kdf, "pbkdf2");
  assert(kdf.algorithm == vk::core::KdfAlgorithm::kPbkdf2);
  assert(kdf.pbkdf2_iterations == 4321);
}

}  // namespace

int main() {
  TestDefaults();
  TestOverrides();
  TestMalformedValues();
  TestApplyKdfAlgorithmKeepsCosts();
  std::cout << "runtime config test ok\n";
  return 0;
}
