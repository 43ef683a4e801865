#include "vk/orchestrator/io_util.h"

#include <array>
#include <cassert>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

#include "vk/error.h"
#include "test_helpers.h"

namespace {

std::vector<uint8_t> ReadFile(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  return std::vector<uint8_t>(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

size_t CountEntries(const std::filesystem::path& dir) {
  size_t count = 0;
  for ([[maybe_unused]] const auto& entry : std::filesystem::directory_iterator(dir)) {
    ++count;
  }
  return count;
}

void TestCrashBeforeRenameKeepsOldContents() {
  using vk::orchestrator::AtomicReplace;
  using vk::orchestrator::AtomicReplaceHooks;

  vk::testing::TempDir dir("vk_atomic_replace_");
  auto target = dir.path() / "state.bin";
  {
    std::ofstream seed(target, std::ios::binary | std::ios::trunc);
    const std::array<uint8_t, 4> baseline{0xDE, 0xAD, 0xBE, 0xEF};
    seed.write(reinterpret_cast<const char*>(baseline.data()), static_cast<std::streamsize>(baseline.size()));
  }

  AtomicReplaceHooks hooks;
  hooks.before_rename = [](const std::filesystem::path&, const std::filesystem::path&) {
    throw std::runtime_error("simulated crash");
  };

  std::array<uint8_t, 4> update{0xBA, 0xAD, 0xF0, 0x0D};
  bool threw = false;
  try {
    AtomicReplace(target, std::span<const uint8_t>(update.data(), update.size()), hooks);
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw && "Expected simulated crash before rename");

  auto bytes = ReadFile(target);
  assert(bytes.size() == 4);
  assert(bytes[0] == 0xDE && bytes[1] == 0xAD && bytes[2] == 0xBE && bytes[3] == 0xEF);
  assert(CountEntries(dir.path()) == 1 && "temporary file must be cleaned up");

  AtomicReplace(target, std::span<const uint8_t>(update.data(), update.size()));
  bytes = ReadFile(target);
  assert(bytes.size() == 4);
  assert(bytes[0] == 0xBA && bytes[1] == 0xAD && bytes[2] == 0xF0 && bytes[3] == 0x0D);
  assert(CountEntries(dir.path()) == 1);

#ifndef _WIN32
  auto perms = std::filesystem::status(target).permissions();
  assert((perms & (std::filesystem::perms::group_all | std::filesystem::perms::others_all)) ==
             std::filesystem::perms::none &&
         "replaced file must be owner-only");
#endif
}

void TestReadFileBytesReportsMissing() {
  vk::testing::TempDir dir("vk_read_bytes_");
  constexpr int kMissing = vk::errors::io::kInfoFileMissing;
  constexpr int kRead = vk::errors::io::kInfoFileReadFailed;

  bool threw = false;
  try {
    (void)vk::orchestrator::ReadFileBytes(dir.path() / "absent", kMissing, kRead);
  } catch (const vk::Error& err) {
    threw = true;
    assert(err.domain == vk::ErrorDomain::IO);
    assert(err.code == kMissing);
  }
  assert(threw && "missing file must throw");

  const std::array<uint8_t, 3> payload{1, 2, 3};
  vk::orchestrator::AtomicReplace(dir.path() / "present", payload);
  auto bytes = vk::orchestrator::ReadFileBytes(dir.path() / "present", kMissing, kRead);
  assert(bytes == std::vector<uint8_t>({1, 2, 3}));
}

}  // namespace

int main() {
  TestCrashBeforeRenameKeepsOldContents();
  TestReadFileBytesReportsMissing();
  std::cout << "atomic replace tests ok\n";
  return 0;
}
