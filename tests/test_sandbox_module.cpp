#include "vk/sandbox/sandbox_module.h"

#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "vk/core/info_file_io.h"
#include "vk/error.h"
#include "vk/orchestrator/event_bus.h"
#include "vk/orchestrator/key_orchestrator.h"
#include "vk/orchestrator/passphrase_source.h"
#include "vk/sandbox/host_value.h"
#include "test_helpers.h"

namespace {

using vk::sandbox::HostValue;

class EchoDecryptor : public vk::sandbox::ContentDecryptor {
 public:
  HostValue DecryptRequest(std::span<const uint8_t> master_key, const HostValue& args) override {
    ++calls;
    if (const auto* path = args.Get("path"); path != nullptr && path->AsString() == "fail") {
      throw std::runtime_error("content engine failure");
    }
    auto out = HostValue::Record();
    out.Set("keyBytes", HostValue::Number(static_cast<double>(master_key.size())));
    out.Set("path", args.Get("path") != nullptr ? *args.Get("path") : HostValue::Null());
    return out;
  }

  int calls{0};
};

class FixedIndex : public vk::sandbox::IndexProvider {
 public:
  HostValue GetIndex(std::span<const uint8_t> master_key) override {
    auto out = HostValue::Record();
    out.Set("entries", HostValue::Number(3));
    out.Set("firstKeyByte", HostValue::Number(master_key[0]));
    return out;
  }
};

struct Fixture {
  Fixture() : module(primitives, decryptor, index) {
    vk::orchestrator::StaticPassphraseSource source("sandbox phrase");
    auto created = vk::orchestrator::KeyOrchestrator(primitives, source)
                       .CreateRepository(vk::orchestrator::FactorSpec::Passphrase());
    info_bytes = vk::core::EncodeInfoFile(created.info);
    master_key.assign(created.master_key.data(), created.master_key.data() + created.master_key.size());
  }

  HostValue UnlockArgs(std::string passphrase) const {
    auto args = HostValue::Record();
    args.Set("info", HostValue::Bytes(info_bytes));
    args.Set("passphrase", HostValue::String(std::move(passphrase)));
    return args;
  }

  vk::orchestrator::DefaultPrimitiveProvider primitives{vk::testing::FastKdf()};
  EchoDecryptor decryptor;
  FixedIndex index;
  vk::sandbox::SandboxModule module;
  std::vector<uint8_t> info_bytes;
  std::vector<uint8_t> master_key;
};

std::string ErrorKind(const HostValue& value) {
  const auto* kind = value.Get("kind");
  assert(value.Get("error") != nullptr && kind != nullptr && "expected an error record");
  return kind->AsString();
}

void TestEntryPoints() {
  Fixture fixture;
  const auto names = fixture.module.EntryPointNames();
  assert((names == std::vector<std::string>{"decryptRequest", "getIndex", "unlock"}));

  auto result = fixture.module.Call("mount", HostValue::Record());
  assert(ErrorKind(result) == "NotFound");
}

void TestUnlock() {
  Fixture fixture;
  auto result = fixture.module.Call(vk::sandbox::kEntryUnlock, fixture.UnlockArgs("sandbox phrase"));
  assert(result.IsRecord());
  assert(result.Get("masterKey")->AsBytes() == fixture.master_key);
  assert(result.Get("type")->AsString() == "passphrase");
  assert(result.Get("keyId")->AsString().rfind("p:", 0) == 0);

  auto wrong = fixture.module.Call(vk::sandbox::kEntryUnlock, fixture.UnlockArgs("wrong"));
  assert(ErrorKind(wrong) == "InvalidCredentials");

  auto empty = fixture.module.Call(vk::sandbox::kEntryUnlock, fixture.UnlockArgs(""));
  assert(empty.IsUndefined() && "empty passphrase is not handled");

  auto missing = fixture.module.Call(vk::sandbox::kEntryUnlock, HostValue::Record());
  assert(ErrorKind(missing) == "Validation");

  auto garbage = HostValue::Record();
  garbage.Set("info", HostValue::Bytes(std::vector<uint8_t>{1, 2, 3}));
  garbage.Set("passphrase", HostValue::String("sandbox phrase"));
  assert(ErrorKind(fixture.module.Call(vk::sandbox::kEntryUnlock, garbage)) == "Validation");
}

void TestDecryptAndIndex() {
  Fixture fixture;
  auto args = HostValue::Record();
  args.Set("masterKey", HostValue::Bytes(fixture.master_key));
  args.Set("path", HostValue::String("/notes/today.md"));

  auto decrypted = fixture.module.Call(vk::sandbox::kEntryDecryptRequest, args);
  assert(decrypted.Get("keyBytes")->AsNumber() == 32.0);
  assert(decrypted.Get("path")->AsString() == "/notes/today.md");
  assert(fixture.decryptor.calls == 1);

  auto indexed = fixture.module.Call(vk::sandbox::kEntryGetIndex, args);
  assert(indexed.Get("entries")->AsNumber() == 3.0);
  assert(indexed.Get("firstKeyByte")->AsNumber() == static_cast<double>(fixture.master_key[0]));

  auto short_key = HostValue::Record();
  short_key.Set("masterKey", HostValue::Bytes(std::vector<uint8_t>(16, 0x01)));
  assert(ErrorKind(fixture.module.Call(vk::sandbox::kEntryGetIndex, short_key)) == "Validation");
  assert(ErrorKind(fixture.module.Call(vk::sandbox::kEntryDecryptRequest, short_key)) == "Validation");
  assert(fixture.decryptor.calls == 1);

  args.Set("path", HostValue::String("fail"));
  assert(ErrorKind(fixture.module.Call(vk::sandbox::kEntryDecryptRequest, args)) == "Internal");
}

void TestHostValueSemantics() {
  auto record = HostValue::Record();
  record.Set("a", HostValue::Number(1));
  record.Set("b", HostValue::Bool(true));
  record.Set("a", HostValue::Number(2));
  assert(record.fields().size() == 2);
  assert(record.fields()[0].name == "a");
  assert(record.Get("a")->AsNumber() == 2.0);
  assert(record.Get("missing") == nullptr);

  auto reordered = HostValue::Record();
  reordered.Set("b", HostValue::Bool(true));
  reordered.Set("a", HostValue::Number(2));
  assert(record == reordered);

  bool threw = false;
  try {
    (void)HostValue::String("x").AsBytes();
  } catch (const vk::Error& err) {
    threw = err.code == vk::errors::validation::kHostValueMismatch;
  }
  assert(threw && "kind mismatch is a validation error");

  auto lazy = HostValue::Undefined();
  lazy.Set("k", HostValue::Null());
  assert(lazy.IsRecord());
}

void TestShutdown() {
  Fixture fixture;
  assert(!fixture.module.shutdown_requested());
  std::thread stopper([&fixture] { fixture.module.RequestShutdown(); });
  fixture.module.ServeUntilShutdown();
  stopper.join();
  assert(fixture.module.shutdown_requested());
}

}  // namespace

int main() {
  TestEntryPoints();
  TestUnlock();
  TestDecryptAndIndex();
  TestHostValueSemantics();
  TestShutdown();
  vk::orchestrator::ResetEventBusForTesting();
  std::cout << "sandbox module test ok\n";
  return 0;
}
