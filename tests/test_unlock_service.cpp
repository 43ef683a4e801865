#include "vk/orchestrator/unlock_service.h"

#include <algorithm>
#include <cassert>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "vk/common.h"
#include "vk/error.h"
#include "vk/orchestrator/event_bus.h"
#include "vk/orchestrator/key_orchestrator.h"
#include "vk/orchestrator/passphrase_source.h"
#include "test_helpers.h"

namespace {

using vk::orchestrator::UnlockRequest;

struct Fixture {
  Fixture() {
    vk::orchestrator::StaticPassphraseSource source("request phrase");
    auto created = vk::orchestrator::KeyOrchestrator(primitives, source)
                       .CreateRepository(vk::orchestrator::FactorSpec::Passphrase());
    info = std::move(created.info);
    master_hex = vk::HexEncode(created.master_key.AsU8Span());
  }

  vk::orchestrator::DefaultPrimitiveProvider primitives{vk::testing::FastKdf()};
  vk::core::InfoFile info;
  std::string master_hex;
};

std::shared_ptr<std::vector<vk::orchestrator::Event>> RecordEvents() {
  vk::orchestrator::ResetEventBusForTesting();
  auto events = std::make_shared<std::vector<vk::orchestrator::Event>>();
  vk::orchestrator::EventBus::Instance().Subscribe(
      [events](const vk::orchestrator::Event& event) { events->push_back(event); });
  return events;
}

size_t CountUnlocked(const std::vector<vk::orchestrator::Event>& events) {
  return static_cast<size_t>(std::count_if(events.begin(), events.end(), [](const auto& event) {
    return event.event_id == "unlocked";
  }));
}

void TestRequestFiltering() {
  Fixture fixture;
  auto events = RecordEvents();
  vk::orchestrator::UnlockService service(fixture.primitives);

  assert(!service.HandleUnlockRequest(fixture.info, UnlockRequest{"token", "request phrase"}));
  assert(!service.HandleUnlockRequest(fixture.info, UnlockRequest{"Passphrase", "request phrase"}));
  assert(!service.HandleUnlockRequest(fixture.info, UnlockRequest{"passphrase", ""}));
  assert(events->empty() && "ignored requests have no side effects");
}

void TestSuccessfulUnlockPublishes() {
  Fixture fixture;
  auto events = RecordEvents();
  vk::orchestrator::UnlockService service(fixture.primitives);

  auto outcome = service.HandleUnlockRequest(fixture.info, UnlockRequest{"passphrase", "request phrase"});
  assert(outcome && "valid request unlocks");
  assert(vk::HexEncode(outcome->master_key.AsU8Span()) == fixture.master_hex);
  assert(outcome->response.type == "passphrase");
  assert(outcome->response.key_id.rfind("p:", 0) == 0);
  assert(CountUnlocked(*events) == 1);

  const auto it = std::find_if(events->begin(), events->end(),
                               [](const auto& event) { return event.event_id == "unlocked"; });
  assert(it->message == vk::orchestrator::kUnlockedMessage);
  for (const auto& event : *events) {
    assert(event.message.find(fixture.master_hex) == std::string::npos);
    for (const auto& field : event.fields) {
      assert(field.value.find(fixture.master_hex) == std::string::npos && "no key material in events");
      assert(field.value.find("request phrase") == std::string::npos && "no passphrase in events");
    }
  }
}

void TestWrongPassphraseThrows() {
  Fixture fixture;
  auto events = RecordEvents();
  vk::orchestrator::UnlockService service(fixture.primitives);

  bool threw = false;
  try {
    (void)service.HandleUnlockRequest(fixture.info, UnlockRequest{"passphrase", "wrong phrase"});
  } catch (const vk::KeyError& err) {
    threw = err.kind == vk::FactorErrorKind::kInvalidCredentials;
  }
  assert(threw && "bad credentials surface as KeyError");
  assert(CountUnlocked(*events) == 0);
}

void TestSubscriberFailureDoesNotFailUnlock() {
  Fixture fixture;
  vk::orchestrator::ResetEventBusForTesting();
  vk::orchestrator::EventBus::Instance().Subscribe([](const vk::orchestrator::Event& event) {
    if (event.event_id == "unlocked") {
      throw std::runtime_error("subscriber exploded");
    }
  });
  vk::orchestrator::UnlockService service(fixture.primitives);
  auto outcome = service.HandleUnlockRequest(fixture.info, UnlockRequest{"passphrase", "request phrase"});
  assert(outcome && "publish failures are not unlock failures");
}

}  // namespace

int main() {
  TestRequestFiltering();
  TestSuccessfulUnlockPublishes();
  TestWrongPassphraseThrows();
  TestSubscriberFailureDoesNotFailUnlock();
  vk::orchestrator::ResetEventBusForTesting();
  std::cout << "unlock service test ok\n";
  return 0;
}
