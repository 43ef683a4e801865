#include "vk/orchestrator/event_bus.h"

#include <cassert>
#include <chrono>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

#include "test_helpers.h"

namespace {

using vk::orchestrator::Event;
using vk::orchestrator::EventCategory;
using vk::orchestrator::EventSeverity;
using vk::orchestrator::FieldPrivacy;
using vk::orchestrator::JsonLineLogger;

Event SampleEvent() {
  Event event;
  event.category = EventCategory::kSecurity;
  event.severity = EventSeverity::kWarning;
  event.event_id = "unlock_failed";
  event.message = "quote \" and newline\n";
  event.fields.emplace_back("count", "2", FieldPrivacy::kPublic, true);
  event.fields.emplace_back("recipient", "secret-id", FieldPrivacy::kRedact);
  event.fields.emplace_back("path", "abc", FieldPrivacy::kHash);
  return event;
}

void TestJsonFormatting() {
  const auto line = JsonLineLogger::BuildEventJson(SampleEvent(), "2026-01-02T03:04:05.000006Z");
  assert(line.rfind("{\"ts\":\"2026-01-02T03:04:05.000006Z\"", 0) == 0);
  assert(line.find("\"severity\":\"warning\"") != std::string::npos);
  assert(line.find("\"category\":\"security\"") != std::string::npos);
  assert(line.find("\"event_id\":\"unlock_failed\"") != std::string::npos);
  assert(line.find("quote \\\" and newline\\n") != std::string::npos && "messages are escaped");
  assert(line.find("\"count\":2") != std::string::npos);
  assert(line.find("secret-id") == std::string::npos);
  assert(line.find("\"recipient\":\"[REDACTED]\"") != std::string::npos);
  assert(line.find("ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad") != std::string::npos &&
         "hashed fields carry SHA-256 hex");
  assert(line.back() == '}');

  const auto stamp = JsonLineLogger::FormatTimestamp(std::chrono::system_clock::time_point{});
  assert(stamp == "1970-01-01T00:00:00.000000Z");
}

void TestSeverityFilterAndFallback() {
  std::ostringstream sink;
  JsonLineLogger logger(std::nullopt, EventSeverity::kError, &sink);
  logger.Log(SampleEvent());
  assert(sink.str().empty() && "warnings are below the error threshold");

  auto event = SampleEvent();
  event.severity = EventSeverity::kCritical;
  logger.Log(event);
  assert(sink.str().find("\"severity\":\"critical\"") != std::string::npos);
}

void TestFileSink() {
  vk::testing::TempDir dir("vk_event_log_");
  const auto path = dir.path() / "logs" / "vk.jsonl";
  {
    std::ostringstream unused;
    JsonLineLogger logger(path, EventSeverity::kDebug, &unused);
    logger.Log(SampleEvent());
    logger.Log(SampleEvent());
    assert(unused.str().empty());
  }
  std::ifstream in(path);
  std::string line;
  int lines = 0;
  while (std::getline(in, line)) {
    assert(line.front() == '{' && line.back() == '}');
    ++lines;
  }
  assert(lines == 2);
}

void TestBusDelivery() {
  vk::orchestrator::ResetEventBusForTesting();
  auto& bus = vk::orchestrator::EventBus::Instance();
  int delivered = 0;
  bus.Subscribe([](const Event&) { throw std::runtime_error("first subscriber fails"); });
  bus.Subscribe([&delivered](const Event&) { ++delivered; });
  bus.Publish(SampleEvent());
  assert(delivered == 1 && "a failing subscriber does not stop delivery");

  bool reentered = false;
  vk::orchestrator::ResetEventBusForTesting();
  vk::orchestrator::EventBus::Instance().Subscribe([&reentered](const Event& event) {
    if (event.event_id == "outer") {
      Event inner;
      inner.event_id = "inner";
      vk::orchestrator::EventBus::Instance().Publish(inner);
    } else {
      reentered = true;
    }
  });
  Event outer;
  outer.event_id = "outer";
  vk::orchestrator::EventBus::Instance().Publish(outer);
  assert(!reentered && "recursive publish is suppressed");
  vk::orchestrator::ResetEventBusForTesting();
}

}  // namespace

int main() {
  TestJsonFormatting();
  TestSeverityFilterAndFallback();
  TestFileSink();
  TestBusDelivery();
  std::cout << "event bus test ok\n";
  return 0;
}
