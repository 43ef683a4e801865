#include "vk/orchestrator/unlock_service.h"

#include <iostream>

#include "vk/orchestrator/event_bus.h"
#include "vk/orchestrator/passphrase_source.h"

namespace vk::orchestrator {

UnlockService::UnlockService(PrimitiveProvider& primitives) : primitives_(primitives) {}

std::optional<UnlockOutcome> UnlockService::HandleUnlockRequest(const core::InfoFile& info,
                                                                const UnlockRequest& request) {
  if (request.type != kUnlockRequestTypePassphrase || request.passphrase.empty()) {
    return std::nullopt;
  }

  StaticPassphraseSource source(request.passphrase);
  KeyOrchestrator orchestrator(primitives_, source);
  auto result = orchestrator.Unlock(info);

  Event event;
  event.category = EventCategory::kLifecycle;
  event.severity = EventSeverity::kInfo;
  event.event_id = "unlocked";
  event.message = kUnlockedMessage;
  event.fields.emplace_back("factor_kind", std::string(FactorKindName(result.kind)));
  try {
    EventBus::Instance().Publish(event);
  } catch (const std::exception& ex) {
    std::clog << "{\"event\":\"unlocked_publish_failed\",\"error\":\"" << ex.what() << "\"}" << std::endl;
  }

  return UnlockOutcome{std::move(result.master_key),
                       UnlockResponse{result.factor_id, kUnlockRequestTypePassphrase}};
}

}  // namespace vk::orchestrator
