#pragma once

#include <optional>
#include <string>

#include "vk/core/info_file.h"
#include "vk/orchestrator/key_orchestrator.h"
#include "vk/orchestrator/primitives.h"

namespace vk::orchestrator {

inline constexpr const char* kUnlockRequestTypePassphrase = "passphrase";
inline constexpr const char* kUnlockedMessage = "unlocked";

struct UnlockRequest {
  std::string type;
  std::string passphrase;
};

struct UnlockResponse {
  std::string key_id;
  std::string type;
};

struct UnlockOutcome {
  MasterKey master_key;
  UnlockResponse response;
};

// Serves host unlock requests. Only passphrase requests with a non-empty
// passphrase are handled; anything else yields nullopt without side effects.
// A successful unlock publishes the "unlocked" event on the EventBus.
class UnlockService {
 public:
  explicit UnlockService(PrimitiveProvider& primitives);

  std::optional<UnlockOutcome> HandleUnlockRequest(const core::InfoFile& info,
                                                   const UnlockRequest& request);

 private:
  PrimitiveProvider& primitives_;
};

}  // namespace vk::orchestrator
