#pragma once

#include <condition_variable>
#include <functional>
#include <map>
#include <mutex>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "vk/orchestrator/primitives.h"
#include "vk/sandbox/host_value.h"

namespace vk::sandbox {

inline constexpr std::string_view kModuleNamespace{"VaultKey"};
inline constexpr std::string_view kEntryUnlock{"unlock"};
inline constexpr std::string_view kEntryDecryptRequest{"decryptRequest"};
inline constexpr std::string_view kEntryGetIndex{"getIndex"};

// Content engine behind decryptRequest. Receives the full argument record.
class ContentDecryptor {
 public:
  virtual ~ContentDecryptor() = default;
  virtual HostValue DecryptRequest(std::span<const uint8_t> master_key, const HostValue& args) = 0;
};

// Produces the index handle returned by getIndex.
class IndexProvider {
 public:
  virtual ~IndexProvider() = default;
  virtual HostValue GetIndex(std::span<const uint8_t> master_key) = 0;
};

// Host-facing adapter for sandboxed runtimes. Holds no session state: every
// call carries the master key or info file it needs. Call() never throws;
// failures come back as {error, kind} records.
class SandboxModule {
 public:
  SandboxModule(orchestrator::PrimitiveProvider& primitives, ContentDecryptor& decryptor,
                IndexProvider& index);

  SandboxModule(const SandboxModule&) = delete;
  SandboxModule& operator=(const SandboxModule&) = delete;

  [[nodiscard]] std::vector<std::string> EntryPointNames() const;
  HostValue Call(std::string_view entry_point, const HostValue& args);

  // Blocks until RequestShutdown() is called from any thread.
  void ServeUntilShutdown();
  void RequestShutdown();
  [[nodiscard]] bool shutdown_requested() const;

  static HostValue ErrorRecord(std::string_view message, std::string_view kind);

 private:
  using EntryPoint = std::function<HostValue(const HostValue&)>;

  HostValue Unlock(const HostValue& args);
  HostValue DecryptRequest(const HostValue& args);
  HostValue GetIndex(const HostValue& args);

  orchestrator::PrimitiveProvider& primitives_;
  ContentDecryptor& decryptor_;
  IndexProvider& index_;
  std::map<std::string, EntryPoint, std::less<>> entry_points_;

  mutable std::mutex shutdown_mutex_;
  std::condition_variable shutdown_cv_;
  bool shutdown_{false};
};

}  // namespace vk::sandbox
