#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace vk::orchestrator {

  // Structured logging primitives
  enum class EventSeverity { kDebug, kInfo, kWarning, kError, kCritical };

  enum class EventCategory { kTelemetry, kLifecycle, kSecurity, kDiagnostics };

  enum class FieldPrivacy { kPublic, kRedact, kHash };

  struct EventField {
    std::string key;
    std::string value;
    FieldPrivacy privacy{FieldPrivacy::kPublic};
    bool numeric{false};

    EventField(std::string k, std::string v, FieldPrivacy p = FieldPrivacy::kPublic,
               bool is_numeric = false)
        : key(std::move(k)), value(std::move(v)), privacy(p), numeric(is_numeric) {}
  };

  struct Event {
    EventCategory category{EventCategory::kDiagnostics};
    EventSeverity severity{EventSeverity::kInfo};
    std::string event_id;
    std::string message;
    std::vector<EventField> fields;
  };

  // Lowercase SHA-256 hex, used for kHash fields.
  std::string HashForTelemetry(std::string_view input);

  const char* SeverityToString(EventSeverity severity) noexcept;
  const char* CategoryToString(EventCategory category) noexcept;
  std::optional<EventSeverity> ParseSeverity(std::string_view text) noexcept;

  // One JSON object per line. Events below |min_severity| are dropped. Without
  // a log path the lines go to |fallback| (std::clog by default).
  class JsonLineLogger {
  public:
    explicit JsonLineLogger(std::optional<std::filesystem::path> log_path = std::nullopt,
                            EventSeverity min_severity = EventSeverity::kInfo,
                            std::ostream* fallback = nullptr);

    void Log(const Event& event);
    static std::string BuildEventJson(const Event& event, const std::string& timestamp);
    static std::string FormatTimestamp(std::chrono::system_clock::time_point tp);

  private:
    void EnsureOpen();

    std::mutex mutex_;
    std::optional<std::filesystem::path> log_path_;
    EventSeverity min_severity_;
    std::ostream* fallback_;
    std::ofstream stream_;
  };

  class EventBus {
  public:
    using Subscriber = std::function<void(const Event&)>;

    static EventBus& Instance();

    // Delivers synchronously to every subscriber. A subscriber that throws is
    // reported on std::clog and never fails the publisher.
    void Publish(const Event& event);
    void Subscribe(Subscriber fn);

  private:
    friend struct EventBusStorage;
    EventBus() = default;

    using SubscriberList = std::vector<Subscriber>;

    std::shared_ptr<const SubscriberList> subscribers_snapshot_;
    std::mutex subscribers_mutex_;
  };

  void ResetEventBusForTesting();

} // namespace vk::orchestrator
