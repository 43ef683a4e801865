#include "vk/orchestrator/event_bus.h"

#include <atomic>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

#include "vk/common.h"
#include "vk/crypto/provider.h"

namespace vk::orchestrator {
namespace {

struct PublishReentrancyGuard {
  explicit PublishReentrancyGuard(bool& flag) : flag_(flag) { flag_ = true; }
  ~PublishReentrancyGuard() { flag_ = false; }
  PublishReentrancyGuard(const PublishReentrancyGuard&) = delete;
  PublishReentrancyGuard& operator=(const PublishReentrancyGuard&) = delete;

 private:
  bool& flag_;
};

std::string EscapeJson(std::string_view text) {
  std::string out;
  out.reserve(text.size() + 8);
  for (unsigned char c : text) {
    switch (c) {
    case '\\':
      out += "\\\\";
      break;
    case '"':
      out += "\\\"";
      break;
    case '\b':
      out += "\\b";
      break;
    case '\f':
      out += "\\f";
      break;
    case '\n':
      out += "\\n";
      break;
    case '\r':
      out += "\\r";
      break;
    case '\t':
      out += "\\t";
      break;
    default:
      if (c < 0x20) {
        std::ostringstream hex;
        hex << "\\u" << std::hex << std::setw(4) << std::setfill('0') << static_cast<int>(c);
        out += hex.str();
      } else {
        out.push_back(static_cast<char>(c));
      }
      break;
    }
  }
  return out;
}

}  // namespace

struct EventBusStorage {
  std::mutex mutex;
  std::unique_ptr<EventBus> instance;
};

namespace {

EventBusStorage& Storage() {
  static EventBusStorage storage;
  return storage;
}

}  // namespace

std::string HashForTelemetry(std::string_view input) {
  if (input.empty()) {
    return "";
  }
  return HexEncode(vk::crypto::SHA256_Hash(AsBytes(input)));
}

const char* SeverityToString(EventSeverity severity) noexcept {
  switch (severity) {
  case EventSeverity::kDebug:
    return "debug";
  case EventSeverity::kInfo:
    return "info";
  case EventSeverity::kWarning:
    return "warning";
  case EventSeverity::kError:
    return "error";
  case EventSeverity::kCritical:
    return "critical";
  }
  return "info";
}

const char* CategoryToString(EventCategory category) noexcept {
  switch (category) {
  case EventCategory::kTelemetry:
    return "telemetry";
  case EventCategory::kLifecycle:
    return "lifecycle";
  case EventCategory::kSecurity:
    return "security";
  case EventCategory::kDiagnostics:
    return "diagnostics";
  }
  return "diagnostics";
}

std::optional<EventSeverity> ParseSeverity(std::string_view text) noexcept {
  for (auto severity : {EventSeverity::kDebug, EventSeverity::kInfo, EventSeverity::kWarning,
                        EventSeverity::kError, EventSeverity::kCritical}) {
    if (EqualsIgnoreCase(text, SeverityToString(severity))) {
      return severity;
    }
  }
  return std::nullopt;
}

JsonLineLogger::JsonLineLogger(std::optional<std::filesystem::path> log_path,
                               EventSeverity min_severity, std::ostream* fallback)
    : log_path_(std::move(log_path)),
      min_severity_(min_severity),
      fallback_(fallback != nullptr ? fallback : &std::clog) {}

std::string JsonLineLogger::FormatTimestamp(std::chrono::system_clock::time_point tp) {
  auto tt = std::chrono::system_clock::to_time_t(tp);
  std::tm tm{};
#if defined(_WIN32)
  gmtime_s(&tm, &tt);
#else
  gmtime_r(&tt, &tm);
#endif
  auto fractional = std::chrono::duration_cast<std::chrono::microseconds>(tp.time_since_epoch()) %
                    std::chrono::seconds(1);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
  oss << '.' << std::setw(6) << std::setfill('0') << fractional.count() << 'Z';
  return oss.str();
}

std::string JsonLineLogger::BuildEventJson(const Event& event, const std::string& timestamp) {
  std::string payload;
  payload.reserve(256);
  payload += "{\"ts\":\"" + EscapeJson(timestamp) + "\"";
  payload += ",\"severity\":\"";
  payload += SeverityToString(event.severity);
  payload += "\",\"category\":\"";
  payload += CategoryToString(event.category);
  payload += "\"";
  if (!event.event_id.empty()) {
    payload += ",\"event_id\":\"" + EscapeJson(event.event_id) + "\"";
  }
  if (!event.message.empty()) {
    payload += ",\"message\":\"" + EscapeJson(event.message) + "\"";
  }
  for (const auto& field : event.fields) {
    payload += ",\"" + EscapeJson(field.key) + "\":";
    std::string sanitized = field.value;
    if (field.privacy == FieldPrivacy::kRedact) {
      sanitized = "[REDACTED]";
    } else if (field.privacy == FieldPrivacy::kHash) {
      sanitized = HashForTelemetry(field.value);
    }
    if (field.numeric && field.privacy == FieldPrivacy::kPublic) {
      payload += sanitized;
    } else {
      payload += "\"" + EscapeJson(sanitized) + "\"";
    }
  }
  payload += "}";
  return payload;
}

void JsonLineLogger::EnsureOpen() {
  if (!log_path_ || stream_.is_open()) {
    return;
  }
  std::error_code ec;
  const auto parent = log_path_->parent_path();
  if (!parent.empty()) {
    std::filesystem::create_directories(parent, ec);
  }
  stream_.open(*log_path_, std::ios::app);
  if (!stream_) {
    *fallback_ << "{\"event\":\"log_open_failed\",\"path\":\""
               << EscapeJson(vk::PathToUtf8String(*log_path_)) << "\"}" << std::endl;
  }
}

void JsonLineLogger::Log(const Event& event) {
  if (static_cast<int>(event.severity) < static_cast<int>(min_severity_)) {
    return;
  }
  const auto line = BuildEventJson(event, FormatTimestamp(std::chrono::system_clock::now()));
  std::lock_guard<std::mutex> guard(mutex_);
  EnsureOpen();
  if (stream_.is_open()) {
    stream_ << line << '\n';
    stream_.flush();
    return;
  }
  *fallback_ << line << std::endl;
}

EventBus& EventBus::Instance() {
  auto& storage = Storage();
  std::lock_guard<std::mutex> guard(storage.mutex);
  if (!storage.instance) {
    storage.instance.reset(new EventBus());
  }
  return *storage.instance;
}

void EventBus::Publish(const Event& event) {
  static thread_local bool in_publish = false;
  if (in_publish) {
    std::clog << "{\"event\":\"event_bus_reentrancy\",\"message\":\"recursive publish suppressed\"}"
              << std::endl;
    return;
  }
  PublishReentrancyGuard guard(in_publish);
  auto targets = std::atomic_load_explicit(&subscribers_snapshot_, std::memory_order_acquire);
  if (!targets) {
    return;
  }
  for (const auto& subscriber : *targets) {
    if (!subscriber) {
      continue;
    }
    try {
      subscriber(event);
    } catch (const std::exception& ex) {
      std::clog << "{\"event\":\"subscriber_failed\",\"event_id\":\"" << EscapeJson(event.event_id)
                << "\",\"error\":\"" << EscapeJson(ex.what()) << "\"}" << std::endl;
    }
  }
}

void EventBus::Subscribe(Subscriber fn) {
  std::lock_guard<std::mutex> guard(subscribers_mutex_);
  auto current = std::atomic_load_explicit(&subscribers_snapshot_, std::memory_order_acquire);
  auto updated = current ? std::make_shared<SubscriberList>(*current) : std::make_shared<SubscriberList>();
  updated->push_back(std::move(fn));
  std::atomic_store_explicit(&subscribers_snapshot_, std::const_pointer_cast<const SubscriberList>(updated),
                             std::memory_order_release);
}

void ResetEventBusForTesting() {
  auto& storage = Storage();
  std::lock_guard<std::mutex> guard(storage.mutex);
  storage.instance.reset();
}

} // namespace vk::orchestrator
