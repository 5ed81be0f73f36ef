#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pxl::orchestrator {

  // Pack, verify and identity events. Every event is also written as one
  // JSON line by the default logger.
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

  std::string HashForTelemetry(std::string_view input);

  const char* SeverityToString(EventSeverity severity) noexcept;
  std::optional<EventSeverity> ParseSeverity(std::string_view name) noexcept;

  // One JSON object per line: ts, severity, category, event_id, message, then
  // the fields in insertion order. Redacted fields print as "[REDACTED]" and
  // hashed fields as a SHA-256 tag.
  std::string FormatEventJson(const Event& event, std::string_view timestamp);

  struct LoggerOptions {
    std::optional<std::filesystem::path> path; // unset: std::clog
    size_t max_bytes{10 * 1024 * 1024};
    size_t max_files{3};
    EventSeverity min_severity{EventSeverity::kInfo};
  };

  // PXL_LOG_PATH, PXL_LOG_MAX_SIZE, PXL_LOG_LEVEL. Malformed values fall back
  // to the defaults.
  LoggerOptions LoadLoggerOptionsFromEnvironment();

  class JsonLineLogger {
  public:
    JsonLineLogger();
    explicit JsonLineLogger(LoggerOptions options);

    void Log(const Event& event);

  private:
    bool OpenLocked();
    void RotateLocked(size_t incoming_bytes);

    std::mutex mutex_;
    std::ofstream stream_;
    LoggerOptions options_;
  };

  JsonLineLogger& DefaultJsonLogger();

  class EventBus {
  public:
    using Subscriber = std::function<void(const Event&)>;

    static EventBus& Instance();

    // Delivers synchronously to every subscriber, the default JSON logger
    // first. Recursive publishes from inside a subscriber are dropped. A
    // subscriber throwing std::exception is reported on std::clog and the
    // remaining subscribers still run.
    void Publish(const Event& event);
    void Subscribe(Subscriber fn);

    EventBus();

  private:
    using SubscriberList = std::vector<Subscriber>;

    // Copy-on-write; Publish delivers to the list current when it started.
    std::shared_ptr<const SubscriberList> Snapshot() const;

    mutable std::mutex mutex_;
    std::shared_ptr<const SubscriberList> subscribers_;
  };

  void ResetEventBusForTesting();

} // namespace pxl::orchestrator
