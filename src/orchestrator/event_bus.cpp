#include "pxl/orchestrator/event_bus.h"

#include <algorithm>
#include <charconv>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <ctime>
#include <iostream>
#include <iterator>
#include <limits>
#include <system_error>

#include "pxl/common.h"
#include "pxl/crypto/digest.h"

namespace pxl::orchestrator {
namespace {

constexpr size_t kMaxLineBytes = 16 * 1024;
constexpr size_t kDefaultLogBytes = 10 * 1024 * 1024;

// Logger failures go to std::clog; they never fail a pack or verify.
void ReportLoggerFailure(const char* what, const std::error_code& ec = {}) {
  std::clog << "{\"event_id\":\"logger_error\",\"message\":\"" << what << '"';
  if (ec) {
    std::clog << ",\"error_code\":" << ec.value();
  }
  std::clog << '}' << std::endl;
}

void AppendEscaped(std::string& out, std::string_view text) {
  static constexpr char kHex[] = "0123456789abcdef";
  for (unsigned char c : text) {
    switch (c) {
    case '"':  out += "\\\""; break;
    case '\\': out += "\\\\"; break;
    case '\n': out += "\\n"; break;
    case '\r': out += "\\r"; break;
    case '\t': out += "\\t"; break;
    case '\b': out += "\\b"; break;
    case '\f': out += "\\f"; break;
    default:
      if (c < 0x20) {
        out += "\\u00";
        out.push_back(kHex[c >> 4]);
        out.push_back(kHex[c & 0x0F]);
      } else {
        out.push_back(static_cast<char>(c));
      }
    }
  }
}

void AppendQuoted(std::string& out, std::string_view text) {
  out.push_back('"');
  AppendEscaped(out, text);
  out.push_back('"');
}

const char* CategoryName(EventCategory category) {
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

std::string PrivateValue(const EventField& field) {
  switch (field.privacy) {
  case FieldPrivacy::kRedact:
    return "[REDACTED]";
  case FieldPrivacy::kHash:
    return "sha256:" + HashForTelemetry(field.value).substr(0, 16);
  case FieldPrivacy::kPublic:
    break;
  }
  return field.value;
}

std::string UtcTimestamp(std::chrono::system_clock::time_point now) {
  const auto since_epoch = now.time_since_epoch();
  const auto micros =
      std::chrono::duration_cast<std::chrono::microseconds>(since_epoch % std::chrono::seconds(1)).count();
  const std::time_t seconds = std::chrono::system_clock::to_time_t(now);
  std::tm tm{};
  gmtime_r(&seconds, &tm);
  char buffer[40];
  std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02dT%02d:%02d:%02d.%06lldZ", tm.tm_year + 1900,
                tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec, static_cast<long long>(micros));
  return buffer;
}

std::optional<size_t> PositiveSize(const char* text) {
  if (!text || *text == '\0') {
    return std::nullopt;
  }
  unsigned long long value = 0;
  const char* end = text + std::strlen(text);
  auto [ptr, ec] = std::from_chars(text, end, value);
  if (ec != std::errc() || ptr != end || value == 0) {
    return std::nullopt;
  }
  return static_cast<size_t>(std::min<unsigned long long>(value, std::numeric_limits<size_t>::max()));
}

std::filesystem::path Rotated(const std::filesystem::path& base, size_t generation) {
  if (generation == 0) {
    return base;
  }
  auto rotated = base;
  rotated += "." + std::to_string(generation);
  return rotated;
}

std::mutex& BusMutex() {
  static std::mutex mutex;
  return mutex;
}

std::unique_ptr<EventBus>& BusInstance() {
  static std::unique_ptr<EventBus> bus;
  return bus;
}

} // namespace

std::string HashForTelemetry(std::string_view input) {
  if (input.empty()) {
    return "";
  }
  return HexEncode(pxl::crypto::Sha256(AsByteView(input)));
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

std::optional<EventSeverity> ParseSeverity(std::string_view name) noexcept {
  static constexpr EventSeverity kAll[] = {EventSeverity::kDebug, EventSeverity::kInfo, EventSeverity::kWarning,
                                           EventSeverity::kError, EventSeverity::kCritical};
  const auto* match = std::find_if(std::begin(kAll), std::end(kAll),
                                   [name](EventSeverity s) { return name == SeverityToString(s); });
  if (match == std::end(kAll)) {
    return std::nullopt;
  }
  return *match;
}

std::string FormatEventJson(const Event& event, std::string_view timestamp) {
  std::string line = "{\"ts\":";
  AppendQuoted(line, timestamp);
  line += ",\"severity\":";
  AppendQuoted(line, SeverityToString(event.severity));
  line += ",\"category\":";
  AppendQuoted(line, CategoryName(event.category));
  if (!event.event_id.empty()) {
    line += ",\"event_id\":";
    AppendQuoted(line, event.event_id);
  }
  if (!event.message.empty()) {
    line += ",\"message\":";
    AppendQuoted(line, event.message);
  }
  for (const auto& field : event.fields) {
    line.push_back(',');
    AppendQuoted(line, field.key);
    line.push_back(':');
    if (field.numeric && field.privacy == FieldPrivacy::kPublic) {
      line += field.value;
    } else {
      AppendQuoted(line, PrivateValue(field));
    }
  }
  line.push_back('}');
  return line;
}

LoggerOptions LoadLoggerOptionsFromEnvironment() {
  LoggerOptions options;
  if (const char* path = std::getenv("PXL_LOG_PATH"); path && *path != '\0') {
    options.path = std::filesystem::path(path);
  }
  options.max_bytes = PositiveSize(std::getenv("PXL_LOG_MAX_SIZE")).value_or(kDefaultLogBytes);
  if (const char* level = std::getenv("PXL_LOG_LEVEL"); level && *level != '\0') {
    options.min_severity = ParseSeverity(level).value_or(EventSeverity::kInfo);
  }
  return options;
}

JsonLineLogger::JsonLineLogger() : JsonLineLogger(LoadLoggerOptionsFromEnvironment()) {}

JsonLineLogger::JsonLineLogger(LoggerOptions options) : options_(std::move(options)) {
  options_.max_files = std::max<size_t>(options_.max_files, 1);
}

bool JsonLineLogger::OpenLocked() {
  if (stream_.is_open()) {
    return true;
  }
  const auto parent = options_.path->parent_path();
  if (!parent.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      ReportLoggerFailure("cannot create log directory", ec);
      return false;
    }
  }
  stream_.open(*options_.path, std::ios::out | std::ios::app);
  if (!stream_.is_open()) {
    ReportLoggerFailure("cannot open log file");
    return false;
  }
  return true;
}

// pxl.log -> pxl.log.1 -> ... -> pxl.log.<max_files>; the oldest is dropped.
void JsonLineLogger::RotateLocked(size_t incoming_bytes) {
  const auto& base = *options_.path;
  std::error_code ec;
  const auto size = std::filesystem::file_size(base, ec);
  if (ec || size == 0 || size + incoming_bytes <= options_.max_bytes) {
    return;
  }
  stream_.close();
  for (size_t generation = options_.max_files; generation > 0; --generation) {
    const auto from = Rotated(base, generation - 1);
    if (!std::filesystem::exists(from, ec)) {
      continue;
    }
    std::filesystem::rename(from, Rotated(base, generation), ec);
    if (ec) {
      ReportLoggerFailure("log rotation failed", ec);
    }
  }
}

void JsonLineLogger::Log(const Event& event) {
  if (event.severity < options_.min_severity) {
    return;
  }
  const auto timestamp = UtcTimestamp(std::chrono::system_clock::now());
  std::string line = FormatEventJson(event, timestamp);
  if (line.size() > kMaxLineBytes) {
    Event oversized;
    oversized.severity = EventSeverity::kWarning;
    oversized.event_id = "event_too_large";
    oversized.message = "Event exceeded the log line limit";
    oversized.fields.emplace_back("original_event_id", event.event_id, FieldPrivacy::kHash);
    oversized.fields.emplace_back("limit_bytes", std::to_string(kMaxLineBytes), FieldPrivacy::kPublic, true);
    line = FormatEventJson(oversized, timestamp);
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if (!options_.path) {
    std::clog << line << std::endl;
    return;
  }
  RotateLocked(line.size() + 1);
  if (!OpenLocked()) {
    return;
  }
  stream_ << line << '\n';
  stream_.flush();
}

JsonLineLogger& DefaultJsonLogger() {
  static JsonLineLogger logger;
  return logger;
}

EventBus::EventBus()
    : subscribers_(std::make_shared<const SubscriberList>(
          SubscriberList{[](const Event& event) { DefaultJsonLogger().Log(event); }})) {}

EventBus& EventBus::Instance() {
  std::lock_guard<std::mutex> lock(BusMutex());
  auto& bus = BusInstance();
  if (!bus) {
    bus = std::make_unique<EventBus>();
  }
  return *bus;
}

std::shared_ptr<const EventBus::SubscriberList> EventBus::Snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return subscribers_;
}

void EventBus::Publish(const Event& event) {
  static thread_local bool publishing = false;
  if (publishing) {
    ReportLoggerFailure("recursive publish suppressed");
    return;
  }
  publishing = true;
  struct Reset {
    ~Reset() { publishing = false; }
  } reset;

  // A failing subscriber is reported and skipped; it never turns the
  // publisher's result into an error.
  const auto subscribers = Snapshot();
  for (const auto& subscriber : *subscribers) {
    if (!subscriber) {
      continue;
    }
    try {
      subscriber(event);
    } catch (const std::exception& ex) {
      std::string line = "{\"event_id\":\"subscriber_error\",\"failed_event_id\":";
      AppendQuoted(line, event.event_id);
      line += ",\"message\":";
      AppendQuoted(line, ex.what());
      line.push_back('}');
      std::clog << line << std::endl;
    }
  }
}

void EventBus::Subscribe(Subscriber fn) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto updated = std::make_shared<SubscriberList>(*subscribers_);
  updated->push_back(std::move(fn));
  subscribers_ = std::move(updated);
}

void ResetEventBusForTesting() {
  std::lock_guard<std::mutex> lock(BusMutex());
  BusInstance().reset();
}

} // namespace pxl::orchestrator
