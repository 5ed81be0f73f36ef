#include "pxl/orchestrator/event_bus.h"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

using namespace pxl::orchestrator;

void Require(bool condition, const std::string& message) {
  if (!condition) {
    std::cerr << "test_event_bus: " << message << std::endl;
    std::abort();
  }
}

std::vector<std::string> ReadLines(const std::filesystem::path& path) {
  std::ifstream in(path);
  std::vector<std::string> lines;
  std::string line;
  while (std::getline(in, line)) {
    lines.push_back(line);
  }
  return lines;
}

Event SampleEvent() {
  Event event;
  event.category = EventCategory::kSecurity;
  event.severity = EventSeverity::kWarning;
  event.event_id = "verify_failed";
  event.message = "Chunk \"2\" mismatch";
  event.fields.emplace_back("chunk_index", "2", FieldPrivacy::kPublic, true);
  event.fields.emplace_back("secret", "hunter2", FieldPrivacy::kRedact);
  event.fields.emplace_back("device", "device-1", FieldPrivacy::kHash);
  return event;
}

void TestFormatting() {
  const auto line = FormatEventJson(SampleEvent(), "2024-01-01T00:00:00.000000Z");
  const std::string device_tag = "sha256:" + HashForTelemetry("device-1").substr(0, 16);
  const std::string expected =
      "{\"ts\":\"2024-01-01T00:00:00.000000Z\",\"severity\":\"warning\",\"category\":\"security\","
      "\"event_id\":\"verify_failed\",\"message\":\"Chunk \\\"2\\\" mismatch\",\"chunk_index\":2,"
      "\"secret\":\"[REDACTED]\",\"device\":\"" + device_tag + "\"}";
  Require(line == expected, "unexpected event JSON: " + line);
  Require(line.find("hunter2") == std::string::npos, "redacted value must not appear");
  Require(line.find("device-1") == std::string::npos, "hashed value must not appear");
  Require(HashForTelemetry("").empty(), "empty input hashes to an empty tag");
}

void TestSeverityNames() {
  Require(ParseSeverity("debug") == EventSeverity::kDebug, "debug");
  Require(ParseSeverity("critical") == EventSeverity::kCritical, "critical");
  Require(!ParseSeverity("loud").has_value(), "unknown severity");
  Require(std::string(SeverityToString(EventSeverity::kError)) == "error", "error name");
}

void TestFileLoggerAndRotation() {
  auto dir = std::filesystem::temp_directory_path() / "pxl_event_bus_test";
  std::filesystem::remove_all(dir);
  auto log_path = dir / "logs" / "pxl.log";

  LoggerOptions options;
  options.path = log_path;
  options.max_bytes = 400;
  options.max_files = 2;
  options.min_severity = EventSeverity::kWarning;
  JsonLineLogger logger(options);

  Event debug = SampleEvent();
  debug.severity = EventSeverity::kInfo;
  logger.Log(debug);
  Require(!std::filesystem::exists(log_path), "events below the threshold must be dropped");

  logger.Log(SampleEvent());
  auto lines = ReadLines(log_path);
  Require(lines.size() == 1, "one event must produce one line");
  Require(lines[0].find("\"event_id\":\"verify_failed\"") != std::string::npos, "logged line content");

  for (int i = 0; i < 6; ++i) {
    logger.Log(SampleEvent());
  }
  Require(std::filesystem::exists(log_path.string() + ".1"), "log must rotate past max_bytes");
  Require(!std::filesystem::exists(log_path.string() + ".3"), "rotation must keep at most max_files");
  Require(std::filesystem::file_size(log_path) <= options.max_bytes, "active log stays under the cap");

  std::filesystem::remove_all(dir);
}

void TestEnvironmentOptions() {
  ::setenv("PXL_LOG_PATH", "/tmp/pxl-env.log", 1);
  ::setenv("PXL_LOG_MAX_SIZE", "2048", 1);
  ::setenv("PXL_LOG_LEVEL", "error", 1);
  auto options = LoadLoggerOptionsFromEnvironment();
  Require(options.path && *options.path == "/tmp/pxl-env.log", "log path from environment");
  Require(options.max_bytes == 2048, "log size from environment");
  Require(options.min_severity == EventSeverity::kError, "log level from environment");

  ::setenv("PXL_LOG_MAX_SIZE", "lots", 1);
  ::setenv("PXL_LOG_LEVEL", "verbose", 1);
  options = LoadLoggerOptionsFromEnvironment();
  Require(options.max_bytes == LoggerOptions{}.max_bytes, "malformed size falls back");
  Require(options.min_severity == EventSeverity::kInfo, "malformed level falls back");

  ::unsetenv("PXL_LOG_PATH");
  ::unsetenv("PXL_LOG_MAX_SIZE");
  ::unsetenv("PXL_LOG_LEVEL");
  Require(!LoadLoggerOptionsFromEnvironment().path.has_value(), "no path means std::clog");
}

void TestSubscribers() {
  ResetEventBusForTesting();
  std::vector<std::string> seen;
  EventBus::Instance().Subscribe([&seen](const Event& event) {
    seen.push_back(event.event_id);
    Event nested;
    nested.event_id = "nested";
    EventBus::Instance().Publish(nested);
  });

  Event event;
  event.event_id = "pack_completed";
  EventBus::Instance().Publish(event);
  Require(seen == std::vector<std::string>{"pack_completed"}, "subscriber must see the event once");

  ResetEventBusForTesting();
  EventBus::Instance().Publish(event);
  Require(seen.size() == 1, "reset must drop subscribers");

  EventBus::Instance().Subscribe([](const Event&) { throw std::runtime_error("subscriber failure"); });
  EventBus::Instance().Subscribe([&seen](const Event& delivered) { seen.push_back(delivered.event_id); });
  EventBus::Instance().Publish(event);
  Require(seen.size() == 2 && seen.back() == "pack_completed",
          "a throwing subscriber must not stop delivery to the next one");
  ResetEventBusForTesting();
}

}  // namespace

int main() {
  TestFormatting();
  TestSeverityNames();
  TestFileLoggerAndRotation();
  TestEnvironmentOptions();
  TestSubscribers();
  std::cout << "event bus tests ok\n";
  return 0;
}
