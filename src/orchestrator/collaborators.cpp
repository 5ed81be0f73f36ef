#include "pxl/orchestrator/collaborators.h"

#include <algorithm>
#include <array>
#include <ctime>
#include <fstream>
#include <initializer_list>
#include <iomanip>
#include <sstream>
#include <utility>

#include "pxl/platform/hardware_key_registration.h"
#include "pxl/security/secure_memory.h"

#include <unistd.h>

namespace pxl::orchestrator {
namespace {

struct SniffedFormat {
  std::string format{"Unknown"};
  uint32_t width{0};
  uint32_t height{0};
};

bool StartsWith(std::span<const uint8_t> bytes, std::initializer_list<uint8_t> prefix) {
  return bytes.size() >= prefix.size() && std::equal(prefix.begin(), prefix.end(), bytes.begin());
}

std::string TrimWhitespace(const std::string& value) {
  const auto first = value.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) {
    return {};
  }
  const auto last = value.find_last_not_of(" \t\r\n");
  return value.substr(first, last - first + 1);
}

std::string DetectHostname() {
  std::array<char, 256> buffer{};
  if (::gethostname(buffer.data(), buffer.size()) != 0) {
    return {};
  }
  buffer.back() = '\0';
  return std::string(buffer.data());
}

uint32_t ReadBigEndian32(const uint8_t* p) {
  return (static_cast<uint32_t>(p[0]) << 24) | (static_cast<uint32_t>(p[1]) << 16) |
         (static_cast<uint32_t>(p[2]) << 8) | static_cast<uint32_t>(p[3]);
}

uint32_t ReadLittleEndian16(const uint8_t* p) {
  return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8);
}

SniffedFormat Sniff(std::span<const uint8_t> image) {
  SniffedFormat result;
  if (StartsWith(image, {0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A})) {
    result.format = "PNG";
    // IHDR is always the first chunk: width and height at offsets 16 and 20.
    if (image.size() >= 24) {
      result.width = ReadBigEndian32(image.data() + 16);
      result.height = ReadBigEndian32(image.data() + 20);
    }
  } else if (StartsWith(image, {'G', 'I', 'F', '8'})) {
    result.format = "GIF";
    if (image.size() >= 10) {
      result.width = ReadLittleEndian16(image.data() + 6);
      result.height = ReadLittleEndian16(image.data() + 8);
    }
  } else if (StartsWith(image, {0xFF, 0xD8, 0xFF})) {
    result.format = "JPEG";
  } else if (image.size() >= 12 && StartsWith(image, {'R', 'I', 'F', 'F'}) &&
             std::equal(image.begin() + 8, image.begin() + 12, "WEBP")) {
    result.format = "WEBP";
  } else if (StartsWith(image, {'I', 'I', 0x2A, 0x00}) || StartsWith(image, {'M', 'M', 0x00, 0x2A})) {
    result.format = "TIFF";
  }
  return result;
}

std::string FormatIsoTimestamp(std::chrono::system_clock::time_point tp) {
  auto tt = std::chrono::system_clock::to_time_t(tp);
  std::tm tm{};
  gmtime_r(&tt, &tm);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
  return oss.str();
}

}  // namespace

SyntheticMetadataExtractor::SyntheticMetadataExtractor()
    : SyntheticMetadataExtractor([] { return std::chrono::system_clock::now(); }) {}

SyntheticMetadataExtractor::SyntheticMetadataExtractor(Clock clock) : clock_(std::move(clock)) {}

pxl::core::Metadata SyntheticMetadataExtractor::Extract(std::span<const uint8_t> image) {
  const auto sniffed = Sniff(image);
  pxl::core::Metadata metadata;
  metadata["width"] = std::to_string(sniffed.width);
  metadata["height"] = std::to_string(sniffed.height);
  metadata["format"] = sniffed.format;
  metadata["make"] = "Unknown";
  metadata["model"] = "Unknown";
  metadata["datetime_original"] = FormatIsoTimestamp(clock_());
  metadata["source"] = "synthetic";
  metadata["byte_size"] = std::to_string(image.size());
  return metadata;
}

std::string DetectDeviceId(const std::filesystem::path& machine_id_path) {
  std::ifstream in(machine_id_path);
  std::string line;
  if (in && std::getline(in, line)) {
    line = TrimWhitespace(line);
    if (!line.empty()) {
      return line;
    }
  }
  return DetectHostname();
}

DerivingKeyStore::DerivingKeyStore(pxl::provenance::IdentityConfig config,
                                   pxl::provenance::HardwareKeyRegistry& registry)
    : config_(std::move(config)), registry_(registry) {
  if (config_.device_id.empty()) {
    config_.device_id = DetectDeviceId();
  }
}

DerivingKeyStore::~DerivingKeyStore() {
  pxl::security::SecureWipe(config_.app_secret);
}

pxl::provenance::DeviceIdentity DerivingKeyStore::LoadOrCreateIdentity() {
  pxl::platform::RegisterPlatformHardwareKeys(registry_, config_);
  return pxl::provenance::AcquireIdentity(config_, registry_);
}

}  // namespace pxl::orchestrator
