#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <span>
#include <string>

#include "pxl/core/manifest.h"
#include "pxl/provenance/config.h"
#include "pxl/provenance/hardware_key.h"
#include "pxl/provenance/identity.h"

namespace pxl::orchestrator {

class MetadataExtractor {
 public:
  virtual ~MetadataExtractor() = default;
  virtual pxl::core::Metadata Extract(std::span<const uint8_t> image) = 0;
};

// Used when no EXIF/XMP extractor is available. Produces width, height,
// format, make, model, datetime_original (ISO 8601, UTC), source=synthetic
// and byte_size. Format and dimensions are sniffed from PNG, GIF, JPEG,
// WebP and TIFF signatures; anything else reports "Unknown" and 0x0.
class SyntheticMetadataExtractor final : public MetadataExtractor {
 public:
  using Clock = std::function<std::chrono::system_clock::time_point()>;

  SyntheticMetadataExtractor();
  explicit SyntheticMetadataExtractor(Clock clock);

  pxl::core::Metadata Extract(std::span<const uint8_t> image) override;

 private:
  Clock clock_;
};

class KeyStore {
 public:
  virtual ~KeyStore() = default;
  virtual pxl::provenance::DeviceIdentity LoadOrCreateIdentity() = 0;
};

// Trimmed first line of machine_id_path, or the hostname when that is
// missing or blank. Empty when neither is available.
std::string DetectDeviceId(const std::filesystem::path& machine_id_path = "/etc/machine-id");

// Never persists anything: registers the configured platform providers, then
// acquires a hardware identity or derives the fallback one on every call.
// An empty device_id is filled from DetectDeviceId() at construction.
class DerivingKeyStore final : public KeyStore {
 public:
  explicit DerivingKeyStore(pxl::provenance::IdentityConfig config,
                            pxl::provenance::HardwareKeyRegistry& registry =
                                pxl::provenance::HardwareKeyRegistry::Instance());
  ~DerivingKeyStore() override;

  pxl::provenance::DeviceIdentity LoadOrCreateIdentity() override;

 private:
  pxl::provenance::IdentityConfig config_;
  pxl::provenance::HardwareKeyRegistry& registry_;
};

}  // namespace pxl::orchestrator
