#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "pxl/crypto/provider.h"

// Hardware-backed signing key abstractions

namespace pxl::provenance {

// A platform secure key store holding one Ed25519 key. The private key never
// leaves the capability and there is no export operation.
class HardwareKeyCapability {
 public:
  virtual ~HardwareKeyCapability() = default;
  virtual std::string_view Id() const noexcept = 0;
  virtual std::string_view Description() const noexcept = 0;
  virtual bool IsAvailable() const noexcept = 0;
  virtual pxl::crypto::Ed25519::PublicKey PublicKey() = 0;
  virtual pxl::crypto::Ed25519::Signature Sign(std::span<const uint8_t> message) = 0;
};

using HardwareKeyCapabilityPtr = std::shared_ptr<HardwareKeyCapability>;

class HardwareKeyRegistry {
 public:
  static HardwareKeyRegistry& Instance() noexcept;

  HardwareKeyRegistry() = default;
  HardwareKeyRegistry(const HardwareKeyRegistry&) = delete;
  HardwareKeyRegistry& operator=(const HardwareKeyRegistry&) = delete;

  // Replaces an existing capability with the same id.
  void RegisterCapability(HardwareKeyCapabilityPtr capability);
  HardwareKeyCapabilityPtr FindCapability(std::string_view id) const;
  // Registration order; the first available entry is preferred.
  std::vector<HardwareKeyCapabilityPtr> Capabilities() const;
  std::vector<std::string> CapabilityIds() const;
  void Clear();

 private:
  mutable std::mutex mutex_;
  std::vector<HardwareKeyCapabilityPtr> capabilities_;
};

}  // namespace pxl::provenance
