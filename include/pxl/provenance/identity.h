#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string_view>

#include "pxl/core/manifest.h"
#include "pxl/crypto/provider.h"
#include "pxl/provenance/config.h"
#include "pxl/provenance/hardware_key.h"

namespace pxl::provenance {

using pxl::core::TrustLevel;
using Fingerprint32 = pxl::core::DeviceFingerprint;

enum class KeyOrigin : uint8_t { kHardwareBacked, kDeterministicFallback };

std::string_view KeyOriginName(KeyOrigin origin) noexcept;

inline constexpr std::string_view kFallbackInfo{"PXL-DEVICE-IDENTITY/v1"};

// The device signing identity. Hardware identities hold a handle to the
// capability; fallback identities hold the expanded secret key, wiped on
// destruction. Move-only.
class DeviceIdentity {
 public:
  static DeviceIdentity FromHardware(HardwareKeyCapabilityPtr capability);
  static DeviceIdentity FromSeed(std::span<const uint8_t, pxl::crypto::Ed25519::SEED_SIZE> seed,
                                 KeyOrigin origin = KeyOrigin::kDeterministicFallback);

  DeviceIdentity(DeviceIdentity&& other) noexcept;
  DeviceIdentity& operator=(DeviceIdentity&& other) noexcept;
  DeviceIdentity(const DeviceIdentity&) = delete;
  DeviceIdentity& operator=(const DeviceIdentity&) = delete;
  ~DeviceIdentity();

  const pxl::crypto::Ed25519::PublicKey& public_key() const noexcept { return public_key_; }
  KeyOrigin origin() const noexcept { return origin_; }
  // Capability id for hardware identities, "fallback" otherwise.
  std::string_view signer_id() const noexcept;

 private:
  DeviceIdentity() = default;

  friend pxl::crypto::Ed25519::Signature Sign(const DeviceIdentity& identity,
                                              std::span<const uint8_t> message);

  pxl::crypto::Ed25519::PublicKey public_key_{};
  KeyOrigin origin_{KeyOrigin::kDeterministicFallback};
  HardwareKeyCapabilityPtr hardware_;
  pxl::crypto::Ed25519::SecretKey secret_key_{};
};

// First available capability wins; std::nullopt means no hardware key.
std::optional<DeviceIdentity> AcquireHardwareIdentity(const HardwareKeyRegistry& registry);

// seed = HKDF-SHA256(ikm = app_secret, salt = device_id, info = kFallbackInfo),
// then the Ed25519 keypair of that seed. Deterministic for equal inputs.
// Throws pxl::Error (Validation) when either input is empty.
DeviceIdentity DeriveFallbackIdentity(std::string_view device_id,
                                      std::span<const uint8_t> app_secret);

// Hardware first; the deterministic fallback when no capability is available.
DeviceIdentity AcquireIdentity(const IdentityConfig& config,
                               const HardwareKeyRegistry& registry = HardwareKeyRegistry::Instance());

Fingerprint32 Fingerprint(std::span<const uint8_t, pxl::crypto::Ed25519::PUBLIC_KEY_SIZE> public_key);

constexpr TrustLevel TrustTier(KeyOrigin origin) noexcept {
  return origin == KeyOrigin::kHardwareBacked ? TrustLevel::kHigh : TrustLevel::kMedium;
}

// Throws SignatureError (kSigningFailed) if the produced signature does not
// verify under the identity's public key.
pxl::crypto::Ed25519::Signature Sign(const DeviceIdentity& identity,
                                     std::span<const uint8_t> message);

bool Verify(std::span<const uint8_t, pxl::crypto::Ed25519::PUBLIC_KEY_SIZE> public_key,
            std::span<const uint8_t> message,
            std::span<const uint8_t, pxl::crypto::Ed25519::SIGNATURE_SIZE> signature);

}  // namespace pxl::provenance
