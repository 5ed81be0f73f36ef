#include "pxl/provenance/identity.h"

#include <string>
#include <utility>

#include "pxl/common.h"
#include "pxl/crypto/digest.h"
#include "pxl/crypto/hkdf.h"
#include "pxl/error.h"
#include "pxl/errors.h"
#include "pxl/orchestrator/event_bus.h"
#include "pxl/security/secure_memory.h"

namespace pxl::provenance {
namespace {

using pxl::crypto::Ed25519;

constexpr std::string_view kFallbackSignerId{"fallback"};

void PublishIdentityEvent(const DeviceIdentity& identity) {
  orchestrator::Event event;
  event.category = orchestrator::EventCategory::kSecurity;
  event.severity = identity.origin() == KeyOrigin::kHardwareBacked ? orchestrator::EventSeverity::kInfo
                                                                   : orchestrator::EventSeverity::kWarning;
  event.event_id = "identity_acquired";
  event.message = identity.origin() == KeyOrigin::kHardwareBacked
                      ? "Hardware-backed device identity selected"
                      : "Hardware key unavailable; using deterministic fallback identity";
  event.fields.emplace_back("origin", std::string(KeyOriginName(identity.origin())));
  event.fields.emplace_back("signer", std::string(identity.signer_id()));
  event.fields.emplace_back("fingerprint", HexEncode(Fingerprint(identity.public_key())));
  orchestrator::EventBus::Instance().Publish(event);
}

}  // namespace

std::string_view KeyOriginName(KeyOrigin origin) noexcept {
  switch (origin) {
  case KeyOrigin::kHardwareBacked:
    return "hardware_backed";
  case KeyOrigin::kDeterministicFallback:
    return "deterministic_fallback";
  }
  return "deterministic_fallback";
}

DeviceIdentity DeviceIdentity::FromHardware(HardwareKeyCapabilityPtr capability) {
  if (!capability) {
    throw ProvenanceError(std::string(errors::msg::kHardwareKeyUnavailable),
                          errors::provenance::kHardwareKeyFailure);
  }
  DeviceIdentity identity;
  identity.public_key_ = capability->PublicKey();
  identity.origin_ = KeyOrigin::kHardwareBacked;
  identity.hardware_ = std::move(capability);
  return identity;
}

DeviceIdentity DeviceIdentity::FromSeed(std::span<const uint8_t, Ed25519::SEED_SIZE> seed,
                                        KeyOrigin origin) {
  DeviceIdentity identity;
  identity.public_key_ = pxl::crypto::GetCryptoProvider().Ed25519KeypairFromSeed(seed, identity.secret_key_);
  identity.origin_ = origin;
  return identity;
}

DeviceIdentity::DeviceIdentity(DeviceIdentity&& other) noexcept
    : public_key_(other.public_key_),
      origin_(other.origin_),
      hardware_(std::move(other.hardware_)),
      secret_key_(other.secret_key_) {
  pxl::security::SecureWipe(other.secret_key_);
}

DeviceIdentity& DeviceIdentity::operator=(DeviceIdentity&& other) noexcept {
  if (this != &other) {
    public_key_ = other.public_key_;
    origin_ = other.origin_;
    hardware_ = std::move(other.hardware_);
    secret_key_ = other.secret_key_;
    pxl::security::SecureWipe(other.secret_key_);
  }
  return *this;
}

DeviceIdentity::~DeviceIdentity() {
  pxl::security::SecureWipe(secret_key_);
}

std::string_view DeviceIdentity::signer_id() const noexcept {
  if (hardware_) {
    return hardware_->Id();
  }
  return kFallbackSignerId;
}

std::optional<DeviceIdentity> AcquireHardwareIdentity(const HardwareKeyRegistry& registry) {
  for (auto& capability : registry.Capabilities()) {
    if (capability && capability->IsAvailable()) {
      return DeviceIdentity::FromHardware(std::move(capability));
    }
  }
  return std::nullopt;
}

DeviceIdentity DeriveFallbackIdentity(std::string_view device_id,
                                      std::span<const uint8_t> app_secret) {
  if (device_id.empty()) {
    throw Error(ErrorDomain::Validation, errors::validation::kMissingIdentityInput,
                std::string(errors::msg::kMissingDeviceId));
  }
  if (app_secret.empty()) {
    throw Error(ErrorDomain::Validation, errors::validation::kMissingIdentityInput,
                std::string(errors::msg::kMissingAppSecret));
  }
  auto seed = pxl::crypto::HkdfSha256(app_secret, AsByteView(device_id), AsByteView(kFallbackInfo));
  pxl::security::WipeOnExit wipe_seed(seed);
  return DeviceIdentity::FromSeed(seed, KeyOrigin::kDeterministicFallback);
}

DeviceIdentity AcquireIdentity(const IdentityConfig& config, const HardwareKeyRegistry& registry) {
  auto hardware = AcquireHardwareIdentity(registry);
  if (hardware) {
    PublishIdentityEvent(*hardware);
    return std::move(*hardware);
  }
  auto identity = DeriveFallbackIdentity(config.device_id, config.app_secret);
  PublishIdentityEvent(identity);
  return identity;
}

Fingerprint32 Fingerprint(std::span<const uint8_t, Ed25519::PUBLIC_KEY_SIZE> public_key) {
  return pxl::crypto::Sha256(public_key);
}

Ed25519::Signature Sign(const DeviceIdentity& identity, std::span<const uint8_t> message) {
  Ed25519::Signature signature{};
  if (identity.hardware_) {
    signature = identity.hardware_->Sign(message);
  } else {
    signature = pxl::crypto::GetCryptoProvider().Ed25519Sign(message, identity.secret_key_);
  }
  if (!Verify(identity.public_key_, message, signature)) {
    throw SignatureError(std::string(errors::msg::kSigningFailed), errors::signature::kSigningFailed);
  }
  return signature;
}

bool Verify(std::span<const uint8_t, Ed25519::PUBLIC_KEY_SIZE> public_key,
            std::span<const uint8_t> message,
            std::span<const uint8_t, Ed25519::SIGNATURE_SIZE> signature) {
  return pxl::crypto::GetCryptoProvider().Ed25519Verify(message, signature, public_key);
}

}  // namespace pxl::provenance
