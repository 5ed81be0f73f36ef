#pragma once

#include <memory>
#include <string>
#include <string_view>

#include "pxl/provenance/config.h"
#include "pxl/provenance/hardware_key.h"

// Platform hardware key providers and their registration hook

namespace pxl::platform {

// Ed25519 key reached through an OpenSSL 3 OSSL_STORE URI served by a
// hardware-facing provider, e.g. "pkcs11:" through a PKCS#11 provider. The
// private key stays an EVP_PKEY inside that provider's boundary.
class OsslStoreHardwareKey final : public pxl::provenance::HardwareKeyCapability {
 public:
  // Throws ProvenanceError: kHardwareKeyFailure when the URI does not yield
  // an Ed25519 private key, kSoftwareKeyRejected when the key is held by one
  // of OpenSSL's built-in software providers (e.g. a PEM file decoded by
  // "default"). Only hardware keys may claim High trust.
  static std::shared_ptr<OsslStoreHardwareKey> Open(const std::string& uri);

  ~OsslStoreHardwareKey() override;
  OsslStoreHardwareKey(const OsslStoreHardwareKey&) = delete;
  OsslStoreHardwareKey& operator=(const OsslStoreHardwareKey&) = delete;

  std::string_view Id() const noexcept override { return "ossl-store"; }
  std::string_view Description() const noexcept override { return description_; }
  bool IsAvailable() const noexcept override;
  pxl::crypto::Ed25519::PublicKey PublicKey() override;
  pxl::crypto::Ed25519::Signature Sign(std::span<const uint8_t> message) override;

 private:
  struct KeyHandle;
  OsslStoreHardwareKey(std::unique_ptr<KeyHandle> key, std::string description);

  std::unique_ptr<KeyHandle> key_;
  std::string description_;
};

// Registers every provider the configuration names. A provider that fails to
// open is reported on the event bus and left out, so identity acquisition
// falls back.
void RegisterPlatformHardwareKeys(pxl::provenance::HardwareKeyRegistry& registry,
                                  const pxl::provenance::IdentityConfig& config);

}  // namespace pxl::platform
