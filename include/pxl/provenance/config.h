#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pxl::provenance {

struct IdentityConfig {
  std::string device_id;
  std::vector<uint8_t> app_secret;
  // OSSL_STORE URI of a hardware key; empty means no platform provider.
  std::string hardware_key_uri;
};

// PXL_DEVICE_ID, PXL_APP_SECRET and PXL_HARDWARE_KEY_URI. Missing values
// stay empty; a malformed PXL_APP_SECRET throws pxl::Error (Validation).
// Host detection of the device id lives in DerivingKeyStore.
IdentityConfig LoadIdentityConfigFromEnvironment();

// "hex:<lowercase hex>" decodes; anything else is taken as raw bytes.
std::optional<std::vector<uint8_t>> ParseAppSecret(std::string_view text);

}  // namespace pxl::provenance
