#include "pxl/provenance/config.h"

#include <cstdlib>
#include <string>

#include "pxl/common.h"
#include "pxl/error.h"

namespace pxl::provenance {
namespace {

constexpr std::string_view kHexPrefix{"hex:"};

std::string Trim(std::string value) {
  const auto first = value.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) {
    return {};
  }
  const auto last = value.find_last_not_of(" \t\r\n");
  return value.substr(first, last - first + 1);
}

std::string EnvOrEmpty(const char* name) {
  const char* value = std::getenv(name);
  return value ? std::string(value) : std::string();
}

}  // namespace

std::optional<std::vector<uint8_t>> ParseAppSecret(std::string_view text) {
  if (text.substr(0, kHexPrefix.size()) == kHexPrefix) {
    return HexDecode(text.substr(kHexPrefix.size()));
  }
  return std::vector<uint8_t>(text.begin(), text.end());
}

IdentityConfig LoadIdentityConfigFromEnvironment() {
  IdentityConfig config;
  config.device_id = Trim(EnvOrEmpty("PXL_DEVICE_ID"));
  const std::string secret = EnvOrEmpty("PXL_APP_SECRET");
  if (!secret.empty()) {
    auto parsed = ParseAppSecret(secret);
    if (!parsed) {
      throw Error(ErrorDomain::Validation, errors::validation::kBadConfiguration,
                  "PXL_APP_SECRET has a malformed hex: value");
    }
    config.app_secret = std::move(*parsed);
  }
  config.hardware_key_uri = Trim(EnvOrEmpty("PXL_HARDWARE_KEY_URI"));
  return config;
}

}  // namespace pxl::provenance
