#include "pxl/platform/hardware_key_registration.h"

#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/provider.h>
#include <openssl/store.h>

#include <algorithm>
#include <array>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include "pxl/error.h"
#include "pxl/errors.h"
#include "pxl/orchestrator/event_bus.h"

namespace pxl::platform {
namespace {

using pxl::crypto::Ed25519;

std::string OpenSslErrorString(const char* context) {
  unsigned long err = ERR_get_error();
  std::string message(context);
  if (err == 0) {
    return message + ": unknown OpenSSL error";
  }
  char buf[256] = {0};
  ERR_error_string_n(err, buf, sizeof(buf));
  message.append(": ");
  message.append(buf);
  ERR_clear_error();
  return message;
}

[[noreturn]] void ThrowHardwareFailure(const std::string& message) {
  throw ProvenanceError(std::string(errors::msg::kHardwareKeyUnavailable) + ": " + message,
                        errors::provenance::kHardwareKeyFailure);
}

struct StoreCloser {
  void operator()(OSSL_STORE_CTX* ctx) const noexcept { OSSL_STORE_close(ctx); }
};

struct StoreInfoFree {
  void operator()(OSSL_STORE_INFO* info) const noexcept { OSSL_STORE_INFO_free(info); }
};

struct MdCtxFree {
  void operator()(EVP_MD_CTX* ctx) const noexcept { EVP_MD_CTX_free(ctx); }
};

// Providers that decode keys into process memory. A key they hold is a
// software key whatever URI it was loaded from.
constexpr std::array<std::string_view, 4> kSoftwareProviders{"default", "base", "fips", "legacy"};

bool HeldBySoftwareProvider(const EVP_PKEY* key) {
  const OSSL_PROVIDER* provider = EVP_PKEY_get0_provider(key);
  if (provider == nullptr) {
    return true;  // legacy EVP_PKEY with no provider
  }
  const char* name = OSSL_PROVIDER_get0_name(provider);
  if (name == nullptr) {
    return true;
  }
  return std::find(kSoftwareProviders.begin(), kSoftwareProviders.end(), std::string_view(name)) !=
         kSoftwareProviders.end();
}

// URIs may carry a PIN ("pin-value=") so only the scheme is kept for display.
std::string DescribeUri(const std::string& uri) {
  const auto colon = uri.find(':');
  const std::string scheme = colon == std::string::npos ? std::string("file") : uri.substr(0, colon);
  return "OpenSSL store key (" + scheme + ")";
}

}  // namespace

struct OsslStoreHardwareKey::KeyHandle {
  struct PkeyFree {
    void operator()(EVP_PKEY* key) const noexcept { EVP_PKEY_free(key); }
  };
  std::unique_ptr<EVP_PKEY, PkeyFree> pkey;
};

OsslStoreHardwareKey::OsslStoreHardwareKey(std::unique_ptr<KeyHandle> key, std::string description)
    : key_(std::move(key)), description_(std::move(description)) {}

OsslStoreHardwareKey::~OsslStoreHardwareKey() = default;

std::shared_ptr<OsslStoreHardwareKey> OsslStoreHardwareKey::Open(const std::string& uri) {
  if (uri.empty()) {
    ThrowHardwareFailure("empty key URI");
  }
  std::unique_ptr<OSSL_STORE_CTX, StoreCloser> store(
      OSSL_STORE_open(uri.c_str(), nullptr, nullptr, nullptr, nullptr));
  if (!store) {
    ThrowHardwareFailure(OpenSslErrorString("OSSL_STORE_open"));
  }
  if (OSSL_STORE_expect(store.get(), OSSL_STORE_INFO_PKEY) != 1) {
    ThrowHardwareFailure(OpenSslErrorString("OSSL_STORE_expect"));
  }

  auto handle = std::make_unique<KeyHandle>();
  while (!handle->pkey && OSSL_STORE_eof(store.get()) == 0) {
    std::unique_ptr<OSSL_STORE_INFO, StoreInfoFree> info(OSSL_STORE_load(store.get()));
    if (!info) {
      if (OSSL_STORE_error(store.get()) != 0) {
        ThrowHardwareFailure(OpenSslErrorString("OSSL_STORE_load"));
      }
      break;
    }
    if (OSSL_STORE_INFO_get_type(info.get()) == OSSL_STORE_INFO_PKEY) {
      handle->pkey.reset(OSSL_STORE_INFO_get1_PKEY(info.get()));
    }
  }
  if (!handle->pkey) {
    ThrowHardwareFailure("no private key at URI");
  }
  if (EVP_PKEY_is_a(handle->pkey.get(), "ED25519") != 1) {
    ThrowHardwareFailure("key is not Ed25519");
  }
  if (HeldBySoftwareProvider(handle->pkey.get())) {
    throw ProvenanceError(std::string(errors::msg::kSoftwareKeyRejected) + " (" + DescribeUri(uri) + ")",
                          errors::provenance::kSoftwareKeyRejected);
  }
  return std::shared_ptr<OsslStoreHardwareKey>(
      new OsslStoreHardwareKey(std::move(handle), DescribeUri(uri)));
}

bool OsslStoreHardwareKey::IsAvailable() const noexcept {
  return key_ && key_->pkey;
}

Ed25519::PublicKey OsslStoreHardwareKey::PublicKey() {
  if (!IsAvailable()) {
    ThrowHardwareFailure("key handle released");
  }
  Ed25519::PublicKey public_key{};
  size_t length = public_key.size();
  if (EVP_PKEY_get_raw_public_key(key_->pkey.get(), public_key.data(), &length) != 1 ||
      length != public_key.size()) {
    ThrowHardwareFailure(OpenSslErrorString("EVP_PKEY_get_raw_public_key"));
  }
  return public_key;
}

Ed25519::Signature OsslStoreHardwareKey::Sign(std::span<const uint8_t> message) {
  if (!IsAvailable()) {
    ThrowHardwareFailure("key handle released");
  }
  std::unique_ptr<EVP_MD_CTX, MdCtxFree> ctx(EVP_MD_CTX_new());
  if (!ctx) {
    ThrowHardwareFailure(OpenSslErrorString("EVP_MD_CTX_new"));
  }
  // Ed25519 is a one-shot scheme; no digest is configured.
  if (EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, key_->pkey.get()) != 1) {
    ThrowHardwareFailure(OpenSslErrorString("EVP_DigestSignInit"));
  }
  Ed25519::Signature signature{};
  size_t length = signature.size();
  if (EVP_DigestSign(ctx.get(), signature.data(), &length, message.data(), message.size()) != 1 ||
      length != signature.size()) {
    throw SignatureError(OpenSslErrorString("EVP_DigestSign"), errors::signature::kSigningFailed);
  }
  return signature;
}

void RegisterPlatformHardwareKeys(pxl::provenance::HardwareKeyRegistry& registry,
                                  const pxl::provenance::IdentityConfig& config) {
  if (config.hardware_key_uri.empty()) {
    return;
  }
  try {
    registry.RegisterCapability(OsslStoreHardwareKey::Open(config.hardware_key_uri));
  } catch (const ProvenanceError& err) {
    orchestrator::Event event;
    event.category = orchestrator::EventCategory::kSecurity;
    event.severity = orchestrator::EventSeverity::kWarning;
    event.event_id = "hardware_key_unavailable";
    event.message = err.what();
    event.fields.emplace_back("provider", "ossl-store");
    event.fields.emplace_back("code", std::to_string(err.code), orchestrator::FieldPrivacy::kPublic, true);
    event.fields.emplace_back("uri", config.hardware_key_uri, orchestrator::FieldPrivacy::kHash);
    orchestrator::EventBus::Instance().Publish(event);
  }
}

}  // namespace pxl::platform
