#include "pxl/crypto/provider.h"
#include "pxl/error.h"
#include "pxl/errors.h"
#include "pxl/orchestrator/event_bus.h"
#include "pxl/orchestrator/packer.h"
#include "pxl/platform/hardware_key_registration.h"
#include "pxl/provenance/identity.h"

#include <openssl/bio.h>
#include <openssl/evp.h>
#include <openssl/pem.h>

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <random>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace fs = std::filesystem;

namespace {

void Require(bool condition, const std::string& message) {
  if (!condition) {
    std::cerr << "test_hardware_key: " << message << std::endl;
    std::abort();
  }
}

class TempDir {
public:
  TempDir() {
    auto base = fs::temp_directory_path();
    std::mt19937_64 rng(static_cast<uint64_t>(std::chrono::steady_clock::now().time_since_epoch().count()));
    for (int attempt = 0; attempt < 16; ++attempt) {
      auto candidate = base / ("pxl_hwkey_" + std::to_string(rng()));
      std::error_code ec;
      if (fs::create_directory(candidate, ec)) {
        path_ = candidate;
        return;
      }
    }
    throw std::runtime_error("failed to create temporary directory");
  }

  ~TempDir() {
    std::error_code ec;
    fs::remove_all(path_, ec);
  }

  const fs::path& path() const { return path_; }

private:
  fs::path path_;
};

struct PkeyFree {
  void operator()(EVP_PKEY* key) const noexcept { EVP_PKEY_free(key); }
};
using PkeyPtr = std::unique_ptr<EVP_PKEY, PkeyFree>;

struct BioFree {
  void operator()(BIO* bio) const noexcept { BIO_free(bio); }
};

PkeyPtr GenerateKey(const char* type) {
  PkeyPtr key;
  if (std::string(type) == "EC") {
    key.reset(EVP_PKEY_Q_keygen(nullptr, nullptr, "EC", "P-256"));
  } else {
    key.reset(EVP_PKEY_Q_keygen(nullptr, nullptr, type));
  }
  Require(key != nullptr, std::string("key generation failed for ") + type);
  return key;
}

void WritePrivateKeyPem(EVP_PKEY* key, const fs::path& path) {
  std::unique_ptr<BIO, BioFree> bio(BIO_new_file(path.string().c_str(), "w"));
  Require(bio != nullptr, "BIO_new_file failed");
  Require(PEM_write_bio_PrivateKey(bio.get(), key, nullptr, nullptr, 0, nullptr, nullptr) == 1,
          "PEM_write_bio_PrivateKey failed");
}

pxl::crypto::Ed25519::PublicKey RawPublicKey(EVP_PKEY* key) {
  pxl::crypto::Ed25519::PublicKey out{};
  size_t length = out.size();
  Require(EVP_PKEY_get_raw_public_key(key, out.data(), &length) == 1 && length == out.size(),
          "raw public key export failed");
  return out;
}

std::string FileUri(const fs::path& path) {
  return "file:" + path.string();
}

// Stands in for a token-backed key: the EVP_PKEY never leaves this object and
// only sign and public key export are offered.
class InProcessSigner final : public pxl::provenance::HardwareKeyCapability {
 public:
  InProcessSigner() : key_(GenerateKey("ED25519")) {}

  std::string_view Id() const noexcept override { return "test-token"; }
  std::string_view Description() const noexcept override { return "in-process test token"; }
  bool IsAvailable() const noexcept override { return true; }
  pxl::crypto::Ed25519::PublicKey PublicKey() override { return RawPublicKey(key_.get()); }

  pxl::crypto::Ed25519::Signature Sign(std::span<const uint8_t> message) override {
    ++sign_calls;
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    Require(ctx && EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, key_.get()) == 1,
            "test token sign init failed");
    pxl::crypto::Ed25519::Signature signature{};
    size_t length = signature.size();
    Require(EVP_DigestSign(ctx.get(), signature.data(), &length, message.data(), message.size()) == 1,
            "test token sign failed");
    return signature;
  }

  int sign_calls{0};

 private:
  PkeyPtr key_;
};

int CaughtProvenanceCode(const std::string& uri) {
  try {
    (void)pxl::platform::OsslStoreHardwareKey::Open(uri);
  } catch (const pxl::ProvenanceError& err) {
    return err.code;
  }
  return 0;
}

void TestSoftwareKeysRejected(const TempDir& dir) {
  auto key = GenerateKey("ED25519");
  const auto path = dir.path() / "device.pem";
  WritePrivateKeyPem(key.get(), path);

  Require(CaughtProvenanceCode(FileUri(path)) == pxl::errors::provenance::kSoftwareKeyRejected,
          "a PEM key behind a file: URI is a software key");
  Require(CaughtProvenanceCode(path.string()) == pxl::errors::provenance::kSoftwareKeyRejected,
          "a bare PEM path is a software key");
}

void TestRejectsUnusableKeys(const TempDir& dir) {
  auto ec_key = GenerateKey("EC");
  const auto ec_path = dir.path() / "ec.pem";
  WritePrivateKeyPem(ec_key.get(), ec_path);

  const int failure = pxl::errors::provenance::kHardwareKeyFailure;
  Require(CaughtProvenanceCode(FileUri(ec_path)) == failure, "non-Ed25519 key must be rejected");
  Require(CaughtProvenanceCode(FileUri(dir.path() / "missing.pem")) == failure,
          "missing key file must be rejected");
  Require(CaughtProvenanceCode("") == failure, "empty URI must be rejected");
}

void TestRegistrationFallsBack(const TempDir& dir) {
  auto key = GenerateKey("ED25519");
  const auto path = dir.path() / "registered.pem";
  WritePrivateKeyPem(key.get(), path);

  pxl::provenance::IdentityConfig config;
  config.device_id = "device-hw";
  config.app_secret = {1, 2, 3};

  pxl::provenance::HardwareKeyRegistry registry;
  pxl::platform::RegisterPlatformHardwareKeys(registry, config);
  Require(registry.Capabilities().empty(), "no URI must register nothing");

  std::vector<std::string> codes;
  pxl::orchestrator::ResetEventBusForTesting();
  pxl::orchestrator::EventBus::Instance().Subscribe([&codes](const pxl::orchestrator::Event& event) {
    if (event.event_id != "hardware_key_unavailable") {
      return;
    }
    for (const auto& field : event.fields) {
      if (field.key == "code") {
        codes.push_back(field.value);
      }
    }
  });

  config.hardware_key_uri = FileUri(dir.path() / "absent.pem");
  pxl::platform::RegisterPlatformHardwareKeys(registry, config);
  config.hardware_key_uri = FileUri(path);
  pxl::platform::RegisterPlatformHardwareKeys(registry, config);
  Require(registry.Capabilities().empty(), "missing and software keys must be left out");
  Require(codes == std::vector<std::string>{std::to_string(pxl::errors::provenance::kHardwareKeyFailure),
                                            std::to_string(pxl::errors::provenance::kSoftwareKeyRejected)},
          "each refused key must be reported with its reason");
  pxl::orchestrator::ResetEventBusForTesting();

  auto identity = pxl::provenance::AcquireIdentity(config, registry);
  Require(identity.origin() == pxl::provenance::KeyOrigin::kDeterministicFallback,
          "a refused key must lead to the fallback identity");
  Require(identity.public_key() != RawPublicKey(key.get()), "the software key must not be used");

  const auto container = pxl::orchestrator::Pack(std::vector<uint8_t>(4096, 0x5A), {}, identity);
  Require(pxl::orchestrator::Verify(container).trust_level == pxl::core::TrustLevel::kMedium,
          "a software key on disk must never report High trust");
}

void TestHardwareCapabilityReportsHighTrust() {
  auto token = std::make_shared<InProcessSigner>();
  pxl::provenance::HardwareKeyRegistry registry;
  registry.RegisterCapability(token);

  pxl::provenance::IdentityConfig config;
  config.device_id = "device-hw";
  config.app_secret = {1, 2, 3};
  auto identity = pxl::provenance::AcquireIdentity(config, registry);
  Require(identity.origin() == pxl::provenance::KeyOrigin::kHardwareBacked, "token key must be preferred");
  Require(identity.public_key() == token->PublicKey(), "identity key must be the token key");

  std::vector<uint8_t> image(300000);
  for (size_t i = 0; i < image.size(); ++i) {
    image[i] = static_cast<uint8_t>(i * 13);
  }
  const auto container = pxl::orchestrator::Pack(image, {{"source", "hardware"}}, identity);
  Require(token->sign_calls == 1, "the manifest must be signed inside the token");
  const auto result = pxl::orchestrator::Verify(container, token->PublicKey());
  Require(result.verified, "token-signed container must verify");
  Require(result.trust_level == pxl::core::TrustLevel::kHigh, "hardware signing must report High trust");
  Require(result.chunk_count == 2, "300000 bytes span two chunks");
}

}  // namespace

int main() {
  pxl::crypto::EnsureCryptoProviderInitialized();
  TempDir dir;
  TestSoftwareKeysRejected(dir);
  TestRejectsUnusableKeys(dir);
  TestRegistrationFallsBack(dir);
  TestHardwareCapabilityReportsHighTrust();
  std::cout << "hardware key tests ok\n";
  return 0;
}
