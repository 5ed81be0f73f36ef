#include "pxl/crypto/provider.h"

#include <openssl/err.h>
#include <openssl/evp.h>

#include <sodium.h>

#include <algorithm>
#include <array>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

#include "pxl/crypto/digest.h"
#include "pxl/error.h"
#include "pxl/errors.h"

namespace pxl::crypto {

namespace {

std::string BuildOpenSSLErrorMessage(const char* context) {
  unsigned long err = ERR_get_error();
  if (err == 0) {
    return std::string(context) + ": unknown OpenSSL error";
  }

  char buf[256] = {0};
  ERR_error_string_n(err, buf, sizeof(buf));
  std::string message(context);
  message.append(": ");
  message.append(buf);
  return message;
}

[[noreturn]] void ThrowCryptoError(const std::string& message,
                                   int code = pxl::errors::crypto::kOpenSsl) {
  throw pxl::Error(pxl::ErrorDomain::Crypto, code, message);
}

class EVPContextDeleter {
public:
  void operator()(EVP_MD_CTX* ctx) const noexcept { EVP_MD_CTX_free(ctx); }
};

using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, EVPContextDeleter>;

struct RuntimeState {
  std::once_flag once;
  bool kat_passed{false};
};

RuntimeState& MutableRuntimeState() {
  static RuntimeState state{};
  return state;
}

std::mutex& ProviderMutex() {
  static std::mutex mutex;
  return mutex;
}

std::shared_ptr<CryptoProvider>& ProviderInstance() {
  static std::shared_ptr<CryptoProvider> instance;
  return instance;
}

void RunSha256KnownAnswerTest() {
  static constexpr std::array<uint8_t, 3> kMessage{'a', 'b', 'c'};
  static constexpr std::array<uint8_t, 32> kExpected{
      0xba, 0x78, 0x16, 0xbf, 0x8f, 0x01, 0xcf, 0xea, 0x41, 0x41, 0x40, 0xde, 0x5d, 0xae, 0x22, 0x23,
      0xb0, 0x03, 0x61, 0xa3, 0x96, 0x17, 0x7a, 0x9c, 0xb4, 0x10, 0xff, 0x61, 0xf2, 0x00, 0x15, 0xad};

  DefaultCryptoProvider provider;
  const auto digest = provider.SHA256(std::span<const uint8_t>(kMessage.data(), kMessage.size()));
  if (!ConstantTimeEqual(digest, kExpected)) {
    ThrowCryptoError("SHA-256 KAT mismatch");
  }
}

// Pairwise consistency check: a freshly expanded key must verify its own signature
// and reject a modified message.
void RunEd25519PairwiseTest() {
  Ed25519::Seed seed{};
  for (size_t i = 0; i < seed.size(); ++i) {
    seed[i] = static_cast<uint8_t>(i);
  }
  Ed25519::SecretKey secret{};
  DefaultCryptoProvider provider;
  const auto public_key = provider.Ed25519KeypairFromSeed(
      std::span<const uint8_t, Ed25519::SEED_SIZE>(seed),
      std::span<uint8_t, Ed25519::SECRET_KEY_SIZE>(secret));
  std::array<uint8_t, 16> message{};
  message.fill(0x5A);
  const auto signature = provider.Ed25519Sign(
      std::span<const uint8_t>(message.data(), message.size()),
      std::span<const uint8_t, Ed25519::SECRET_KEY_SIZE>(secret));
  sodium_memzero(secret.data(), secret.size());
  const bool accepted = provider.Ed25519Verify(
      std::span<const uint8_t>(message.data(), message.size()),
      std::span<const uint8_t, Ed25519::SIGNATURE_SIZE>(signature),
      std::span<const uint8_t, Ed25519::PUBLIC_KEY_SIZE>(public_key));
  message[0] ^= 0x01;
  const bool rejected = !provider.Ed25519Verify(
      std::span<const uint8_t>(message.data(), message.size()),
      std::span<const uint8_t, Ed25519::SIGNATURE_SIZE>(signature),
      std::span<const uint8_t, Ed25519::PUBLIC_KEY_SIZE>(public_key));
  if (!accepted || !rejected) {
    ThrowCryptoError("Ed25519 pairwise consistency test failed", pxl::errors::crypto::kSodium);
  }
}

void EnsureCryptoRuntimeConfigured() {
  auto& state = MutableRuntimeState();
  std::call_once(state.once, [&state]() {
    if (sodium_init() < 0) {
      ThrowCryptoError(std::string(pxl::errors::msg::kSodiumInitFailed),
                       pxl::errors::crypto::kSodiumInit);
    }
    RunSha256KnownAnswerTest();
    RunEd25519PairwiseTest();
    state.kat_passed = true;
  });
}

}  // namespace

std::array<uint8_t, 32> DefaultCryptoProvider::SHA256(std::span<const uint8_t> data) {
  std::array<uint8_t, 32> digest{};
  MdCtxPtr ctx(EVP_MD_CTX_new());
  if (!ctx) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_MD_CTX_new"));
  }
  if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_DigestInit_ex"));
  }
  if (!data.empty() && EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_DigestUpdate"));
  }
  unsigned int length = 0;
  if (EVP_DigestFinal_ex(ctx.get(), digest.data(), &length) != 1 || length != digest.size()) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_DigestFinal_ex"));
  }
  return digest;
}

std::array<uint8_t, 32> DefaultCryptoProvider::BLAKE2b256(std::span<const uint8_t> data) {
  static_assert(crypto_generichash_BYTES == 32, "libsodium generichash default must be 32 bytes");
  std::array<uint8_t, 32> digest{};
  if (crypto_generichash(digest.data(), digest.size(), data.data(), data.size(), nullptr, 0) != 0) {
    ThrowCryptoError("crypto_generichash failed", pxl::errors::crypto::kSodium);
  }
  return digest;
}

Ed25519::PublicKey DefaultCryptoProvider::Ed25519KeypairFromSeed(
    std::span<const uint8_t, Ed25519::SEED_SIZE> seed,
    std::span<uint8_t, Ed25519::SECRET_KEY_SIZE> secret_key) {
  static_assert(crypto_sign_SEEDBYTES == Ed25519::SEED_SIZE);
  static_assert(crypto_sign_SECRETKEYBYTES == Ed25519::SECRET_KEY_SIZE);
  static_assert(crypto_sign_PUBLICKEYBYTES == Ed25519::PUBLIC_KEY_SIZE);
  Ed25519::PublicKey public_key{};
  if (crypto_sign_seed_keypair(public_key.data(), secret_key.data(), seed.data()) != 0) {
    ThrowCryptoError("crypto_sign_seed_keypair failed", pxl::errors::crypto::kSodium);
  }
  return public_key;
}

Ed25519::Signature DefaultCryptoProvider::Ed25519Sign(
    std::span<const uint8_t> message,
    std::span<const uint8_t, Ed25519::SECRET_KEY_SIZE> secret_key) {
  static_assert(crypto_sign_BYTES == Ed25519::SIGNATURE_SIZE);
  Ed25519::Signature signature{};
  unsigned long long signature_length = 0;
  if (crypto_sign_detached(signature.data(), &signature_length, message.data(), message.size(),
                           secret_key.data()) != 0 ||
      signature_length != signature.size()) {
    ThrowCryptoError("crypto_sign_detached failed", pxl::errors::crypto::kSodium);
  }
  return signature;
}

bool DefaultCryptoProvider::Ed25519Verify(
    std::span<const uint8_t> message,
    std::span<const uint8_t, Ed25519::SIGNATURE_SIZE> signature,
    std::span<const uint8_t, Ed25519::PUBLIC_KEY_SIZE> public_key) {
  return crypto_sign_verify_detached(signature.data(), message.data(), message.size(),
                                     public_key.data()) == 0;
}

std::shared_ptr<CryptoProvider> GetCryptoProviderShared() {
  EnsureCryptoRuntimeConfigured();
  std::lock_guard<std::mutex> lock(ProviderMutex());
  auto& instance = ProviderInstance();
  if (!instance) {
    instance = std::make_shared<DefaultCryptoProvider>();
  }
  return instance;
}

CryptoProvider& GetCryptoProvider() {
  return *GetCryptoProviderShared();
}

void SetCryptoProvider(std::shared_ptr<CryptoProvider> provider) {
  std::lock_guard<std::mutex> lock(ProviderMutex());
  ProviderInstance() = std::move(provider);
}

void EnsureCryptoProviderInitialized() {
  EnsureCryptoRuntimeConfigured();
}

void ResetCryptoProviderForTesting() {
  std::lock_guard<std::mutex> lock(ProviderMutex());
  ProviderInstance().reset();
}

}  // namespace pxl::crypto
