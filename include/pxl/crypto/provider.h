#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>

namespace pxl::crypto {

struct Ed25519 {
  static constexpr size_t PUBLIC_KEY_SIZE = 32;
  static constexpr size_t SECRET_KEY_SIZE = 64;
  static constexpr size_t SEED_SIZE = 32;
  static constexpr size_t SIGNATURE_SIZE = 64;

  using PublicKey = std::array<uint8_t, PUBLIC_KEY_SIZE>;
  using SecretKey = std::array<uint8_t, SECRET_KEY_SIZE>;
  using Seed = std::array<uint8_t, SEED_SIZE>;
  using Signature = std::array<uint8_t, SIGNATURE_SIZE>;
};

class CryptoProvider {
public:
  virtual ~CryptoProvider() = default;

  virtual std::array<uint8_t, 32> SHA256(
      std::span<const uint8_t> data) = 0;

  // Unkeyed BLAKE2b with a 32-byte output.
  virtual std::array<uint8_t, 32> BLAKE2b256(
      std::span<const uint8_t> data) = 0;

  // Expands |seed| into a keypair. Writes the secret key into |secret_key|.
  virtual Ed25519::PublicKey Ed25519KeypairFromSeed(
      std::span<const uint8_t, Ed25519::SEED_SIZE> seed,
      std::span<uint8_t, Ed25519::SECRET_KEY_SIZE> secret_key) = 0;

  virtual Ed25519::Signature Ed25519Sign(
      std::span<const uint8_t> message,
      std::span<const uint8_t, Ed25519::SECRET_KEY_SIZE> secret_key) = 0;

  virtual bool Ed25519Verify(
      std::span<const uint8_t> message,
      std::span<const uint8_t, Ed25519::SIGNATURE_SIZE> signature,
      std::span<const uint8_t, Ed25519::PUBLIC_KEY_SIZE> public_key) = 0;
};

// SHA-256 through OpenSSL EVP; BLAKE2b and Ed25519 through libsodium.
class DefaultCryptoProvider : public CryptoProvider {
public:
  std::array<uint8_t, 32> SHA256(
      std::span<const uint8_t> data) override;

  std::array<uint8_t, 32> BLAKE2b256(
      std::span<const uint8_t> data) override;

  Ed25519::PublicKey Ed25519KeypairFromSeed(
      std::span<const uint8_t, Ed25519::SEED_SIZE> seed,
      std::span<uint8_t, Ed25519::SECRET_KEY_SIZE> secret_key) override;

  Ed25519::Signature Ed25519Sign(
      std::span<const uint8_t> message,
      std::span<const uint8_t, Ed25519::SECRET_KEY_SIZE> secret_key) override;

  bool Ed25519Verify(
      std::span<const uint8_t> message,
      std::span<const uint8_t, Ed25519::SIGNATURE_SIZE> signature,
      std::span<const uint8_t, Ed25519::PUBLIC_KEY_SIZE> public_key) override;
};

std::shared_ptr<CryptoProvider> GetCryptoProviderShared();
CryptoProvider& GetCryptoProvider();
void SetCryptoProvider(std::shared_ptr<CryptoProvider> provider);
void EnsureCryptoProviderInitialized(); // sodium_init plus known-answer self tests
void ResetCryptoProviderForTesting();

}  // namespace pxl::crypto
