#include "pxl/crypto/digest.h"

#include <sodium.h>

#include "pxl/crypto/provider.h"

namespace pxl::crypto {

Digest Sha256(ByteView data) { return GetCryptoProviderShared()->SHA256(data); }

Digest Blake2b256(ByteView data) { return GetCryptoProviderShared()->BLAKE2b256(data); }

void FillRandom(std::span<uint8_t> out) {
  if (out.empty()) {
    return;
  }
  EnsureCryptoProviderInitialized();
  randombytes_buf(out.data(), out.size());
}

bool ConstantTimeEqual(ByteView a, ByteView b) noexcept {
  if (a.size() != b.size()) {
    return false;
  }
  if (a.empty()) {
    return true;
  }
  return sodium_memcmp(a.data(), b.data(), a.size()) == 0;
}

}  // namespace pxl::crypto
