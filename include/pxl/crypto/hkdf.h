#pragma once

#include <cstdint>
#include <span>

#include "pxl/common.h"

namespace pxl::crypto {

// RFC 5869 extract-and-expand with SHA-256, filling all of |okm|. An empty
// salt means a zero-filled salt of hash length. Throws pxl::Error (Crypto)
// when OpenSSL rejects the request, e.g. |okm| longer than 255 * 32 bytes.
void HkdfSha256(ByteView ikm, ByteView salt, ByteView info, std::span<uint8_t> okm);

// Convenience for the common 32-byte case (Ed25519 seeds).
inline Digest HkdfSha256(ByteView ikm, ByteView salt, ByteView info) {
  Digest okm{};
  HkdfSha256(ikm, salt, info, okm);
  return okm;
}

}  // namespace pxl::crypto
