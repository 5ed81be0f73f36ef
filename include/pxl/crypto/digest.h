#pragma once

#include <cstdint>
#include <span>

#include "pxl/common.h"

namespace pxl::crypto {

// Both hashes go through the installed CryptoProvider so tests can count or
// intercept them.
Digest Sha256(ByteView data);

// Unkeyed BLAKE2b truncated to 32 bytes at the parameter level (not a prefix
// of BLAKE2b-512).
Digest Blake2b256(ByteView data);

// Fills |out| from the libsodium CSPRNG.
void FillRandom(std::span<uint8_t> out);

// Content comparison in constant time. Lengths are public.
bool ConstantTimeEqual(ByteView a, ByteView b) noexcept;

}  // namespace pxl::crypto
