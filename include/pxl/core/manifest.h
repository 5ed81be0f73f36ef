#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "pxl/core/chunker.h"
#include "pxl/core/merkle.h"
#include "pxl/crypto/provider.h"

namespace pxl::core {

enum class TrustLevel : uint8_t { kHigh, kMedium };

std::string_view TrustLevelName(TrustLevel level) noexcept;
std::optional<TrustLevel> ParseTrustLevel(std::string_view name) noexcept;

// Ordered by key bytes; the ordering is what the canonical form relies on.
using Metadata = std::map<std::string, std::string>;

using DeviceFingerprint = std::array<uint8_t, 32>;

struct Manifest {
  Metadata metadata;
  std::vector<ChunkDigest> chunk_hashes;
  MerkleRoot merkle_root{};
  DeviceFingerprint device_fingerprint{};
  TrustLevel trust_level{TrustLevel::kMedium};
  uint64_t chunk_size{kChunkSize};
  uint64_t total_size{0};
  uint64_t num_chunks{0};
  pxl::crypto::Ed25519::PublicKey public_key{};

  bool operator==(const Manifest&) const = default;
};

// Upper bound on metadata entries, enforced by both Canonicalize and
// ParseManifest so every manifest that can be signed can also be parsed.
inline constexpr size_t kMaxMetadataEntries = 4096;

// Compact JSON with keys sorted by byte value at every level, separators ","
// and ":" and no whitespace. Strings are emitted as pure ASCII: printable
// characters verbatim, everything else as short escapes or lowercase \uXXXX
// (surrogate pairs above U+FFFF). Digests are lowercase hex strings.
// Throws pxl::Error (Validation) if a metadata string is not valid UTF-8 or
// the metadata exceeds kMaxMetadataEntries.
std::vector<uint8_t> Canonicalize(const Manifest& manifest);
std::string CanonicalizeToString(const Manifest& manifest);

// Strict inverse of Canonicalize. Unknown, missing or duplicate keys, wrong
// value types, malformed escapes and non-lowercase hex all throw FormatError.
Manifest ParseManifest(std::span<const uint8_t> bytes);

}  // namespace pxl::core
