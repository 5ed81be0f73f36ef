#pragma once

#include <string_view>

namespace pxl::errors::msg {
inline constexpr std::string_view kEmptyImage{"Image buffer is empty"};
inline constexpr std::string_view kEmptyDigestList{"Cannot build Merkle root from an empty digest list"};
inline constexpr std::string_view kZeroChunkSize{"Chunk size must be positive"};
inline constexpr std::string_view kImageTooLarge{"Image exceeds the container size limits"};
inline constexpr std::string_view kContainerTruncated{"Container truncated"};
inline constexpr std::string_view kBadMagic{"Container magic mismatch"};
inline constexpr std::string_view kUnsupportedVersion{"Unsupported container version"};
inline constexpr std::string_view kBadChunkLayout{"Container chunk layout invalid"};
inline constexpr std::string_view kBadFooter{"Container footer mismatch"};
inline constexpr std::string_view kTrailingBytes{"Unexpected trailing bytes after footer"};
inline constexpr std::string_view kMalformedManifest{"Manifest malformed"};
inline constexpr std::string_view kLayoutMismatch{"Container header disagrees with signed manifest"};
inline constexpr std::string_view kChunkHashMismatch{"Chunk hash mismatch"};
inline constexpr std::string_view kMerkleRootMismatch{"Merkle root mismatch"};
inline constexpr std::string_view kSignatureInvalid{"Manifest signature does not verify"};
inline constexpr std::string_view kSigningFailed{"Manifest signing failed"};
inline constexpr std::string_view kFingerprintMismatch{"Device fingerprint does not match public key"};
inline constexpr std::string_view kDeclaredKeyMismatch{"Declared public key does not match verification key"};
inline constexpr std::string_view kMissingDeviceId{"Device identifier required for fallback identity"};
inline constexpr std::string_view kMissingAppSecret{"App secret required for fallback identity"};
inline constexpr std::string_view kHardwareKeyUnavailable{"Hardware key capability unavailable"};
inline constexpr std::string_view kSoftwareKeyRejected{"Key is held by a software provider, not hardware"};
inline constexpr std::string_view kTooManyMetadataEntries{"Metadata has more entries than a manifest may carry"};
inline constexpr std::string_view kInvalidUtf8{"Manifest string is not valid UTF-8"};
inline constexpr std::string_view kSodiumInitFailed{"sodium_init failed"};
}  // namespace pxl::errors::msg
