#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

#include "pxl/crypto/provider.h"

namespace pxl::core {

inline constexpr std::array<uint8_t, 4> kContainerMagic = {'P', 'X', 'L', '!'};
inline constexpr uint8_t kContainerVersion = 0x01;
inline constexpr std::array<uint8_t, 4> kContainerFooter = {'E', 'N', 'D', '!'};
inline constexpr size_t kSignatureSize = pxl::crypto::Ed25519::SIGNATURE_SIZE;

// MAGIC | VERSION | CHUNK_COUNT | CHUNK_SIZE | LAST_CHUNK_SIZE
inline constexpr size_t kPrefixSize = kContainerMagic.size() + 1;
inline constexpr size_t kHeaderSize = kPrefixSize + 3 * sizeof(uint32_t);

struct ContainerHeader {
  uint32_t chunk_count{0};
  uint32_t chunk_size{0};
  uint32_t last_chunk_size{0};

  [[nodiscard]] uint64_t ImageSize() const noexcept {
    if (chunk_count == 0) {
      return 0;
    }
    return static_cast<uint64_t>(chunk_count - 1) * chunk_size + last_chunk_size;
  }

  bool operator==(const ContainerHeader&) const = default;
};

// Views into a parsed container; valid only while the container bytes live.
struct ContainerView {
  ContainerHeader header;
  std::span<const uint8_t> image;
  std::span<const uint8_t> manifest;
  pxl::crypto::Ed25519::Signature signature{};
};

// Throws pxl::Error (Validation) when the image cannot be described by the
// 32-bit header fields.
ContainerHeader HeaderFor(size_t image_size, size_t chunk_size);

std::vector<uint8_t> EncodeContainer(const ContainerHeader& header,
                                     std::span<const uint8_t> image,
                                     std::span<const uint8_t> manifest,
                                     const pxl::crypto::Ed25519::Signature& signature);

// Structural parse only; nothing is hashed or verified.
// TruncatedError when a field runs past the end of |container|.
// FormatError for bad magic, version, header values, footer or trailing bytes.
ContainerView ParseContainer(std::span<const uint8_t> container);

}  // namespace pxl::core
