#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace pxl::core {

// Protocol constant. Containers record it, but every writer uses this value.
constexpr size_t kChunkSize = 256 * 1024;

struct Chunk {
  size_t index{0};
  std::span<const uint8_t> bytes{};
};

// Splits |image| into contiguous chunks of |chunk_size| bytes; the last chunk
// holds the remainder. Chunks view |image| and must not outlive it.
// Throws EmptyInputError for an empty buffer and std::invalid_argument for a
// zero chunk size.
std::vector<Chunk> Split(std::span<const uint8_t> image, size_t chunk_size = kChunkSize);

std::vector<uint8_t> Join(std::span<const Chunk> chunks);

[[nodiscard]] constexpr size_t ChunkCountFor(size_t total_size, size_t chunk_size) noexcept {
  if (chunk_size == 0) {
    return 0;
  }
  return total_size / chunk_size + (total_size % chunk_size != 0 ? 1 : 0);
}

}  // namespace pxl::core
