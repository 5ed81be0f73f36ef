#include "pxl/core/chunker.h"

#include <algorithm>
#include <stdexcept>
#include <string>

#include "pxl/error.h"
#include "pxl/errors.h"

namespace pxl::core {

std::vector<Chunk> Split(std::span<const uint8_t> image, size_t chunk_size) {
  if (image.empty()) {
    throw EmptyInputError(std::string(errors::msg::kEmptyImage));
  }
  if (chunk_size == 0) {
    throw std::invalid_argument(std::string(errors::msg::kZeroChunkSize));
  }
  std::vector<Chunk> chunks;
  chunks.reserve(ChunkCountFor(image.size(), chunk_size));
  size_t offset = 0;
  while (offset < image.size()) {
    const size_t length = std::min(chunk_size, image.size() - offset);
    chunks.push_back(Chunk{chunks.size(), image.subspan(offset, length)});
    offset += length;
  }
  return chunks;
}

std::vector<uint8_t> Join(std::span<const Chunk> chunks) {
  size_t total = 0;
  for (const auto& chunk : chunks) {
    total += chunk.bytes.size();
  }
  std::vector<uint8_t> out;
  out.reserve(total);
  for (const auto& chunk : chunks) {
    out.insert(out.end(), chunk.bytes.begin(), chunk.bytes.end());
  }
  return out;
}

}  // namespace pxl::core
