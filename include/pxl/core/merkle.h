#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

#include "pxl/core/chunker.h"

namespace pxl::core {

using ChunkDigest = std::array<uint8_t, 32>;
using MerkleRoot = std::array<uint8_t, 32>;

// BLAKE2b-256 of the raw chunk bytes. Leaves carry no domain separation.
ChunkDigest HashChunk(std::span<const uint8_t> bytes);

// BLAKE2b-256 of left || right (raw digests, 64 bytes).
std::array<uint8_t, 32> HashNode(const std::array<uint8_t, 32>& left,
                                 const std::array<uint8_t, 32>& right);

// Reduces the ordered digests to a single root. Adjacent pairs are combined
// left to right; an odd digest at the end of a level is promoted to the next
// level unchanged, never duplicated or padded. One digest is its own root.
// Throws EmptyDigestListError when |digests| is empty.
MerkleRoot BuildRoot(std::span<const ChunkDigest> digests);

// Hashes every chunk into its own result slot using up to |workers| threads
// (0 selects std::thread::hardware_concurrency()). All workers are joined
// before returning; the first worker failure is rethrown.
std::vector<ChunkDigest> HashChunks(std::span<const Chunk> chunks, size_t workers = 0);

bool VerifyChunk(std::span<const uint8_t> bytes, const ChunkDigest& expected);

}  // namespace pxl::core
