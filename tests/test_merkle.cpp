#include "pxl/common.h"
#include "pxl/core/chunker.h"
#include "pxl/core/merkle.h"
#include "pxl/error.h"

#include <array>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <vector>

namespace {

using pxl::core::ChunkDigest;

void Require(bool condition, const char* message) {
  if (!condition) {
    std::cerr << "test_merkle: " << message << std::endl;
    std::abort();
  }
}

ChunkDigest Leaf(uint8_t seed) {
  std::array<uint8_t, 4> bytes{seed, static_cast<uint8_t>(seed + 1), static_cast<uint8_t>(seed * 3), 0x5A};
  return pxl::core::HashChunk(bytes);
}

void TestEmptyHashKnownAnswer() {
  // BLAKE2b-256 of the empty string.
  const auto digest = pxl::core::HashChunk(std::span<const uint8_t>());
  Require(pxl::HexEncode(digest) == "0e5751c026e543b2e8ab2eb06099daa1d1e5df47778f7787faab45cdf12fe3a8",
          "BLAKE2b-256 empty-string vector mismatch");
}

void TestSmallTrees() {
  const auto a = Leaf(1);
  const auto b = Leaf(2);
  const auto c = Leaf(3);
  const auto d = Leaf(4);
  const auto e = Leaf(5);

  std::vector<ChunkDigest> one{a};
  Require(pxl::core::BuildRoot(one) == a, "a single digest is its own root");

  std::vector<ChunkDigest> two{a, b};
  Require(pxl::core::BuildRoot(two) == pxl::core::HashNode(a, b), "two digests hash as one node");

  std::vector<ChunkDigest> three{a, b, c};
  const auto promoted = pxl::core::HashNode(pxl::core::HashNode(a, b), c);
  Require(pxl::core::BuildRoot(three) == promoted, "odd digest must be promoted unchanged");
  const auto duplicated =
      pxl::core::HashNode(pxl::core::HashNode(a, b), pxl::core::HashNode(c, c));
  Require(pxl::core::BuildRoot(three) != duplicated, "odd digest must not be duplicated");

  std::vector<ChunkDigest> five{a, b, c, d, e};
  const auto abcd = pxl::core::HashNode(pxl::core::HashNode(a, b), pxl::core::HashNode(c, d));
  Require(pxl::core::BuildRoot(five) == pxl::core::HashNode(abcd, e),
          "five digests must promote the fifth through two levels");
}

void TestDeterminismAndSensitivity() {
  std::vector<ChunkDigest> digests;
  for (uint8_t i = 0; i < 7; ++i) {
    digests.push_back(Leaf(i));
  }
  const auto root = pxl::core::BuildRoot(digests);
  Require(pxl::core::BuildRoot(digests) == root, "root must be deterministic");

  auto flipped = digests;
  flipped[4][0] ^= 0x01;
  Require(pxl::core::BuildRoot(flipped) != root, "flipping a bit must change the root");

  auto swapped = digests;
  std::swap(swapped[1], swapped[2]);
  Require(pxl::core::BuildRoot(swapped) != root, "reordering must change the root");
}

void TestEmptyDigestList() {
  std::vector<ChunkDigest> none;
  bool threw = false;
  try {
    (void)pxl::core::BuildRoot(none);
  } catch (const pxl::EmptyDigestListError&) {
    threw = true;
  }
  Require(threw, "empty digest list must raise EmptyDigestListError");
}

void TestParallelHashing() {
  std::vector<uint8_t> image(1000);
  for (size_t i = 0; i < image.size(); ++i) {
    image[i] = static_cast<uint8_t>(i ^ (i >> 3));
  }
  const auto chunks = pxl::core::Split(image, 64);
  std::vector<ChunkDigest> expected;
  for (const auto& chunk : chunks) {
    expected.push_back(pxl::core::HashChunk(chunk.bytes));
  }
  for (size_t workers : {size_t{0}, size_t{1}, size_t{3}, size_t{8}, size_t{64}}) {
    Require(pxl::core::HashChunks(chunks, workers) == expected,
            "parallel hashing must match sequential hashing in order");
  }
  Require(pxl::core::VerifyChunk(chunks[5].bytes, expected[5]), "VerifyChunk must accept a match");
  Require(!pxl::core::VerifyChunk(chunks[5].bytes, expected[6]), "VerifyChunk must reject a mismatch");
}

}  // namespace

int main() {
  TestEmptyHashKnownAnswer();
  TestSmallTrees();
  TestDeterminismAndSensitivity();
  TestEmptyDigestList();
  TestParallelHashing();
  std::cout << "merkle tests ok\n";
  return 0;
}
