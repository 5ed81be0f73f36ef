#include "pxl/core/chunker.h"
#include "pxl/error.h"

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <vector>

namespace {

void Require(bool condition, const char* message) {
  if (!condition) {
    std::cerr << "test_chunker: " << message << std::endl;
    std::abort();
  }
}

std::vector<uint8_t> Pattern(size_t size) {
  std::vector<uint8_t> bytes(size);
  for (size_t i = 0; i < size; ++i) {
    bytes[i] = static_cast<uint8_t>((i * 31 + 7) & 0xFF);
  }
  return bytes;
}

static_assert(pxl::core::ChunkCountFor(1, 4) == 1);
static_assert(pxl::core::ChunkCountFor(4, 4) == 1);
static_assert(pxl::core::ChunkCountFor(5, 4) == 2);
static_assert(pxl::core::ChunkCountFor(1000000, pxl::core::kChunkSize) == 4);

void TestExactMultiple() {
  constexpr size_t C = pxl::core::kChunkSize;
  auto image = Pattern(3 * C);
  auto chunks = pxl::core::Split(image);
  Require(chunks.size() == 3, "3*C bytes must yield three chunks");
  for (size_t i = 0; i < chunks.size(); ++i) {
    Require(chunks[i].index == i, "chunk indices must be sequential");
    Require(chunks[i].bytes.size() == C, "full chunks must be C bytes");
  }
}

void TestRemainder() {
  constexpr size_t C = pxl::core::kChunkSize;
  auto image = Pattern(1000000);
  auto chunks = pxl::core::Split(image);
  Require(chunks.size() == 4, "1,000,000 bytes must yield four chunks");
  Require(chunks[3].bytes.size() == 213408, "last chunk must hold the remainder");
  Require(chunks[0].bytes.size() == C, "first chunk must be full");

  auto one_over = Pattern(C + 1);
  auto split = pxl::core::Split(one_over);
  Require(split.size() == 2 && split[1].bytes.size() == 1, "C+1 bytes must end in a one-byte chunk");

  auto single = Pattern(1);
  Require(pxl::core::Split(single).size() == 1, "one byte must yield one chunk");
}

void TestRoundTrip() {
  for (size_t size : {size_t{1}, size_t{99}, size_t{100}, size_t{101}, size_t{4096}}) {
    auto image = Pattern(size);
    auto chunks = pxl::core::Split(image, 10);
    Require(chunks.size() == pxl::core::ChunkCountFor(size, 10), "chunk count must match ChunkCountFor");
    Require(pxl::core::Join(chunks) == image, "joined chunks must reproduce the image");
  }
}

void TestChunksViewInput() {
  auto image = Pattern(25);
  auto chunks = pxl::core::Split(image, 10);
  Require(chunks[1].bytes.data() == image.data() + 10, "chunks must view the caller's buffer");
}

void TestRejectsBadInput() {
  std::vector<uint8_t> empty;
  bool threw = false;
  try {
    (void)pxl::core::Split(empty);
  } catch (const pxl::EmptyInputError& err) {
    threw = err.domain == pxl::ErrorDomain::Validation;
  }
  Require(threw, "empty image must raise EmptyInputError");

  auto image = Pattern(8);
  threw = false;
  try {
    (void)pxl::core::Split(image, 0);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  Require(threw, "zero chunk size must be rejected");
}

}  // namespace

int main() {
  TestExactMultiple();
  TestRemainder();
  TestRoundTrip();
  TestChunksViewInput();
  TestRejectsBadInput();
  std::cout << "chunker tests ok\n";
  return 0;
}
