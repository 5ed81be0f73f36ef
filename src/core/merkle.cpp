#include "pxl/core/merkle.h"

#include <algorithm>
#include <cstring>
#include <exception>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "pxl/crypto/digest.h"
#include "pxl/error.h"
#include "pxl/errors.h"

namespace pxl::core {

ChunkDigest HashChunk(std::span<const uint8_t> bytes) {
  return pxl::crypto::Blake2b256(bytes);
}

std::array<uint8_t, 32> HashNode(const std::array<uint8_t, 32>& left,
                                 const std::array<uint8_t, 32>& right) {
  std::array<uint8_t, 64> buffer{};
  std::memcpy(buffer.data(), left.data(), left.size());
  std::memcpy(buffer.data() + left.size(), right.data(), right.size());
  return pxl::crypto::Blake2b256(buffer);
}

MerkleRoot BuildRoot(std::span<const ChunkDigest> digests) {
  if (digests.empty()) {
    throw EmptyDigestListError(std::string(errors::msg::kEmptyDigestList));
  }
  std::vector<std::array<uint8_t, 32>> level(digests.begin(), digests.end());
  while (level.size() > 1) {
    std::vector<std::array<uint8_t, 32>> next;
    next.reserve((level.size() + 1) / 2);
    size_t i = 0;
    for (; i + 1 < level.size(); i += 2) {
      next.push_back(HashNode(level[i], level[i + 1]));
    }
    if (i < level.size()) {
      next.push_back(level[i]);  // odd leftover promoted as-is
    }
    level.swap(next);
  }
  return level.front();
}

std::vector<ChunkDigest> HashChunks(std::span<const Chunk> chunks, size_t workers) {
  std::vector<ChunkDigest> digests(chunks.size());
  if (chunks.empty()) {
    return digests;
  }
  if (workers == 0) {
    workers = std::max<size_t>(1, std::thread::hardware_concurrency());
  }
  workers = std::min(workers, chunks.size());
  if (workers == 1) {
    for (size_t i = 0; i < chunks.size(); ++i) {
      digests[i] = HashChunk(chunks[i].bytes);
    }
    return digests;
  }

  std::exception_ptr failure;
  std::mutex failure_mutex;
  std::vector<std::thread> pool;
  pool.reserve(workers);
  auto join_all = [&pool]() {
    for (auto& thread : pool) {
      if (thread.joinable()) {
        thread.join();
      }
    }
  };
  try {
    for (size_t w = 0; w < workers; ++w) {
      pool.emplace_back([&, w]() {
        try {
          for (size_t i = w; i < chunks.size(); i += workers) {
            digests[i] = HashChunk(chunks[i].bytes);
          }
        } catch (...) {
          std::lock_guard<std::mutex> lock(failure_mutex);
          if (!failure) {
            failure = std::current_exception();
          }
        }
      });
    }
  } catch (...) {
    join_all();
    throw;
  }
  join_all();
  if (failure) {
    std::rethrow_exception(failure);
  }
  return digests;
}

bool VerifyChunk(std::span<const uint8_t> bytes, const ChunkDigest& expected) {
  return pxl::crypto::ConstantTimeEqual(HashChunk(bytes), expected);
}

}  // namespace pxl::core
