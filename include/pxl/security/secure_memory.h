#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace pxl::security {

// Overwrites key material through sodium_memzero, which the optimizer may not
// elide. Safe to call before sodium_init().
void SecureWipe(std::span<uint8_t> bytes) noexcept;

template <typename T>
void SecureWipe(std::vector<T>& values) noexcept {
  SecureWipe(std::span<uint8_t>(reinterpret_cast<uint8_t*>(values.data()), values.size() * sizeof(T)));
}

// Wipes a stack buffer (typically a derived seed) when the scope ends.
class WipeOnExit {
 public:
  explicit WipeOnExit(std::span<uint8_t> bytes) noexcept : bytes_(bytes) {}
  WipeOnExit(const WipeOnExit&) = delete;
  WipeOnExit& operator=(const WipeOnExit&) = delete;
  ~WipeOnExit() { SecureWipe(bytes_); }

 private:
  std::span<uint8_t> bytes_;
};

}  // namespace pxl::security
