#include "pxl/security/secure_memory.h"

#include <sodium.h>

namespace pxl::security {

void SecureWipe(std::span<uint8_t> bytes) noexcept {
  if (!bytes.empty()) {
    sodium_memzero(bytes.data(), bytes.size());
  }
}

}  // namespace pxl::security
