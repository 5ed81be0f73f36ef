#include "pxl/crypto/hkdf.h"

#include <memory>
#include <string>

#include <openssl/core_names.h>
#include <openssl/err.h>
#include <openssl/kdf.h>
#include <openssl/params.h>

#include "pxl/error.h"
#include "pxl/errors.h"

namespace pxl::crypto {
namespace {

using KdfPtr = std::unique_ptr<EVP_KDF, decltype(&EVP_KDF_free)>;
using KdfCtxPtr = std::unique_ptr<EVP_KDF_CTX, decltype(&EVP_KDF_CTX_free)>;

[[noreturn]] void ThrowOpenSsl(const char* step) {
  const unsigned long native = ERR_get_error();
  std::string message = std::string("HKDF-SHA256 ") + step + " failed";
  if (native != 0) {
    char buffer[256];
    ERR_error_string_n(native, buffer, sizeof(buffer));
    message += ": ";
    message += buffer;
  }
  ERR_clear_error();
  throw Error(ErrorDomain::Crypto, errors::crypto::kOpenSsl, std::move(message),
              native != 0 ? std::optional<int>(static_cast<int>(native & 0x7FFFFFFF)) : std::nullopt);
}

// OSSL_PARAM wants mutable pointers even for inputs it only reads.
void* Mutable(ByteView bytes) {
  return const_cast<uint8_t*>(bytes.data());
}

}  // namespace

void HkdfSha256(ByteView ikm, ByteView salt, ByteView info, std::span<uint8_t> okm) {
  if (okm.empty()) {
    return;
  }
  KdfPtr kdf(EVP_KDF_fetch(nullptr, OSSL_KDF_NAME_HKDF, nullptr), &EVP_KDF_free);
  if (!kdf) {
    ThrowOpenSsl("fetch");
  }
  KdfCtxPtr ctx(EVP_KDF_CTX_new(kdf.get()), &EVP_KDF_CTX_free);
  if (!ctx) {
    ThrowOpenSsl("context");
  }

  char digest_name[] = "SHA256";
  OSSL_PARAM params[5];
  size_t n = 0;
  params[n++] = OSSL_PARAM_construct_utf8_string(OSSL_KDF_PARAM_DIGEST, digest_name, 0);
  params[n++] = OSSL_PARAM_construct_octet_string(OSSL_KDF_PARAM_KEY, Mutable(ikm), ikm.size());
  if (!salt.empty()) {
    params[n++] = OSSL_PARAM_construct_octet_string(OSSL_KDF_PARAM_SALT, Mutable(salt), salt.size());
  }
  if (!info.empty()) {
    params[n++] = OSSL_PARAM_construct_octet_string(OSSL_KDF_PARAM_INFO, Mutable(info), info.size());
  }
  params[n] = OSSL_PARAM_construct_end();

  if (EVP_KDF_derive(ctx.get(), okm.data(), okm.size(), params) <= 0) {
    ThrowOpenSsl("derive");
  }
}

}  // namespace pxl::crypto
