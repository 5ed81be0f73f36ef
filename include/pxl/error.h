#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace pxl {
  enum class ErrorDomain : std::uint16_t {
    Format = 0x01,
    Integrity = 0x02,
    Signature = 0x03,
    Provenance = 0x04,
    Validation = 0x05,
    Crypto = 0x06,
    IO = 0x07,
    Internal = 0x7F
  };

  // Each domain reserves a span of codes so platform error numbers carried in
  // native_code never collide with framework codes.
  inline constexpr int kErrorDomainSpan = 0x0100;

  inline constexpr int ErrorDomainBase(ErrorDomain domain) {
    switch (domain) {
    case ErrorDomain::Format:
      return 0x0100;
    case ErrorDomain::Integrity:
      return 0x0200;
    case ErrorDomain::Signature:
      return 0x0300;
    case ErrorDomain::Provenance:
      return 0x0400;
    case ErrorDomain::Validation:
      return 0x0500;
    case ErrorDomain::Crypto:
      return 0x0600;
    case ErrorDomain::IO:
      return 0x0700;
    case ErrorDomain::Internal:
      return 0x7F00;
    }
    return 0;
  }

  inline constexpr int ErrorDomainMax(ErrorDomain domain) {
    return ErrorDomainBase(domain) + kErrorDomainSpan - 1;
  }

  inline constexpr bool IsFrameworkErrorCode(ErrorDomain domain, int code) {
    return code >= ErrorDomainBase(domain) && code <= ErrorDomainMax(domain);
  }

  enum class Retryability : std::uint8_t {
    kFatal = 0,
    kTransient,
    kRetryable
  };

  namespace errors {
    inline constexpr int Make(ErrorDomain domain, int offset) {
      return ErrorDomainBase(domain) + offset;
    }

    namespace format {
      inline constexpr int kBadMagic = Make(ErrorDomain::Format, 0x01);
      inline constexpr int kUnsupportedVersion = Make(ErrorDomain::Format, 0x02);
      inline constexpr int kBadHeader = Make(ErrorDomain::Format, 0x03);
      inline constexpr int kBadFooter = Make(ErrorDomain::Format, 0x04);
      inline constexpr int kTrailingBytes = Make(ErrorDomain::Format, 0x05);
      inline constexpr int kMalformedManifest = Make(ErrorDomain::Format, 0x06);
      inline constexpr int kTruncated = Make(ErrorDomain::Format, 0x10);
    } // namespace format

    namespace integrity {
      inline constexpr int kChunkHashMismatch = Make(ErrorDomain::Integrity, 0x01);
      inline constexpr int kMerkleRootMismatch = Make(ErrorDomain::Integrity, 0x02);
      inline constexpr int kLayoutMismatch = Make(ErrorDomain::Integrity, 0x03);
    } // namespace integrity

    namespace signature {
      inline constexpr int kSignatureInvalid = Make(ErrorDomain::Signature, 0x01);
      inline constexpr int kSigningFailed = Make(ErrorDomain::Signature, 0x02);
    } // namespace signature

    namespace provenance {
      inline constexpr int kFingerprintMismatch = Make(ErrorDomain::Provenance, 0x01);
      inline constexpr int kDeclaredKeyMismatch = Make(ErrorDomain::Provenance, 0x02);
      inline constexpr int kHardwareKeyFailure = Make(ErrorDomain::Provenance, 0x03);
      inline constexpr int kSoftwareKeyRejected = Make(ErrorDomain::Provenance, 0x04);
    } // namespace provenance

    namespace validation {
      inline constexpr int kEmptyInput = Make(ErrorDomain::Validation, 0x01);
      inline constexpr int kEmptyDigestList = Make(ErrorDomain::Validation, 0x02);
      inline constexpr int kMissingIdentityInput = Make(ErrorDomain::Validation, 0x03);
      inline constexpr int kImageTooLarge = Make(ErrorDomain::Validation, 0x04);
      inline constexpr int kInvalidUtf8 = Make(ErrorDomain::Validation, 0x05);
      inline constexpr int kBadConfiguration = Make(ErrorDomain::Validation, 0x06);
      inline constexpr int kTooManyMetadataEntries = Make(ErrorDomain::Validation, 0x07);
    } // namespace validation

    namespace crypto {
      inline constexpr int kOpenSsl = Make(ErrorDomain::Crypto, 0x01);
      inline constexpr int kSodiumInit = Make(ErrorDomain::Crypto, 0x02);
      inline constexpr int kSodium = Make(ErrorDomain::Crypto, 0x03);
    } // namespace crypto

    namespace io {
      inline constexpr int kReadFailed = Make(ErrorDomain::IO, 0x01);
      inline constexpr int kAtomicWriteFailed = Make(ErrorDomain::IO, 0x02);
    } // namespace io

    namespace internal {
      inline constexpr int kInvariantViolation = Make(ErrorDomain::Internal, 0x01);
    } // namespace internal

  } // namespace errors

  struct Error : public std::runtime_error {
    ErrorDomain domain;
    int code;
    std::optional<int> native_code;
    Retryability retryability{Retryability::kFatal};
    std::vector<std::string> context;
    explicit Error(ErrorDomain d, int c, std::string msg,
                   std::optional<int> native = std::nullopt,
                   Retryability retry = Retryability::kFatal,
                   std::vector<std::string> ctx = {})
        : std::runtime_error(std::move(msg)),
          domain(d),
          code(c),
          native_code(native),
          retryability(retry),
          context(std::move(ctx)) {}
  };

  // Typed failures of a single pack or verify call. All are fatal to that call.
  struct FormatError : public Error {
    explicit FormatError(std::string msg, int c = errors::format::kBadHeader)
        : Error(ErrorDomain::Format, c, std::move(msg)) {}
  };

  struct TruncatedError : public Error {
    explicit TruncatedError(std::string msg)
        : Error(ErrorDomain::Format, errors::format::kTruncated, std::move(msg)) {}
  };

  struct IntegrityError : public Error {
    std::optional<std::size_t> chunk_index;
    IntegrityError(std::string msg, int c, std::optional<std::size_t> index = std::nullopt)
        : Error(ErrorDomain::Integrity, c, std::move(msg)), chunk_index(index) {}
  };

  struct SignatureError : public Error {
    explicit SignatureError(std::string msg, int c = errors::signature::kSignatureInvalid)
        : Error(ErrorDomain::Signature, c, std::move(msg)) {}
  };

  struct ProvenanceError : public Error {
    explicit ProvenanceError(std::string msg, int c = errors::provenance::kFingerprintMismatch)
        : Error(ErrorDomain::Provenance, c, std::move(msg)) {}
  };

  struct EmptyInputError : public Error {
    explicit EmptyInputError(std::string msg)
        : Error(ErrorDomain::Validation, errors::validation::kEmptyInput, std::move(msg)) {}
  };

  struct EmptyDigestListError : public Error {
    explicit EmptyDigestListError(std::string msg)
        : Error(ErrorDomain::Validation, errors::validation::kEmptyDigestList, std::move(msg)) {}
  };
} // namespace pxl
