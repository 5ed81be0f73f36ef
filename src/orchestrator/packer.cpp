#include "pxl/orchestrator/packer.h"

#include <charconv>
#include <cstdlib>
#include <cstring>
#include <string>
#include <utility>

#include "pxl/common.h"
#include "pxl/core/chunker.h"
#include "pxl/core/merkle.h"
#include "pxl/crypto/digest.h"
#include "pxl/error.h"
#include "pxl/errors.h"
#include "pxl/orchestrator/event_bus.h"
#include "pxl/orchestrator/io_util.h"

namespace pxl::orchestrator {
namespace {

using pxl::crypto::Ed25519;

const char* DomainName(ErrorDomain domain) {
  switch (domain) {
  case ErrorDomain::Format:
    return "format";
  case ErrorDomain::Integrity:
    return "integrity";
  case ErrorDomain::Signature:
    return "signature";
  case ErrorDomain::Provenance:
    return "provenance";
  case ErrorDomain::Validation:
    return "validation";
  case ErrorDomain::Crypto:
    return "crypto";
  case ErrorDomain::IO:
    return "io";
  case ErrorDomain::Internal:
    return "internal";
  }
  return "internal";
}

void PublishFailure(const char* event_id, const Error& err) {
  Event event;
  event.category = EventCategory::kSecurity;
  event.severity = EventSeverity::kError;
  event.event_id = event_id;
  event.message = err.what();
  event.fields.emplace_back("domain", DomainName(err.domain));
  event.fields.emplace_back("code", std::to_string(err.code), FieldPrivacy::kPublic, true);
  if (const auto* integrity = dynamic_cast<const IntegrityError*>(&err);
      integrity && integrity->chunk_index) {
    event.fields.emplace_back("chunk_index", std::to_string(*integrity->chunk_index),
                              FieldPrivacy::kPublic, true);
  }
  EventBus::Instance().Publish(event);
}

// Framing plus manifest parse and the header/manifest cross-check.
struct ParsedContainer {
  pxl::core::ContainerView view;
  pxl::core::Manifest manifest;
};

ParsedContainer ParseStructure(std::span<const uint8_t> container) {
  ParsedContainer parsed{pxl::core::ParseContainer(container), {}};
  parsed.manifest = pxl::core::ParseManifest(parsed.view.manifest);

  const auto& header = parsed.view.header;
  const auto& manifest = parsed.manifest;
  if (manifest.num_chunks != header.chunk_count || manifest.chunk_size != header.chunk_size ||
      manifest.total_size != header.ImageSize() || manifest.chunk_hashes.size() != header.chunk_count) {
    throw IntegrityError(std::string(errors::msg::kLayoutMismatch), errors::integrity::kLayoutMismatch);
  }
  return parsed;
}

VerificationResult VerifyParsed(const ParsedContainer& parsed,
                                const std::optional<Ed25519::PublicKey>& expected_public_key,
                                const PackOptions& options) {
  const auto& view = parsed.view;
  const auto& manifest = parsed.manifest;

  auto chunks = pxl::core::Split(view.image, view.header.chunk_size);
  auto digests = pxl::core::HashChunks(chunks, options.hash_workers);
  for (size_t i = 0; i < digests.size(); ++i) {
    if (!pxl::crypto::ConstantTimeEqual(digests[i], manifest.chunk_hashes[i])) {
      throw IntegrityError(std::string(errors::msg::kChunkHashMismatch) + " at chunk " + std::to_string(i),
                           errors::integrity::kChunkHashMismatch, i);
    }
  }

  const auto root = pxl::core::BuildRoot(digests);
  if (!pxl::crypto::ConstantTimeEqual(root, manifest.merkle_root)) {
    throw IntegrityError(std::string(errors::msg::kMerkleRootMismatch),
                         errors::integrity::kMerkleRootMismatch);
  }

  const Ed25519::PublicKey key = expected_public_key.value_or(manifest.public_key);
  const auto canonical = pxl::core::Canonicalize(manifest);
  if (!pxl::provenance::Verify(key, canonical, view.signature)) {
    throw SignatureError(std::string(errors::msg::kSignatureInvalid));
  }

  if (!pxl::crypto::ConstantTimeEqual(pxl::provenance::Fingerprint(key), manifest.device_fingerprint)) {
    throw ProvenanceError(std::string(errors::msg::kFingerprintMismatch),
                          errors::provenance::kFingerprintMismatch);
  }
  if (!pxl::crypto::ConstantTimeEqual(manifest.public_key, key)) {
    throw ProvenanceError(std::string(errors::msg::kDeclaredKeyMismatch),
                          errors::provenance::kDeclaredKeyMismatch);
  }

  VerificationResult result;
  result.verified = true;
  result.metadata = manifest.metadata;
  result.trust_level = manifest.trust_level;
  result.device_fingerprint = manifest.device_fingerprint;
  result.merkle_root = manifest.merkle_root;
  result.chunk_count = manifest.num_chunks;
  result.total_size = manifest.total_size;
  result.public_key = key;
  return result;
}

}  // namespace

PackOptions LoadPackOptionsFromEnvironment() {
  PackOptions options;
  const char* env = std::getenv("PXL_HASH_WORKERS");
  if (!env || *env == '\0') {
    return options;
  }
  size_t value = 0;
  const size_t length = std::strlen(env);
  auto [ptr, ec] = std::from_chars(env, env + length, value);
  if (ec == std::errc() && ptr == env + length) {
    options.hash_workers = value;
  }
  return options;
}

std::vector<uint8_t> Pack(std::span<const uint8_t> image, const pxl::core::Metadata& metadata,
                          const pxl::provenance::DeviceIdentity& identity, const PackOptions& options) {
  pxl::core::Manifest manifest;
  pxl::core::ContainerHeader header{};
  std::vector<uint8_t> container;
  try {
    header = pxl::core::HeaderFor(image.size(), pxl::core::kChunkSize);
    const auto chunks = pxl::core::Split(image, pxl::core::kChunkSize);

    manifest.metadata = metadata;
    manifest.chunk_hashes = pxl::core::HashChunks(chunks, options.hash_workers);
    manifest.merkle_root = pxl::core::BuildRoot(manifest.chunk_hashes);
    manifest.public_key = identity.public_key();
    manifest.device_fingerprint = pxl::provenance::Fingerprint(identity.public_key());
    manifest.trust_level = pxl::provenance::TrustTier(identity.origin());
    manifest.chunk_size = header.chunk_size;
    manifest.total_size = image.size();
    manifest.num_chunks = header.chunk_count;

    const auto canonical = pxl::core::Canonicalize(manifest);
    const auto signature = pxl::provenance::Sign(identity, canonical);
    container = pxl::core::EncodeContainer(header, image, canonical, signature);
  } catch (const Error& err) {
    PublishFailure("pack_failed", err);
    throw;
  }

  // Reported only once the container exists.
  Event event;
  event.category = EventCategory::kLifecycle;
  event.event_id = "pack_completed";
  event.message = "Image packed";
  event.fields.emplace_back("chunks", std::to_string(header.chunk_count), FieldPrivacy::kPublic, true);
  event.fields.emplace_back("total_size", std::to_string(image.size()), FieldPrivacy::kPublic, true);
  event.fields.emplace_back("merkle_root", HexEncode(manifest.merkle_root));
  event.fields.emplace_back("fingerprint", HexEncode(manifest.device_fingerprint));
  event.fields.emplace_back("trust_level", std::string(pxl::core::TrustLevelName(manifest.trust_level)));
  EventBus::Instance().Publish(event);
  return container;
}

VerificationResult Verify(std::span<const uint8_t> container,
                          const std::optional<Ed25519::PublicKey>& expected_public_key,
                          const PackOptions& options) {
  VerificationResult result;
  try {
    const auto parsed = ParseStructure(container);
    result = VerifyParsed(parsed, expected_public_key, options);
  } catch (const Error& err) {
    PublishFailure("verify_failed", err);
    throw;
  }

  Event event;
  event.category = EventCategory::kSecurity;
  event.event_id = "verify_succeeded";
  event.message = "Container verified";
  event.fields.emplace_back("chunks", std::to_string(result.chunk_count), FieldPrivacy::kPublic, true);
  event.fields.emplace_back("merkle_root", HexEncode(result.merkle_root));
  event.fields.emplace_back("fingerprint", HexEncode(result.device_fingerprint));
  event.fields.emplace_back("trust_level", std::string(pxl::core::TrustLevelName(result.trust_level)));
  event.fields.emplace_back("expected_key", expected_public_key ? "supplied" : "declared");
  EventBus::Instance().Publish(event);
  return result;
}

ContainerContents ReadContainer(std::span<const uint8_t> container) {
  auto parsed = ParseStructure(container);
  ContainerContents contents;
  contents.header = parsed.view.header;
  contents.image.assign(parsed.view.image.begin(), parsed.view.image.end());
  contents.manifest = std::move(parsed.manifest);
  contents.signature = parsed.view.signature;
  return contents;
}

void PackFile(const std::filesystem::path& image_path, const std::filesystem::path& output_path,
              const pxl::core::Metadata& metadata, const pxl::provenance::DeviceIdentity& identity,
              const PackOptions& options) {
  const auto image = ReadFileBytes(image_path);
  const auto container = Pack(image, metadata, identity, options);
  try {
    AtomicReplace(output_path, container);
  } catch (const Error& err) {
    PublishFailure("container_write_failed", err);
    throw;
  }

  Event event;
  event.category = EventCategory::kLifecycle;
  event.event_id = "container_written";
  event.message = "Container persisted";
  event.fields.emplace_back("path", PathToUtf8String(output_path), FieldPrivacy::kHash);
  event.fields.emplace_back("bytes", std::to_string(container.size()), FieldPrivacy::kPublic, true);
  EventBus::Instance().Publish(event);
}

VerificationResult VerifyFile(const std::filesystem::path& container_path,
                              const std::optional<Ed25519::PublicKey>& expected_public_key,
                              const PackOptions& options) {
  const auto container = ReadFileBytes(container_path);
  return Verify(container, expected_public_key, options);
}

}  // namespace pxl::orchestrator
