#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <vector>

#include "pxl/core/container.h"
#include "pxl/core/manifest.h"
#include "pxl/crypto/provider.h"
#include "pxl/provenance/identity.h"

namespace pxl::orchestrator {

struct PackOptions {
  size_t hash_workers{0}; // 0 selects std::thread::hardware_concurrency()
};

// PXL_HASH_WORKERS; malformed values fall back to 0.
PackOptions LoadPackOptionsFromEnvironment();

struct VerificationResult {
  bool verified{false};
  pxl::core::Metadata metadata;
  pxl::core::TrustLevel trust_level{pxl::core::TrustLevel::kMedium};
  pxl::core::DeviceFingerprint device_fingerprint{};
  pxl::core::MerkleRoot merkle_root{};
  uint64_t chunk_count{0};
  uint64_t total_size{0};
  pxl::crypto::Ed25519::PublicKey public_key{};
};

// Structure only, no trust decision.
struct ContainerContents {
  pxl::core::ContainerHeader header;
  std::vector<uint8_t> image;
  pxl::core::Manifest manifest;
  pxl::crypto::Ed25519::Signature signature{};
};

// Chunk, hash, build the root, assemble and canonicalize the manifest, sign,
// emit. Throws on any failure; no partial container is ever returned.
std::vector<uint8_t> Pack(std::span<const uint8_t> image, const pxl::core::Metadata& metadata,
                          const pxl::provenance::DeviceIdentity& identity,
                          const PackOptions& options = {});

// Stops at the first failing check, in this order: framing (TruncatedError,
// FormatError), header against manifest (IntegrityError), chunk digests
// (IntegrityError with chunk_index), Merkle root (IntegrityError), signature
// (SignatureError), fingerprint and declared key (ProvenanceError).
// The verification key is |expected_public_key| when given, otherwise the
// key the manifest declares. Medium trust is reported, never rejected.
VerificationResult Verify(std::span<const uint8_t> container,
                          const std::optional<pxl::crypto::Ed25519::PublicKey>& expected_public_key = std::nullopt,
                          const PackOptions& options = {});

ContainerContents ReadContainer(std::span<const uint8_t> container);

// The container is fully built in memory before AtomicReplace touches disk.
void PackFile(const std::filesystem::path& image_path, const std::filesystem::path& output_path,
              const pxl::core::Metadata& metadata, const pxl::provenance::DeviceIdentity& identity,
              const PackOptions& options = {});

VerificationResult VerifyFile(const std::filesystem::path& container_path,
                              const std::optional<pxl::crypto::Ed25519::PublicKey>& expected_public_key = std::nullopt,
                              const PackOptions& options = {});

}  // namespace pxl::orchestrator
