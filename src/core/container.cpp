#include "pxl/core/container.h"

#include <algorithm>
#include <limits>
#include <stdexcept>
#include <string>

#include "pxl/common.h"
#include "pxl/core/chunker.h"
#include "pxl/error.h"
#include "pxl/errors.h"

namespace pxl::core {

namespace {

[[noreturn]] void ThrowTruncated(const char* field) {
  std::string message(errors::msg::kContainerTruncated);
  message.append(" in ");
  message.append(field);
  throw TruncatedError(std::move(message));
}

class Cursor {
 public:
  explicit Cursor(std::span<const uint8_t> bytes) : bytes_(bytes) {}

  std::span<const uint8_t> Take(uint64_t count, const char* field) {
    if (count > Remaining()) {
      ThrowTruncated(field);
    }
    auto out = bytes_.subspan(offset_, static_cast<size_t>(count));
    offset_ += static_cast<size_t>(count);
    return out;
  }

  uint32_t TakeU32(const char* field) { return ReadU32(Take(sizeof(uint32_t), field).data()); }

  [[nodiscard]] size_t Remaining() const noexcept { return bytes_.size() - offset_; }

 private:
  std::span<const uint8_t> bytes_;
  size_t offset_{0};
};

}  // namespace

ContainerHeader HeaderFor(size_t image_size, size_t chunk_size) {
  if (chunk_size == 0) {
    throw std::invalid_argument(std::string(errors::msg::kZeroChunkSize));
  }
  if (image_size == 0) {
    throw EmptyInputError(std::string(errors::msg::kEmptyImage));
  }
  const size_t count = ChunkCountFor(image_size, chunk_size);
  constexpr size_t kLimit = std::numeric_limits<uint32_t>::max();
  if (chunk_size > kLimit || count > kLimit) {
    throw Error(ErrorDomain::Validation, errors::validation::kImageTooLarge,
                std::string(errors::msg::kImageTooLarge));
  }
  ContainerHeader header;
  header.chunk_count = static_cast<uint32_t>(count);
  header.chunk_size = static_cast<uint32_t>(chunk_size);
  header.last_chunk_size = static_cast<uint32_t>(image_size - (count - 1) * chunk_size);
  return header;
}

std::vector<uint8_t> EncodeContainer(const ContainerHeader& header,
                                     std::span<const uint8_t> image,
                                     std::span<const uint8_t> manifest,
                                     const pxl::crypto::Ed25519::Signature& signature) {
  if (image.size() != header.ImageSize()) {
    throw Error(ErrorDomain::Internal, errors::internal::kInvariantViolation,
                "Container header does not describe the image");
  }
  if (manifest.size() > std::numeric_limits<uint32_t>::max()) {
    throw Error(ErrorDomain::Validation, errors::validation::kImageTooLarge,
                std::string(errors::msg::kImageTooLarge));
  }
  std::vector<uint8_t> out;
  out.reserve(kHeaderSize + image.size() + sizeof(uint32_t) + manifest.size() + kSignatureSize +
              kContainerFooter.size());
  out.insert(out.end(), kContainerMagic.begin(), kContainerMagic.end());
  out.push_back(kContainerVersion);
  AppendU32(out, header.chunk_count);
  AppendU32(out, header.chunk_size);
  AppendU32(out, header.last_chunk_size);
  out.insert(out.end(), image.begin(), image.end());
  AppendU32(out, static_cast<uint32_t>(manifest.size()));
  out.insert(out.end(), manifest.begin(), manifest.end());
  out.insert(out.end(), signature.begin(), signature.end());
  out.insert(out.end(), kContainerFooter.begin(), kContainerFooter.end());
  return out;
}

ContainerView ParseContainer(std::span<const uint8_t> container) {
  // Magic is judged on whatever prefix is present, so "PXL?" alone is a
  // format error rather than a truncation.
  const size_t magic_bytes = std::min(container.size(), kContainerMagic.size());
  if (!std::equal(kContainerMagic.begin(), kContainerMagic.begin() + magic_bytes, container.begin())) {
    throw FormatError(std::string(errors::msg::kBadMagic), errors::format::kBadMagic);
  }
  if (container.size() < kPrefixSize) {
    ThrowTruncated("header");
  }
  if (container[kContainerMagic.size()] != kContainerVersion) {
    throw FormatError(std::string(errors::msg::kUnsupportedVersion),
                      errors::format::kUnsupportedVersion);
  }

  Cursor cursor(container);
  (void)cursor.Take(kPrefixSize, "header");

  ContainerView view;
  view.header.chunk_count = cursor.TakeU32("header");
  view.header.chunk_size = cursor.TakeU32("header");
  view.header.last_chunk_size = cursor.TakeU32("header");
  if (view.header.chunk_count == 0 || view.header.chunk_size == 0 ||
      view.header.last_chunk_size == 0 || view.header.last_chunk_size > view.header.chunk_size) {
    throw FormatError(std::string(errors::msg::kBadChunkLayout), errors::format::kBadHeader);
  }

  view.image = cursor.Take(view.header.ImageSize(), "image chunks");
  const uint32_t manifest_length = cursor.TakeU32("manifest length");
  view.manifest = cursor.Take(manifest_length, "manifest");
  const auto signature = cursor.Take(kSignatureSize, "signature");
  std::copy(signature.begin(), signature.end(), view.signature.begin());
  const auto footer = cursor.Take(kContainerFooter.size(), "footer");
  if (!std::equal(kContainerFooter.begin(), kContainerFooter.end(), footer.begin())) {
    throw FormatError(std::string(errors::msg::kBadFooter), errors::format::kBadFooter);
  }
  if (cursor.Remaining() != 0) {
    throw FormatError(std::string(errors::msg::kTrailingBytes), errors::format::kTrailingBytes);
  }
  return view;
}

}  // namespace pxl::core
