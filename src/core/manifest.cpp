#include "pxl/core/manifest.h"

#include <cstdio>
#include <limits>
#include <string>
#include <utility>

#include "pxl/common.h"
#include "pxl/error.h"
#include "pxl/errors.h"

namespace pxl::core {

namespace {

constexpr std::string_view kHigh{"High"};
constexpr std::string_view kMedium{"Medium"};

// Field names in canonical (byte-sorted) order.
constexpr std::string_view kChunkHashes{"chunk_hashes"};
constexpr std::string_view kChunkSizeKey{"chunk_size"};
constexpr std::string_view kDeviceFingerprint{"device_fingerprint"};
constexpr std::string_view kMerkleRoot{"merkle_root"};
constexpr std::string_view kMetadata{"metadata"};
constexpr std::string_view kNumChunks{"num_chunks"};
constexpr std::string_view kPublicKey{"public_key"};
constexpr std::string_view kTotalSize{"total_size"};
constexpr std::string_view kTrustLevel{"trust_level"};

[[noreturn]] void ThrowMalformed(std::string_view detail) {
  std::string message(errors::msg::kMalformedManifest);
  message.append(": ");
  message.append(detail);
  throw FormatError(std::move(message), errors::format::kMalformedManifest);
}

// Decodes one UTF-8 sequence starting at |pos|. Returns std::nullopt on
// overlong forms, surrogates, truncation or values above U+10FFFF.
std::optional<uint32_t> DecodeUtf8(std::string_view text, size_t& pos) {
  const auto lead = static_cast<uint8_t>(text[pos]);
  uint32_t code_point = 0;
  size_t extra = 0;
  uint32_t min_value = 0;
  if (lead < 0x80) {
    ++pos;
    return lead;
  } else if ((lead & 0xE0) == 0xC0) {
    code_point = lead & 0x1F;
    extra = 1;
    min_value = 0x80;
  } else if ((lead & 0xF0) == 0xE0) {
    code_point = lead & 0x0F;
    extra = 2;
    min_value = 0x800;
  } else if ((lead & 0xF8) == 0xF0) {
    code_point = lead & 0x07;
    extra = 3;
    min_value = 0x10000;
  } else {
    return std::nullopt;
  }
  if (text.size() - pos <= extra) {
    return std::nullopt;
  }
  for (size_t i = 1; i <= extra; ++i) {
    const auto next = static_cast<uint8_t>(text[pos + i]);
    if ((next & 0xC0) != 0x80) {
      return std::nullopt;
    }
    code_point = (code_point << 6) | (next & 0x3F);
  }
  if (code_point < min_value || code_point > 0x10FFFF ||
      (code_point >= 0xD800 && code_point <= 0xDFFF)) {
    return std::nullopt;
  }
  pos += extra + 1;
  return code_point;
}

void AppendUtf8(std::string& out, uint32_t code_point) {
  if (code_point < 0x80) {
    out.push_back(static_cast<char>(code_point));
  } else if (code_point < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (code_point >> 6)));
    out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
  } else if (code_point < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (code_point >> 12)));
    out.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (code_point >> 18)));
    out.push_back(static_cast<char>(0x80 | ((code_point >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
  }
}

void AppendUnicodeEscape(std::string& out, uint32_t unit) {
  char buffer[7];
  std::snprintf(buffer, sizeof(buffer), "\\u%04x", static_cast<unsigned>(unit));
  out.append(buffer);
}

void AppendJsonString(std::string& out, std::string_view text) {
  out.push_back('"');
  size_t pos = 0;
  while (pos < text.size()) {
    auto decoded = DecodeUtf8(text, pos);
    if (!decoded) {
      throw Error(ErrorDomain::Validation, errors::validation::kInvalidUtf8,
                  std::string(errors::msg::kInvalidUtf8));
    }
    const uint32_t c = *decoded;
    switch (c) {
    case '\\':
      out += "\\\\";
      break;
    case '"':
      out += "\\\"";
      break;
    case '\b':
      out += "\\b";
      break;
    case '\f':
      out += "\\f";
      break;
    case '\n':
      out += "\\n";
      break;
    case '\r':
      out += "\\r";
      break;
    case '\t':
      out += "\\t";
      break;
    default:
      if (c >= 0x20 && c <= 0x7E) {
        out.push_back(static_cast<char>(c));
      } else if (c < 0x10000) {
        AppendUnicodeEscape(out, c);
      } else {
        const uint32_t v = c - 0x10000;
        AppendUnicodeEscape(out, 0xD800 + (v >> 10));
        AppendUnicodeEscape(out, 0xDC00 + (v & 0x3FF));
      }
      break;
    }
  }
  out.push_back('"');
}

void AppendKey(std::string& out, std::string_view key) {
  AppendJsonString(out, key);
  out.push_back(':');
}

void AppendHex(std::string& out, std::span<const uint8_t> bytes) {
  out.push_back('"');
  out.append(HexEncode(bytes));
  out.push_back('"');
}

class ManifestReader {
 public:
  explicit ManifestReader(std::string_view text) : text_(text) {}

  Manifest Read() {
    Manifest manifest;
    uint32_t seen = 0;
    auto mark = [&seen](uint32_t bit, std::string_view key) {
      if ((seen & bit) != 0) {
        ThrowMalformed("duplicate key " + std::string(key));
      }
      seen |= bit;
    };

    SkipWhitespace();
    Expect('{');
    SkipWhitespace();
    if (!Consume('}')) {
      for (;;) {
        SkipWhitespace();
        const std::string key = ReadString();
        SkipWhitespace();
        Expect(':');
        SkipWhitespace();
        if (key == kChunkHashes) {
          mark(1u << 0, key);
          manifest.chunk_hashes = ReadDigestArray();
        } else if (key == kChunkSizeKey) {
          mark(1u << 1, key);
          manifest.chunk_size = ReadUnsigned();
        } else if (key == kDeviceFingerprint) {
          mark(1u << 2, key);
          manifest.device_fingerprint = ReadDigest();
        } else if (key == kMerkleRoot) {
          mark(1u << 3, key);
          manifest.merkle_root = ReadDigest();
        } else if (key == kMetadata) {
          mark(1u << 4, key);
          manifest.metadata = ReadMetadata();
        } else if (key == kNumChunks) {
          mark(1u << 5, key);
          manifest.num_chunks = ReadUnsigned();
        } else if (key == kPublicKey) {
          mark(1u << 6, key);
          manifest.public_key = ReadDigest();
        } else if (key == kTotalSize) {
          mark(1u << 7, key);
          manifest.total_size = ReadUnsigned();
        } else if (key == kTrustLevel) {
          mark(1u << 8, key);
          const auto level = ParseTrustLevel(ReadString());
          if (!level) {
            ThrowMalformed("unknown trust_level");
          }
          manifest.trust_level = *level;
        } else {
          ThrowMalformed("unknown key " + key);
        }
        SkipWhitespace();
        if (Consume('}')) {
          break;
        }
        Expect(',');
      }
    }
    SkipWhitespace();
    if (pos_ != text_.size()) {
      ThrowMalformed("trailing characters");
    }
    if (seen != 0x1FFu) {
      ThrowMalformed("missing required key");
    }
    return manifest;
  }

 private:
  void SkipWhitespace() {
    while (pos_ < text_.size() &&
           (text_[pos_] == ' ' || text_[pos_] == '\t' || text_[pos_] == '\n' || text_[pos_] == '\r')) {
      ++pos_;
    }
  }

  bool Consume(char expected) {
    if (pos_ < text_.size() && text_[pos_] == expected) {
      ++pos_;
      return true;
    }
    return false;
  }

  void Expect(char expected) {
    if (!Consume(expected)) {
      ThrowMalformed(std::string("expected '") + expected + "'");
    }
  }

  uint32_t ReadHex4() {
    if (text_.size() - pos_ < 4) {
      ThrowMalformed("truncated unicode escape");
    }
    uint32_t value = 0;
    for (int i = 0; i < 4; ++i) {
      const char ch = text_[pos_++];
      value <<= 4;
      if (ch >= '0' && ch <= '9') {
        value |= static_cast<uint32_t>(ch - '0');
      } else if (ch >= 'a' && ch <= 'f') {
        value |= static_cast<uint32_t>(ch - 'a' + 10);
      } else if (ch >= 'A' && ch <= 'F') {
        value |= static_cast<uint32_t>(ch - 'A' + 10);
      } else {
        ThrowMalformed("bad unicode escape");
      }
    }
    return value;
  }

  std::string ReadString() {
    Expect('"');
    std::string out;
    for (;;) {
      if (pos_ >= text_.size()) {
        ThrowMalformed("unterminated string");
      }
      const auto ch = static_cast<uint8_t>(text_[pos_]);
      if (ch == '"') {
        ++pos_;
        return out;
      }
      if (ch < 0x20) {
        ThrowMalformed("control character in string");
      }
      if (ch != '\\') {
        auto decoded = DecodeUtf8(text_, pos_);
        if (!decoded) {
          ThrowMalformed("invalid UTF-8");
        }
        AppendUtf8(out, *decoded);
        continue;
      }
      ++pos_;
      if (pos_ >= text_.size()) {
        ThrowMalformed("unterminated escape");
      }
      const char esc = text_[pos_++];
      switch (esc) {
      case '"':
        out.push_back('"');
        break;
      case '\\':
        out.push_back('\\');
        break;
      case '/':
        out.push_back('/');
        break;
      case 'b':
        out.push_back('\b');
        break;
      case 'f':
        out.push_back('\f');
        break;
      case 'n':
        out.push_back('\n');
        break;
      case 'r':
        out.push_back('\r');
        break;
      case 't':
        out.push_back('\t');
        break;
      case 'u': {
        uint32_t unit = ReadHex4();
        if (unit >= 0xD800 && unit <= 0xDBFF) {
          if (!Consume('\\') || !Consume('u')) {
            ThrowMalformed("unpaired surrogate");
          }
          const uint32_t low = ReadHex4();
          if (low < 0xDC00 || low > 0xDFFF) {
            ThrowMalformed("unpaired surrogate");
          }
          unit = 0x10000 + ((unit - 0xD800) << 10) + (low - 0xDC00);
        } else if (unit >= 0xDC00 && unit <= 0xDFFF) {
          ThrowMalformed("unpaired surrogate");
        }
        AppendUtf8(out, unit);
        break;
      }
      default:
        ThrowMalformed("unknown escape");
      }
    }
  }

  uint64_t ReadUnsigned() {
    const size_t start = pos_;
    uint64_t value = 0;
    while (pos_ < text_.size() && text_[pos_] >= '0' && text_[pos_] <= '9') {
      const uint64_t digit = static_cast<uint64_t>(text_[pos_] - '0');
      if (value > (std::numeric_limits<uint64_t>::max() - digit) / 10) {
        ThrowMalformed("integer overflow");
      }
      value = value * 10 + digit;
      ++pos_;
    }
    const size_t length = pos_ - start;
    if (length == 0) {
      ThrowMalformed("expected unsigned integer");
    }
    if (length > 1 && text_[start] == '0') {
      ThrowMalformed("leading zero in integer");
    }
    if (pos_ < text_.size() && (text_[pos_] == '.' || text_[pos_] == 'e' || text_[pos_] == 'E')) {
      ThrowMalformed("non-integer number");
    }
    return value;
  }

  std::array<uint8_t, 32> ReadDigest() {
    auto decoded = HexDecodeFixed<32>(ReadString());
    if (!decoded) {
      ThrowMalformed("digest is not 64 lowercase hex characters");
    }
    return *decoded;
  }

  std::vector<ChunkDigest> ReadDigestArray() {
    std::vector<ChunkDigest> digests;
    Expect('[');
    SkipWhitespace();
    if (Consume(']')) {
      return digests;
    }
    for (;;) {
      SkipWhitespace();
      digests.push_back(ReadDigest());
      SkipWhitespace();
      if (Consume(']')) {
        return digests;
      }
      Expect(',');
    }
  }

  Metadata ReadMetadata() {
    Metadata metadata;
    Expect('{');
    SkipWhitespace();
    if (Consume('}')) {
      return metadata;
    }
    for (;;) {
      SkipWhitespace();
      std::string key = ReadString();
      SkipWhitespace();
      Expect(':');
      SkipWhitespace();
      std::string value = ReadString();
      if (!metadata.emplace(std::move(key), std::move(value)).second) {
        ThrowMalformed("duplicate metadata key");
      }
      if (metadata.size() > kMaxMetadataEntries) {
        ThrowMalformed("too many metadata entries");
      }
      SkipWhitespace();
      if (Consume('}')) {
        return metadata;
      }
      Expect(',');
    }
  }

  std::string_view text_;
  size_t pos_{0};
};

}  // namespace

std::string_view TrustLevelName(TrustLevel level) noexcept {
  switch (level) {
  case TrustLevel::kHigh:
    return kHigh;
  case TrustLevel::kMedium:
    return kMedium;
  }
  return kMedium;
}

std::optional<TrustLevel> ParseTrustLevel(std::string_view name) noexcept {
  if (name == kHigh) {
    return TrustLevel::kHigh;
  }
  if (name == kMedium) {
    return TrustLevel::kMedium;
  }
  return std::nullopt;
}

std::string CanonicalizeToString(const Manifest& manifest) {
  if (manifest.metadata.size() > kMaxMetadataEntries) {
    throw Error(ErrorDomain::Validation, errors::validation::kTooManyMetadataEntries,
                std::string(errors::msg::kTooManyMetadataEntries) + " (" +
                    std::to_string(manifest.metadata.size()) + " > " + std::to_string(kMaxMetadataEntries) + ")");
  }
  std::string out;
  out.reserve(512 + manifest.chunk_hashes.size() * 68);
  out.push_back('{');

  AppendKey(out, kChunkHashes);
  out.push_back('[');
  for (size_t i = 0; i < manifest.chunk_hashes.size(); ++i) {
    if (i != 0) {
      out.push_back(',');
    }
    AppendHex(out, manifest.chunk_hashes[i]);
  }
  out.push_back(']');
  out.push_back(',');

  AppendKey(out, kChunkSizeKey);
  out.append(std::to_string(manifest.chunk_size));
  out.push_back(',');

  AppendKey(out, kDeviceFingerprint);
  AppendHex(out, manifest.device_fingerprint);
  out.push_back(',');

  AppendKey(out, kMerkleRoot);
  AppendHex(out, manifest.merkle_root);
  out.push_back(',');

  AppendKey(out, kMetadata);
  out.push_back('{');
  bool first = true;
  for (const auto& [key, value] : manifest.metadata) {
    if (!first) {
      out.push_back(',');
    }
    first = false;
    AppendKey(out, key);
    AppendJsonString(out, value);
  }
  out.push_back('}');
  out.push_back(',');

  AppendKey(out, kNumChunks);
  out.append(std::to_string(manifest.num_chunks));
  out.push_back(',');

  AppendKey(out, kPublicKey);
  AppendHex(out, manifest.public_key);
  out.push_back(',');

  AppendKey(out, kTotalSize);
  out.append(std::to_string(manifest.total_size));
  out.push_back(',');

  AppendKey(out, kTrustLevel);
  AppendJsonString(out, TrustLevelName(manifest.trust_level));

  out.push_back('}');
  return out;
}

std::vector<uint8_t> Canonicalize(const Manifest& manifest) {
  const std::string text = CanonicalizeToString(manifest);
  return std::vector<uint8_t>(text.begin(), text.end());
}

Manifest ParseManifest(std::span<const uint8_t> bytes) {
  const std::string_view text(reinterpret_cast<const char*>(bytes.data()), bytes.size());
  return ManifestReader(text).Read();
}

}  // namespace pxl::core
