#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <span>
#include <vector>

#include "pxl/error.h"

namespace pxl::orchestrator {

// Lets tests interrupt a container write between the durable temp file and the
// rename that publishes it.
struct AtomicReplaceHooks {
  std::function<void(const std::filesystem::path& temp, const std::filesystem::path& target)> before_rename;
};

// Writes |payload| to a sibling temp file (mode 0600), fsyncs it, renames it
// over |target| and fsyncs the directory. Readers see either the old
// container or the complete new one, never a prefix. Throws pxl::Error (IO)
// with the failing step recorded in Error::context.
void AtomicReplace(const std::filesystem::path& target, std::span<const uint8_t> payload,
                   const AtomicReplaceHooks& hooks = {});

// Whole-file read for images and containers. Throws pxl::Error (IO, kReadFailed).
std::vector<uint8_t> ReadFileBytes(const std::filesystem::path& path);

}  // namespace pxl::orchestrator
