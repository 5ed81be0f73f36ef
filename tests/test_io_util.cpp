#include "pxl/orchestrator/io_util.h"

#include <array>
#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

#include "pxl/errors.h"

namespace {

void Require(bool condition, const char* message) {
  if (!condition) {
    std::cerr << "test_io_util: " << message << std::endl;
    std::abort();
  }
}

std::vector<uint8_t> ReadFile(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  return std::vector<uint8_t>(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

size_t CountEntries(const std::filesystem::path& dir) {
  size_t count = 0;
  for (const auto& entry : std::filesystem::directory_iterator(dir)) {
    (void)entry;
    ++count;
  }
  return count;
}

}  // namespace

int main() {
  using pxl::orchestrator::AtomicReplace;
  using pxl::orchestrator::AtomicReplaceHooks;
  using pxl::orchestrator::ReadFileBytes;

  auto dir = std::filesystem::temp_directory_path() / "pxl_atomic_replace_test";
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);
  auto target = dir / "image.pxl";

  {
    std::ofstream seed(target, std::ios::binary | std::ios::trunc);
    const std::array<uint8_t, 4> baseline{0xDE, 0xAD, 0xBE, 0xEF};
    seed.write(reinterpret_cast<const char*>(baseline.data()), static_cast<std::streamsize>(baseline.size()));
  }

  AtomicReplaceHooks hooks;
  hooks.before_rename = [](const std::filesystem::path&, const std::filesystem::path&) {
    throw std::runtime_error("simulated crash");
  };

  std::array<uint8_t, 4> update{0xBA, 0xAD, 0xF0, 0x0D};
  bool threw = false;
  try {
    AtomicReplace(target, std::span<const uint8_t>(update.data(), update.size()), hooks);
  } catch (const std::runtime_error&) {
    threw = true;
  }
  Require(threw, "expected simulated crash before rename");

  auto bytes = ReadFile(target);
  Require(bytes == std::vector<uint8_t>{0xDE, 0xAD, 0xBE, 0xEF}, "crash must leave the previous file intact");
  Require(CountEntries(dir) == 1, "crash must not leave a temporary file behind");

  hooks.before_rename = nullptr;
  AtomicReplace(target, std::span<const uint8_t>(update.data(), update.size()));
  Require(ReadFileBytes(target) == std::vector<uint8_t>{0xBA, 0xAD, 0xF0, 0x0D}, "replace must land");

  auto fresh = dir / "nested" / "fresh.pxl";
  std::filesystem::create_directories(fresh.parent_path());
  AtomicReplace(fresh, std::span<const uint8_t>(update.data(), update.size()));
  Require(ReadFileBytes(fresh).size() == update.size(), "replace must create a missing target");

  threw = false;
  try {
    (void)ReadFileBytes(dir / "missing.pxl");
  } catch (const pxl::Error& err) {
    threw = err.domain == pxl::ErrorDomain::IO && err.code == pxl::errors::io::kReadFailed;
  }
  Require(threw, "reading a missing file must raise an IO error");

  threw = false;
  try {
    AtomicReplace(dir / "no-such-dir" / "out.pxl", std::span<const uint8_t>(update.data(), update.size()));
  } catch (const pxl::Error& err) {
    threw = err.domain == pxl::ErrorDomain::IO && err.code == pxl::errors::io::kAtomicWriteFailed &&
            err.native_code == ENOENT && !err.context.empty() &&
            err.context.front().rfind("atomic replace target=", 0) == 0;
  }
  Require(threw, "a missing parent directory must fail with the target in the error context");

  std::filesystem::remove_all(dir);

  std::cout << "atomic replace tests ok\n";
  return 0;
}
