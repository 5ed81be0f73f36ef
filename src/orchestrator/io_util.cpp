#include "pxl/orchestrator/io_util.h"

#include <array>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>
#include <system_error>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include "pxl/common.h"
#include "pxl/crypto/digest.h"
#include "pxl/errors.h"

namespace pxl::orchestrator {
namespace {

Retryability RetryabilityOf(int err) {
  switch (err) {
    case EINTR:
    case EAGAIN:
      return Retryability::kRetryable;
    case EBUSY:
    case ETIMEDOUT:
      return Retryability::kTransient;
    default:
      return Retryability::kFatal;
  }
}

// Tracks which step of the replace is running so a failure reports the whole
// path ("atomic replace target=..." then "fsync temp file").
class WriteSteps {
 public:
  explicit WriteSteps(const std::filesystem::path& target)
      : steps_{"atomic replace target=" + PathToUtf8String(target)} {}

  template <typename Fn>
  auto Run(const char* step, Fn&& fn) {
    steps_.emplace_back(step);
    try {
      if constexpr (std::is_void_v<decltype(fn())>) {
        fn();
        steps_.pop_back();
      } else {
        auto result = fn();
        steps_.pop_back();
        return result;
      }
    } catch (const Error& err) {
      if (!err.context.empty()) {
        throw;
      }
      throw Error{err.domain, err.code, Describe(err.what()), err.native_code, err.retryability, steps_};
    } catch (const std::system_error& sys) {
      const int native = sys.code().value();
      throw Error{ErrorDomain::IO, errors::io::kAtomicWriteFailed, Describe(sys.what()), native,
                  RetryabilityOf(native), steps_};
    }
  }

  [[noreturn]] void FailErrno(const char* what, int err) const {
    throw Error{ErrorDomain::IO, errors::io::kAtomicWriteFailed,
                Describe(std::string(what) + ": " + std::generic_category().message(err)), err,
                RetryabilityOf(err), steps_};
  }

 private:
  std::string Describe(const std::string& message) const {
    std::string out = message;
    for (auto it = steps_.rbegin(); it != steps_.rend(); ++it) {
      out += "\n  while: " + *it;
    }
    return out;
  }

  std::vector<std::string> steps_;
};

// Owns the temp file descriptor and path until the rename succeeds.
class TempFile {
 public:
  TempFile(std::filesystem::path path, int fd) noexcept : path_(std::move(path)), fd_(fd) {}
  TempFile(const TempFile&) = delete;
  TempFile& operator=(const TempFile&) = delete;
  ~TempFile() {
    if (fd_ >= 0) {
      ::close(fd_);
    }
    if (!path_.empty()) {
      std::error_code ec;
      if (!std::filesystem::remove(path_, ec) && ec) {
        std::cerr << "pxl: could not remove " << path_ << ": " << ec.message() << '\n';
      }
    }
  }

  int fd() const noexcept { return fd_; }
  const std::filesystem::path& path() const noexcept { return path_; }

  int Close() noexcept {
    const int rc = ::close(fd_);
    fd_ = -1;
    return rc;
  }
  void Keep() noexcept { path_.clear(); }

 private:
  std::filesystem::path path_;
  int fd_;
};

std::filesystem::path TempPathFor(const std::filesystem::path& dir, const std::filesystem::path& target) {
  std::array<uint8_t, 8> nonce{};
  pxl::crypto::FillRandom(nonce);
  auto name = target.filename();
  name += ".partial-";
  name += HexEncode(nonce);
  return dir / name;
}

void WriteFully(int fd, std::span<const uint8_t> payload, const WriteSteps& steps) {
  while (!payload.empty()) {
    const ssize_t n = ::write(fd, payload.data(), payload.size());
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      steps.FailErrno("write", errno);
    }
    if (n == 0) {
      steps.FailErrno("write made no progress", EIO);
    }
    payload = payload.subspan(static_cast<size_t>(n));
  }
}

// fsync is retried a few times on EINTR/EAGAIN/EBUSY with doubling backoff.
void SyncWithBackoff(int fd, const WriteSteps& steps) {
  std::chrono::milliseconds delay{5};
  for (int attempt = 0;; ++attempt) {
    if (::fsync(fd) == 0) {
      return;
    }
    const int err = errno;
    const bool transient = err == EINTR || err == EAGAIN || err == EBUSY;
    if (!transient || attempt == 4) {
      steps.FailErrno("fsync", err);
    }
    std::this_thread::sleep_for(delay);
    delay *= 2;
  }
}

void SyncDirectory(const std::filesystem::path& dir, const WriteSteps& steps) {
  const int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
  if (fd < 0) {
    steps.FailErrno("open directory", errno);
  }
  const int rc = ::fsync(fd);
  const int err = errno;
  ::close(fd);
  if (rc != 0) {
    steps.FailErrno("fsync directory", err);
  }
}

}  // namespace

void AtomicReplace(const std::filesystem::path& target, std::span<const uint8_t> payload,
                   const AtomicReplaceHooks& hooks) {
  if (target.empty()) {
    throw Error{ErrorDomain::Validation, errors::validation::kBadConfiguration,
                "Container output path is empty"};
  }
  WriteSteps steps(target);

  auto dir = target.parent_path();
  if (dir.empty()) {
    dir = steps.Run("resolve working directory", [] { return std::filesystem::current_path(); });
  }

  const auto temp_path = TempPathFor(dir, target);
  const int fd = ::open(temp_path.c_str(), O_CREAT | O_EXCL | O_WRONLY | O_CLOEXEC, S_IRUSR | S_IWUSR);
  if (fd < 0) {
    steps.FailErrno("create temp file", errno);
  }
  TempFile temp(temp_path, fd);

  steps.Run("write temp file", [&] { WriteFully(temp.fd(), payload, steps); });
  steps.Run("fsync temp file", [&] { SyncWithBackoff(temp.fd(), steps); });
  if (temp.Close() != 0) {
    steps.FailErrno("close temp file", errno);
  }

  if (hooks.before_rename) {
    hooks.before_rename(temp.path(), target);
  }

  if (::rename(temp.path().c_str(), target.c_str()) != 0) {
    steps.FailErrno("rename into place", errno);
  }
  temp.Keep();
  steps.Run("fsync directory", [&] { SyncDirectory(dir, steps); });
}

std::vector<uint8_t> ReadFileBytes(const std::filesystem::path& path) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    throw Error{ErrorDomain::IO, errors::io::kReadFailed, "Not a regular file: " + PathToUtf8String(path),
                ec ? std::optional<int>(ec.value()) : std::optional<int>(ENOENT)};
  }
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw Error{ErrorDomain::IO, errors::io::kReadFailed, "Cannot open " + PathToUtf8String(path), errno};
  }
  std::vector<uint8_t> bytes{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
  if (in.bad()) {
    throw Error{ErrorDomain::IO, errors::io::kReadFailed, "Read error on " + PathToUtf8String(path), errno};
  }
  return bytes;
}

}  // namespace pxl::orchestrator
