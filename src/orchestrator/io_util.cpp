#include "vk/orchestrator/io_util.h"

#include "vk/common.h"
#include "vk/crypto/random.h"

#include <array>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <span>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <type_traits>
#include <vector>

#ifndef _WIN32
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>
#else
#ifndef NOMINMAX
#define NOMINMAX
#endif
#define WIN32_LEAN_AND_MEAN
#include <Windows.h>
#include <fcntl.h>
#include <io.h>
#include <sys/stat.h>
#endif

namespace vk::orchestrator {
namespace {

constexpr const char* kAtomicReplaceErrorMessage = "Atomic file replace failed";

class ErrorContext {
 public:
  void Push(std::string context) { context_stack_.push_back(std::move(context)); }
  void Pop() {
    if (!context_stack_.empty()) {
      context_stack_.pop_back();
    }
  }
  [[nodiscard]] std::vector<std::string> Stack() const { return context_stack_; }
  [[nodiscard]] std::string Format(std::string_view message) const {
    std::ostringstream oss;
    oss << message;
    for (auto it = context_stack_.rbegin(); it != context_stack_.rend(); ++it) {
      oss << "\n  while: " << *it;
    }
    return oss.str();
  }

 private:
  std::vector<std::string> context_stack_;
};

class ScopedErrorContext {
 public:
  ScopedErrorContext(ErrorContext& ctx, std::string description) : ctx_(ctx) {
    ctx_.Push(std::move(description));
  }
  ScopedErrorContext(const ScopedErrorContext&) = delete;
  ScopedErrorContext& operator=(const ScopedErrorContext&) = delete;
  ~ScopedErrorContext() { ctx_.Pop(); }

 private:
  ErrorContext& ctx_;
};

vk::Retryability ClassifyNativeError(int native) {
  switch (native) {
#if defined(EINTR)
    case EINTR:
#endif
#if defined(EAGAIN)
    case EAGAIN:
#endif
#if defined(EWOULDBLOCK) && EWOULDBLOCK != EAGAIN
    case EWOULDBLOCK:
#endif
      return vk::Retryability::kRetryable;
#if defined(EBUSY)
    case EBUSY:
      return vk::Retryability::kTransient;
#endif
#if defined(ETIMEDOUT)
    case ETIMEDOUT:
      return vk::Retryability::kTransient;
#endif
    default:
      break;
  }
  return vk::Retryability::kFatal;
}

[[noreturn]] void ThrowIoError(const ErrorContext& ctx, std::string message, int native) {
  throw Error{ErrorDomain::IO, errors::io::kAtomicReplaceFailed, ctx.Format(message), native,
              ClassifyNativeError(native), ctx.Stack()};
}

Error AugmentError(const Error& err, const ErrorContext& ctx) {
  auto merged = err.context;
  auto stack = ctx.Stack();
  merged.insert(merged.end(), stack.begin(), stack.end());
  return Error{err.domain, err.code, ctx.Format(err.what()), err.native_code, err.retryability,
               std::move(merged)};
}

template <typename Func>
auto WithContext(ErrorContext& ctx, std::string description, Func&& fn)
    -> std::invoke_result_t<Func&> {
  ScopedErrorContext scoped(ctx, std::move(description));
  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Func&>>) {
      fn();
      return;
    } else {
      return fn();
    }
  } catch (const Error& err) {
    if (err.context.empty()) {
      throw AugmentError(err, ctx);
    }
    throw;
  } catch (const std::system_error& sys_err) {
    throw Error{ErrorDomain::IO, errors::io::kAtomicReplaceFailed, ctx.Format(sys_err.what()),
                sys_err.code().value(), ClassifyNativeError(sys_err.code().value()), ctx.Stack()};
  }
}

#ifdef _WIN32
int NativeOpen(const std::filesystem::path& path) {
  return _wopen(path.wstring().c_str(), _O_CREAT | _O_WRONLY | _O_TRUNC | _O_BINARY | _O_EXCL,
                _S_IREAD | _S_IWRITE);
}

int NativeClose(int fd) { return _close(fd); }

// _commit flushes file contents; directory metadata is flushed separately.
int NativeFsync(int fd) { return _commit(fd); }

int NativeWrite(int fd, const uint8_t* data, size_t size) {
  return _write(fd, data, static_cast<unsigned int>(size));
}

bool NativeRename(const std::filesystem::path& from, const std::filesystem::path& to) {
  return ::MoveFileExW(from.wstring().c_str(), to.wstring().c_str(),
                       MOVEFILE_REPLACE_EXISTING | MOVEFILE_WRITE_THROUGH) != 0;
}

void SyncDirectory(const std::filesystem::path& dir, const ErrorContext& ctx) {
  HANDLE handle = ::CreateFileW(
      dir.wstring().c_str(), GENERIC_READ | GENERIC_WRITE,
      FILE_SHARE_READ | FILE_SHARE_WRITE | FILE_SHARE_DELETE, nullptr, OPEN_EXISTING,
      FILE_FLAG_BACKUP_SEMANTICS | FILE_ATTRIBUTE_NORMAL, nullptr);
  if (handle == INVALID_HANDLE_VALUE) {
    ThrowIoError(ctx, std::string(kAtomicReplaceErrorMessage) + ": open directory failed",
                 static_cast<int>(::GetLastError()));
  }
  if (!::FlushFileBuffers(handle)) {
    const int err = static_cast<int>(::GetLastError());
    ::CloseHandle(handle);
    ThrowIoError(ctx, std::string(kAtomicReplaceErrorMessage) + ": directory flush failed", err);
  }
  ::CloseHandle(handle);
}

#else

int NativeOpen(const std::filesystem::path& path) {
  return ::open(path.c_str(), O_CREAT | O_EXCL | O_WRONLY | O_CLOEXEC, 0600);
}

int NativeClose(int fd) { return ::close(fd); }

int NativeFsync(int fd) { return ::fsync(fd); }

ssize_t NativeWrite(int fd, const uint8_t* data, size_t size) {
  return ::write(fd, data, size);
}

bool NativeRename(const std::filesystem::path& from, const std::filesystem::path& to) {
  return ::rename(from.c_str(), to.c_str()) == 0;
}

void SyncDirectory(const std::filesystem::path& dir, const ErrorContext& ctx) {
  int dir_fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
  if (dir_fd < 0) {
    ThrowIoError(ctx, std::string(kAtomicReplaceErrorMessage) + ": open directory failed", errno);
  }
  if (::fsync(dir_fd) != 0) {
    const int err = errno;
    ::close(dir_fd);
    ThrowIoError(ctx, std::string(kAtomicReplaceErrorMessage) + ": directory flush failed", err);
  }
  ::close(dir_fd);
}

#endif

void SyncFileWithRetry(int fd, const ErrorContext& ctx) {
  constexpr int kMaxRetries = 4;
  std::chrono::milliseconds backoff{5};
  for (int attempt = 0;; ++attempt) {
    if (NativeFsync(fd) == 0) {
      return;
    }
    const int saved_errno = errno;
    if (saved_errno == EINTR) {
      continue;
    }
    if (attempt >= kMaxRetries || ClassifyNativeError(saved_errno) == Retryability::kFatal) {
      ThrowIoError(ctx, std::string(kAtomicReplaceErrorMessage) + ": fsync failed", saved_errno);
    }
    std::this_thread::sleep_for(backoff);
    backoff *= 2;
  }
}

void WriteAll(int fd, std::span<const uint8_t> payload, const ErrorContext& ctx) {
  size_t written = 0;
  while (written < payload.size()) {
    auto chunk = NativeWrite(fd, payload.data() + written, payload.size() - written);
    if (chunk < 0) {
      const int saved_errno = errno;
      if (saved_errno == EINTR) {
        continue;
      }
      ThrowIoError(ctx, std::string(kAtomicReplaceErrorMessage) + ": write failed", saved_errno);
    }
    if (chunk == 0) {
      ThrowIoError(ctx, std::string(kAtomicReplaceErrorMessage) + ": short write", 0);
    }
    written += static_cast<size_t>(chunk);
  }
}

class TempFileGuard {
 public:
  explicit TempFileGuard(std::filesystem::path path) noexcept : path_(std::move(path)) {}
  TempFileGuard(const TempFileGuard&) = delete;
  TempFileGuard& operator=(const TempFileGuard&) = delete;
  ~TempFileGuard() noexcept {
    if (!path_.empty()) {
      std::error_code ec;
      if (!std::filesystem::remove(path_, ec) && ec) {
        std::cerr << "TempFileGuard cleanup failed for " << path_ << ": " << ec.message() << '\n';
      }
    }
  }

  void Release() noexcept { path_.clear(); }

 private:
  std::filesystem::path path_;
};

std::filesystem::path MakeTempPath(const std::filesystem::path& dir,
                                   const std::filesystem::path& base) {
  std::array<uint8_t, 16> random{};
  vk::crypto::SystemRandomBytes(std::span<uint8_t>(random.data(), random.size()));
  std::filesystem::path temp_name = base.filename();
  temp_name += ".tmp.";
  temp_name += HexEncode(random);
  return dir / temp_name;
}

}  // namespace

void AtomicReplace(const std::filesystem::path& target, std::span<const uint8_t> payload,
                   const AtomicReplaceHooks& hooks) {
  ErrorContext ctx;
  const std::string target_utf8 =
      target.empty() ? std::string("<empty>") : vk::PathToUtf8String(target);
  ScopedErrorContext root(ctx, "atomic replace target=" + target_utf8);

  if (target.empty()) {
    throw Error{ErrorDomain::Validation, errors::io::kAtomicReplaceFailed,
                ctx.Format("Target path required"), std::nullopt, Retryability::kFatal,
                ctx.Stack()};
  }

  auto dir = target.parent_path();
  if (dir.empty()) {
    dir = WithContext(ctx, "resolving current working directory",
                      [] { return std::filesystem::current_path(); });
  }

  auto temp_path = MakeTempPath(dir, target);
  TempFileGuard cleanup(temp_path);

  int fd = WithContext(ctx, "opening temporary payload file", [&]() {
    int handle = NativeOpen(temp_path);
    if (handle < 0) {
      ThrowIoError(ctx, std::string(kAtomicReplaceErrorMessage) + ": open failed", errno);
    }
    return handle;
  });

  try {
    WithContext(ctx, "writing payload", [&] { WriteAll(fd, payload, ctx); });
    WithContext(ctx, "syncing payload", [&] { SyncFileWithRetry(fd, ctx); });
  } catch (const Error&) {
    NativeClose(fd);
    throw;
  }

  WithContext(ctx, "closing temporary payload file", [&] {
    if (NativeClose(fd) != 0) {
      ThrowIoError(ctx, std::string(kAtomicReplaceErrorMessage) + ": close failed", errno);
    }
  });

  if (hooks.before_rename) {
    WithContext(ctx, "executing before_rename hook", [&] { hooks.before_rename(temp_path, target); });
  }

  WithContext(ctx, "renaming temporary file into place", [&] {
    if (!NativeRename(temp_path, target)) {
      int err = errno;
#ifdef _WIN32
      if (err == 0) {
        err = static_cast<int>(::GetLastError());
      }
#endif
      ThrowIoError(ctx, std::string(kAtomicReplaceErrorMessage) + ": rename failed", err);
    }
  });
  cleanup.Release();

  WithContext(ctx, "syncing directory metadata", [&] { SyncDirectory(dir, ctx); });
}

std::vector<uint8_t> ReadFileBytes(const std::filesystem::path& path, int missing_code,
                                   int read_code) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    throw Error{ErrorDomain::IO, missing_code,
                "File not found: " + vk::PathToUtf8String(path),
                ec ? std::optional<int>(ec.value()) : std::nullopt};
  }
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw Error{ErrorDomain::IO, read_code, "Unable to open " + vk::PathToUtf8String(path)};
  }
  std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(in)),
                             std::istreambuf_iterator<char>());
  if (in.bad()) {
    throw Error{ErrorDomain::IO, read_code, "Unable to read " + vk::PathToUtf8String(path)};
  }
  return bytes;
}

}  // namespace vk::orchestrator
