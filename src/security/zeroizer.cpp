#include "vk/security/zeroizer.h"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <iostream>
#include <mutex>
#include <span>

#if defined(_WIN32)
#define NOMINMAX
#include <windows.h>
#else
#include <sys/mman.h>
#include <sys/resource.h>
#include <unistd.h>
#endif

namespace vk::security {
  namespace {

    inline void PortableZero(std::span<uint8_t> data) noexcept {
      if (data.empty()) {
        return;
      }

#if defined(_WIN32)
      ::SecureZeroMemory(data.data(), static_cast<SIZE_T>(data.size()));
#else
      volatile uint8_t* ptr = reinterpret_cast<volatile uint8_t*>(data.data());
      for (std::size_t i = 0; i < data.size(); ++i) {
        ptr[i] = 0;
      }
#if defined(__GNUC__) || defined(__clang__)
      __asm__ __volatile__("" ::: "memory");
#endif
#endif
      std::atomic_thread_fence(std::memory_order_seq_cst);
      volatile uint8_t verification = 0;
      const volatile uint8_t* verify_ptr =
          reinterpret_cast<const volatile uint8_t*>(data.data());
      for (std::size_t i = 0; i < data.size(); ++i) {
        verification |= verify_ptr[i];
      }
      if (verification != 0) {
        std::clog << "SecureBuffer warning: zeroization verification failed.\n";
      }
    }

#if !defined(_WIN32)
    void AdjustMemlockLimitIfNeeded() {
      struct rlimit current {};
      if (::getrlimit(RLIMIT_MEMLOCK, &current) != 0) {
        return;
      }
      constexpr rlim_t kDesired = 16U * 1024U * 1024U;
      if (current.rlim_cur >= kDesired) {
        return;
      }
      struct rlimit requested = current;
      if (current.rlim_max == RLIM_INFINITY || current.rlim_max >= kDesired) {
        requested.rlim_cur = kDesired;
      } else {
        requested.rlim_cur = current.rlim_max;
      }
      if (requested.rlim_cur <= current.rlim_cur) {
        return;
      }
      // Failure leaves the soft limit as is; TryLockMemory reports the outcome.
      (void)::setrlimit(RLIMIT_MEMLOCK, &requested);
    }

    void EnsurePosixLockingConfigured() {
      static std::once_flag once;
      std::call_once(once, []() { AdjustMemlockLimitIfNeeded(); });
    }
#endif

  } // namespace

  void Zeroizer::Wipe(std::span<uint8_t> data) noexcept {
    if (data.empty()) {
      return;
    }
    PortableZero(data);
    std::atomic_signal_fence(std::memory_order_seq_cst);
  }

  bool Zeroizer::MemoryLockingSupported() noexcept {
#if defined(_WIN32) || defined(_POSIX_VERSION)
    return true;
#else
    return false;
#endif
  }

  Zeroizer::LockStatus Zeroizer::TryLockMemory(std::span<uint8_t> data) noexcept {
    if (data.empty()) {
      return LockStatus::Locked;
    }
#if defined(_WIN32)
    return ::VirtualLock(data.data(), data.size()) ? LockStatus::Locked : LockStatus::Failed;
#elif defined(_POSIX_VERSION)
    EnsurePosixLockingConfigured();
    return ::mlock(data.data(), data.size()) == 0 ? LockStatus::Locked : LockStatus::Failed;
#else
    return LockStatus::Unsupported;
#endif
  }

  void Zeroizer::UnlockMemory(std::span<uint8_t> data) noexcept {
    if (data.empty()) {
      return;
    }
#if defined(_WIN32)
    ::VirtualUnlock(data.data(), data.size());
#elif defined(_POSIX_VERSION)
    ::munlock(data.data(), data.size());
#endif
  }

} // namespace vk::security
