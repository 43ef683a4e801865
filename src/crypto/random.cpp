#include "vk/crypto/random.h"

#include <cerrno>
#include <cstdint>
#include <fstream>
#include <span>

#if defined(_WIN32)
#include <windows.h>
#include <bcrypt.h>
#if defined(_MSC_VER)
#pragma comment(lib, "bcrypt.lib")
#endif
#if !defined(BCRYPT_SUCCESS)
#define BCRYPT_SUCCESS(status) ((status) >= 0)
#endif
#elif defined(__APPLE__) || defined(__FreeBSD__) || defined(__OpenBSD__) || defined(__NetBSD__)
#include <stdlib.h>
#include <unistd.h>
#elif defined(__linux__) || defined(__ANDROID__)
#include <sys/random.h>
#include <unistd.h>
#endif

#if VK_HAVE_SODIUM
#include <sodium.h>
#endif

#include "vk/crypto/provider.h"
#include "vk/error.h"

namespace {

[[maybe_unused]] void ReadFromUrandom(std::span<uint8_t> out) {
  std::ifstream urandom("/dev/urandom", std::ios::in | std::ios::binary);
  if (!urandom) {
    throw vk::Error(vk::ErrorDomain::Crypto, errno, "Failed to open /dev/urandom");
  }
  urandom.read(reinterpret_cast<char*>(out.data()),
               static_cast<std::streamsize>(out.size()));
  if (urandom.gcount() != static_cast<std::streamsize>(out.size())) {
    throw vk::Error(vk::ErrorDomain::Crypto, errno,
                    "Failed to read sufficient entropy from /dev/urandom");
  }
}

}  // namespace

namespace vk::crypto {

void SystemRandomBytes(std::span<uint8_t> out) {
  if (out.empty()) {
    return;
  }
#if VK_HAVE_SODIUM
  EnsureCryptoProviderInitialized();
  randombytes_buf(out.data(), out.size());
#elif defined(_WIN32)
  NTSTATUS status = BCryptGenRandom(nullptr, reinterpret_cast<PUCHAR>(out.data()),
                                    static_cast<ULONG>(out.size()),
                                    BCRYPT_USE_SYSTEM_PREFERRED_RNG);
  if (!BCRYPT_SUCCESS(status)) {
    throw Error(ErrorDomain::Crypto, static_cast<int>(status), "Windows RNG failed");
  }
#elif defined(__APPLE__) || defined(__FreeBSD__) || defined(__OpenBSD__) || defined(__NetBSD__)
  arc4random_buf(out.data(), out.size());
#elif defined(__linux__) || defined(__ANDROID__)
  size_t offset = 0;
  while (offset < out.size()) {
    ssize_t result = ::getrandom(out.data() + offset, out.size() - offset, 0);
    if (result < 0) {
      if (errno == EINTR) {
        continue;
      }
      if (errno == ENOSYS) {
        break;
      }
      throw Error(ErrorDomain::Crypto, errno, "getrandom failed");
    }
    offset += static_cast<size_t>(result);
  }
  if (offset < out.size()) {
    ReadFromUrandom(out.subspan(offset));
  }
#else
  ReadFromUrandom(out);
#endif
}

}  // namespace vk::crypto
