#include "vk/orchestrator/passphrase_source.h"

#include <array>
#include <cerrno>
#include <iostream>

#include "vk/error.h"
#include "vk/errors.h"
#include "vk/security/zeroizer.h"

#if defined(_WIN32)
#ifndef NOMINMAX
#define NOMINMAX
#endif
#define WIN32_LEAN_AND_MEAN
#include <Windows.h>
#else
#include <termios.h>
#include <unistd.h>
#endif

namespace vk::orchestrator {
namespace {

constexpr char kEndOfTransmission = 0x04;

#if defined(_WIN32)

class ConsoleModeGuard {
 public:
  ConsoleModeGuard(HANDLE handle, DWORD mode) : handle_(handle), mode_(mode) {}
  ~ConsoleModeGuard() { Restore(); }
  void Restore() {
    if (!restored_) {
      SetConsoleMode(handle_, mode_);
      restored_ = true;
    }
  }

 private:
  HANDLE handle_;
  DWORD mode_;
  bool restored_{false};
};

#else

class TermiosGuard {
 public:
  TermiosGuard(int fd, const termios& state) : fd_(fd), state_(state), restored_(false) {}
  ~TermiosGuard() { Restore(); }
  void Restore() {
    if (!restored_) {
      tcsetattr(fd_, TCSAFLUSH, &state_);
      restored_ = true;
    }
  }

 private:
  int fd_;
  termios state_;
  bool restored_;
};

#endif

// Reads one line with echo disabled. nullopt on EOF before a newline or ^D.
std::optional<std::string> ReadSilentLine(std::string_view prompt) {
#if defined(_WIN32)
  HANDLE input = GetStdHandle(STD_INPUT_HANDLE);
  DWORD original = 0;
  if (input == INVALID_HANDLE_VALUE || !GetConsoleMode(input, &original)) {
    throw Error{ErrorDomain::IO, errors::io::kConsoleModeQueryFailed,
                "Failed to query console mode.", static_cast<int>(GetLastError())};
  }
  ConsoleModeGuard guard(input, original);
  if (!SetConsoleMode(input, original & ~static_cast<DWORD>(ENABLE_ECHO_INPUT))) {
    throw Error{ErrorDomain::IO, errors::io::kConsoleEchoDisableFailed,
                "Failed to disable console echo.", static_cast<int>(GetLastError())};
  }
#else
  if (!isatty(STDIN_FILENO)) {
    throw Error{ErrorDomain::IO, errors::io::kPasswordPromptNeedsTty,
                "Passphrase prompt requires a TTY"};
  }
  termios original{};
  if (tcgetattr(STDIN_FILENO, &original) != 0) {
    const int err = errno;
    throw Error{ErrorDomain::IO, errors::io::kConsoleModeQueryFailed,
                "Failed to query terminal attributes.", err};
  }
  TermiosGuard guard(STDIN_FILENO, original);
  termios silent = original;
  silent.c_lflag &= ~ECHO;
  if (tcsetattr(STDIN_FILENO, TCSAFLUSH, &silent) != 0) {
    const int err = errno;
    throw Error{ErrorDomain::IO, errors::io::kConsoleEchoDisableFailed,
                "Failed to disable terminal echo.", err};
  }
#endif

  std::cerr << prompt << std::flush;

  std::array<char, kMaxPassphraseLength + 1> buffer{};
  security::Zeroizer::ScopeWiper<char> buf_guard(buffer.data(), buffer.size());

  size_t pos = 0;
  bool overflow = false;
  bool terminated = false;
  bool cancelled = false;
  while (true) {
    char ch = 0;
#if defined(_WIN32)
    DWORD n = 0;
    if (!ReadFile(input, &ch, 1, &n, nullptr)) {
      throw Error{ErrorDomain::IO, errors::io::kPasswordReadFailed,
                  "Failed to read passphrase input.", static_cast<int>(GetLastError())};
    }
#else
    ssize_t n = ::read(STDIN_FILENO, &ch, 1);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      const int err = errno;
      throw Error{ErrorDomain::IO, errors::io::kPasswordReadFailed,
                  "Failed to read passphrase input.", err};
    }
#endif
    if (n == 0) {
      break;
    }
    if (ch == kEndOfTransmission) {
      cancelled = true;
      break;
    }
    if (ch == '\r') {
      continue;
    }
    if (ch == '\n') {
      terminated = true;
      break;
    }
    if (ch == '\b' || ch == 0x7f) {
      if (pos > 0) {
        --pos;
        buffer[pos] = 0;
      }
      continue;
    }
    if (pos >= kMaxPassphraseLength) {
      overflow = true;
      continue;
    }
    buffer[pos++] = ch;
  }

  guard.Restore();
  std::cerr << std::endl;

  if (cancelled || (!terminated && pos == 0)) {
    return std::nullopt;
  }
  if (overflow) {
    throw Error{ErrorDomain::Validation, errors::validation::kPassphraseTooLong,
                "Passphrase exceeds maximum length (" + std::to_string(kMaxPassphraseLength) + ")"};
  }
  return std::string(buffer.data(), pos);
}

}  // namespace

std::optional<std::string> TerminalPassphraseSource::Acquire(std::string_view prompt) {
  while (true) {
    auto passphrase = ReadSilentLine(prompt);
    if (!passphrase) {
      return std::nullopt;
    }
    if (!passphrase->empty()) {
      return passphrase;
    }
    std::cerr << errors::msg::kPassphraseEmpty << std::endl;
  }
}

StaticPassphraseSource::StaticPassphraseSource(std::string passphrase) {
  answers_.emplace_back(std::move(passphrase));
}

StaticPassphraseSource::StaticPassphraseSource(std::vector<std::optional<std::string>> answers)
    : answers_(std::move(answers)) {}

StaticPassphraseSource::~StaticPassphraseSource() {
  for (auto& answer : answers_) {
    if (answer) {
      security::Zeroizer::WipeString(*answer);
    }
  }
}

std::optional<std::string> StaticPassphraseSource::Acquire(std::string_view) {
  const size_t index = prompts_++;
  if (index >= answers_.size()) {
    return std::nullopt;
  }
  return answers_[index];
}

}  // namespace vk::orchestrator
