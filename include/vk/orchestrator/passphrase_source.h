#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace vk::orchestrator {

inline constexpr size_t kMaxPassphraseLength = 1024;

// Supplies passphrases to the key orchestrator. nullopt means the user
// cancelled; I/O failures throw vk::Error.
class PassphraseSource {
 public:
  virtual ~PassphraseSource() = default;
  virtual std::optional<std::string> Acquire(std::string_view prompt) = 0;
};

// Prompts on the controlling terminal with echo disabled. Empty input is
// rejected and the prompt repeated; EOF or ^D cancels.
class TerminalPassphraseSource : public PassphraseSource {
 public:
  std::optional<std::string> Acquire(std::string_view prompt) override;
};

// Hands out a fixed sequence of answers, then cancels. Used where the
// passphrase arrives with the request.
class StaticPassphraseSource : public PassphraseSource {
 public:
  explicit StaticPassphraseSource(std::string passphrase);
  explicit StaticPassphraseSource(std::vector<std::optional<std::string>> answers);
  ~StaticPassphraseSource() override;

  std::optional<std::string> Acquire(std::string_view prompt) override;

  [[nodiscard]] size_t prompts() const noexcept { return prompts_; }

 private:
  std::vector<std::optional<std::string>> answers_;
  size_t prompts_{0};
};

}  // namespace vk::orchestrator
