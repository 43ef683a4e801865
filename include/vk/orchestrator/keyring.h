#pragma once

#include <array>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "vk/crypto/provider.h"
#include "vk/security/secure_buffer.h"

namespace vk::orchestrator {

using PublicKey = std::array<uint8_t, crypto::kX25519KeySize>;

struct KeyringIdentity {
  std::string id;
  PublicKey public_key{};
  bool has_private{false};
};

struct PrivateIdentity {
  std::string id;
  PublicKey public_key{};
  security::SecureBuffer<uint8_t> private_key{crypto::kX25519KeySize};
};

// X25519 identities kept as <id>.pub and <id>.key hex files. The id is the
// lowercase hex of the first 20 bytes of SHA-256 over the public key.
class Keyring {
 public:
  explicit Keyring(std::filesystem::path directory);

  [[nodiscard]] const std::filesystem::path& directory() const noexcept { return directory_; }

  KeyringIdentity Generate();
  // Throws vk::Error (Validation) when |public_hex| is not a 32-byte key.
  KeyringIdentity Import(std::string_view public_hex);
  [[nodiscard]] std::vector<KeyringIdentity> List() const;
  [[nodiscard]] std::optional<PublicKey> FindPublic(std::string_view id) const;
  [[nodiscard]] std::vector<PrivateIdentity> PrivateIdentities() const;

  static std::string IdForPublicKey(const PublicKey& public_key);

 private:
  void EnsureDirectory() const;
  [[nodiscard]] std::filesystem::path PublicPath(std::string_view id) const;
  [[nodiscard]] std::filesystem::path PrivatePath(std::string_view id) const;

  std::filesystem::path directory_;
};

}  // namespace vk::orchestrator
