#include "vk/orchestrator/keyring.h"

#include <algorithm>
#include <system_error>

#include "vk/common.h"
#include "vk/crypto/sealed_box.h"
#include "vk/error.h"
#include "vk/errors.h"
#include "vk/orchestrator/io_util.h"
#include "vk/security/zeroizer.h"

namespace vk::orchestrator {
namespace {

constexpr const char* kPublicSuffix = ".pub";
constexpr const char* kPrivateSuffix = ".key";

[[noreturn]] void ThrowKeyringError(const std::string& message, std::optional<int> native = std::nullopt) {
  throw Error{ErrorDomain::IO, errors::io::kKeyringAccessFailed, message, native};
}

std::optional<PublicKey> ParsePublicHex(std::string_view text) {
  while (!text.empty() && (text.back() == '\n' || text.back() == '\r' || text.back() == ' ')) {
    text.remove_suffix(1);
  }
  auto decoded = HexDecode(text);
  if (!decoded || decoded->size() != crypto::kX25519KeySize) {
    return std::nullopt;
  }
  PublicKey key{};
  std::copy(decoded->begin(), decoded->end(), key.begin());
  return key;
}

std::string ReadText(const std::filesystem::path& path) {
  auto bytes = ReadFileBytes(path, errors::io::kKeyringAccessFailed, errors::io::kKeyringAccessFailed);
  std::string text(bytes.begin(), bytes.end());
  security::Zeroizer::WipeVector(bytes);
  return text;
}

bool IsIdentityId(std::string_view text) {
  return text.size() == crypto::SealedBox::kFingerprintSize * 2 &&
         std::all_of(text.begin(), text.end(), [](char ch) {
           return (ch >= '0' && ch <= '9') || (ch >= 'a' && ch <= 'f');
         });
}

}  // namespace

Keyring::Keyring(std::filesystem::path directory) : directory_(std::move(directory)) {}

std::string Keyring::IdForPublicKey(const PublicKey& public_key) {
  return HexEncode(crypto::FingerprintForPublicKey(public_key));
}

void Keyring::EnsureDirectory() const {
  std::error_code ec;
  std::filesystem::create_directories(directory_, ec);
  if (ec) {
    ThrowKeyringError("Unable to create keyring directory " + PathToUtf8String(directory_), ec.value());
  }
  std::filesystem::permissions(directory_, std::filesystem::perms::owner_all,
                               std::filesystem::perm_options::replace, ec);
}

std::filesystem::path Keyring::PublicPath(std::string_view id) const {
  return directory_ / (std::string(id) + kPublicSuffix);
}

std::filesystem::path Keyring::PrivatePath(std::string_view id) const {
  return directory_ / (std::string(id) + kPrivateSuffix);
}

KeyringIdentity Keyring::Generate() {
  EnsureDirectory();
  auto pair = crypto::GetCryptoProvider().GenerateX25519();
  KeyringIdentity identity;
  identity.public_key = pair.public_key;
  identity.id = IdForPublicKey(pair.public_key);
  identity.has_private = true;

  std::string private_hex = HexEncode(pair.private_key.AsSpan());
  security::Zeroizer::ScopeWiper<char> private_guard(std::span<char>(private_hex.data(), private_hex.size()));
  AtomicReplace(PrivatePath(identity.id), AsBytes(private_hex));
  const auto public_hex = HexEncode(identity.public_key);
  AtomicReplace(PublicPath(identity.id), AsBytes(public_hex));
  return identity;
}

KeyringIdentity Keyring::Import(std::string_view public_hex) {
  auto key = ParsePublicHex(public_hex);
  if (!key) {
    throw Error{ErrorDomain::Validation, errors::validation::kInvalidKeyMaterial,
                std::string(errors::msg::kMalformedKeyMaterial)};
  }
  EnsureDirectory();
  KeyringIdentity identity;
  identity.public_key = *key;
  identity.id = IdForPublicKey(*key);
  const auto normalized = HexEncode(*key);
  AtomicReplace(PublicPath(identity.id), AsBytes(normalized));
  std::error_code ec;
  identity.has_private = std::filesystem::exists(PrivatePath(identity.id), ec);
  return identity;
}

std::vector<KeyringIdentity> Keyring::List() const {
  std::vector<KeyringIdentity> identities;
  std::error_code ec;
  if (!std::filesystem::is_directory(directory_, ec)) {
    return identities;
  }
  for (const auto& dirent : std::filesystem::directory_iterator(directory_, ec)) {
    const auto& path = dirent.path();
    if (path.extension() != kPublicSuffix) {
      continue;
    }
    const auto id = path.stem().string();
    if (!IsIdentityId(id)) {
      continue;
    }
    auto key = ParsePublicHex(ReadText(path));
    if (!key || IdForPublicKey(*key) != id) {
      continue;
    }
    KeyringIdentity identity;
    identity.id = id;
    identity.public_key = *key;
    identity.has_private = std::filesystem::exists(PrivatePath(id), ec);
    identities.push_back(std::move(identity));
  }
  if (ec) {
    ThrowKeyringError("Unable to list keyring " + PathToUtf8String(directory_), ec.value());
  }
  std::sort(identities.begin(), identities.end(),
            [](const KeyringIdentity& a, const KeyringIdentity& b) { return a.id < b.id; });
  return identities;
}

std::optional<PublicKey> Keyring::FindPublic(std::string_view id) const {
  const auto normalized = ToLowerAscii(id);
  if (!IsIdentityId(normalized)) {
    return std::nullopt;
  }
  const auto path = PublicPath(normalized);
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    return std::nullopt;
  }
  auto key = ParsePublicHex(ReadText(path));
  if (!key || IdForPublicKey(*key) != normalized) {
    return std::nullopt;
  }
  return key;
}

std::vector<PrivateIdentity> Keyring::PrivateIdentities() const {
  std::vector<PrivateIdentity> identities;
  for (const auto& identity : List()) {
    if (!identity.has_private) {
      continue;
    }
    auto text = ReadText(PrivatePath(identity.id));
    security::Zeroizer::ScopeWiper<char> text_guard(std::span<char>(text.data(), text.size()));
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) {
      text.pop_back();
    }
    auto decoded = HexDecode(text);
    if (!decoded || decoded->size() != crypto::kX25519KeySize) {
      if (decoded) {
        security::Zeroizer::WipeVector(*decoded);
      }
      continue;
    }
    PrivateIdentity entry;
    entry.id = identity.id;
    entry.public_key = identity.public_key;
    std::copy(decoded->begin(), decoded->end(), entry.private_key.data());
    security::Zeroizer::WipeVector(*decoded);
    const auto derived = crypto::GetCryptoProvider().X25519PublicFromPrivate(
        std::span<const uint8_t, crypto::kX25519KeySize>(entry.private_key.data(), crypto::kX25519KeySize));
    if (derived != entry.public_key) {
      continue;
    }
    identities.push_back(std::move(entry));
  }
  return identities;
}

}  // namespace vk::orchestrator
