#pragma once

#include <string_view>

namespace vk::errors::msg {
// User-facing messages. Diagnostic detail travels separately.
inline constexpr std::string_view kErrorCreatingInfoFile{"Error creating info file"};
inline constexpr std::string_view kErrorGeneratingMasterKey{"Error generating the master key"};
inline constexpr std::string_view kErrorGeneratingSalt{"Error generating a new salt"};
inline constexpr std::string_view kErrorDerivingWrappingKey{"Error deriving the wrapping key"};
inline constexpr std::string_view kErrorWrappingMasterKey{"Error wrapping the master key"};
inline constexpr std::string_view kErrorUnwrappingMasterKey{"Error unwrapping the master key"};
inline constexpr std::string_view kErrorAsymmetricWrap{"Error encrypting the master key for the recipient"};
inline constexpr std::string_view kErrorGettingPassphrase{"Error getting passphrase"};
inline constexpr std::string_view kPassphraseEmpty{"Passphrase must not be empty"};
inline constexpr std::string_view kPassphraseCancelled{"Passphrase entry was cancelled"};
inline constexpr std::string_view kErrorAddingKey{"Error adding the key"};
inline constexpr std::string_view kPassphraseAlreadyAdded{"This passphrase has already been added to the repository"};
inline constexpr std::string_view kRecipientAlreadyAdded{"This key has already been added to the repository"};
inline constexpr std::string_view kInvalidCredentials{"Cannot unlock the repository"};
inline constexpr std::string_view kCannotUnlockToMigrate{"Cannot unlock the repository to migrate it"};
inline constexpr std::string_view kUnsupportedVersion{"This repository has already been upgraded or is using an unsupported version"};
inline constexpr std::string_view kUpgradeRequired{"Repository needs to be upgraded; run 'vk upgrade'"};
inline constexpr std::string_view kFactorNotFound{"No key with this id exists in the repository"};
inline constexpr std::string_view kFactorInUse{"Cannot remove the key used to unlock the repository"};
inline constexpr std::string_view kInfoFileExists{"A repository already exists at this path"};
inline constexpr std::string_view kInfoFileMissing{"Repository info file not found"};
inline constexpr std::string_view kInfoFileMalformed{"Repository info file is malformed"};
inline constexpr std::string_view kInfoFileUnknownRecord{"Repository info file contains an unknown record"};
inline constexpr std::string_view kInvalidRecipient{"Recipient id is not a valid key fingerprint"};
inline constexpr std::string_view kRecipientUnknown{"No public key for this recipient in the keyring"};
inline constexpr std::string_view kVersionRegression{"Format version cannot decrease"};
inline constexpr std::string_view kUnsupportedArgon2HashLength{"Unsupported Argon2 hash length"};
inline constexpr std::string_view kArgon2DerivationFailed{"Argon2id derivation failed"};
inline constexpr std::string_view kArgon2Unavailable{"Argon2id support not available in this build"};
inline constexpr std::string_view kUnknownKdfAlgorithm{"Unknown key derivation algorithm"};
inline constexpr std::string_view kMalformedKeyMaterial{"Key material has an unexpected length"};
}  // namespace vk::errors::msg
