#include "vk/core/info_file_io.h"

#include <algorithm>
#include <cstring>
#include <string>

#include "vk/common.h"
#include "vk/error.h"
#include "vk/errors.h"
#include "vk/orchestrator/io_util.h"
#include "vk/tlv/parser.h"
#include "vk/tlv/writer.h"

namespace vk::core {
namespace {

// --- Top-level records ----------------------------------------------------------
constexpr uint16_t kTlvVersion = 0x0001;
constexpr uint16_t kTlvLegacySalt = 0x0002;
constexpr uint16_t kTlvLegacyHash = 0x0003;
constexpr uint16_t kTlvLegacyKdf = 0x0004;
constexpr uint16_t kTlvPassphraseEntry = 0x0010;
constexpr uint16_t kTlvAsymmetricEntry = 0x0011;

// --- Passphrase entry fields ----------------------------------------------------
constexpr uint16_t kEntrySalt = 0x01;
constexpr uint16_t kEntryHash = 0x02;
constexpr uint16_t kEntryWrapped = 0x03;
constexpr uint16_t kEntryKdf = 0x04;

// --- Asymmetric entry fields ----------------------------------------------------
constexpr uint16_t kEntryRecipient = 0x01;
constexpr uint16_t kEntryRecipientWrapped = 0x02;

// --- KDF fields -----------------------------------------------------------------
constexpr uint16_t kKdfAlgorithm = 0x01;
constexpr uint16_t kKdfIterations = 0x02;
constexpr uint16_t kKdfMemoryKib = 0x03;
constexpr uint16_t kKdfTimeCost = 0x04;
constexpr uint16_t kKdfParallelism = 0x05;

constexpr size_t kMaxTopLevelRecords = 1024;

[[noreturn]] void ThrowMalformed(const std::string& detail) {
  throw Error{ErrorDomain::Validation, errors::validation::kInfoFileMalformed,
              std::string(errors::msg::kInfoFileMalformed) + ": " + detail};
}

[[noreturn]] void ThrowUnknownRecord(uint16_t type) {
  throw Error{ErrorDomain::Validation, errors::validation::kInfoFileMalformed,
              std::string(errors::msg::kInfoFileUnknownRecord) + " (type " + std::to_string(type) + ")"};
}

tlv::Parser ParseNested(std::span<const uint8_t> value, const char* what) {
  tlv::Parser parser(value, 16);
  if (!parser.valid()) {
    ThrowMalformed(std::string("truncated ") + what);
  }
  return parser;
}

uint32_t ReadU32(std::span<const uint8_t> value, const char* what) {
  if (value.size() != sizeof(uint32_t)) {
    ThrowMalformed(std::string("bad length for ") + what);
  }
  uint32_t le = 0;
  std::memcpy(&le, value.data(), sizeof(le));
  return FromLittleEndian32(le);
}

template <size_t N>
std::array<uint8_t, N> ReadFixed(std::span<const uint8_t> value, const char* what) {
  if (value.size() != N) {
    ThrowMalformed(std::string("bad length for ") + what);
  }
  std::array<uint8_t, N> out{};
  std::copy(value.begin(), value.end(), out.begin());
  return out;
}

// Records a singleton field, rejecting repeats.
template <typename T>
void SetOnce(std::optional<T>& slot, T value, const char* what) {
  if (slot.has_value()) {
    ThrowMalformed(std::string("duplicate ") + what);
  }
  slot = std::move(value);
}

std::vector<uint8_t> EncodeKdf(const KdfParams& kdf) {
  tlv::Writer writer;
  writer.AddU8(kKdfAlgorithm, static_cast<uint8_t>(kdf.algorithm));
  if (kdf.algorithm == KdfAlgorithm::kPbkdf2) {
    writer.AddU32(kKdfIterations, kdf.pbkdf2_iterations);
  } else {
    writer.AddU32(kKdfMemoryKib, kdf.argon2.memory_kib);
    writer.AddU32(kKdfTimeCost, kdf.argon2.time_cost);
    writer.AddU32(kKdfParallelism, kdf.argon2.parallelism);
  }
  return writer.Take();
}

KdfParams DecodeKdf(std::span<const uint8_t> value) {
  std::optional<uint8_t> algorithm;
  std::optional<uint32_t> iterations;
  std::optional<uint32_t> memory_kib;
  std::optional<uint32_t> time_cost;
  std::optional<uint32_t> parallelism;
  for (const auto& record : ParseNested(value, "kdf parameters")) {
    switch (record.type) {
      case kKdfAlgorithm:
        if (record.value.size() != 1) {
          ThrowMalformed("bad length for kdf algorithm");
        }
        SetOnce(algorithm, record.value[0], "kdf algorithm");
        break;
      case kKdfIterations:
        SetOnce(iterations, ReadU32(record.value, "kdf iterations"), "kdf iterations");
        break;
      case kKdfMemoryKib:
        SetOnce(memory_kib, ReadU32(record.value, "kdf memory"), "kdf memory");
        break;
      case kKdfTimeCost:
        SetOnce(time_cost, ReadU32(record.value, "kdf time cost"), "kdf time cost");
        break;
      case kKdfParallelism:
        SetOnce(parallelism, ReadU32(record.value, "kdf parallelism"), "kdf parallelism");
        break;
      default:
        ThrowUnknownRecord(record.type);
    }
  }
  if (!algorithm) {
    ThrowMalformed("kdf algorithm missing");
  }
  KdfParams kdf;
  switch (static_cast<KdfAlgorithm>(*algorithm)) {
    case KdfAlgorithm::kPbkdf2:
      if (!iterations || *iterations == 0) {
        ThrowMalformed("pbkdf2 iterations missing");
      }
      kdf = KdfParams::Pbkdf2(*iterations);
      break;
    case KdfAlgorithm::kArgon2id:
      if (!memory_kib || !time_cost || !parallelism || *time_cost == 0 || *parallelism == 0) {
        ThrowMalformed("argon2 parameters missing");
      }
      kdf = KdfParams::Argon2id(crypto::Argon2Params{*memory_kib, *time_cost, *parallelism});
      break;
    default:
      throw Error{ErrorDomain::Validation, errors::validation::kInfoFileMalformed,
                  std::string(errors::msg::kUnknownKdfAlgorithm) + " (" +
                      std::to_string(static_cast<int>(*algorithm)) + ")"};
  }
  return kdf;
}

std::vector<uint8_t> EncodePassphraseEntry(const PassphraseEntry& entry) {
  tlv::Writer writer;
  writer.Add(kEntrySalt, entry.salt);
  writer.Add(kEntryHash, entry.confirmation_hash);
  writer.Add(kEntryWrapped, entry.wrapped_master_key);
  writer.Add(kEntryKdf, EncodeKdf(entry.kdf));
  return writer.Take();
}

PassphraseEntry DecodePassphraseEntry(std::span<const uint8_t> value) {
  std::optional<Salt> salt;
  std::optional<ConfirmationHash> hash;
  std::optional<std::vector<uint8_t>> wrapped;
  std::optional<KdfParams> kdf;
  for (const auto& record : ParseNested(value, "passphrase entry")) {
    switch (record.type) {
      case kEntrySalt:
        SetOnce(salt, ReadFixed<kSaltSize>(record.value, "salt"), "salt");
        break;
      case kEntryHash:
        SetOnce(hash, ReadFixed<kConfirmationHashSize>(record.value, "confirmation hash"),
                "confirmation hash");
        break;
      case kEntryWrapped:
        SetOnce(wrapped, std::vector<uint8_t>(record.value.begin(), record.value.end()),
                "wrapped key");
        break;
      case kEntryKdf:
        SetOnce(kdf, DecodeKdf(record.value), "kdf parameters");
        break;
      default:
        ThrowUnknownRecord(record.type);
    }
  }
  if (!salt || !hash || !wrapped || !kdf) {
    ThrowMalformed("incomplete passphrase entry");
  }
  return PassphraseEntry{*salt, *hash, std::move(*wrapped), *kdf};
}

std::vector<uint8_t> EncodeAsymmetricEntry(const AsymmetricEntry& entry) {
  tlv::Writer writer;
  writer.AddString(kEntryRecipient, entry.recipient_id);
  writer.Add(kEntryRecipientWrapped, entry.wrapped_master_key);
  return writer.Take();
}

AsymmetricEntry DecodeAsymmetricEntry(std::span<const uint8_t> value) {
  std::optional<std::string> recipient;
  std::optional<std::vector<uint8_t>> wrapped;
  for (const auto& record : ParseNested(value, "asymmetric entry")) {
    switch (record.type) {
      case kEntryRecipient:
        SetOnce(recipient, std::string(record.value.begin(), record.value.end()), "recipient");
        break;
      case kEntryRecipientWrapped:
        SetOnce(wrapped, std::vector<uint8_t>(record.value.begin(), record.value.end()),
                "wrapped key");
        break;
      default:
        ThrowUnknownRecord(record.type);
    }
  }
  if (!recipient || recipient->empty() || !wrapped) {
    ThrowMalformed("incomplete asymmetric entry");
  }
  return AsymmetricEntry{std::move(*recipient), std::move(*wrapped)};
}

}  // namespace

std::vector<uint8_t> EncodeInfoFile(const InfoFile& info) {
  tlv::Writer writer;
  writer.AddU32(kTlvVersion, static_cast<uint32_t>(info.version()));
  if (info.legacy_salt) {
    writer.Add(kTlvLegacySalt, *info.legacy_salt);
  }
  if (info.legacy_confirmation_hash) {
    writer.Add(kTlvLegacyHash, *info.legacy_confirmation_hash);
  }
  if (info.legacy_kdf) {
    writer.Add(kTlvLegacyKdf, EncodeKdf(*info.legacy_kdf));
  }
  for (const auto& entry : info.keys()) {
    if (const auto* passphrase = std::get_if<PassphraseEntry>(&entry)) {
      writer.Add(kTlvPassphraseEntry, EncodePassphraseEntry(*passphrase));
    } else {
      writer.Add(kTlvAsymmetricEntry, EncodeAsymmetricEntry(std::get<AsymmetricEntry>(entry)));
    }
  }

  std::vector<uint8_t> out(kInfoFileMagic.begin(), kInfoFileMagic.end());
  const auto& body = writer.bytes();
  out.insert(out.end(), body.begin(), body.end());
  return out;
}

InfoFile DecodeInfoFile(std::span<const uint8_t> bytes) {
  if (bytes.size() < kInfoFileMagic.size() ||
      !std::equal(kInfoFileMagic.begin(), kInfoFileMagic.end(), bytes.begin())) {
    ThrowMalformed("bad magic");
  }
  tlv::Parser parser(bytes.subspan(kInfoFileMagic.size()), kMaxTopLevelRecords);
  if (!parser.valid()) {
    ThrowMalformed("truncated record");
  }

  std::optional<uint32_t> version;
  std::optional<Salt> legacy_salt;
  std::optional<ConfirmationHash> legacy_hash;
  std::optional<KdfParams> legacy_kdf;
  std::vector<KeyEntry> entries;
  for (const auto& record : parser) {
    switch (record.type) {
      case kTlvVersion:
        SetOnce(version, ReadU32(record.value, "version"), "version");
        break;
      case kTlvLegacySalt:
        SetOnce(legacy_salt, ReadFixed<kSaltSize>(record.value, "legacy salt"), "legacy salt");
        break;
      case kTlvLegacyHash:
        SetOnce(legacy_hash, ReadFixed<kConfirmationHashSize>(record.value, "legacy hash"),
                "legacy hash");
        break;
      case kTlvLegacyKdf:
        SetOnce(legacy_kdf, DecodeKdf(record.value), "legacy kdf");
        break;
      case kTlvPassphraseEntry:
        entries.emplace_back(DecodePassphraseEntry(record.value));
        break;
      case kTlvAsymmetricEntry:
        entries.emplace_back(DecodeAsymmetricEntry(record.value));
        break;
      default:
        ThrowUnknownRecord(record.type);
    }
  }
  if (!version) {
    ThrowMalformed("version missing");
  }

  InfoFile info(static_cast<int>(static_cast<int32_t>(*version)));
  info.legacy_salt = legacy_salt;
  info.legacy_confirmation_hash = legacy_hash;
  info.legacy_kdf = legacy_kdf;
  for (auto& entry : entries) {
    if (auto* passphrase = std::get_if<PassphraseEntry>(&entry)) {
      info.AddPassphrase(std::move(*passphrase));
    } else {
      try {
        info.AddAsymmetric(std::move(std::get<AsymmetricEntry>(entry)));
      } catch (const KeyError& err) {
        ThrowMalformed(err.detail);
      }
    }
  }
  return info;
}

InfoFile LoadInfoFile(const std::filesystem::path& path) {
  const auto bytes = orchestrator::ReadFileBytes(path, errors::io::kInfoFileMissing,
                                                 errors::io::kInfoFileReadFailed);
  return DecodeInfoFile(bytes);
}

void SaveInfoFile(const std::filesystem::path& path, const InfoFile& info) {
  const auto bytes = EncodeInfoFile(info);
  orchestrator::AtomicReplace(path, bytes);
}

}  // namespace vk::core
