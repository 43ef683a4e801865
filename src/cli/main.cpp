#include <algorithm>
#include <charconv>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include "vk/common.h"
#include "vk/core/info_file.h"
#include "vk/core/info_file_io.h"
#include "vk/error.h"
#include "vk/errors.h"
#include "vk/orchestrator/config.h"
#include "vk/orchestrator/event_bus.h"
#include "vk/orchestrator/key_orchestrator.h"
#include "vk/orchestrator/keyring.h"
#include "vk/orchestrator/passphrase_source.h"
#include "vk/orchestrator/primitives.h"

namespace {

  constexpr int kExitOk = 0;
  constexpr int kExitUsage = 64;
  constexpr int kExitIO = 74;
  constexpr int kExitAuth = 77;

  void PrintUsage() {
    std::cerr << "VaultKey\n";
    std::cerr << "Usage:\n";
    std::cerr << "  vk init [--recipient=<id>]\n";
    std::cerr << "  vk addkey [--recipient=<id>]\n";
    std::cerr << "  vk unlock\n";
    std::cerr << "  vk upgrade\n";
    std::cerr << "  vk keys ls\n";
    std::cerr << "  vk keys rm <factor-id>\n";
    std::cerr << "  vk keyring generate | list | import <public-hex>\n";
    std::cerr << "\nGlobal flags:\n";
    std::cerr << "  --info=<path>        Repository info file (default ./" << vk::core::kDefaultInfoFileName
              << ")\n";
    std::cerr << "  --kdf=<name>         pbkdf2 or argon2id for new passphrase factors\n";
    std::cerr << "  --kdf-iterations=N   Override PBKDF2 iteration count for new factors\n";
    std::cerr << "  --keyring=<dir>      Keyring directory\n";
  }

  struct CliOptions {
    std::filesystem::path info_path{vk::core::kDefaultInfoFileName};
    std::optional<std::string> kdf;
    std::optional<uint32_t> kdf_iterations;
    std::optional<std::filesystem::path> keyring_dir;
  };

  // Everything a command needs. The provider keeps a pointer to the keyring.
  struct CliContext {
    CliContext(const vk::orchestrator::RuntimeConfig& config, std::filesystem::path info)
        : info_path(std::move(info)),
          keyring(config.keyring_dir),
          primitives(config.kdf, &keyring),
          orchestrator(primitives, passphrases) {}

    std::filesystem::path info_path;
    vk::orchestrator::Keyring keyring;
    vk::orchestrator::DefaultPrimitiveProvider primitives;
    vk::orchestrator::TerminalPassphraseSource passphrases;
    vk::orchestrator::KeyOrchestrator orchestrator;
  };

  bool TryParseFlagValue(std::string_view arg, std::string_view flag, std::string_view& value) {
    if (arg.rfind(flag, 0) != 0) {
      return false;
    }
    value = arg.substr(flag.size());
    return true;
  }

  std::optional<uint32_t> ParseIterations(std::string_view text) {
    if (text.empty()) {
      return std::nullopt;
    }
    unsigned long long parsed = 0;
    auto [endptr, ec] = std::from_chars(text.data(), text.data() + text.size(), parsed);
    if (ec != std::errc() || endptr != text.data() + text.size() ||
        parsed < vk::orchestrator::kMinPbkdf2Iterations ||
        parsed > vk::orchestrator::kMaxPbkdf2Iterations) {
      return std::nullopt;
    }
    return static_cast<uint32_t>(parsed);
  }

  std::optional<std::string> ParseRecipientFlag(int argc, char** argv, int index) {
    if (argc - index == 0) {
      return std::string{};
    }
    if (argc - index != 1) {
      return std::nullopt;
    }
    std::string_view value;
    if (!TryParseFlagValue(argv[index], "--recipient=", value) || value.empty()) {
      return std::nullopt;
    }
    return std::string(value);
  }

  vk::orchestrator::FactorSpec SpecFor(const std::string& recipient) {
    if (recipient.empty()) {
      return vk::orchestrator::FactorSpec::Passphrase();
    }
    return vk::orchestrator::FactorSpec::Recipient(recipient);
  }

  vk::core::InfoFile LoadCurrentInfo(const std::filesystem::path& path) {
    auto info = vk::core::LoadInfoFile(path);
    if (info.version() < vk::core::kCurrentInfoFileVersion) {
      throw vk::Error{vk::ErrorDomain::State, vk::errors::state::kUpgradeRequired,
                      std::string(vk::errors::msg::kUpgradeRequired)};
    }
    return info;
  }

  std::string_view DomainPrefix(vk::ErrorDomain domain) {
    switch (domain) {
    case vk::ErrorDomain::IO:
      return "I/O error";
    case vk::ErrorDomain::Security:
      return "Security error";
    case vk::ErrorDomain::Crypto:
      return "Cryptography error";
    case vk::ErrorDomain::Validation:
      return "Validation error";
    case vk::ErrorDomain::Config:
      return "Configuration error";
    case vk::ErrorDomain::Dependency:
      return "Dependency error";
    case vk::ErrorDomain::State:
      return "State error";
    case vk::ErrorDomain::Internal:
      return "Internal error";
    }
    return "Error";
  }

  void PublishCliError(const vk::Error& err, std::string detail) {
    vk::orchestrator::Event event;
    event.category = vk::orchestrator::EventCategory::kDiagnostics;
    event.severity = vk::orchestrator::EventSeverity::kError;
    event.event_id = "cli_error";
    event.message = std::move(detail);
    event.fields.emplace_back("domain", std::string(DomainPrefix(err.domain)));
    event.fields.emplace_back("code", std::to_string(err.code), vk::orchestrator::FieldPrivacy::kPublic,
                              true);
    if (err.native_code.has_value()) {
      event.fields.emplace_back("native_code", std::to_string(*err.native_code),
                                vk::orchestrator::FieldPrivacy::kHash, true);
    }
    try {
      vk::orchestrator::EventBus::Instance().Publish(event);
    } catch (const std::exception& publish_error) {
      std::clog << "{\"event\":\"eventbus_error\",\"message\":\"error report publish failed\",\"detail\":\""
                << publish_error.what() << "\"}" << std::endl;
    }
  }

  void ReportError(const vk::Error& err) {
    std::cerr << DomainPrefix(err.domain) << ": " << err.what() << '\n';
    std::string detail = err.what();
    for (const auto& frame : err.context) {
      detail += " [" + frame + "]";
    }
    PublishCliError(err, std::move(detail));
  }

  void ReportError(const vk::KeyError& err) {
    std::cerr << DomainPrefix(err.domain) << ": " << err.what() << '\n';
    std::string detail = std::string(vk::FactorErrorKindName(err.kind)) + ": " + err.what();
    if (!err.detail.empty()) {
      detail += " (" + err.detail + ")";
    }
    PublishCliError(err, std::move(detail));
  }

  int ExitCodeFor(const vk::Error& err) {
    switch (err.domain) {
    case vk::ErrorDomain::IO:
      return kExitIO;
    case vk::ErrorDomain::Security:
    case vk::ErrorDomain::Crypto:
      return kExitAuth;
    case vk::ErrorDomain::Validation:
    case vk::ErrorDomain::Config:
    case vk::ErrorDomain::Dependency:
      return kExitUsage;
    case vk::ErrorDomain::State:
    case vk::ErrorDomain::Internal:
    default:
      return kExitIO;
    }
  }

  void InstallLogger(const vk::orchestrator::RuntimeConfig& config) {
    auto min_severity = config.log_level;
    if (!config.log_file && static_cast<int>(min_severity) <
                                static_cast<int>(vk::orchestrator::EventSeverity::kWarning)) {
      min_severity = vk::orchestrator::EventSeverity::kWarning;
    }
    auto logger = std::make_shared<vk::orchestrator::JsonLineLogger>(config.log_file, min_severity);
    vk::orchestrator::EventBus::Instance().Subscribe(
        [logger](const vk::orchestrator::Event& event) { logger->Log(event); });
  }

  int HandleInit(CliContext& ctx, const std::string& recipient) {
    std::error_code ec;
    if (std::filesystem::exists(ctx.info_path, ec)) {
      throw vk::Error{vk::ErrorDomain::Validation, vk::errors::validation::kInfoFileExists,
                      std::string(vk::errors::msg::kInfoFileExists) + ": " +
                          vk::PathToUtf8String(ctx.info_path)};
    }
    auto created = ctx.orchestrator.CreateRepository(SpecFor(recipient));
    vk::core::SaveInfoFile(ctx.info_path, created.info);
    const auto factors = ctx.orchestrator.ListFactors(created.info);
    std::cout << "Repository created at " << vk::PathToUtf8String(ctx.info_path) << '\n';
    if (!factors.empty()) {
      std::cout << "Initial key: " << factors.front().id << '\n';
    }
    return kExitOk;
  }

  int HandleAddKey(CliContext& ctx, const std::string& recipient) {
    auto info = LoadCurrentInfo(ctx.info_path);
    auto unlocked = ctx.orchestrator.Unlock(info);
    ctx.orchestrator.AddFactor(info, unlocked.master_key, SpecFor(recipient));
    vk::core::SaveInfoFile(ctx.info_path, info);
    const auto factors = ctx.orchestrator.ListFactors(info);
    std::cout << "Added key " << factors.back().id << '\n';
    return kExitOk;
  }

  int HandleUnlock(CliContext& ctx) {
    const auto info = LoadCurrentInfo(ctx.info_path);
    const auto unlocked = ctx.orchestrator.Unlock(info);
    std::cout << "Unlocked with " << unlocked.factor_id << '\n';
    return kExitOk;
  }

  int HandleUpgrade(CliContext& ctx) {
    auto info = vk::core::LoadInfoFile(ctx.info_path);
    const int from = info.version();
    if (ctx.orchestrator.UpgradeFormat(info) == vk::orchestrator::UpgradeOutcome::kAlreadyCurrent) {
      std::cout << "Repository is already at version " << info.version() << '\n';
      return kExitOk;
    }
    vk::core::SaveInfoFile(ctx.info_path, info);
    std::cout << "Repository upgraded from version " << from << " to " << info.version() << '\n';
    return kExitOk;
  }

  int HandleKeysList(CliContext& ctx) {
    const auto info = vk::core::LoadInfoFile(ctx.info_path);
    for (const auto& factor : ctx.orchestrator.ListFactors(info)) {
      std::cout << factor.id << '\t' << vk::orchestrator::FactorKindName(factor.kind) << '\t'
                << factor.detail << '\n';
    }
    return kExitOk;
  }

  int HandleKeysRemove(CliContext& ctx, std::string_view factor_id) {
    auto info = LoadCurrentInfo(ctx.info_path);
    const auto unlocked = ctx.orchestrator.Unlock(info);
    ctx.orchestrator.RemoveFactor(info, factor_id, unlocked.factor_id);
    vk::core::SaveInfoFile(ctx.info_path, info);
    std::cout << "Removed key " << factor_id << '\n';
    return kExitOk;
  }

  void PrintIdentity(const vk::orchestrator::KeyringIdentity& identity) {
    std::cout << identity.id << '\t' << (identity.has_private ? "private" : "public") << '\t'
              << vk::HexEncode(identity.public_key) << '\n';
  }

  int HandleKeyring(CliContext& ctx, int argc, char** argv, int index) {
    if (argc - index < 1) {
      PrintUsage();
      return kExitUsage;
    }
    const std::string_view sub = argv[index++];
    if (sub == "generate" && argc == index) {
      PrintIdentity(ctx.keyring.Generate());
      return kExitOk;
    }
    if (sub == "list" && argc == index) {
      for (const auto& identity : ctx.keyring.List()) {
        PrintIdentity(identity);
      }
      return kExitOk;
    }
    if (sub == "import" && argc - index == 1) {
      PrintIdentity(ctx.keyring.Import(argv[index]));
      return kExitOk;
    }
    PrintUsage();
    return kExitUsage;
  }

  int Dispatch(CliContext& ctx, const std::string& cmd, int argc, char** argv, int index) {
    if (cmd == "init" || cmd == "addkey") {
      auto recipient = ParseRecipientFlag(argc, argv, index);
      if (!recipient) {
        PrintUsage();
        return kExitUsage;
      }
      return cmd == "init" ? HandleInit(ctx, *recipient) : HandleAddKey(ctx, *recipient);
    }
    if (cmd == "unlock" || cmd == "upgrade") {
      if (argc != index) {
        PrintUsage();
        return kExitUsage;
      }
      return cmd == "unlock" ? HandleUnlock(ctx) : HandleUpgrade(ctx);
    }
    if (cmd == "keys") {
      if (argc - index == 1 && std::string_view(argv[index]) == "ls") {
        return HandleKeysList(ctx);
      }
      if (argc - index == 2 && std::string_view(argv[index]) == "rm") {
        return HandleKeysRemove(ctx, argv[index + 1]);
      }
      PrintUsage();
      return kExitUsage;
    }
    if (cmd == "keyring") {
      return HandleKeyring(ctx, argc, argv, index);
    }
    PrintUsage();
    return kExitUsage;
  }

} // namespace

int main(int argc, char** argv) {
  try {
    if (argc < 2) {
      PrintUsage();
      return kExitUsage;
    }

    CliOptions options;
    int index = 1; // parse global flags
    for (; index < argc; ++index) {
      std::string_view arg = argv[index];
      if (arg.rfind("--", 0) != 0) {
        break;
      }
      std::string_view value;
      if (TryParseFlagValue(arg, "--info=", value)) {
        if (value.empty()) {
          PrintUsage();
          return kExitUsage;
        }
        options.info_path = std::filesystem::path(std::string(value));
        continue;
      }
      if (TryParseFlagValue(arg, "--kdf=", value)) {
        if (value.empty()) {
          PrintUsage();
          return kExitUsage;
        }
        options.kdf = std::string(value);
        continue;
      }
      if (TryParseFlagValue(arg, "--kdf-iterations=", value)) {
        options.kdf_iterations = ParseIterations(value);
        if (!options.kdf_iterations) {
          PrintUsage();
          return kExitUsage;
        }
        continue;
      }
      if (TryParseFlagValue(arg, "--keyring=", value)) {
        if (value.empty()) {
          PrintUsage();
          return kExitUsage;
        }
        options.keyring_dir = std::filesystem::path(std::string(value));
        continue;
      }

      PrintUsage();
      return kExitUsage;
    }

    if (index >= argc) {
      PrintUsage();
      return kExitUsage;
    }

    auto config = vk::orchestrator::LoadRuntimeConfig();
    if (options.kdf) {
      vk::orchestrator::ApplyKdfAlgorithm(config.kdf, *options.kdf);
    }
    if (options.kdf_iterations) {
      config.kdf.pbkdf2_iterations = *options.kdf_iterations;
    }
    if (options.keyring_dir) {
      config.keyring_dir = *options.keyring_dir;
    }
    InstallLogger(config);

    const std::string cmd = argv[index++];
    CliContext ctx(config, options.info_path);
    ctx.primitives.SetProgressCallback([](uint32_t current, uint32_t total) {
      if (total == 0) {
        return;
      }
      auto percent = static_cast<uint32_t>((static_cast<uint64_t>(current) * 100u) / total);
      std::cerr << "\rDeriving passphrase key... " << percent << "%" << std::flush;
      if (current >= total) {
        std::cerr << std::endl;
      }
    });
    return Dispatch(ctx, cmd, argc, argv, index);
  } catch (const vk::KeyError& err) {
    ReportError(err);
    return ExitCodeFor(err);
  } catch (const vk::Error& err) {
    ReportError(err);
    return ExitCodeFor(err);
  } catch (const vk::AuthenticationFailureError& err) {
    std::cerr << "Authentication failed: " << err.what() << '\n';
    return kExitAuth;
  } catch (const std::exception& e) {
    std::cerr << "Unexpected error: " << e.what() << '\n';
    return kExitIO;
  }
}
