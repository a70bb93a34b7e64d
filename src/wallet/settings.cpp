// AETHER - Wallet Settings Implementation
// Copyright (c) 2024 AETHER Developers
// MIT License

#include <aether/wallet/settings.h>

#include <algorithm>
#include <cctype>
#include <optional>
#include <stdexcept>

namespace aether {
namespace wallet {

namespace {

std::optional<util::LogLevel> ParseLogLevel(std::string name) {
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (name == "trace") return util::LogLevel::Trace;
    if (name == "debug") return util::LogLevel::Debug;
    if (name == "info") return util::LogLevel::Info;
    if (name == "warn" || name == "warning") return util::LogLevel::Warn;
    if (name == "error") return util::LogLevel::Error;
    if (name == "fatal") return util::LogLevel::Fatal;
    if (name == "off" || name == "none") return util::LogLevel::Off;
    return std::nullopt;
}

std::string JoinDataDir(const std::string& dataDir, const std::string& file) {
    if (dataDir.empty() || (!file.empty() && file.front() == '/')) {
        return file;
    }
    if (dataDir.back() == '/') {
        return dataDir + file;
    }
    return dataDir + "/" + file;
}

} // anonymous namespace

size_t ParseAddressCount(const util::ConfigManager& config, const std::string& key,
                         size_t defaultValue) {
    if (!config.HasKey(key)) {
        return defaultValue;
    }
    auto count = config.TryGetInt(key);
    if (!count || *count < 0 || *count > MAX_ADDRESS_COUNT) {
        throw std::invalid_argument(key + " must be a whole number between 0 and " +
                                    std::to_string(MAX_ADDRESS_COUNT));
    }
    return static_cast<size_t>(*count);
}

WalletSettings WalletSettings::FromConfig(const util::ConfigManager& config) {
    WalletSettings settings;

    settings.dataDir = config.GetPath("datadir", util::ConfigManager::GetDefaultDataDir());
    if (settings.dataDir.empty()) {
        throw std::invalid_argument("datadir is not set and HOME is unknown");
    }

    settings.walletFile = config.GetString("wallet", DEFAULT_WALLET_FILENAME);
    if (settings.walletFile.empty() ||
        settings.walletFile.find('/') != std::string::npos ||
        settings.walletFile == "." || settings.walletFile == "..") {
        throw std::invalid_argument("wallet must be a plain file name");
    }

    settings.addressCount = ParseAddressCount(config, "addresscount", settings.addressCount);

    if (auto level = config.TryGetString("loglevel")) {
        auto parsed = ParseLogLevel(*level);
        if (!parsed) {
            throw std::invalid_argument("loglevel must be one of trace, debug, info, warn, "
                                        "error, fatal, off");
        }
        settings.logLevel = *parsed;
    }

    if (config.HasKey("printtoconsole")) {
        auto print = config.TryGetBool("printtoconsole");
        if (!print) {
            throw std::invalid_argument("printtoconsole must be a boolean");
        }
        settings.printToConsole = *print;
    }

    if (config.HasKey("debuglog")) {
        std::string value = config.GetPath("debuglog");
        auto enabled = util::ConfigManager::ParseBool(value);
        if (enabled) {
            settings.debugLogFile = *enabled ? DEFAULT_DEBUG_LOG_FILENAME : "";
        } else {
            settings.debugLogFile = value;
        }
    }

    return settings;
}

std::string WalletSettings::WalletPath() const {
    return JoinDataDir(dataDir, walletFile);
}

std::string WalletSettings::DebugLogPath() const {
    if (debugLogFile.empty()) {
        return "";
    }
    return JoinDataDir(dataDir, debugLogFile);
}

} // namespace wallet
} // namespace aether
