// AETHER - Wallet Settings
// Copyright (c) 2024 AETHER Developers
// MIT License
//
// Typed view of the configuration keys the wallet tool reads:
//
//   datadir         Data directory (default ~/.aether)
//   wallet          Wallet file name inside datadir (default wallet.json)
//   addresscount    Addresses listed by "addresses" (0..1000, default 12)
//   loglevel        trace, debug, info, warn, error, fatal or off
//   printtoconsole  Log to the console (default true)
//   debuglog        Log file; relative names resolve inside datadir, 1 means
//                   debug.log, 0 or unset disables file logging

#ifndef AETHER_WALLET_SETTINGS_H
#define AETHER_WALLET_SETTINGS_H

#include <aether/util/config.h>
#include <aether/util/logging.h>

#include <cstddef>
#include <cstdint>
#include <string>

namespace aether {
namespace wallet {

constexpr const char* DEFAULT_WALLET_FILENAME = "wallet.json";
constexpr const char* DEFAULT_DEBUG_LOG_FILENAME = "debug.log";

/// Upper bound for addresscount
constexpr int64_t MAX_ADDRESS_COUNT = 1000;

struct WalletSettings {
    std::string dataDir;
    std::string walletFile{DEFAULT_WALLET_FILENAME};
    size_t addressCount{12};
    util::LogLevel logLevel{util::LogLevel::Info};
    bool printToConsole{true};
    std::string debugLogFile;   // Empty when file logging is off

    /**
     * Read settings from a parsed configuration.
     *
     * @throws std::invalid_argument naming the offending key
     */
    static WalletSettings FromConfig(const util::ConfigManager& config);

    /// dataDir joined with walletFile
    std::string WalletPath() const;

    /// Absolute or datadir-relative log file; empty when file logging is off
    std::string DebugLogPath() const;
};

/// Validate an address count option
/// @throws std::invalid_argument if not a whole number in [0, MAX_ADDRESS_COUNT]
size_t ParseAddressCount(const util::ConfigManager& config, const std::string& key,
                         size_t defaultValue);

} // namespace wallet
} // namespace aether

#endif // AETHER_WALLET_SETTINGS_H
