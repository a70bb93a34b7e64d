// AETHER - Wallet Settings Tests
// Copyright (c) 2024 AETHER Developers
// MIT License

#include <gtest/gtest.h>
#include "aether/util/config.h"
#include "aether/util/logging.h"
#include "aether/wallet/settings.h"

#include <stdexcept>
#include <string>

namespace aether {
namespace wallet {
namespace test {

// ============================================================================
// Test Fixtures
// ============================================================================

class WalletSettingsTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.Set("datadir", "/tmp/aether-settings");
    }

    util::ConfigManager config_;
};

// ============================================================================
// Defaults
// ============================================================================

TEST_F(WalletSettingsTest, Defaults) {
    WalletSettings settings = WalletSettings::FromConfig(config_);

    EXPECT_EQ(settings.dataDir, "/tmp/aether-settings");
    EXPECT_EQ(settings.walletFile, DEFAULT_WALLET_FILENAME);
    EXPECT_EQ(settings.addressCount, 12u);
    EXPECT_EQ(settings.logLevel, util::LogLevel::Info);
    EXPECT_TRUE(settings.printToConsole);
    EXPECT_EQ(settings.WalletPath(), "/tmp/aether-settings/wallet.json");
}

TEST_F(WalletSettingsTest, ReadsConfiguredValues) {
    ASSERT_TRUE(config_.ParseString(
        "wallet=savings.json\n"
        "addresscount=3\n"
        "loglevel=Debug\n"
        "printtoconsole=false\n").success);

    WalletSettings settings = WalletSettings::FromConfig(config_);
    EXPECT_EQ(settings.walletFile, "savings.json");
    EXPECT_EQ(settings.addressCount, 3u);
    EXPECT_EQ(settings.logLevel, util::LogLevel::Debug);
    EXPECT_FALSE(settings.printToConsole);
}

TEST(WalletPathTest, JoinsDirectoryAndFile) {
    WalletSettings settings;
    settings.dataDir = "/data/";
    settings.walletFile = "w.json";
    EXPECT_EQ(settings.WalletPath(), "/data/w.json");

    settings.dataDir = "/data";
    EXPECT_EQ(settings.WalletPath(), "/data/w.json");

    settings.dataDir.clear();
    EXPECT_EQ(settings.WalletPath(), "w.json");
}

TEST_F(WalletSettingsTest, DebugLogOffByDefault) {
    WalletSettings settings = WalletSettings::FromConfig(config_);
    EXPECT_TRUE(settings.debugLogFile.empty());
    EXPECT_EQ(settings.DebugLogPath(), "");
}

TEST_F(WalletSettingsTest, DebugLogPaths) {
    config_.Set("debuglog", "1");
    EXPECT_EQ(WalletSettings::FromConfig(config_).DebugLogPath(),
              "/tmp/aether-settings/debug.log");

    config_.Set("debuglog", "wallet-trace.log");
    EXPECT_EQ(WalletSettings::FromConfig(config_).DebugLogPath(),
              "/tmp/aether-settings/wallet-trace.log");

    config_.Set("debuglog", "/var/log/aether.log");
    EXPECT_EQ(WalletSettings::FromConfig(config_).DebugLogPath(), "/var/log/aether.log");

    config_.Set("debuglog", "0");
    EXPECT_EQ(WalletSettings::FromConfig(config_).DebugLogPath(), "");
}

TEST(WalletSettingsCommandLineTest, BareDebugLogFlag) {
    util::ConfigManager config;
    const char* argv[] = {"aether-wallet", "-datadir=/data", "-debuglog", "info"};
    ASSERT_TRUE(config.ParseCommandLine(4, argv).success);

    WalletSettings settings = WalletSettings::FromConfig(config);
    EXPECT_EQ(settings.DebugLogPath(), "/data/debug.log");
}

// ============================================================================
// Validation
// ============================================================================

TEST_F(WalletSettingsTest, RejectsWalletPaths) {
    for (const char* name : {"../escape.json", "dir/wallet.json", "..", "."}) {
        config_.Set("wallet", name);
        EXPECT_THROW(WalletSettings::FromConfig(config_), std::invalid_argument) << name;
    }
}

TEST_F(WalletSettingsTest, RejectsBadLogLevel) {
    config_.Set("loglevel", "loud");
    EXPECT_THROW(WalletSettings::FromConfig(config_), std::invalid_argument);
}

TEST_F(WalletSettingsTest, RejectsBadPrintToConsole) {
    config_.Set("printtoconsole", "sometimes");
    EXPECT_THROW(WalletSettings::FromConfig(config_), std::invalid_argument);
}

TEST_F(WalletSettingsTest, AddressCountBounds) {
    EXPECT_EQ(ParseAddressCount(config_, "count", 7), 7u);

    config_.Set("count", "0");
    EXPECT_EQ(ParseAddressCount(config_, "count", 7), 0u);

    config_.Set("count", "1000");
    EXPECT_EQ(ParseAddressCount(config_, "count", 7), 1000u);

    for (const char* bad : {"1001", "-1", "ten", "2.5"}) {
        config_.Set("count", bad);
        EXPECT_THROW(ParseAddressCount(config_, "count", 7), std::invalid_argument) << bad;
    }
}

TEST_F(WalletSettingsTest, AddressCountFromConfig) {
    config_.Set("addresscount", "5000");
    try {
        WalletSettings::FromConfig(config_);
        FAIL() << "expected invalid_argument";
    } catch (const std::invalid_argument& e) {
        EXPECT_NE(std::string(e.what()).find("addresscount"), std::string::npos);
    }
}

} // namespace test
} // namespace wallet
} // namespace aether
