// AETHER - Configuration File Parser Tests
// Copyright (c) 2024 AETHER Developers
// MIT License

#include <gtest/gtest.h>

#include "aether/util/config.h"

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <string>
#include <unistd.h>
#include <vector>

namespace aether {
namespace util {
namespace test {

// ============================================================================
// Test Fixtures
// ============================================================================

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.Clear();
    }

    void TearDown() override {
        for (const auto& file : tempFiles_) {
            std::remove(file.c_str());
        }
        tempFiles_.clear();
    }

    std::string CreateTempFile(const std::string& content) {
        char filename[] = "/tmp/aether_config_test_XXXXXX";
        int fd = mkstemp(filename);
        if (fd < 0) {
            throw std::runtime_error("Failed to create temp file");
        }
        close(fd);

        std::ofstream file(filename);
        file << content;
        file.close();

        tempFiles_.push_back(filename);
        return filename;
    }

    ConfigParseResult ParseArgs(std::vector<const char*> args) {
        args.insert(args.begin(), "aether-wallet");
        return config_.ParseCommandLine(static_cast<int>(args.size()), args.data());
    }

    ConfigManager config_;
    std::vector<std::string> tempFiles_;
};

// ============================================================================
// Basic Parsing Tests
// ============================================================================

TEST_F(ConfigTest, ParseEmptyString) {
    auto result = config_.ParseString("");
    EXPECT_TRUE(result.success);
    EXPECT_EQ(config_.Size(), 0u);
}

TEST_F(ConfigTest, ParseComments) {
    std::string content = R"(
# This is a comment
; This is also a comment
# key=value
)";
    auto result = config_.ParseString(content);
    EXPECT_TRUE(result.success);
    EXPECT_EQ(config_.Size(), 0u);
}

TEST_F(ConfigTest, ParseKeyValuePairs) {
    std::string content = R"(
  datadir  =  /tmp/aether
wallet = main.json
addresscount=5
)";
    auto result = config_.ParseString(content);
    ASSERT_TRUE(result.success);
    EXPECT_EQ(config_.Size(), 3u);
    EXPECT_EQ(config_.GetString("datadir", ""), "/tmp/aether");
    EXPECT_EQ(config_.GetString("wallet", ""), "main.json");
    EXPECT_EQ(config_.GetInt("addresscount", 0), 5);
}

TEST_F(ConfigTest, ParseQuotedValue) {
    std::string content = R"(
key1="value with spaces"
key2='single quoted'
key3="with \"escaped\" quotes"
key4="line1\nline2\ttabbed"
)";
    auto result = config_.ParseString(content);
    ASSERT_TRUE(result.success);
    EXPECT_EQ(config_.GetString("key1", ""), "value with spaces");
    EXPECT_EQ(config_.GetString("key2", ""), "single quoted");
    EXPECT_EQ(config_.GetString("key3", ""), "with \"escaped\" quotes");
    EXPECT_EQ(config_.GetString("key4", ""), "line1\nline2\ttabbed");
}

TEST_F(ConfigTest, ParseBareAndNegatedFlags) {
    std::string content = R"(
printtoconsole
nodebug
)";
    auto result = config_.ParseString(content);
    ASSERT_TRUE(result.success);
    EXPECT_TRUE(config_.GetBool("printtoconsole", false));
    EXPECT_FALSE(config_.GetBool("debug", true));
    EXPECT_FALSE(config_.HasKey("nodebug"));
}

TEST_F(ConfigTest, ParseSections) {
    std::string content = R"(
wallet=global.json
[testnet]
wallet=test.json
)";
    auto result = config_.ParseString(content);
    ASSERT_TRUE(result.success);
    EXPECT_EQ(config_.GetString("wallet", ""), "global.json");
    EXPECT_EQ(config_.GetString("wallet", "", "testnet"), "test.json");
    EXPECT_FALSE(config_.HasKey("wallet", "mainnet"));
}

TEST_F(ConfigTest, ParseLineContinuation) {
    auto result = config_.ParseString("entropy=first \\\nsecond");
    ASSERT_TRUE(result.success);
    EXPECT_EQ(config_.GetString("entropy", ""), "first second");
}

TEST_F(ConfigTest, LaterValueOverrides) {
    auto result = config_.ParseString("wallet=a.json\nwallet=b.json\n");
    ASSERT_TRUE(result.success);
    EXPECT_EQ(config_.GetString("wallet", ""), "b.json");
}

// ============================================================================
// Error Handling Tests
// ============================================================================

TEST_F(ConfigTest, MissingSectionBracket) {
    auto result = config_.ParseString("ok=1\n[broken\n", "test.conf");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorFile, "test.conf");
    EXPECT_EQ(result.errorLine, 2);
}

TEST_F(ConfigTest, InvalidKey) {
    auto result = config_.ParseString("bad key=1");
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.errorMessage.find("Invalid key"), std::string::npos);

    config_.Clear();
    EXPECT_FALSE(config_.ParseString("=value").success);
}

TEST_F(ConfigTest, LineTooLong) {
    std::string content = "key=" + std::string(MAX_LINE_LENGTH + 1, 'x');
    auto result = config_.ParseString(content);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorLine, 1);
}

TEST_F(ConfigTest, MissingFile) {
    auto result = config_.ParseFile("/nonexistent/path/aether.conf");
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.errorMessage.find("Cannot open file"), std::string::npos);
}

// ============================================================================
// File and Include Tests
// ============================================================================

TEST_F(ConfigTest, ParseFile) {
    std::string path = CreateTempFile("wallet=file.json\naddresscount=7\n");
    auto result = config_.ParseFile(path);
    ASSERT_TRUE(result.success);
    EXPECT_EQ(config_.GetString("wallet", ""), "file.json");

    auto entry = config_.GetEntry("addresscount");
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->source, path);
    EXPECT_EQ(entry->lineNumber, 2);
}

TEST_F(ConfigTest, IncludeFile) {
    std::string inner = CreateTempFile("loglevel=debug\n");
    std::string outer = CreateTempFile("wallet=outer.json\ninclude " + inner + "\n");

    auto result = config_.ParseFile(outer);
    ASSERT_TRUE(result.success);
    EXPECT_EQ(config_.GetString("wallet", ""), "outer.json");
    EXPECT_EQ(config_.GetString("loglevel", ""), "debug");
}

TEST_F(ConfigTest, IncludeMissingFileFails) {
    auto result = config_.ParseString("include /nonexistent/aether-extra.conf");
    EXPECT_FALSE(result.success);
}

TEST_F(ConfigTest, RecursiveIncludeIsBounded) {
    std::string path = CreateTempFile("");
    {
        std::ofstream file(path);
        file << "include " << path << "\n";
    }
    auto result = config_.ParseFile(path);
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.errorMessage.find("include depth"), std::string::npos);
}

// ============================================================================
// Environment and Path Expansion
// ============================================================================

TEST_F(ConfigTest, ExpandEnvVars) {
    setenv("AETHER_TEST_VAR", "expanded", 1);
    auto result = config_.ParseString("key=${AETHER_TEST_VAR}/suffix\nmissing=${AETHER_NOT_SET_VAR}x");
    ASSERT_TRUE(result.success);
    EXPECT_EQ(config_.GetString("key", ""), "expanded/suffix");
    EXPECT_EQ(config_.GetString("missing", ""), "x");
    unsetenv("AETHER_TEST_VAR");
}

TEST_F(ConfigTest, ExpandTilde) {
    const char* oldHome = std::getenv("HOME");
    std::string savedHome = oldHome ? oldHome : "";
    setenv("HOME", "/home/tester", 1);
    EXPECT_EQ(ConfigManager::ExpandTilde("~/wallets"), "/home/tester/wallets");
    EXPECT_EQ(ConfigManager::ExpandTilde("/abs/path"), "/abs/path");
    EXPECT_EQ(ConfigManager::ExpandTilde("~other/path"), "~other/path");
    EXPECT_EQ(ConfigManager::GetDefaultDataDir(), "/home/tester/.aether");

    config_.Set("datadir", "~/custom");
    EXPECT_EQ(config_.GetPath("datadir"), "/home/tester/custom");

    if (oldHome) {
        setenv("HOME", savedHome.c_str(), 1);
    } else {
        unsetenv("HOME");
    }
}

// ============================================================================
// Typed Getters
// ============================================================================

TEST_F(ConfigTest, ParseBoolValues) {
    for (const char* yes : {"true", "YES", "on", "1"}) {
        EXPECT_EQ(ConfigManager::ParseBool(yes), std::optional<bool>(true)) << yes;
    }
    for (const char* no : {"false", "No", "OFF", "0"}) {
        EXPECT_EQ(ConfigManager::ParseBool(no), std::optional<bool>(false)) << no;
    }
    EXPECT_FALSE(ConfigManager::ParseBool("maybe").has_value());
}

TEST_F(ConfigTest, IntegerParsing) {
    auto result = config_.ParseString("good=42\nnegative=-3\nbad=12abc\nempty=\n");
    ASSERT_TRUE(result.success);
    EXPECT_EQ(config_.TryGetInt("good"), std::optional<int64_t>(42));
    EXPECT_EQ(config_.TryGetInt("negative"), std::optional<int64_t>(-3));
    EXPECT_FALSE(config_.TryGetInt("bad").has_value());
    EXPECT_FALSE(config_.TryGetInt("empty").has_value());
    EXPECT_FALSE(config_.TryGetInt("absent").has_value());
    EXPECT_EQ(config_.GetInt("bad", 9), 9);
}

TEST_F(ConfigTest, UnrecognizedBoolFallsBack) {
    config_.Set("printtoconsole", "sometimes");
    EXPECT_FALSE(config_.TryGetBool("printtoconsole").has_value());
    EXPECT_TRUE(config_.GetBool("printtoconsole", true));
}

// ============================================================================
// Command Line and Priority Tests
// ============================================================================

TEST_F(ConfigTest, CommandLineOptionsAndPositionals) {
    auto result = ParseArgs({"-datadir=/tmp/x", "--count=3", "addresses", "-noprinttoconsole",
                             "-help"});
    ASSERT_TRUE(result.success);
    EXPECT_EQ(config_.GetString("datadir", ""), "/tmp/x");
    EXPECT_EQ(config_.GetInt("count", 0), 3);
    EXPECT_FALSE(config_.GetBool("printtoconsole", true));
    EXPECT_TRUE(config_.GetBool("help", false));

    ASSERT_EQ(config_.GetArgs().size(), 1u);
    EXPECT_EQ(config_.GetArgs()[0], "addresses");
}

TEST_F(ConfigTest, DoubleDashEndsOptions) {
    auto result = ParseArgs({"sign", "--", "-to=0x00"});
    ASSERT_TRUE(result.success);
    EXPECT_FALSE(config_.HasKey("to"));
    ASSERT_EQ(config_.GetArgs().size(), 2u);
    EXPECT_EQ(config_.GetArgs()[1], "-to=0x00");
}

TEST_F(ConfigTest, InvalidCommandLineOption) {
    auto result = ParseArgs({"-bad key=1"});
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorFile, COMMAND_LINE_SOURCE);

    config_.Clear();
    EXPECT_FALSE(ParseArgs({"---"}).success);
}

TEST_F(ConfigTest, CommandLineBeatsFile) {
    ASSERT_TRUE(ParseArgs({"-wallet=cli.json"}).success);
    ASSERT_TRUE(config_.ParseString("wallet=file.json\nloglevel=warn\n").success);

    EXPECT_EQ(config_.GetString("wallet", ""), "cli.json");
    EXPECT_EQ(config_.GetString("loglevel", ""), "warn");
}

TEST_F(ConfigTest, DefaultsNeverOverride) {
    config_.SetDefault("addresscount", "12");
    EXPECT_EQ(config_.GetInt("addresscount", 0), 12);
    EXPECT_TRUE(config_.GetEntry("addresscount")->isDefault);

    ASSERT_TRUE(config_.ParseString("addresscount=4").success);
    EXPECT_EQ(config_.GetInt("addresscount", 0), 4);

    config_.SetDefault("addresscount", "99");
    EXPECT_EQ(config_.GetInt("addresscount", 0), 4);
}

TEST_F(ConfigTest, ClearRemovesEverything) {
    ASSERT_TRUE(ParseArgs({"-a=1", "info"}).success);
    config_.Clear();
    EXPECT_EQ(config_.Size(), 0u);
    EXPECT_TRUE(config_.GetArgs().empty());
}

} // namespace test
} // namespace util
} // namespace aether
