// AETHER - Harmonic Transform Tests
// Copyright (c) 2024 AETHER Developers
// MIT License

#include <gtest/gtest.h>
#include "aether/core/base64.h"
#include "aether/core/errors.h"
#include "aether/core/hex.h"
#include "aether/harmonic/constants.h"
#include "aether/harmonic/harmonic_transform.h"

#include <cctype>
#include <cmath>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace aether {
namespace harmonic {
namespace test {

namespace {

const std::vector<std::string> ZERO_KEY_WORDS = {
    "quartz", "horizon", "cipher", "lumen", "resonance", "delta",
    "zephyr", "mosaic", "equinox", "aurora", "river", "lumen"
};

} // anonymous namespace

// ============================================================================
// Constants
// ============================================================================

TEST(HarmonicConstantsTest, TablesWrap) {
    EXPECT_EQ(Octave(0), 174u);
    EXPECT_EQ(Octave(11), 1185u);
    EXPECT_EQ(Octave(12), 174u);
    EXPECT_DOUBLE_EQ(PhaseShift(3), 0.0);
    EXPECT_DOUBLE_EQ(PhaseShift(4), 1.0 / 3.0);
    EXPECT_STREQ(Ratio(9).text, PHI.text);
}

TEST(HarmonicConstantsTest, FormatNumber) {
    EXPECT_EQ(FormatNumber(144.0), "144");
    EXPECT_EQ(FormatNumber(0.5), "0.5");
    EXPECT_EQ(FormatNumber(-3.0), "-3");
}

TEST(HarmonicConstantsTest, FormatNumberReadsBackExactly) {
    EXPECT_EQ(FormatNumber(PHI.value), PHI.text);
    EXPECT_EQ(FormatNumber(PHI.value), "1.618033988749895");
    EXPECT_EQ(FormatNumber(PHI.value * PHI.value * PHI.value), "4.23606797749979");
    EXPECT_EQ(FormatNumber(std::pow(PHI.value, 4.0)), "6.854101966249686");
    EXPECT_EQ(FormatNumber(std::pow(PHI.value, 5.0)), "11.090169943749476");
    EXPECT_EQ(FormatNumber(0.1), "0.1");
}

TEST(HarmonicConstantsTest, VocabularyIsDistinct) {
    std::set<std::string> words(VOCABULARY.begin(), VOCABULARY.end());
    EXPECT_EQ(words.size(), VOCABULARY_SIZE);

    EXPECT_EQ(VocabularyIndex("aether"), std::optional<size_t>(0));
    EXPECT_EQ(VocabularyIndex("zephyr"), std::optional<size_t>(63));
    EXPECT_FALSE(VocabularyIndex("Aether").has_value());
    EXPECT_FALSE(VocabularyIndex("bitcoin").has_value());
}

// ============================================================================
// Key Derivation
// ============================================================================

TEST(HarmonicKeyTest, KnownKeys) {
    EXPECT_EQ(HarmonicTransform::DeriveKey("password"),
              "420b28a3be4d3848988bf8114b9bd28b22e248eccda7dca081887f925ac0dde7");
    EXPECT_EQ(HarmonicTransform::DeriveKey(""),
              "b1522be9270b8cd7ecf55c900491d313bff18100ff728e3245e7caee7b7d8969");
}

TEST(HarmonicKeyTest, ShapeAndSensitivity) {
    std::string a = HarmonicTransform::DeriveKey("passphrase one");
    std::string b = HarmonicTransform::DeriveKey("passphrase two");

    EXPECT_EQ(a.size(), 64u);
    EXPECT_TRUE(IsValidHex(a));
    EXPECT_NE(a, b);
    EXPECT_EQ(a, HarmonicTransform::DeriveKey("passphrase one"));
}

// ============================================================================
// Symmetric Cipher
// ============================================================================

TEST(HarmonicCipherTest, EncryptDecrypt) {
    std::string plaintext = "twelve words of pure resonance";
    std::string ciphertext = HarmonicTransform::Encrypt(plaintext, "correct passphrase");

    EXPECT_NE(ciphertext, plaintext);
    EXPECT_TRUE(DecodeBase64(ciphertext).has_value());
    EXPECT_EQ(HarmonicTransform::Decrypt(ciphertext, "correct passphrase"), plaintext);
}

TEST(HarmonicCipherTest, Deterministic) {
    EXPECT_EQ(HarmonicTransform::Encrypt("same", "key"),
              HarmonicTransform::Encrypt("same", "key"));
    EXPECT_NE(HarmonicTransform::Encrypt("same", "key"),
              HarmonicTransform::Encrypt("same", "other key"));
}

TEST(HarmonicCipherTest, UnicodePlaintext) {
    std::string plaintext = "caf\xc3\xa9 \xe2\x82\xac \xf0\x9f\x98\x80";
    EXPECT_EQ(HarmonicTransform::Decrypt(HarmonicTransform::Encrypt(plaintext, "k"), "k"),
              plaintext);
}

TEST(HarmonicCipherTest, EmptyPlaintext) {
    std::string ciphertext = HarmonicTransform::Encrypt("", "k");
    EXPECT_FALSE(ciphertext.empty());
    EXPECT_EQ(HarmonicTransform::Decrypt(ciphertext, "k"), "");
}

TEST(HarmonicCipherTest, WrongPassphraseYieldsEmpty) {
    std::string ciphertext = HarmonicTransform::Encrypt("a longer secret message body", "right");
    EXPECT_EQ(HarmonicTransform::Decrypt(ciphertext, "wrong"), "");
}

TEST(HarmonicCipherTest, MalformedCiphertextYieldsEmpty) {
    EXPECT_EQ(HarmonicTransform::Decrypt("not base64!", "k"), "");
    EXPECT_EQ(HarmonicTransform::Decrypt("", "k"), "");
    EXPECT_EQ(HarmonicTransform::Decrypt(EncodeBase64(std::string("short")), "k"), "");
}

TEST(HarmonicCipherTest, KeyedVariants) {
    std::string key = HarmonicTransform::DeriveKey("material");
    std::string ciphertext = HarmonicTransform::EncryptWithKey("payload", key);

    EXPECT_EQ(ciphertext, HarmonicTransform::Encrypt("payload", "material"));
    EXPECT_EQ(HarmonicTransform::DecryptWithKey(ciphertext, key),
              std::optional<std::string>("payload"));

    EXPECT_THROW(HarmonicTransform::EncryptWithKey("payload", "abcd"), std::invalid_argument);
    EXPECT_FALSE(HarmonicTransform::DecryptWithKey(ciphertext, "abcd").has_value());
    EXPECT_FALSE(HarmonicTransform::DecryptWithKey(ciphertext, std::string(64, 'z')).has_value());
}

// ============================================================================
// Signatures
// ============================================================================

TEST(HarmonicSignatureTest, KnownSignature) {
    EXPECT_EQ(HarmonicTransform::Sign("hello", "secret"),
              "4516a714625b4b8371da23943d35605bc3434dfc99b9998f745a978c493a5f80");
}

TEST(HarmonicSignatureTest, SignVerify) {
    std::string sig = HarmonicTransform::Sign("message", "key material");
    EXPECT_TRUE(HarmonicTransform::Verify("message", sig, "key material"));
    EXPECT_FALSE(HarmonicTransform::Verify("message!", sig, "key material"));
    EXPECT_FALSE(HarmonicTransform::Verify("message", sig, "other material"));
    EXPECT_FALSE(HarmonicTransform::Verify("message", sig.substr(1), "key material"));
    EXPECT_FALSE(HarmonicTransform::Verify("message", "", "key material"));
}

// ============================================================================
// Mnemonic
// ============================================================================

TEST(HarmonicMnemonicTest, ZeroKeyWords) {
    EXPECT_EQ(HarmonicTransform::EncodeHarmonicKey(std::string(64, '0')), ZERO_KEY_WORDS);
}

TEST(HarmonicMnemonicTest, KnownMnemonic) {
    auto words = HarmonicTransform::EncodeMnemonic("correct horse battery staple");
    EXPECT_EQ(HarmonicTransform::JoinMnemonic(words),
              "amber resonance tempo beacon octave mosaic lumen nova aether lyric indigo cascade");
}

TEST(HarmonicMnemonicTest, WordsComeFromVocabulary) {
    for (const char* secret : {"a", "b", "a much longer secret with spaces", ""}) {
        auto words = HarmonicTransform::EncodeMnemonic(secret);
        ASSERT_EQ(words.size(), MNEMONIC_WORD_COUNT);
        for (const auto& word : words) {
            EXPECT_TRUE(VocabularyIndex(word).has_value()) << word;
        }
    }
}

TEST(HarmonicMnemonicTest, EncodeRejectsBadKeys) {
    EXPECT_THROW(HarmonicTransform::EncodeHarmonicKey(std::string(59, '0')),
                 std::invalid_argument);
    EXPECT_THROW(HarmonicTransform::EncodeHarmonicKey(std::string(64, 'g')),
                 std::invalid_argument);
}

TEST(HarmonicMnemonicTest, DecodeZeroKey) {
    DecodedMnemonic decoded = HarmonicTransform::DecodeMnemonic(ZERO_KEY_WORDS);
    EXPECT_EQ(decoded.harmonicKey,
              "0000000000000000000000000000000000000000000000000000000000007d9d");
    EXPECT_EQ(decoded.seed,
              "94a2cb76da91574afd34788e9fd25d4372dd3c4728ec1228720863fdf59368ff");
}

TEST(HarmonicMnemonicTest, DecodeKnownMnemonic) {
    auto words = HarmonicTransform::EncodeMnemonic("correct horse battery staple");
    DecodedMnemonic decoded = HarmonicTransform::DecodeMnemonic(words);
    EXPECT_EQ(decoded.harmonicKey,
              "00013000130002c00024000390001500022000020002c0001f0002c0002863db");
    EXPECT_EQ(decoded.seed,
              "198c552cb9343438498b3b1b726d3779907009d65199e646760aa7e421f165d5");
}

TEST(HarmonicMnemonicTest, DecodedKeyReencodesToSameWords) {
    auto words = HarmonicTransform::EncodeMnemonic("round trip");
    DecodedMnemonic decoded = HarmonicTransform::DecodeMnemonic(words);

    EXPECT_EQ(decoded.harmonicKey.size(), 64u);
    EXPECT_EQ(HarmonicTransform::EncodeHarmonicKey(decoded.harmonicKey), words);
}

TEST(HarmonicMnemonicTest, DecodeIsCaseAndSpaceInsensitive) {
    std::vector<std::string> messy;
    for (const auto& word : ZERO_KEY_WORDS) {
        std::string upper;
        for (char c : word) {
            upper += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        }
        messy.push_back("  " + upper + "\t");
    }
    EXPECT_EQ(HarmonicTransform::DecodeMnemonic(messy).seed,
              HarmonicTransform::DecodeMnemonic(ZERO_KEY_WORDS).seed);
}

TEST(HarmonicMnemonicTest, DecodeRejectsWrongCount) {
    std::vector<std::string> eleven(ZERO_KEY_WORDS.begin(), ZERO_KEY_WORDS.end() - 1);
    EXPECT_THROW(HarmonicTransform::DecodeMnemonic(eleven), InvalidMnemonicError);

    std::vector<std::string> thirteen = ZERO_KEY_WORDS;
    thirteen.push_back("aether");
    EXPECT_THROW(HarmonicTransform::DecodeMnemonic(thirteen), InvalidMnemonicError);

    EXPECT_THROW(HarmonicTransform::DecodeMnemonic({}), InvalidMnemonicError);
}

TEST(HarmonicMnemonicTest, DecodeRejectsUnknownWord) {
    std::vector<std::string> words = ZERO_KEY_WORDS;
    words[4] = "abandon";
    try {
        HarmonicTransform::DecodeMnemonic(words);
        FAIL() << "expected InvalidMnemonicError";
    } catch (const InvalidMnemonicError& e) {
        std::string what = e.what();
        EXPECT_NE(what.find("position 5"), std::string::npos);
        EXPECT_EQ(what.find("abandon"), std::string::npos);
    }
}

TEST(HarmonicMnemonicTest, ParseAndJoin) {
    auto words = HarmonicTransform::ParseMnemonic("  Quartz\tHORIZON\n cipher  ");
    ASSERT_EQ(words.size(), 3u);
    EXPECT_EQ(words[0], "quartz");
    EXPECT_EQ(words[1], "horizon");
    EXPECT_EQ(HarmonicTransform::JoinMnemonic(words), "quartz horizon cipher");
    EXPECT_TRUE(HarmonicTransform::ParseMnemonic("   ").empty());
}

} // namespace test
} // namespace harmonic
} // namespace aether
