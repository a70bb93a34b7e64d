// AETHER - Quantum Enhancer Tests
// Copyright (c) 2024 AETHER Developers
// MIT License

#include <gtest/gtest.h>
#include "aether/core/hex.h"
#include "aether/crypto/hmac.h"
#include "aether/crypto/sha256.h"
#include "aether/quantum/quantum_enhancer.h"

#include <string>

namespace aether {
namespace quantum {
namespace test {

// ============================================================================
// Test Fixtures
// ============================================================================

class QuantumEnhancerTest : public ::testing::Test {
protected:
    void SetUp() override {
        publicKey_ = "0279be667ef9dcbbac55a06295ce870b07029bfcdb2dce28d959f2815b16f81798";
        privateKey_ = "0000000000000000000000000000000000000000000000000000000000000001";
        qkp_ = QuantumEnhancer::Enhance(publicKey_, privateKey_);
    }

    std::string publicKey_;
    std::string privateKey_;
    QuantumKeyPair qkp_;
};

// ============================================================================
// Building Blocks
// ============================================================================

TEST(QuantumPrimitiveTest, LatticeHashKnownAnswer) {
    EXPECT_EQ(QuantumEnhancer::LatticeHash("abc", "salt"),
              "7325c38c55f0e760315f2846421ca27d38f643b001615fba16ebd7ba9120bc12");
}

TEST(QuantumPrimitiveTest, EntangleKnownAnswer) {
    EXPECT_EQ(QuantumEnhancer::Entangle("abc", "xyz"),
              "9d5b0fc3416d3db863a039bd2ceb9fe2e5e42e7e9486799cfd0249aa7690878e");
    EXPECT_EQ(QuantumEnhancer::Entangle("", ""),
              "510657b3a0194e598c043c5592f4da0dd46a6651027c408e2d36f29519c6573a");
}

TEST(QuantumPrimitiveTest, EntangleIsOrderSensitive) {
    EXPECT_NE(QuantumEnhancer::Entangle("abc", "xyz"), QuantumEnhancer::Entangle("xyz", "abc"));
    EXPECT_NE(QuantumEnhancer::Entangle("abc", ""), QuantumEnhancer::Entangle("abc", "d"));
}

TEST(QuantumPrimitiveTest, SuperpositionStatesKnownAnswer) {
    auto states = QuantumEnhancer::SuperpositionStates("key");
    ASSERT_EQ(states.size(), SUPERPOSITION_STATE_COUNT);
    EXPECT_EQ(states[0], "f3d340dfc729903aadc6fcbc083e1c585a4babc0db340eacbbe2072a48e183f2");
    EXPECT_EQ(states[1], "9ed5a6adc7573230b78f1b0363235f07f5cc6cf6e93f102318d282279f361d05");
    EXPECT_EQ(states[2], "71545c4833f9c0bb4ddf77a87b01e14b68379f963b88c154741441fb14d6a71f");
}

TEST(QuantumPrimitiveTest, LatticeSaltKnownAnswer) {
    EXPECT_EQ(QuantumEnhancer::LatticeSalt("seed"),
              "b7bc1cf36436994f9304836ab370eb3b119e7a73db271d0eaae542beb84842d5");
}

TEST(QuantumPrimitiveTest, DeriveSeedKnownAnswer) {
    EXPECT_EQ(QuantumEnhancer::DeriveSeed("entropy"),
              "97356de333f6f0f873be79e8a6271b72c0160f409249dd1096b4b98be06b7fc2");
    EXPECT_NE(QuantumEnhancer::DeriveSeed("entropy"), QuantumEnhancer::DeriveSeed("entropy2"));
}

TEST(QuantumPrimitiveTest, FingerprintShape) {
    std::string a = QuantumEnhancer::Fingerprint("public", "signature");
    EXPECT_EQ(a.size(), 64u);
    EXPECT_TRUE(IsValidHex(a));
    EXPECT_EQ(a, QuantumEnhancer::Fingerprint("public", "signature"));
    EXPECT_NE(a, QuantumEnhancer::Fingerprint("public", "signaturf"));

    // Buffer length follows the public key
    EXPECT_EQ(QuantumEnhancer::Fingerprint("", "x"), SHA256Hex(std::string("")));
}

// ============================================================================
// Key Pair
// ============================================================================

TEST_F(QuantumEnhancerTest, EnhanceFillsAllFields) {
    EXPECT_EQ(qkp_.publicKey, publicKey_);
    EXPECT_EQ(qkp_.privateKey, privateKey_);
    EXPECT_EQ(qkp_.entanglementHash, QuantumEnhancer::Entangle(publicKey_, privateKey_));
    EXPECT_EQ(qkp_.latticeSalt, QuantumEnhancer::LatticeSalt(publicKey_ + privateKey_));
    EXPECT_EQ(qkp_.superpositionStates, QuantumEnhancer::SuperpositionStates(privateKey_));
    EXPECT_EQ(qkp_.quantumFingerprint,
              QuantumEnhancer::Fingerprint(publicKey_,
                                           HMACSHA256Hex(qkp_.entanglementHash, privateKey_)));
}

TEST_F(QuantumEnhancerTest, EnhanceIsDeterministic) {
    QuantumKeyPair again = QuantumEnhancer::Enhance(publicKey_, privateKey_);
    EXPECT_EQ(again.quantumFingerprint, qkp_.quantumFingerprint);
    EXPECT_EQ(again.entanglementHash, qkp_.entanglementHash);
}

TEST(QuantumKeyPairTest, EmptyKeysVerify) {
    QuantumKeyPair empty = QuantumEnhancer::Enhance("", "");
    EXPECT_EQ(empty.superpositionStates.size(), SUPERPOSITION_STATE_COUNT);
    EXPECT_EQ(empty.latticeSalt.size(), 64u);
    EXPECT_TRUE(QuantumEnhancer::VerifyKeyPair(empty));
}

TEST_F(QuantumEnhancerTest, VerifyKeyPair) {
    EXPECT_TRUE(QuantumEnhancer::VerifyKeyPair(qkp_));

    QuantumKeyPair tampered = qkp_;
    tampered.entanglementHash[0] = tampered.entanglementHash[0] == 'a' ? 'b' : 'a';
    EXPECT_FALSE(QuantumEnhancer::VerifyKeyPair(tampered));

    tampered = qkp_;
    tampered.quantumFingerprint = std::string(64, '0');
    EXPECT_FALSE(QuantumEnhancer::VerifyKeyPair(tampered));

    tampered = qkp_;
    tampered.privateKey.back() = '2';
    EXPECT_FALSE(QuantumEnhancer::VerifyKeyPair(tampered));
}

// ============================================================================
// Signatures
// ============================================================================

TEST_F(QuantumEnhancerTest, SignVerify) {
    std::string sig = QuantumEnhancer::Sign("transfer 10", qkp_);
    EXPECT_EQ(sig.size(), 64u);
    EXPECT_EQ(sig, QuantumEnhancer::Sign("transfer 10", qkp_));

    EXPECT_TRUE(QuantumEnhancer::Verify("transfer 10", sig, qkp_));
    EXPECT_FALSE(QuantumEnhancer::Verify("transfer 11", sig, qkp_));
    EXPECT_FALSE(QuantumEnhancer::Verify("transfer 10", "", qkp_));
}

TEST_F(QuantumEnhancerTest, VerifyFailsForOtherKeyPair) {
    std::string sig = QuantumEnhancer::Sign("message", qkp_);
    QuantumKeyPair other = QuantumEnhancer::Enhance(publicKey_, std::string(63, '0') + "2");
    EXPECT_FALSE(QuantumEnhancer::Verify("message", sig, other));
}

TEST_F(QuantumEnhancerTest, VerifyAcceptsAnyState) {
    std::string entangled = QuantumEnhancer::Entangle(SHA256Hex(std::string("message")),
                                                      qkp_.entanglementHash);
    std::string fromLastState = HMACSHA256Hex(qkp_.superpositionStates[2] + qkp_.latticeSalt,
                                              entangled);
    EXPECT_NE(fromLastState, QuantumEnhancer::Sign("message", qkp_));
    EXPECT_TRUE(QuantumEnhancer::Verify("message", fromLastState, qkp_));
}

TEST_F(QuantumEnhancerTest, SignWithoutStatesFails) {
    QuantumKeyPair empty = qkp_;
    empty.superpositionStates.clear();
    EXPECT_EQ(QuantumEnhancer::Sign("message", empty), "");
    EXPECT_FALSE(QuantumEnhancer::Verify("message", QuantumEnhancer::Sign("message", qkp_),
                                         empty));
}

// ============================================================================
// Encryption
// ============================================================================

TEST_F(QuantumEnhancerTest, EncryptDecrypt) {
    std::string data = R"({"quantumSeed":"abc"})";
    std::string ciphertext = QuantumEnhancer::Encrypt(data, qkp_);
    EXPECT_NE(ciphertext, data);
    EXPECT_EQ(QuantumEnhancer::Decrypt(ciphertext, qkp_), data);
}

TEST_F(QuantumEnhancerTest, EncryptDecryptEmptyAndUnicode) {
    std::string empty = QuantumEnhancer::Encrypt("", qkp_);
    EXPECT_FALSE(empty.empty());
    EXPECT_EQ(QuantumEnhancer::Decrypt(empty, qkp_), "");

    std::string unicode = "h\xc3\xa9llo \xe2\x9c\x93";
    std::string ciphertext = QuantumEnhancer::Encrypt(unicode, qkp_);
    EXPECT_EQ(QuantumEnhancer::Decrypt(ciphertext, qkp_), unicode);
}

TEST_F(QuantumEnhancerTest, DecryptWithOtherKeyPairFails) {
    std::string ciphertext = QuantumEnhancer::Encrypt("component payload of some length", qkp_);
    QuantumKeyPair other = QuantumEnhancer::Enhance(publicKey_, std::string(63, '0') + "3");
    EXPECT_EQ(QuantumEnhancer::Decrypt(ciphertext, other), "");
    EXPECT_EQ(QuantumEnhancer::Decrypt("garbage", qkp_), "");
}

} // namespace test
} // namespace quantum
} // namespace aether
