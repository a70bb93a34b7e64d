// AETHER - secp256k1 Tests
// Copyright (c) 2024 AETHER Developers
// MIT License

#include <gtest/gtest.h>
#include "aether/core/hex.h"
#include "aether/crypto/secp256k1.h"
#include "aether/crypto/sha256.h"

namespace aether {
namespace test {

namespace {

const char* GENERATOR_X =
    "79be667ef9dcbbac55a06295ce870b07029bfcdb2dce28d959f2815b16f81798";
const char* GENERATOR_Y =
    "483ada7726a3c4655da4fbfc0e1108a8fd17b448a68554199c47d08ffb10d4b8";
const char* CURVE_ORDER =
    "fffffffffffffffffffffffffffffffebaaedce6af48a03bbfd25e8cd0364141";
const char* HALF_ORDER =
    "7fffffffffffffffffffffffffffffff5d576e7357a4501ddfe92f46681b20a0";

Bytes PrivateKeyOne() {
    Bytes key(secp256k1::PRIVATE_KEY_SIZE, 0);
    key.back() = 1;
    return key;
}

} // anonymous namespace

// ============================================================================
// Key Validation
// ============================================================================

TEST(Secp256k1Test, PrivateKeyRange) {
    EXPECT_TRUE(secp256k1::IsValidPrivateKey(PrivateKeyOne()));
    EXPECT_FALSE(secp256k1::IsValidPrivateKey(Bytes(32, 0)));
    EXPECT_FALSE(secp256k1::IsValidPrivateKey(HexToBytes(CURVE_ORDER)));
    EXPECT_FALSE(secp256k1::IsValidPrivateKey(Bytes(31, 1)));

    Bytes orderMinusOne = HexToBytes(CURVE_ORDER);
    orderMinusOne.back() -= 1;
    EXPECT_TRUE(secp256k1::IsValidPrivateKey(orderMinusOne));
}

// ============================================================================
// Public Keys
// ============================================================================

TEST(Secp256k1Test, GeneratorPoint) {
    auto compressed = secp256k1::DerivePublicKey(PrivateKeyOne());
    ASSERT_TRUE(compressed.has_value());
    EXPECT_EQ(BytesToHex(*compressed), std::string("02") + GENERATOR_X);

    auto uncompressed = secp256k1::DerivePublicKey(PrivateKeyOne(), false);
    ASSERT_TRUE(uncompressed.has_value());
    ASSERT_EQ(uncompressed->size(), secp256k1::UNCOMPRESSED_PUBKEY_SIZE);
    EXPECT_EQ(BytesToHex(*uncompressed), std::string("04") + GENERATOR_X + GENERATOR_Y);
}

TEST(Secp256k1Test, InvalidKeyHasNoPublicKey) {
    EXPECT_FALSE(secp256k1::DerivePublicKey(Bytes(32, 0)).has_value());
}

// ============================================================================
// Signatures
// ============================================================================

TEST(Secp256k1Test, SignAndVerify) {
    Bytes priv = HexToBytes("c9afa9d845ba75166b5c215767b1d6934e50c3db36e89b127b8a622b120f6721");
    auto pub = secp256k1::DerivePublicKey(priv);
    ASSERT_TRUE(pub.has_value());

    Hash256 hash = SHA256Hash(std::string("sample"));
    auto sig = secp256k1::SignCompact(hash, priv);
    ASSERT_TRUE(sig.has_value());
    ASSERT_EQ(sig->size(), secp256k1::COMPACT_SIGNATURE_SIZE);

    EXPECT_TRUE(secp256k1::VerifyCompact(hash, *sig, *pub));

    auto uncompressed = secp256k1::DerivePublicKey(priv, false);
    ASSERT_TRUE(uncompressed.has_value());
    EXPECT_TRUE(secp256k1::VerifyCompact(hash, *sig, *uncompressed));
}

TEST(Secp256k1Test, SignatureIsLowS) {
    Bytes half = HexToBytes(HALF_ORDER);
    for (int i = 0; i < 8; ++i) {
        Hash256 hash = SHA256Hash(std::string("message ") + std::to_string(i));
        auto sig = secp256k1::SignCompact(hash, PrivateKeyOne());
        ASSERT_TRUE(sig.has_value());

        Bytes s(sig->begin() + 32, sig->end());
        EXPECT_LE(BytesToHex(s), BytesToHex(half));
    }
}

TEST(Secp256k1Test, VerifyRejectsTampering) {
    auto pub = secp256k1::DerivePublicKey(PrivateKeyOne());
    ASSERT_TRUE(pub.has_value());

    Hash256 hash = SHA256Hash(std::string("payload"));
    auto sig = secp256k1::SignCompact(hash, PrivateKeyOne());
    ASSERT_TRUE(sig.has_value());

    Hash256 otherHash = SHA256Hash(std::string("payload2"));
    EXPECT_FALSE(secp256k1::VerifyCompact(otherHash, *sig, *pub));

    Bytes badSig = *sig;
    badSig[10] ^= 0x01;
    EXPECT_FALSE(secp256k1::VerifyCompact(hash, badSig, *pub));

    Bytes two(32, 0);
    two.back() = 2;
    auto otherPub = secp256k1::DerivePublicKey(two);
    ASSERT_TRUE(otherPub.has_value());
    EXPECT_FALSE(secp256k1::VerifyCompact(hash, *sig, *otherPub));
}

TEST(Secp256k1Test, VerifyRejectsMalformedInput) {
    Hash256 hash = SHA256Hash(std::string("payload"));
    auto pub = secp256k1::DerivePublicKey(PrivateKeyOne());
    ASSERT_TRUE(pub.has_value());

    EXPECT_FALSE(secp256k1::VerifyCompact(hash, Bytes(63, 1), *pub));
    EXPECT_FALSE(secp256k1::VerifyCompact(hash, Bytes(64, 1), Bytes{}));
    EXPECT_FALSE(secp256k1::VerifyCompact(hash, Bytes(64, 1), Bytes(33, 0x07)));
}

TEST(Secp256k1Test, SignRejectsInvalidKey) {
    Hash256 hash = SHA256Hash(std::string("payload"));
    EXPECT_FALSE(secp256k1::SignCompact(hash, Bytes(32, 0)).has_value());
    EXPECT_FALSE(secp256k1::SignCompact(hash, Bytes(16, 1)).has_value());
}

} // namespace test
} // namespace aether
