// AETHER - secp256k1 Elliptic Curve Operations
// Copyright (c) 2024 AETHER Developers
// MIT License
//
// Key validation, public key derivation and compact ECDSA over the
// secp256k1 curve, using OpenSSL's EC implementation.

#ifndef AETHER_CRYPTO_SECP256K1_H
#define AETHER_CRYPTO_SECP256K1_H

#include <aether/core/types.h>

#include <cstddef>
#include <optional>

namespace aether {
namespace secp256k1 {

// ============================================================================
// Constants
// ============================================================================

/// Private key size
constexpr size_t PRIVATE_KEY_SIZE = 32;

/// Compressed public key size (0x02/0x03 prefix + X)
constexpr size_t COMPRESSED_PUBKEY_SIZE = 33;

/// Uncompressed public key size (0x04 prefix + X + Y)
constexpr size_t UNCOMPRESSED_PUBKEY_SIZE = 65;

/// Compact signature size (r || s)
constexpr size_t COMPACT_SIGNATURE_SIZE = 64;

// ============================================================================
// Keys
// ============================================================================

/// Check that a 32-byte big-endian scalar lies in [1, n)
bool IsValidPrivateKey(const Byte* key);

inline bool IsValidPrivateKey(const Bytes& key) {
    return key.size() == PRIVATE_KEY_SIZE && IsValidPrivateKey(key.data());
}

/**
 * Derive the public key for a private key.
 *
 * @param privateKey 32-byte private key
 * @param compressed Emit 33-byte compressed form instead of 65-byte
 * @return Serialized public point, or nullopt if the key is invalid
 */
std::optional<Bytes> DerivePublicKey(const Bytes& privateKey, bool compressed = true);

// ============================================================================
// ECDSA
// ============================================================================

/**
 * Sign a 32-byte digest.
 *
 * @param hash Message digest
 * @param privateKey 32-byte private key
 * @return r || s with s normalized to the lower half of the order,
 *         or nullopt if the key is invalid
 */
std::optional<Bytes> SignCompact(const Hash256& hash, const Bytes& privateKey);

/**
 * Verify a compact signature.
 *
 * @param hash Message digest
 * @param signature 64-byte r || s
 * @param publicKey Serialized public point (compressed or uncompressed)
 * @return true if the signature is valid for the key
 */
bool VerifyCompact(const Hash256& hash, const Bytes& signature, const Bytes& publicKey);

} // namespace secp256k1
} // namespace aether

#endif // AETHER_CRYPTO_SECP256K1_H
