// AETHER - Address Derivation
// Copyright (c) 2024 AETHER Developers
// MIT License
//
// Addresses are "0x" + the last 20 bytes of SHA3-256 over the 64-byte X||Y
// encoding of a secp256k1 public key, in lowercase hex.

#ifndef AETHER_WALLET_ADDRESS_H
#define AETHER_WALLET_ADDRESS_H

#include <aether/core/types.h>

#include <cstddef>
#include <string>

namespace aether {
namespace wallet {

/// Address payload size in bytes
constexpr size_t ADDRESS_SIZE = 20;

/**
 * Address of an uncompressed public key.
 *
 * @param publicKey 65-byte uncompressed point (0x04 || X || Y)
 * @throws std::invalid_argument if the key is not an uncompressed point
 */
std::string AddressFromPublicKey(const Bytes& publicKey);

/**
 * Address of a private key.
 *
 * @param privateKeyHex 64 hex characters, optional 0x prefix
 * @throws std::invalid_argument if the key is malformed or out of range
 */
std::string AddressFromPrivateKey(const std::string& privateKeyHex);

/// "0x" followed by 40 hex characters
bool IsValidAddress(const std::string& address);

} // namespace wallet
} // namespace aether

#endif // AETHER_WALLET_ADDRESS_H
