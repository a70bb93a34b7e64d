// AETHER - SHA3-256 Hash Function
// Copyright (c) 2024 AETHER Developers
// MIT License
//
// FIPS 202 SHA3-256 over OpenSSL's EVP interface. This is the library's
// keccak-style digest: address derivation, entanglement proofs and wallet
// identities are all SHA3-256 rendered as "0x"-prefixed lowercase hex.

#ifndef AETHER_CRYPTO_SHA3_H
#define AETHER_CRYPTO_SHA3_H

#include <aether/core/types.h>

#include <cstddef>
#include <string>

namespace aether {

/// SHA3-256 of raw bytes
Hash256 SHA3_256Hash(const Byte* data, size_t len);

inline Hash256 SHA3_256Hash(const Bytes& data) {
    return SHA3_256Hash(data.data(), data.size());
}

/// SHA3-256 of the UTF-8 bytes of @p data, as 64 lowercase hex characters
std::string SHA3_256Hex(const std::string& data);

/// Keccak-style digest: "0x" + SHA3_256Hex(data)
std::string KeccakDigest(const std::string& data);

} // namespace aether

#endif // AETHER_CRYPTO_SHA3_H
