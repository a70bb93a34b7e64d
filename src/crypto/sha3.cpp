// AETHER - SHA3-256 Implementation
// Copyright (c) 2024 AETHER Developers
// MIT License

#include <aether/crypto/sha3.h>
#include <aether/core/hex.h>
#include "openssl_util.h"

namespace aether {

Hash256 SHA3_256Hash(const Byte* data, size_t len) {
    Hash256 out;
    ossl::Digest(EVP_sha3_256(), data, len, out.data());
    return out;
}

std::string SHA3_256Hex(const std::string& data) {
    Hash256 h = SHA3_256Hash(reinterpret_cast<const Byte*>(data.data()), data.size());
    return BytesToHex(h.data(), h.size());
}

std::string KeccakDigest(const std::string& data) {
    return With0x(SHA3_256Hex(data));
}

} // namespace aether
