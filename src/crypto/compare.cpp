// AETHER - Constant-Time Comparison Implementation
// Copyright (c) 2024 AETHER Developers
// MIT License

#include <aether/crypto/compare.h>

#include <openssl/crypto.h>

namespace aether {

bool ConstantTimeEquals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) {
        return false;
    }
    if (a.empty()) {
        return true;
    }
    // CRYPTO_memcmp XOR-accumulates over the full length
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

} // namespace aether
