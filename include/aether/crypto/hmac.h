// AETHER - HMAC (Hash-based Message Authentication Code)
// Copyright (c) 2024 AETHER Developers
// MIT License
//
// HMAC-SHA256 following RFC 2104, backed by OpenSSL's EVP_MAC.

#ifndef AETHER_CRYPTO_HMAC_H
#define AETHER_CRYPTO_HMAC_H

#include <aether/core/types.h>

#include <cstddef>
#include <memory>
#include <string>

namespace aether {

/**
 * HMAC-SHA256 message authentication code.
 *
 * Provides incremental hashing capability for streaming data.
 */
class HMAC_SHA256 {
public:
    /// Output size in bytes
    static constexpr size_t OUTPUT_SIZE = 32;

    /// Create HMAC with key
    /// @param key Secret key bytes
    /// @param keyLen Length of key (may be zero)
    HMAC_SHA256(const Byte* key, size_t keyLen);

    explicit HMAC_SHA256(const Bytes& key)
        : HMAC_SHA256(key.data(), key.size()) {}

    /// Destructor - securely clear key material
    ~HMAC_SHA256();

    /// Non-copyable (contains key material)
    HMAC_SHA256(const HMAC_SHA256&) = delete;
    HMAC_SHA256& operator=(const HMAC_SHA256&) = delete;

    /// Write data to HMAC
    HMAC_SHA256& Write(const Byte* data, size_t len);

    HMAC_SHA256& Write(const std::string& data) {
        return Write(reinterpret_cast<const Byte*>(data.data()), data.size());
    }

    /// Finalize and get the MAC
    Hash256 Finalize();

    /// Reset to initial state (allows reuse with same key)
    HMAC_SHA256& Reset();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

/// One-shot HMAC-SHA256 over raw bytes
Hash256 ComputeHMAC_SHA256(const Bytes& key, const Bytes& data);

/// HMAC-SHA256 keyed by the UTF-8 bytes of @p key over the UTF-8 bytes of
/// @p data, as 64 lowercase hex characters
std::string HMACSHA256Hex(const std::string& key, const std::string& data);

} // namespace aether

#endif // AETHER_CRYPTO_HMAC_H
