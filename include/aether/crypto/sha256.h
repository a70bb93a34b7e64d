// AETHER - SHA256 Hash Function
// Copyright (c) 2024 AETHER Developers
// MIT License
//
// SHA-256 (FIPS 180-4) over OpenSSL's EVP digest interface, plus the
// hex-string helpers the harmonic and quantum layers chain on.

#ifndef AETHER_CRYPTO_SHA256_H
#define AETHER_CRYPTO_SHA256_H

#include <aether/core/types.h>

#include <cstddef>
#include <memory>
#include <string>

namespace aether {

/// SHA-256 hasher class
/// Incremental: Write any number of times, then Finalize once.
class SHA256 {
public:
    /// Output size in bytes
    static constexpr size_t OUTPUT_SIZE = 32;

    SHA256();
    ~SHA256();

    SHA256(const SHA256&) = delete;
    SHA256& operator=(const SHA256&) = delete;

    /// Write data to the hasher
    /// @param data Pointer to input data
    /// @param len Length of input data
    /// @return Reference to this hasher (for chaining)
    SHA256& Write(const Byte* data, size_t len);

    SHA256& Write(const std::string& data) {
        return Write(reinterpret_cast<const Byte*>(data.data()), data.size());
    }

    /// Finalize the hash and write to output
    /// @param hash Output buffer (OUTPUT_SIZE bytes)
    void Finalize(Byte hash[OUTPUT_SIZE]);

    /// Reset hasher to initial state
    SHA256& Reset();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// ============================================================================
// Convenience Functions
// ============================================================================

/// Compute SHA256 hash of data in a single call
Hash256 SHA256Hash(const Byte* data, size_t len);

inline Hash256 SHA256Hash(const Bytes& data) {
    return SHA256Hash(data.data(), data.size());
}

inline Hash256 SHA256Hash(const std::string& data) {
    return SHA256Hash(reinterpret_cast<const Byte*>(data.data()), data.size());
}

/// SHA-256 of the UTF-8 bytes of @p data, as 64 lowercase hex characters
std::string SHA256Hex(const std::string& data);

/// SHA-256 of raw bytes, as 64 lowercase hex characters
std::string SHA256Hex(const Bytes& data);

} // namespace aether

#endif // AETHER_CRYPTO_SHA256_H
