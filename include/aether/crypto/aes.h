// AETHER - AES Symmetric Encryption
// Copyright (c) 2024 AETHER Developers
// MIT License
//
// AES-128-CBC with PKCS7 padding over OpenSSL's EVP cipher interface.

#ifndef AETHER_CRYPTO_AES_H
#define AETHER_CRYPTO_AES_H

#include <aether/core/types.h>

#include <array>
#include <cstddef>
#include <stdexcept>

namespace aether {

// ============================================================================
// AES Constants
// ============================================================================

namespace aes {
    /// Block size is always 16 bytes for AES
    constexpr size_t BLOCK_SIZE = 16;

    /// AES-128 key size
    constexpr size_t KEY_SIZE_128 = 16;

    /// IV size (same as block size)
    constexpr size_t IV_SIZE = 16;
}

using AESKey128 = std::array<Byte, aes::KEY_SIZE_128>;
using AESIV = std::array<Byte, aes::IV_SIZE>;

/// Thrown when a ciphertext fails to decrypt (bad length or bad padding)
class AESError : public std::runtime_error {
public:
    explicit AESError(const std::string& msg) : std::runtime_error(msg) {}
};

// ============================================================================
// Convenience Functions
// ============================================================================

/**
 * Encrypt data with AES-128-CBC.
 *
 * @param plaintext Data to encrypt (may be empty)
 * @param key 16-byte encryption key
 * @param iv 16-byte initialization vector
 * @return Ciphertext with PKCS7 padding (always a non-zero multiple of 16)
 */
Bytes AES128CBCEncrypt(const Bytes& plaintext, const AESKey128& key, const AESIV& iv);

/**
 * Decrypt data with AES-128-CBC.
 *
 * @param ciphertext Data to decrypt
 * @param key 16-byte decryption key
 * @param iv 16-byte initialization vector
 * @return Plaintext with padding removed
 * @throws AESError if the length or padding is invalid
 */
Bytes AES128CBCDecrypt(const Bytes& ciphertext, const AESKey128& key, const AESIV& iv);

} // namespace aether

#endif // AETHER_CRYPTO_AES_H
