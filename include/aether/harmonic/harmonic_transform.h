// AETHER - Harmonic Transform
// Copyright (c) 2024 AETHER Developers
// MIT License
//
// Passphrase-keyed primitives: the 12-round harmonic key chain, the symmetric
// cipher built on it, HMAC message signatures and the 12-word mnemonic code.
//
// Every function is a pure function of its arguments. None of them throws on
// well-formed input; decryption failures come back as an empty string.

#ifndef AETHER_HARMONIC_HARMONIC_TRANSFORM_H
#define AETHER_HARMONIC_HARMONIC_TRANSFORM_H

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace aether {
namespace harmonic {

/// Number of words in a mnemonic phrase
constexpr size_t MNEMONIC_WORD_COUNT = 12;

/// Number of words in the vocabulary
constexpr size_t VOCABULARY_SIZE = 64;

/// Hex characters consumed per mnemonic word
constexpr size_t MNEMONIC_SLICE_WIDTH = 5;

/// Fixed mnemonic vocabulary; the index of a word is its value
extern const std::array<const char*, VOCABULARY_SIZE> VOCABULARY;

/// Position of a word in VOCABULARY (exact, lowercase match)
std::optional<size_t> VocabularyIndex(const std::string& word);

/**
 * Result of decoding a mnemonic.
 *
 * Decoding is lossy: a mnemonic carries 6 bits per word, so the words do not
 * determine the key they were encoded from. harmonicKey is a 64-hex key that
 * re-encodes to the same words; seed is derived from it.
 */
struct DecodedMnemonic {
    std::string harmonicKey;
    std::string seed;
};

class HarmonicTransform {
public:
    /// 64-hex key from the 12-round octave-weighted hash chain
    static std::string DeriveKey(const std::string& passphrase);

    // ========================================================================
    // Symmetric cipher
    // ========================================================================

    /**
     * Encrypt text under a passphrase.
     *
     * AES-128-CBC with PKCS7 padding. Key and IV are taken from
     * DeriveKey(passphrase): hex [0, 32) is the key, hex [32, 48) the first
     * 8 IV bytes (the rest of the block is zero).
     *
     * @return Base64 ciphertext
     */
    static std::string Encrypt(const std::string& plaintext, const std::string& passphrase);

    /// Inverse of Encrypt; empty string on any failure
    static std::string Decrypt(const std::string& ciphertext, const std::string& passphrase);

    /// Encrypt with an already-derived 64-hex key
    static std::string EncryptWithKey(const std::string& plaintext, const std::string& keyHex);

    /// nullopt on malformed input, wrong key or non-UTF-8 plaintext
    static std::optional<std::string> DecryptWithKey(const std::string& ciphertext,
                                                     const std::string& keyHex);

    // ========================================================================
    // Signatures
    // ========================================================================

    /// HMAC-SHA256 keyed by DeriveKey(keyMaterial) over SHA256Hex(message)
    static std::string Sign(const std::string& message, const std::string& keyMaterial);

    static bool Verify(const std::string& message, const std::string& signature,
                       const std::string& keyMaterial);

    // ========================================================================
    // Mnemonic
    // ========================================================================

    /// EncodeHarmonicKey(DeriveKey(secret))
    static std::vector<std::string> EncodeMnemonic(const std::string& secret);

    /**
     * Map a harmonic key onto 12 vocabulary words.
     *
     * @throws std::invalid_argument if the key is shorter than 60 characters
     *         or is not hex
     */
    static std::vector<std::string> EncodeHarmonicKey(const std::string& keyHex);

    /**
     * Recover an approximate harmonic key and its seed from 12 words.
     *
     * Words are trimmed and matched case-insensitively.
     *
     * @throws InvalidMnemonicError on a wrong word count or unknown word
     */
    static DecodedMnemonic DecodeMnemonic(const std::vector<std::string>& words);

    /// Split on whitespace and lowercase
    static std::vector<std::string> ParseMnemonic(const std::string& phrase);

    static std::string JoinMnemonic(const std::vector<std::string>& words);
};

} // namespace harmonic
} // namespace aether

#endif // AETHER_HARMONIC_HARMONIC_TRANSFORM_H
