// AETHER - Quantum Enhancer
// Copyright (c) 2024 AETHER Developers
// MIT License
//
// Derives the entanglement hash, superposition states, fingerprint and lattice
// salt of a key pair, and the sign/verify/encrypt/decrypt operations keyed by
// that material. All outputs are lowercase hex unless stated otherwise.
//
// These are deterministic mixing transforms over SHA-256 and HMAC-SHA256, not
// a post-quantum scheme.

#ifndef AETHER_QUANTUM_QUANTUM_ENHANCER_H
#define AETHER_QUANTUM_QUANTUM_ENHANCER_H

#include <cstddef>
#include <string>
#include <vector>

namespace aether {
namespace quantum {

/// Rounds mixed by Entangle
constexpr size_t ENTANGLEMENT_ROUNDS = 12;

/// States produced by SuperpositionStates
constexpr size_t SUPERPOSITION_STATE_COUNT = 3;

/// Re-hash rounds in LatticeSalt
constexpr size_t LATTICE_SALT_ROUNDS = 7;

struct KeyPair {
    std::string publicKey;
    std::string privateKey;
};

/// Key pair plus the material derived from it by QuantumEnhancer::Enhance
struct QuantumKeyPair : KeyPair {
    std::string quantumFingerprint;
    std::string entanglementHash;
    std::vector<std::string> superpositionStates;
    std::string latticeSalt;
};

class QuantumEnhancer {
public:
    /// Derive every quantum field of a key pair
    static QuantumKeyPair Enhance(const std::string& publicKey, const std::string& privateKey);

    /**
     * Sign a message.
     *
     * HMAC keyed by the first superposition state and the lattice salt over
     * Entangle(SHA256Hex(message), entanglementHash).
     *
     * @return 64 hex, or empty if the key pair carries no states
     */
    static std::string Sign(const std::string& message, const QuantumKeyPair& qkp);

    /// True if the signature matches the one produced by any state
    static bool Verify(const std::string& message, const std::string& signature,
                       const QuantumKeyPair& qkp);

    /// Encrypt with the key SHA256Hex(entanglementHash + states + latticeSalt)
    static std::string Encrypt(const std::string& data, const QuantumKeyPair& qkp);

    /// Inverse of Encrypt; empty string on failure
    static std::string Decrypt(const std::string& ciphertext, const QuantumKeyPair& qkp);

    /// 64-hex seed from arbitrary user entropy
    static std::string DeriveSeed(const std::string& userEntropy);

    /// Recompute entanglementHash and quantumFingerprint and compare
    static bool VerifyKeyPair(const QuantumKeyPair& qkp);

    // ========================================================================
    // Building blocks
    // ========================================================================

    /// Golden-ratio byte scaling between two SHA-256 passes
    static std::string LatticeHash(const std::string& input, const std::string& salt);

    /// 12 rounds of XOR / additive / multiplicative / Fibonacci byte mixing
    static std::string Entangle(const std::string& a, const std::string& b);

    static std::vector<std::string> SuperpositionStates(const std::string& key);

    /// Interference transform of the public key against a private signature
    static std::string Fingerprint(const std::string& publicKey,
                                   const std::string& privateSignature);

    static std::string LatticeSalt(const std::string& seed);
};

} // namespace quantum
} // namespace aether

#endif // AETHER_QUANTUM_QUANTUM_ENHANCER_H
