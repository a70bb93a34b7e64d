// AETHER - Quantum Enhancer Implementation
// Copyright (c) 2024 AETHER Developers
// MIT License

#include <aether/quantum/quantum_enhancer.h>

#include <aether/core/hex.h>
#include <aether/core/types.h>
#include <aether/crypto/compare.h>
#include <aether/crypto/hmac.h>
#include <aether/crypto/sha256.h>
#include <aether/harmonic/constants.h>
#include <aether/harmonic/harmonic_transform.h>
#include <aether/util/logging.h>

#include <algorithm>
#include <cmath>

namespace aether {
namespace quantum {

using harmonic::FIBONACCI_12;
using harmonic::FIBONACCI_13;
using harmonic::HarmonicTransform;
using harmonic::PHI;
using harmonic::PHI_CONJUGATE;

namespace {

/// Salt prefix length taken from each state's seed hash
constexpr size_t STATE_SALT_LENGTH = 16;

Byte MixBytes(size_t round, unsigned a, unsigned b) {
    switch (round % 4) {
        case 0:
            return static_cast<Byte>(a ^ b);
        case 1:
            return static_cast<Byte>((a + b) % 256);
        case 2:
            return static_cast<Byte>(std::floor(std::fmod(a * b * PHI.value, 256.0)));
        default: {
            auto fib12 = static_cast<unsigned>(FIBONACCI_12.value);
            auto fib13 = static_cast<unsigned>(FIBONACCI_13.value);
            return static_cast<Byte>((a * fib12 + b * fib13) % 256);
        }
    }
}

/// Symmetric key for Encrypt/Decrypt
std::string ComponentKey(const QuantumKeyPair& qkp) {
    std::string material = qkp.entanglementHash;
    for (const auto& state : qkp.superpositionStates) {
        material += state;
    }
    material += qkp.latticeSalt;
    return SHA256Hex(material);
}

} // anonymous namespace

// ============================================================================
// Building Blocks
// ============================================================================

std::string QuantumEnhancer::LatticeHash(const std::string& input, const std::string& salt) {
    Bytes digest = HexToBytes(SHA256Hex(input + salt));

    for (size_t j = 0; j < digest.size(); ++j) {
        double ratio = (j % 2 == 0) ? PHI.value : PHI_CONJUGATE.value;
        digest[j] = static_cast<Byte>(std::floor(std::fmod(digest[j] * ratio, 256.0)));
    }

    std::string h = SHA256Hex(BytesToHex(digest));
    return SHA256Hex(h);
}

std::string QuantumEnhancer::Entangle(const std::string& a, const std::string& b) {
    const size_t length = std::max(a.size(), b.size());
    Bytes buffer(length);
    std::string acc;

    for (size_t round = 0; round < ENTANGLEMENT_ROUNDS; ++round) {
        for (size_t j = 0; j < length; ++j) {
            unsigned byteA = j < a.size() ? static_cast<unsigned char>(a[j]) : 0;
            unsigned byteB = j < b.size() ? static_cast<unsigned char>(b[j]) : 0;
            buffer[j] = MixBytes(round, byteA, byteB);
        }

        std::string roundHash = SHA256Hex(BytesToHex(buffer) + std::to_string(round));
        acc = (round == 0) ? roundHash : SHA256Hex(acc + roundHash);
    }

    return acc;
}

std::vector<std::string> QuantumEnhancer::SuperpositionStates(const std::string& key) {
    std::vector<std::string> states;
    states.reserve(SUPERPOSITION_STATE_COUNT);

    for (size_t i = 0; i < SUPERPOSITION_STATE_COUNT; ++i) {
        std::string salt = SHA256Hex(key + harmonic::Ratio(i).text).substr(0, STATE_SALT_LENGTH);
        states.push_back(LatticeHash(key, salt));
    }

    return states;
}

std::string QuantumEnhancer::Fingerprint(const std::string& publicKey,
                                         const std::string& privateSignature) {
    Bytes buffer(publicKey.size());

    for (size_t i = 0; i < buffer.size(); ++i) {
        unsigned p = static_cast<unsigned char>(publicKey[i]);
        unsigned q = i < privateSignature.size()
            ? static_cast<unsigned char>(privateSignature[i])
            : 0;

        double interference = std::sin(p * q * harmonic::PI.value / 256.0) * 128.0 + 128.0;
        auto tunneled = static_cast<uint64_t>(
            std::floor((p ^ q) * (interference / 256.0) * PHI.value));
        buffer[i] = static_cast<Byte>(tunneled % 256);
    }

    return SHA256Hex(BytesToHex(buffer));
}

std::string QuantumEnhancer::LatticeSalt(const std::string& seed) {
    std::string salt = SHA256Hex(seed);
    for (size_t i = 0; i < LATTICE_SALT_ROUNDS; ++i) {
        double power = std::pow(PHI.value, static_cast<double>(i + 1));
        salt = SHA256Hex(salt + harmonic::FormatNumber(power));
    }
    return salt;
}

// ============================================================================
// Key Pair
// ============================================================================

QuantumKeyPair QuantumEnhancer::Enhance(const std::string& publicKey,
                                        const std::string& privateKey) {
    QuantumKeyPair qkp;
    qkp.publicKey = publicKey;
    qkp.privateKey = privateKey;
    qkp.latticeSalt = LatticeSalt(publicKey + privateKey);
    qkp.entanglementHash = Entangle(publicKey, privateKey);
    qkp.superpositionStates = SuperpositionStates(privateKey);
    qkp.quantumFingerprint = Fingerprint(publicKey,
                                         HMACSHA256Hex(qkp.entanglementHash, privateKey));
    return qkp;
}

bool QuantumEnhancer::VerifyKeyPair(const QuantumKeyPair& qkp) {
    std::string entanglement = Entangle(qkp.publicKey, qkp.privateKey);
    std::string fingerprint = Fingerprint(qkp.publicKey,
                                          HMACSHA256Hex(qkp.entanglementHash, qkp.privateKey));

    bool entanglementOk = ConstantTimeEquals(entanglement, qkp.entanglementHash);
    bool fingerprintOk = ConstantTimeEquals(fingerprint, qkp.quantumFingerprint);
    return entanglementOk && fingerprintOk;
}

// ============================================================================
// Signatures
// ============================================================================

std::string QuantumEnhancer::Sign(const std::string& message, const QuantumKeyPair& qkp) {
    if (qkp.superpositionStates.empty()) {
        LOG_ERROR(util::LogCategory::QUANTUM) << "Cannot sign: key pair has no superposition states";
        return "";
    }

    std::string entangled = Entangle(SHA256Hex(message), qkp.entanglementHash);
    return HMACSHA256Hex(qkp.superpositionStates[0] + qkp.latticeSalt, entangled);
}

bool QuantumEnhancer::Verify(const std::string& message, const std::string& signature,
                             const QuantumKeyPair& qkp) {
    std::string entangled = Entangle(SHA256Hex(message), qkp.entanglementHash);

    // Every state is checked; no early exit
    bool matched = false;
    for (const auto& state : qkp.superpositionStates) {
        std::string candidate = HMACSHA256Hex(state + qkp.latticeSalt, entangled);
        matched |= ConstantTimeEquals(candidate, signature);
    }
    return matched;
}

// ============================================================================
// Encryption
// ============================================================================

std::string QuantumEnhancer::Encrypt(const std::string& data, const QuantumKeyPair& qkp) {
    return HarmonicTransform::EncryptWithKey(data, ComponentKey(qkp));
}

std::string QuantumEnhancer::Decrypt(const std::string& ciphertext, const QuantumKeyPair& qkp) {
    auto plaintext = HarmonicTransform::DecryptWithKey(ciphertext, ComponentKey(qkp));
    if (!plaintext) {
        LOG_WARN(util::LogCategory::QUANTUM) << "Quantum decryption failed";
        return "";
    }
    return *plaintext;
}

// ============================================================================
// Seed Derivation
// ============================================================================

std::string QuantumEnhancer::DeriveSeed(const std::string& userEntropy) {
    std::string seed = HarmonicTransform::DeriveKey(LatticeHash(userEntropy, ""));

    for (const auto& ratio : harmonic::SACRED_RATIOS) {
        std::string t = SHA256Hex(seed + ratio.text);
        seed = SHA256Hex(seed.substr(0, 32) + t.substr(0, 32));
    }

    return seed;
}

} // namespace quantum
} // namespace aether
