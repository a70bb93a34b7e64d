// AETHER - Harmonic Transform Implementation
// Copyright (c) 2024 AETHER Developers
// MIT License

#include <aether/harmonic/harmonic_transform.h>

#include <aether/core/base64.h>
#include <aether/core/errors.h>
#include <aether/core/hex.h>
#include <aether/core/types.h>
#include <aether/crypto/aes.h>
#include <aether/crypto/compare.h>
#include <aether/crypto/hmac.h>
#include <aether/crypto/sha256.h>
#include <aether/harmonic/constants.h>
#include <aether/util/logging.h>

#include <openssl/crypto.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace aether {
namespace harmonic {

// ============================================================================
// Vocabulary
// ============================================================================

const std::array<const char*, VOCABULARY_SIZE> VOCABULARY = {{
    "aether",   "amber",    "anchor",   "aurora",   "axis",     "beacon",   "breeze",   "cadence",
    "canyon",   "cascade",  "celeste",  "chord",    "cipher",   "comet",    "coral",    "crystal",
    "delta",    "drift",    "echo",     "ember",    "equinox",  "falcon",   "fern",     "flare",
    "forge",    "glacier",  "granite",  "harbor",   "helix",    "horizon",  "indigo",   "jade",
    "lantern",  "lumen",    "lyric",    "meadow",   "meridian", "mosaic",   "nebula",   "nova",
    "oasis",    "octave",   "onyx",     "orbit",    "prism",    "pulse",    "quartz",   "radiant",
    "resonance","ridge",    "river",    "sage",     "solace",   "sonnet",   "spiral",   "summit",
    "tempo",    "tide",     "torus",    "valley",   "vertex",   "willow",   "zenith",   "zephyr"
}};

std::optional<size_t> VocabularyIndex(const std::string& word) {
    for (size_t i = 0; i < VOCABULARY.size(); ++i) {
        if (word == VOCABULARY[i]) {
            return i;
        }
    }
    return std::nullopt;
}

namespace {

constexpr size_t ROUND_COUNT = 12;

/// Key material must cover the AES key (32 hex) and the IV prefix (16 hex)
constexpr size_t CIPHER_KEY_HEX = 32;
constexpr size_t CIPHER_IV_HEX = 16;

std::string ToLower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return str;
}

std::string TrimWord(const std::string& str) {
    const char* whitespace = " \t\r\n";
    size_t start = str.find_first_not_of(whitespace);
    if (start == std::string::npos) {
        return "";
    }
    size_t end = str.find_last_not_of(whitespace);
    return str.substr(start, end - start + 1);
}

/// Split a 64-hex key into the AES key and zero-padded IV
bool LoadCipherKey(const std::string& keyHex, AESKey128& key, AESIV& iv) {
    if (keyHex.size() < CIPHER_KEY_HEX + CIPHER_IV_HEX) {
        return false;
    }

    Bytes keyBytes;
    Bytes ivBytes;
    try {
        keyBytes = HexToBytes(keyHex.substr(0, CIPHER_KEY_HEX));
        ivBytes = HexToBytes(keyHex.substr(CIPHER_KEY_HEX, CIPHER_IV_HEX));
    } catch (const std::invalid_argument&) {
        return false;
    }

    std::copy(keyBytes.begin(), keyBytes.end(), key.begin());
    iv.fill(0);
    std::copy(ivBytes.begin(), ivBytes.end(), iv.begin());

    OPENSSL_cleanse(keyBytes.data(), keyBytes.size());
    return true;
}

} // anonymous namespace

// ============================================================================
// Key Derivation
// ============================================================================

std::string HarmonicTransform::DeriveKey(const std::string& passphrase) {
    std::string acc = SHA256Hex(passphrase + HARMONIC_SALT);

    for (size_t i = 0; i < ROUND_COUNT; ++i) {
        uint32_t resonance = passphrase.empty()
            ? 0
            : static_cast<unsigned char>(passphrase[i % passphrase.size()]);
        auto transformed = static_cast<uint64_t>(
            std::floor(resonance * static_cast<double>(Octave(i)) * (1.0 + PhaseShift(i))));

        acc = SHA256Hex(acc + std::to_string(transformed) + ":" + std::to_string(i));
    }

    return acc;
}

// ============================================================================
// Symmetric Cipher
// ============================================================================

std::string HarmonicTransform::EncryptWithKey(const std::string& plaintext,
                                              const std::string& keyHex) {
    AESKey128 key;
    AESIV iv;
    if (!LoadCipherKey(keyHex, key, iv)) {
        throw std::invalid_argument("harmonic cipher key must be at least 48 hex characters");
    }

    Bytes ciphertext = AES128CBCEncrypt(StringToBytes(plaintext), key, iv);
    OPENSSL_cleanse(key.data(), key.size());

    return EncodeBase64(ciphertext);
}

std::optional<std::string> HarmonicTransform::DecryptWithKey(const std::string& ciphertext,
                                                             const std::string& keyHex) {
    AESKey128 key;
    AESIV iv;
    if (!LoadCipherKey(keyHex, key, iv)) {
        return std::nullopt;
    }

    auto raw = DecodeBase64(ciphertext);
    if (!raw) {
        OPENSSL_cleanse(key.data(), key.size());
        return std::nullopt;
    }

    Bytes plain;
    try {
        plain = AES128CBCDecrypt(*raw, key, iv);
    } catch (const AESError&) {
        OPENSSL_cleanse(key.data(), key.size());
        return std::nullopt;
    }
    OPENSSL_cleanse(key.data(), key.size());

    std::string text = BytesToString(plain);
    OPENSSL_cleanse(plain.data(), plain.size());

    if (!IsValidUTF8(text)) {
        return std::nullopt;
    }
    return text;
}

std::string HarmonicTransform::Encrypt(const std::string& plaintext,
                                       const std::string& passphrase) {
    return EncryptWithKey(plaintext, DeriveKey(passphrase));
}

std::string HarmonicTransform::Decrypt(const std::string& ciphertext,
                                       const std::string& passphrase) {
    auto plaintext = DecryptWithKey(ciphertext, DeriveKey(passphrase));
    if (!plaintext) {
        LOG_WARN(util::LogCategory::HARMONIC) << "Harmonic decryption failed";
        return "";
    }
    return *plaintext;
}

// ============================================================================
// Signatures
// ============================================================================

std::string HarmonicTransform::Sign(const std::string& message,
                                    const std::string& keyMaterial) {
    return HMACSHA256Hex(DeriveKey(keyMaterial), SHA256Hex(message));
}

bool HarmonicTransform::Verify(const std::string& message, const std::string& signature,
                               const std::string& keyMaterial) {
    return ConstantTimeEquals(Sign(message, keyMaterial), signature);
}

// ============================================================================
// Mnemonic
// ============================================================================

std::vector<std::string> HarmonicTransform::EncodeMnemonic(const std::string& secret) {
    return EncodeHarmonicKey(DeriveKey(secret));
}

std::vector<std::string> HarmonicTransform::EncodeHarmonicKey(const std::string& keyHex) {
    if (keyHex.size() < MNEMONIC_WORD_COUNT * MNEMONIC_SLICE_WIDTH) {
        throw std::invalid_argument("harmonic key too short for a mnemonic");
    }
    for (char c : keyHex) {
        if (HexDigitValue(c) < 0) {
            throw std::invalid_argument("harmonic key is not hex");
        }
    }

    std::vector<std::string> words;
    words.reserve(MNEMONIC_WORD_COUNT);

    for (size_t i = 0; i < MNEMONIC_WORD_COUNT; ++i) {
        uint64_t raw = ParseHexNumber(keyHex.substr(i * MNEMONIC_SLICE_WIDTH,
                                                    MNEMONIC_SLICE_WIDTH)) % VOCABULARY_SIZE;
        size_t index = (raw + Octave(i) % VOCABULARY_SIZE) % VOCABULARY_SIZE;
        words.emplace_back(VOCABULARY[index]);
    }

    return words;
}

DecodedMnemonic HarmonicTransform::DecodeMnemonic(const std::vector<std::string>& words) {
    if (words.size() != MNEMONIC_WORD_COUNT) {
        throw InvalidMnemonicError("mnemonic must have " +
                                   std::to_string(MNEMONIC_WORD_COUNT) + " words, got " +
                                   std::to_string(words.size()));
    }

    std::string key;
    std::string rawList;

    for (size_t i = 0; i < MNEMONIC_WORD_COUNT; ++i) {
        auto index = VocabularyIndex(ToLower(TrimWord(words[i])));
        if (!index) {
            throw InvalidMnemonicError("unknown mnemonic word at position " +
                                       std::to_string(i + 1));
        }

        size_t offset = Octave(i) % VOCABULARY_SIZE;
        auto raw = static_cast<Byte>((*index + VOCABULARY_SIZE - offset) % VOCABULARY_SIZE);

        key += "000" + BytesToHex(&raw, 1);
        if (i > 0) {
            rawList += ",";
        }
        rawList += std::to_string(raw);
    }

    // Pad to a full 64-hex key
    key += SHA256Hex(rawList).substr(0, 4);

    DecodedMnemonic decoded;
    decoded.harmonicKey = key;
    decoded.seed = SHA256Hex(key + HARMONIC_SALT);
    return decoded;
}

std::vector<std::string> HarmonicTransform::ParseMnemonic(const std::string& phrase) {
    std::vector<std::string> words;
    std::istringstream iss(phrase);
    std::string word;
    while (iss >> word) {
        words.push_back(ToLower(word));
    }
    return words;
}

std::string HarmonicTransform::JoinMnemonic(const std::vector<std::string>& words) {
    std::string phrase;
    for (size_t i = 0; i < words.size(); ++i) {
        if (i > 0) {
            phrase += ' ';
        }
        phrase += words[i];
    }
    return phrase;
}

} // namespace harmonic
} // namespace aether
