// AETHER - Base Wallet Implementation
// Copyright (c) 2024 AETHER Developers
// MIT License

#include <aether/wallet/base_wallet.h>

#include <aether/core/errors.h>
#include <aether/core/hex.h>
#include <aether/core/random.h>
#include <aether/crypto/secp256k1.h>
#include <aether/crypto/sha256.h>
#include <aether/harmonic/harmonic_transform.h>
#include <aether/util/json.h>
#include <aether/util/logging.h>
#include <aether/wallet/address.h>

#include <openssl/crypto.h>

namespace aether {
namespace wallet {

using harmonic::HarmonicTransform;

namespace {

/// Hash seed and passphrase until the result is a usable private key
Bytes DerivePrivateKey(const std::string& seed, const std::string& passphrase) {
    Hash256 candidate = SHA256Hash(seed + ":" + passphrase);

    for (int attempt = 1; attempt <= MAX_KEY_DERIVATION_ATTEMPTS; ++attempt) {
        if (secp256k1::IsValidPrivateKey(candidate.data())) {
            Bytes key(candidate.begin(), candidate.end());
            OPENSSL_cleanse(candidate.data(), candidate.size());
            return key;
        }
        candidate = SHA256Hash(BytesToHex(candidate.data(), candidate.size()) + ":" +
                               std::to_string(attempt));
    }

    OPENSSL_cleanse(candidate.data(), candidate.size());
    throw WalletRecoveryError("could not derive a valid private key");
}

} // anonymous namespace

// ============================================================================
// Creation and Recovery
// ============================================================================

BaseWallet HarmonicWalletProvider::CreateWallet(const std::string& passphrase) {
    Bytes entropy = GetRandBytes(WALLET_ENTROPY_SIZE);
    std::string secret = BytesToHex(entropy);
    OPENSSL_cleanse(entropy.data(), entropy.size());

    std::string mnemonic = HarmonicTransform::JoinMnemonic(
        HarmonicTransform::EncodeMnemonic(secret));
    OPENSSL_cleanse(&secret[0], secret.size());

    return RecoverFromMnemonic(mnemonic, passphrase);
}

BaseWallet HarmonicWalletProvider::RecoverFromMnemonic(const std::string& mnemonic,
                                                       const std::string& passphrase) {
    auto words = HarmonicTransform::ParseMnemonic(mnemonic);
    auto decoded = HarmonicTransform::DecodeMnemonic(words);

    Bytes privateKey = DerivePrivateKey(decoded.seed, passphrase);

    auto compressed = secp256k1::DerivePublicKey(privateKey, true);
    auto uncompressed = secp256k1::DerivePublicKey(privateKey, false);
    if (!compressed || !uncompressed) {
        OPENSSL_cleanse(privateKey.data(), privateKey.size());
        throw WalletRecoveryError("could not derive public key");
    }

    BaseWallet wallet;
    wallet.privateKey = BytesToHex(privateKey);
    wallet.publicKey = BytesToHex(*compressed);
    wallet.address = AddressFromPublicKey(*uncompressed);
    wallet.mnemonic = HarmonicTransform::JoinMnemonic(words);

    OPENSSL_cleanse(privateKey.data(), privateKey.size());
    return wallet;
}

// ============================================================================
// Storage
// ============================================================================

std::string HarmonicWalletProvider::EncryptForStorage(const BaseWallet& wallet,
                                                      const std::string& passphrase) {
    util::JSONValue obj;
    obj["version"] = BASE_WALLET_STORAGE_VERSION;
    obj["address"] = wallet.address;
    obj["publicKey"] = wallet.publicKey;
    obj["mnemonic"] = HarmonicTransform::Encrypt(wallet.mnemonic, passphrase);
    return obj.ToJSON();
}

BaseWallet HarmonicWalletProvider::DecryptFromStorage(const std::string& blob,
                                                      const std::string& passphrase) {
    auto parsed = util::JSONValue::TryParse(blob);
    if (!parsed || !parsed->IsObject()) {
        throw WalletDecryptionError("could not decrypt base wallet", "malformed storage blob");
    }

    const util::JSONValue& obj = *parsed;
    if (!obj["version"].IsInt() || obj["version"].GetInt() != BASE_WALLET_STORAGE_VERSION) {
        throw WalletDecryptionError("could not decrypt base wallet", "unsupported storage version");
    }
    if (!obj["mnemonic"].IsString() || !obj["publicKey"].IsString()) {
        throw WalletDecryptionError("could not decrypt base wallet", "missing storage fields");
    }

    std::string mnemonic = HarmonicTransform::Decrypt(obj["mnemonic"].GetString(), passphrase);
    if (mnemonic.empty()) {
        throw WalletDecryptionError("could not decrypt base wallet", "mnemonic did not decrypt");
    }

    BaseWallet wallet;
    try {
        wallet = RecoverFromMnemonic(mnemonic, passphrase);
    } catch (const WalletError&) {
        OPENSSL_cleanse(&mnemonic[0], mnemonic.size());
        throw WalletDecryptionError("could not decrypt base wallet", "mnemonic did not recover");
    }
    OPENSSL_cleanse(&mnemonic[0], mnemonic.size());

    if (wallet.publicKey != obj["publicKey"].GetString()) {
        throw WalletDecryptionError("could not decrypt base wallet", "public key mismatch");
    }

    LOG_DEBUG(util::LogCategory::WALLET) << "Base wallet " << wallet.address << " decrypted";
    return wallet;
}

} // namespace wallet
} // namespace aether
