// AETHER - Quantum Wallet Manager Implementation
// Copyright (c) 2024 AETHER Developers
// MIT License

#include <aether/wallet/quantum_wallet.h>

#include <aether/core/errors.h>
#include <aether/core/types.h>
#include <aether/crypto/sha3.h>
#include <aether/harmonic/harmonic_transform.h>
#include <aether/util/json.h>
#include <aether/util/logging.h>

#include <stdexcept>
#include <utility>

namespace aether {
namespace wallet {

using harmonic::HarmonicTransform;
using quantum::QuantumEnhancer;
using quantum::QuantumKeyPair;

namespace {

constexpr char SIGNATURE_SEPARATOR = ':';

util::JSONValue ComponentsToJSON(const QuantumWallet& wallet) {
    const QuantumKeyPair& qkp = wallet.quantumKeyPair;

    util::JSONValue states{util::JSONValue::Array{}};
    for (const auto& state : qkp.superpositionStates) {
        states.Push(state);
    }

    util::JSONValue keyPair;
    keyPair["publicKey"] = qkp.publicKey;
    keyPair["quantumFingerprint"] = qkp.quantumFingerprint;
    keyPair["entanglementHash"] = qkp.entanglementHash;
    keyPair["superpositionStates"] = std::move(states);
    keyPair["latticeSalt"] = qkp.latticeSalt;

    util::JSONValue components;
    components["quantumKeyPair"] = std::move(keyPair);
    components["entropySignature"] = wallet.entropySignature;
    components["entanglementProof"] = wallet.entanglementProof;
    return components;
}

const std::string& RequireString(const util::JSONValue& obj, const char* key) {
    const util::JSONValue& value = obj[key];
    if (!value.IsString()) {
        throw WalletDecryptionError("could not decrypt quantum components",
                                    std::string("missing field ") + key);
    }
    return value.GetString();
}

} // anonymous namespace

// ============================================================================
// Construction
// ============================================================================

QuantumWalletManager::QuantumWalletManager()
    : QuantumWalletManager(std::make_shared<HarmonicWalletProvider>(),
                           std::make_shared<Secp256k1Signer>()) {}

QuantumWalletManager::QuantumWalletManager(std::shared_ptr<IBaseWalletProvider> provider,
                                           std::shared_ptr<ITransactionSigner> signer)
    : provider_(std::move(provider)), signer_(std::move(signer)) {
    if (!provider_ || !signer_) {
        throw std::invalid_argument("QuantumWalletManager requires a provider and a signer");
    }
}

QuantumWallet QuantumWalletManager::Assemble(BaseWallet base, std::string quantumSeed) {
    QuantumWallet wallet;
    wallet.quantumKeyPair = QuantumEnhancer::Enhance(base.publicKey, base.privateKey);
    wallet.baseWallet = std::move(base);
    wallet.quantumSeed = std::move(quantumSeed);
    wallet.entropySignature = QuantumEnhancer::Sign(wallet.quantumSeed, wallet.quantumKeyPair);
    wallet.entanglementProof = KeccakDigest(wallet.quantumKeyPair.entanglementHash +
                                            wallet.entropySignature);
    return wallet;
}

// ============================================================================
// Creation and Recovery
// ============================================================================

QuantumWallet QuantumWalletManager::Create(const std::string& passphrase,
                                           const std::string& additionalEntropy) {
    AETHER_LOG_TIMER(util::LogCategory::WALLET, "Wallet creation");

    std::string seed = QuantumEnhancer::DeriveSeed(passphrase + additionalEntropy +
                                                   std::to_string(GetTimeMillis()));
    BaseWallet base = provider_->CreateWallet(passphrase);

    QuantumWallet wallet = Assemble(std::move(base), std::move(seed));
    LOG_INFO(util::LogCategory::WALLET) << "Created wallet " << wallet.baseWallet.address;
    return wallet;
}

QuantumWallet QuantumWalletManager::Recover(const std::string& mnemonic,
                                            const std::string& passphrase) {
    AETHER_LOG_TIMER(util::LogCategory::WALLET, "Wallet recovery");

    BaseWallet base;
    try {
        base = provider_->RecoverFromMnemonic(mnemonic, passphrase);
    } catch (const InvalidMnemonicError&) {
        throw;
    } catch (const WalletRecoveryError&) {
        throw;
    } catch (const std::exception& e) {
        LOG_WARN(util::LogCategory::WALLET) << "Base wallet recovery failed";
        throw WalletRecoveryError(std::string("base wallet recovery failed: ") + e.what());
    }

    std::string seed = QuantumEnhancer::DeriveSeed(passphrase + base.privateKey);
    QuantumWallet wallet = Assemble(std::move(base), std::move(seed));
    LOG_INFO(util::LogCategory::WALLET) << "Recovered wallet " << wallet.baseWallet.address;
    return wallet;
}

// ============================================================================
// Storage
// ============================================================================

EncryptedWalletRecord QuantumWalletManager::EncryptForStorage(const QuantumWallet& wallet,
                                                              const std::string& passphrase) {
    EncryptedWalletRecord record;
    record.baseWallet = provider_->EncryptForStorage(wallet.baseWallet, passphrase);
    record.quantumComponents = QuantumEnhancer::Encrypt(ComponentsToJSON(wallet).ToJSON(),
                                                        wallet.quantumKeyPair);
    return record;
}

QuantumWallet QuantumWalletManager::DecryptFromStorage(const EncryptedWalletRecord& record,
                                                       const std::string& passphrase) {
    BaseWallet base;
    try {
        base = provider_->DecryptFromStorage(record.baseWallet, passphrase);
    } catch (const WalletDecryptionError&) {
        throw;
    } catch (const std::exception& e) {
        throw WalletDecryptionError("could not decrypt base wallet", e.what());
    }

    // The component key depends only on the key pair, so recompute it
    QuantumKeyPair temporary = QuantumEnhancer::Enhance(base.publicKey, base.privateKey);
    std::string plaintext = QuantumEnhancer::Decrypt(record.quantumComponents, temporary);
    if (plaintext.empty()) {
        throw WalletDecryptionError("could not decrypt quantum components");
    }

    auto parsed = util::JSONValue::TryParse(plaintext);
    if (!parsed || !parsed->IsObject()) {
        throw WalletDecryptionError("could not decrypt quantum components", "malformed JSON");
    }
    const util::JSONValue& components = *parsed;
    const util::JSONValue& keyPair = components["quantumKeyPair"];
    if (!keyPair.IsObject()) {
        throw WalletDecryptionError("could not decrypt quantum components",
                                    "missing field quantumKeyPair");
    }

    QuantumWallet wallet;
    QuantumKeyPair& qkp = wallet.quantumKeyPair;
    qkp.publicKey = RequireString(keyPair, "publicKey");
    qkp.privateKey = base.privateKey;
    qkp.quantumFingerprint = RequireString(keyPair, "quantumFingerprint");
    qkp.entanglementHash = RequireString(keyPair, "entanglementHash");
    qkp.latticeSalt = RequireString(keyPair, "latticeSalt");

    const util::JSONValue& states = keyPair["superpositionStates"];
    if (!states.IsArray()) {
        throw WalletDecryptionError("could not decrypt quantum components",
                                    "missing field superpositionStates");
    }
    for (const auto& state : states.GetArray()) {
        if (!state.IsString()) {
            throw WalletDecryptionError("could not decrypt quantum components",
                                        "malformed superposition state");
        }
        qkp.superpositionStates.push_back(state.GetString());
    }

    wallet.entropySignature = RequireString(components, "entropySignature");
    wallet.entanglementProof = RequireString(components, "entanglementProof");

    if (!QuantumEnhancer::VerifyKeyPair(qkp)) {
        LOG_WARN(util::LogCategory::WALLET) << "Quantum key pair failed integrity check";
        throw QuantumIntegrityError("decrypted quantum key pair does not match base wallet");
    }

    wallet.quantumSeed = QuantumEnhancer::DeriveSeed(passphrase + base.privateKey);
    wallet.baseWallet = std::move(base);
    return wallet;
}

std::string QuantumWalletManager::SerializeRecord(const EncryptedWalletRecord& record) {
    util::JSONValue obj;
    obj["baseWallet"] = record.baseWallet;
    obj["quantumComponents"] = record.quantumComponents;
    return obj.ToJSON();
}

EncryptedWalletRecord QuantumWalletManager::ParseRecord(const std::string& serialized) {
    auto parsed = util::JSONValue::TryParse(serialized);
    if (!parsed) {
        throw WalletDecryptionError("could not read wallet record", "malformed record");
    }
    const util::JSONValue& obj = *parsed;
    if (!obj.IsObject() || obj.Size() != 2 ||
        !obj["baseWallet"].IsString() || !obj["quantumComponents"].IsString()) {
        throw WalletDecryptionError("could not read wallet record", "malformed record");
    }

    EncryptedWalletRecord record;
    record.baseWallet = obj["baseWallet"].GetString();
    record.quantumComponents = obj["quantumComponents"].GetString();
    return record;
}

// ============================================================================
// Transactions
// ============================================================================

std::string QuantumWalletManager::SignTransaction(const QuantumWallet& wallet,
                                                  const Transaction& tx) {
    std::string standard = signer_->SignTransaction(wallet.baseWallet.privateKey, tx);
    if (standard.find(SIGNATURE_SEPARATOR) != std::string::npos) {
        throw std::logic_error("standard signature contains the separator character");
    }

    return standard + SIGNATURE_SEPARATOR + QuantumEnhancer::Sign(standard, wallet.quantumKeyPair);
}

bool QuantumWalletManager::VerifySignedTransaction(const std::string& signedTx,
                                                   const QuantumWallet& wallet) {
    size_t pos = signedTx.find(SIGNATURE_SEPARATOR);
    if (pos == std::string::npos) {
        return false;
    }

    std::string standard = signedTx.substr(0, pos);
    std::string quantumSignature = signedTx.substr(pos + 1);
    if (standard.empty() || quantumSignature.empty()) {
        return false;
    }

    return QuantumEnhancer::Verify(standard, quantumSignature, wallet.quantumKeyPair);
}

// ============================================================================
// Addresses and Identity
// ============================================================================

std::vector<std::string> QuantumWalletManager::DeriveAddresses(const QuantumWallet& wallet,
                                                               size_t count) {
    std::vector<std::string> addresses;
    addresses.reserve(count);

    for (size_t i = 0; i < count; ++i) {
        std::string pattern = HarmonicTransform::DeriveKey(
            wallet.quantumSeed + wallet.quantumKeyPair.entanglementHash + std::to_string(i));
        addresses.push_back(signer_->DeriveAddress(SHA3_256Hex(pattern)));
    }

    return addresses;
}

std::string QuantumWalletManager::Identity(const QuantumWallet& wallet) {
    return KeccakDigest(wallet.quantumKeyPair.quantumFingerprint +
                        wallet.entanglementProof +
                        wallet.entropySignature);
}

} // namespace wallet
} // namespace aether
