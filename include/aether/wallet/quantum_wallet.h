// AETHER - Quantum Wallet Manager
// Copyright (c) 2024 AETHER Developers
// MIT License
//
// Composes a base wallet with the quantum key-pair material into a single
// wallet record. Covers creation, mnemonic recovery, encrypted storage,
// transaction signing, derived addresses and identity digests.

#ifndef AETHER_WALLET_QUANTUM_WALLET_H
#define AETHER_WALLET_QUANTUM_WALLET_H

#include <aether/quantum/quantum_enhancer.h>
#include <aether/wallet/base_wallet.h>
#include <aether/wallet/transaction.h>

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace aether {
namespace wallet {

/// Addresses produced by DeriveAddresses when no count is given
constexpr size_t DEFAULT_ADDRESS_COUNT = 12;

struct QuantumWallet {
    BaseWallet baseWallet;
    quantum::QuantumKeyPair quantumKeyPair;
    std::string quantumSeed;
    std::string entropySignature;
    std::string entanglementProof;
};

/**
 * Encrypted form of a QuantumWallet.
 *
 * quantumComponents never contains the private key; it is rebuilt from the
 * base wallet on decryption.
 */
struct EncryptedWalletRecord {
    std::string baseWallet;
    std::string quantumComponents;
};

class QuantumWalletManager {
public:
    /// Uses HarmonicWalletProvider and Secp256k1Signer
    QuantumWalletManager();

    QuantumWalletManager(std::shared_ptr<IBaseWalletProvider> provider,
                         std::shared_ptr<ITransactionSigner> signer);

    /**
     * Create a new wallet.
     *
     * The quantum seed mixes in the current time, so two calls with the same
     * arguments yield different wallets.
     */
    QuantumWallet Create(const std::string& passphrase,
                         const std::string& additionalEntropy = "");

    /**
     * Recover a wallet from its mnemonic.
     *
     * @throws InvalidMnemonicError if the words are malformed
     * @throws WalletRecoveryError on any other provider failure
     */
    QuantumWallet Recover(const std::string& mnemonic, const std::string& passphrase);

    EncryptedWalletRecord EncryptForStorage(const QuantumWallet& wallet,
                                            const std::string& passphrase);

    /**
     * Rebuild a wallet from its encrypted record.
     *
     * @throws WalletDecryptionError if the record is malformed or the
     *         passphrase is wrong
     * @throws QuantumIntegrityError if the decrypted key pair does not verify
     */
    QuantumWallet DecryptFromStorage(const EncryptedWalletRecord& record,
                                     const std::string& passphrase);

    /// "<standard signature>:<quantum signature>"
    std::string SignTransaction(const QuantumWallet& wallet, const Transaction& tx);

    /// Never throws; malformed input is simply not verified
    bool VerifySignedTransaction(const std::string& signedTx, const QuantumWallet& wallet);

    std::vector<std::string> DeriveAddresses(const QuantumWallet& wallet,
                                             size_t count = DEFAULT_ADDRESS_COUNT);

    /// Keccak-style digest of fingerprint, proof and entropy signature
    static std::string Identity(const QuantumWallet& wallet);

    // ========================================================================
    // Record serialization
    // ========================================================================

    /// {"baseWallet": ..., "quantumComponents": ...}
    static std::string SerializeRecord(const EncryptedWalletRecord& record);

    /// @throws WalletDecryptionError if the text is not a wallet record
    static EncryptedWalletRecord ParseRecord(const std::string& serialized);

    IBaseWalletProvider& GetProvider() { return *provider_; }
    ITransactionSigner& GetSigner() { return *signer_; }

private:
    /// Fill the quantum fields of a wallet from its base wallet and seed
    static QuantumWallet Assemble(BaseWallet base, std::string quantumSeed);

    std::shared_ptr<IBaseWalletProvider> provider_;
    std::shared_ptr<ITransactionSigner> signer_;
};

} // namespace wallet
} // namespace aether

#endif // AETHER_WALLET_QUANTUM_WALLET_H
