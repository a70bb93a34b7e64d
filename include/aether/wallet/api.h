// AETHER - Wallet API
// Copyright (c) 2024 AETHER Developers
// MIT License
//
// Free functions over a process-wide QuantumWalletManager wired with the
// bundled provider and signer. Callers that need a different provider or
// signer construct their own QuantumWalletManager instead.

#ifndef AETHER_WALLET_API_H
#define AETHER_WALLET_API_H

#include <aether/wallet/quantum_wallet.h>

#include <cstddef>
#include <string>
#include <vector>

namespace aether {
namespace wallet {

/// The manager behind the free functions below
QuantumWalletManager& DefaultWalletManager();

QuantumWallet CreateWallet(const std::string& passphrase,
                           const std::string& additionalEntropy = "");

QuantumWallet RecoverWallet(const std::string& mnemonic, const std::string& passphrase);

/// Serialized EncryptedWalletRecord
std::string EncryptWalletForStorage(const QuantumWallet& wallet, const std::string& passphrase);

/// @throws WalletDecryptionError or QuantumIntegrityError
QuantumWallet DecryptWalletFromStorage(const std::string& serialized,
                                       const std::string& passphrase);

std::string SignTransaction(const QuantumWallet& wallet, const Transaction& tx);

bool VerifySignedTransaction(const std::string& signedTx, const QuantumWallet& wallet);

std::vector<std::string> DeriveAddresses(const QuantumWallet& wallet,
                                         size_t count = DEFAULT_ADDRESS_COUNT);

std::string WalletIdentity(const QuantumWallet& wallet);

} // namespace wallet
} // namespace aether

#endif // AETHER_WALLET_API_H
