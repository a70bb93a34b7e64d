// AETHER - Wallet API Implementation
// Copyright (c) 2024 AETHER Developers
// MIT License

#include <aether/wallet/api.h>

namespace aether {
namespace wallet {

QuantumWalletManager& DefaultWalletManager() {
    static QuantumWalletManager manager;
    return manager;
}

QuantumWallet CreateWallet(const std::string& passphrase,
                           const std::string& additionalEntropy) {
    return DefaultWalletManager().Create(passphrase, additionalEntropy);
}

QuantumWallet RecoverWallet(const std::string& mnemonic, const std::string& passphrase) {
    return DefaultWalletManager().Recover(mnemonic, passphrase);
}

std::string EncryptWalletForStorage(const QuantumWallet& wallet, const std::string& passphrase) {
    return QuantumWalletManager::SerializeRecord(
        DefaultWalletManager().EncryptForStorage(wallet, passphrase));
}

QuantumWallet DecryptWalletFromStorage(const std::string& serialized,
                                       const std::string& passphrase) {
    return DefaultWalletManager().DecryptFromStorage(
        QuantumWalletManager::ParseRecord(serialized), passphrase);
}

std::string SignTransaction(const QuantumWallet& wallet, const Transaction& tx) {
    return DefaultWalletManager().SignTransaction(wallet, tx);
}

bool VerifySignedTransaction(const std::string& signedTx, const QuantumWallet& wallet) {
    return DefaultWalletManager().VerifySignedTransaction(signedTx, wallet);
}

std::vector<std::string> DeriveAddresses(const QuantumWallet& wallet, size_t count) {
    return DefaultWalletManager().DeriveAddresses(wallet, count);
}

std::string WalletIdentity(const QuantumWallet& wallet) {
    return QuantumWalletManager::Identity(wallet);
}

} // namespace wallet
} // namespace aether
