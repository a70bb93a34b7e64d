// AETHER - Base Wallet
// Copyright (c) 2024 AETHER Developers
// MIT License
//
// The elliptic-curve wallet underneath a quantum wallet, and the provider
// interface the wallet manager obtains it through.

#ifndef AETHER_WALLET_BASE_WALLET_H
#define AETHER_WALLET_BASE_WALLET_H

#include <cstddef>
#include <cstdint>
#include <string>

namespace aether {
namespace wallet {

/// Storage blob format written by HarmonicWalletProvider
constexpr int64_t BASE_WALLET_STORAGE_VERSION = 1;

/// Attempts at mapping a recovery hash onto a valid secp256k1 scalar
constexpr int MAX_KEY_DERIVATION_ATTEMPTS = 16;

/// Entropy drawn for a new wallet, in bytes
constexpr size_t WALLET_ENTROPY_SIZE = 32;

struct BaseWallet {
    std::string publicKey;      // Compressed secp256k1 point, hex
    std::string privateKey;     // 32 bytes, hex
    std::string address;        // 0x + 40 hex
    std::string mnemonic;       // 12 space-separated words
};

/**
 * Source of base wallets.
 *
 * Implementations are synchronous; a provider backed by a device or a remote
 * service applies its own timeout.
 */
class IBaseWalletProvider {
public:
    virtual ~IBaseWalletProvider() = default;

    virtual BaseWallet CreateWallet(const std::string& passphrase) = 0;

    /// @throws InvalidMnemonicError or WalletRecoveryError
    virtual BaseWallet RecoverFromMnemonic(const std::string& mnemonic,
                                           const std::string& passphrase) = 0;

    /// Opaque blob from which DecryptFromStorage can rebuild the wallet
    virtual std::string EncryptForStorage(const BaseWallet& wallet,
                                          const std::string& passphrase) = 0;

    /// @throws WalletDecryptionError
    virtual BaseWallet DecryptFromStorage(const std::string& blob,
                                          const std::string& passphrase) = 0;
};

/**
 * Base wallets keyed by the harmonic mnemonic.
 *
 * The private key is SHA-256(seed ":" passphrase), where seed comes from
 * decoding the mnemonic, so a wallet is fully determined by its words and
 * passphrase. Created wallets go through the same derivation.
 *
 * Storage format:
 *   {"address": ..., "mnemonic": <harmonic ciphertext>, "publicKey": ...,
 *    "version": 1}
 */
class HarmonicWalletProvider : public IBaseWalletProvider {
public:
    BaseWallet CreateWallet(const std::string& passphrase) override;

    BaseWallet RecoverFromMnemonic(const std::string& mnemonic,
                                   const std::string& passphrase) override;

    std::string EncryptForStorage(const BaseWallet& wallet,
                                  const std::string& passphrase) override;

    BaseWallet DecryptFromStorage(const std::string& blob,
                                  const std::string& passphrase) override;
};

} // namespace wallet
} // namespace aether

#endif // AETHER_WALLET_BASE_WALLET_H
