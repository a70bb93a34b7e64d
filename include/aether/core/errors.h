// AETHER - Wallet Error Types
// Copyright (c) 2024 AETHER Developers
// MIT License
//
// Typed failures raised by the orchestration layer. Primitive layers never
// throw these; they report failure through empty or nullopt returns.
//
// Messages never carry key material, passphrases or mnemonic words.

#ifndef AETHER_CORE_ERRORS_H
#define AETHER_CORE_ERRORS_H

#include <stdexcept>
#include <string>

namespace aether {

/// Base class for every wallet-level failure
class WalletError : public std::runtime_error {
public:
    explicit WalletError(const std::string& msg) : std::runtime_error(msg) {}
};

/// Wrong word count, or a word outside the vocabulary
class InvalidMnemonicError : public WalletError {
public:
    explicit InvalidMnemonicError(const std::string& msg) : WalletError(msg) {}
};

/// The base wallet provider rejected a mnemonic/passphrase combination
class WalletRecoveryError : public WalletError {
public:
    explicit WalletRecoveryError(const std::string& msg) : WalletError(msg) {}
};

/// Storage blob malformed, or passphrase wrong
class WalletDecryptionError : public WalletError {
public:
    WalletDecryptionError(const std::string& msg, const std::string& cause = "")
        : WalletError(cause.empty() ? msg : msg + ": " + cause), cause_(cause) {}

    /// Underlying reason, if one was captured
    const std::string& Cause() const { return cause_; }

private:
    std::string cause_;
};

/// A decrypted key pair failed its integrity check
class QuantumIntegrityError : public WalletError {
public:
    explicit QuantumIntegrityError(const std::string& msg) : WalletError(msg) {}
};

} // namespace aether

#endif // AETHER_CORE_ERRORS_H
