// AETHER - Transactions and Standard Signing
// Copyright (c) 2024 AETHER Developers
// MIT License

#ifndef AETHER_WALLET_TRANSACTION_H
#define AETHER_WALLET_TRANSACTION_H

#include <cstdint>
#include <optional>
#include <string>

namespace aether {
namespace wallet {

/**
 * Account-style transfer handed to the standard signer.
 *
 * Amounts are decimal strings so they are not limited to 64 bits.
 */
struct Transaction {
    std::string to;
    std::string value{"0"};
    std::string data{"0x"};
    uint64_t nonce{0};
    uint64_t gasLimit{21000};
    std::string gasPrice{"0"};
    uint64_t chainId{1};

    /// Compact JSON with sorted keys; the exact bytes that get signed
    std::string ToCanonicalJSON() const;

    /// Parse the canonical form (or any JSON object with the same fields)
    static std::optional<Transaction> FromJSON(const std::string& json);

    bool operator==(const Transaction& other) const;
    bool operator!=(const Transaction& other) const { return !(*this == other); }
};

/// Produces the standard (non-quantum) half of a signed transaction
class ITransactionSigner {
public:
    virtual ~ITransactionSigner() = default;

    /// Encoding must never contain ':'
    virtual std::string SignTransaction(const std::string& privateKeyHex,
                                        const Transaction& tx) = 0;

    virtual std::string DeriveAddress(const std::string& privateKeyHex) = 0;
};

/**
 * ECDSA over secp256k1.
 *
 * Signature encoding: "0x" + hex(payload) + hex(r || s), where payload is the
 * canonical JSON of the transaction and the signed digest is SHA3-256 of the
 * payload. s is normalized to the lower half of the curve order.
 */
class Secp256k1Signer : public ITransactionSigner {
public:
    /// @throws std::invalid_argument on a malformed or out-of-range key
    std::string SignTransaction(const std::string& privateKeyHex,
                                const Transaction& tx) override;

    /// @throws std::invalid_argument on a malformed or out-of-range key
    std::string DeriveAddress(const std::string& privateKeyHex) override;

    /// Check a standard signature against a compressed or uncompressed key
    static bool VerifyTransaction(const std::string& signature,
                                  const std::string& publicKeyHex);

    /// Transaction carried inside a standard signature
    static std::optional<Transaction> DecodePayload(const std::string& signature);
};

} // namespace wallet
} // namespace aether

#endif // AETHER_WALLET_TRANSACTION_H
