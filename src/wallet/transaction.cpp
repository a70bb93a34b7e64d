// AETHER - Transactions and Standard Signing Implementation
// Copyright (c) 2024 AETHER Developers
// MIT License

#include <aether/wallet/transaction.h>

#include <aether/core/hex.h>
#include <aether/core/types.h>
#include <aether/crypto/secp256k1.h>
#include <aether/crypto/sha3.h>
#include <aether/util/json.h>
#include <aether/wallet/address.h>

#include <openssl/crypto.h>

#include <stdexcept>

namespace aether {
namespace wallet {

namespace {

Bytes ParsePrivateKey(const std::string& privateKeyHex) {
    Bytes key = HexToBytes(Strip0x(privateKeyHex));
    if (!secp256k1::IsValidPrivateKey(key)) {
        OPENSSL_cleanse(key.data(), key.size());
        throw std::invalid_argument("private key is not a valid secp256k1 scalar");
    }
    return key;
}

std::optional<uint64_t> GetUnsigned(const util::JSONValue& value) {
    if (!value.IsInt() || value.GetInt() < 0) {
        return std::nullopt;
    }
    return static_cast<uint64_t>(value.GetInt());
}

} // anonymous namespace

// ============================================================================
// Transaction
// ============================================================================

std::string Transaction::ToCanonicalJSON() const {
    util::JSONValue obj;
    obj["to"] = to;
    obj["value"] = value;
    obj["data"] = data;
    obj["nonce"] = nonce;
    obj["gasLimit"] = gasLimit;
    obj["gasPrice"] = gasPrice;
    obj["chainId"] = chainId;
    return obj.ToJSON();
}

std::optional<Transaction> Transaction::FromJSON(const std::string& json) {
    auto parsed = util::JSONValue::TryParse(json);
    if (!parsed || !parsed->IsObject()) {
        return std::nullopt;
    }
    const util::JSONValue& obj = *parsed;

    if (!obj["to"].IsString() || !obj["value"].IsString() ||
        !obj["data"].IsString() || !obj["gasPrice"].IsString()) {
        return std::nullopt;
    }
    auto nonce = GetUnsigned(obj["nonce"]);
    auto gasLimit = GetUnsigned(obj["gasLimit"]);
    auto chainId = GetUnsigned(obj["chainId"]);
    if (!nonce || !gasLimit || !chainId) {
        return std::nullopt;
    }

    Transaction tx;
    tx.to = obj["to"].GetString();
    tx.value = obj["value"].GetString();
    tx.data = obj["data"].GetString();
    tx.gasPrice = obj["gasPrice"].GetString();
    tx.nonce = *nonce;
    tx.gasLimit = *gasLimit;
    tx.chainId = *chainId;
    return tx;
}

bool Transaction::operator==(const Transaction& other) const {
    return to == other.to && value == other.value && data == other.data &&
           nonce == other.nonce && gasLimit == other.gasLimit &&
           gasPrice == other.gasPrice && chainId == other.chainId;
}

// ============================================================================
// Secp256k1Signer
// ============================================================================

std::string Secp256k1Signer::SignTransaction(const std::string& privateKeyHex,
                                             const Transaction& tx) {
    Bytes privateKey = ParsePrivateKey(privateKeyHex);

    Bytes payload = StringToBytes(tx.ToCanonicalJSON());
    Hash256 digest = SHA3_256Hash(payload);

    auto signature = secp256k1::SignCompact(digest, privateKey);
    OPENSSL_cleanse(privateKey.data(), privateKey.size());
    if (!signature) {
        throw std::invalid_argument("private key is not a valid secp256k1 scalar");
    }

    return With0x(BytesToHex(payload) + BytesToHex(*signature));
}

std::string Secp256k1Signer::DeriveAddress(const std::string& privateKeyHex) {
    return AddressFromPrivateKey(privateKeyHex);
}

bool Secp256k1Signer::VerifyTransaction(const std::string& signature,
                                        const std::string& publicKeyHex) {
    Bytes raw;
    Bytes publicKey;
    try {
        raw = HexToBytes(Strip0x(signature));
        publicKey = HexToBytes(Strip0x(publicKeyHex));
    } catch (const std::invalid_argument&) {
        return false;
    }
    if (signature.compare(0, 2, "0x") != 0 ||
        raw.size() <= secp256k1::COMPACT_SIGNATURE_SIZE) {
        return false;
    }

    size_t payloadSize = raw.size() - secp256k1::COMPACT_SIGNATURE_SIZE;
    Hash256 digest = SHA3_256Hash(raw.data(), payloadSize);
    Bytes compact(raw.begin() + static_cast<std::ptrdiff_t>(payloadSize), raw.end());

    return secp256k1::VerifyCompact(digest, compact, publicKey);
}

std::optional<Transaction> Secp256k1Signer::DecodePayload(const std::string& signature) {
    Bytes raw;
    try {
        raw = HexToBytes(Strip0x(signature));
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    }
    if (raw.size() <= secp256k1::COMPACT_SIGNATURE_SIZE) {
        return std::nullopt;
    }

    std::string payload(raw.begin(),
                        raw.end() - static_cast<std::ptrdiff_t>(secp256k1::COMPACT_SIGNATURE_SIZE));
    return Transaction::FromJSON(payload);
}

} // namespace wallet
} // namespace aether
