// AETHER - Address Derivation Implementation
// Copyright (c) 2024 AETHER Developers
// MIT License

#include <aether/wallet/address.h>

#include <aether/core/hex.h>
#include <aether/crypto/secp256k1.h>
#include <aether/crypto/sha3.h>

#include <openssl/crypto.h>

#include <stdexcept>

namespace aether {
namespace wallet {

std::string AddressFromPublicKey(const Bytes& publicKey) {
    if (publicKey.size() != secp256k1::UNCOMPRESSED_PUBKEY_SIZE || publicKey[0] != 0x04) {
        throw std::invalid_argument("address requires an uncompressed public key");
    }

    Hash256 hash = SHA3_256Hash(publicKey.data() + 1, publicKey.size() - 1);
    return With0x(BytesToHex(hash.data() + hash.size() - ADDRESS_SIZE, ADDRESS_SIZE));
}

std::string AddressFromPrivateKey(const std::string& privateKeyHex) {
    Bytes privateKey = HexToBytes(Strip0x(privateKeyHex));
    if (privateKey.size() != secp256k1::PRIVATE_KEY_SIZE) {
        OPENSSL_cleanse(privateKey.data(), privateKey.size());
        throw std::invalid_argument("private key must be 32 bytes");
    }

    auto publicKey = secp256k1::DerivePublicKey(privateKey, false);
    OPENSSL_cleanse(privateKey.data(), privateKey.size());
    if (!publicKey) {
        throw std::invalid_argument("private key is not a valid secp256k1 scalar");
    }

    return AddressFromPublicKey(*publicKey);
}

bool IsValidAddress(const std::string& address) {
    if (address.size() != 2 + ADDRESS_SIZE * 2 || Strip0x(address).size() != ADDRESS_SIZE * 2) {
        return false;
    }
    return IsValidHex(Strip0x(address));
}

} // namespace wallet
} // namespace aether
