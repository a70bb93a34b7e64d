// AETHER - AES Implementation
// Copyright (c) 2024 AETHER Developers
// MIT License

#include <aether/crypto/aes.h>
#include "openssl_util.h"

#include <openssl/crypto.h>

namespace aether {

Bytes AES128CBCEncrypt(const Bytes& plaintext, const AESKey128& key, const AESIV& iv) {
    ossl::CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx || EVP_EncryptInit_ex(ctx.get(), EVP_aes_128_cbc(), nullptr,
                                   key.data(), iv.data()) != 1) {
        throw AESError("AES: encrypt init failed");
    }

    Bytes out(plaintext.size() + aes::BLOCK_SIZE);
    int len = 0;
    int total = 0;
    if (!plaintext.empty()) {
        if (EVP_EncryptUpdate(ctx.get(), out.data(), &len, plaintext.data(),
                              static_cast<int>(plaintext.size())) != 1) {
            throw AESError("AES: encrypt update failed");
        }
        total = len;
    }
    if (EVP_EncryptFinal_ex(ctx.get(), out.data() + total, &len) != 1) {
        throw AESError("AES: encrypt final failed");
    }
    total += len;
    out.resize(static_cast<size_t>(total));
    return out;
}

Bytes AES128CBCDecrypt(const Bytes& ciphertext, const AESKey128& key, const AESIV& iv) {
    if (ciphertext.empty() || ciphertext.size() % aes::BLOCK_SIZE != 0) {
        throw AESError("AES: ciphertext length is not a multiple of the block size");
    }

    ossl::CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx || EVP_DecryptInit_ex(ctx.get(), EVP_aes_128_cbc(), nullptr,
                                   key.data(), iv.data()) != 1) {
        throw AESError("AES: decrypt init failed");
    }

    Bytes out(ciphertext.size() + aes::BLOCK_SIZE);
    int len = 0;
    if (EVP_DecryptUpdate(ctx.get(), out.data(), &len, ciphertext.data(),
                          static_cast<int>(ciphertext.size())) != 1) {
        OPENSSL_cleanse(out.data(), out.size());
        throw AESError("AES: decrypt update failed");
    }
    int total = len;
    if (EVP_DecryptFinal_ex(ctx.get(), out.data() + total, &len) != 1) {
        OPENSSL_cleanse(out.data(), out.size());
        throw AESError("AES: invalid padding");
    }
    total += len;
    out.resize(static_cast<size_t>(total));
    return out;
}

} // namespace aether
