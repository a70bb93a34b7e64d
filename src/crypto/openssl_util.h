// AETHER - OpenSSL ownership helpers
// Copyright (c) 2024 AETHER Developers
// MIT License
//
// Private to src/crypto. unique_ptr aliases that pair each OpenSSL object
// with its free function, and a one-shot digest used by the hash wrappers.

#ifndef AETHER_CRYPTO_OPENSSL_UTIL_H
#define AETHER_CRYPTO_OPENSSL_UTIL_H

#include <openssl/bn.h>
#include <openssl/ec.h>
#include <openssl/ecdsa.h>
#include <openssl/evp.h>

#include <cstddef>
#include <memory>
#include <stdexcept>

namespace aether {
namespace ossl {

struct MdCtxFree { void operator()(EVP_MD_CTX* p) const { EVP_MD_CTX_free(p); } };
struct CipherCtxFree { void operator()(EVP_CIPHER_CTX* p) const { EVP_CIPHER_CTX_free(p); } };
struct BNFree { void operator()(BIGNUM* p) const { BN_clear_free(p); } };
struct BNCtxFree { void operator()(BN_CTX* p) const { BN_CTX_free(p); } };
struct ECGroupFree { void operator()(EC_GROUP* p) const { EC_GROUP_free(p); } };
struct ECKeyFree { void operator()(EC_KEY* p) const { EC_KEY_free(p); } };
struct ECPointFree { void operator()(EC_POINT* p) const { EC_POINT_free(p); } };
struct ECDSASigFree { void operator()(ECDSA_SIG* p) const { ECDSA_SIG_free(p); } };

using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, MdCtxFree>;
using CipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxFree>;
using BNPtr = std::unique_ptr<BIGNUM, BNFree>;
using BNCtxPtr = std::unique_ptr<BN_CTX, BNCtxFree>;
using ECGroupPtr = std::unique_ptr<EC_GROUP, ECGroupFree>;
using ECKeyPtr = std::unique_ptr<EC_KEY, ECKeyFree>;
using ECPointPtr = std::unique_ptr<EC_POINT, ECPointFree>;
using ECDSASigPtr = std::unique_ptr<ECDSA_SIG, ECDSASigFree>;

/// Digest @p len bytes with @p md into @p out (EVP_MD_size(md) bytes)
/// @throws std::runtime_error on any OpenSSL failure
inline void Digest(const EVP_MD* md, const unsigned char* data, size_t len,
                   unsigned char* out) {
    MdCtxPtr ctx(EVP_MD_CTX_new());
    unsigned int outLen = 0;
    if (!ctx ||
        EVP_DigestInit_ex(ctx.get(), md, nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), data, len) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), out, &outLen) != 1) {
        throw std::runtime_error("OpenSSL digest failed");
    }
}

} // namespace ossl
} // namespace aether

#endif // AETHER_CRYPTO_OPENSSL_UTIL_H
