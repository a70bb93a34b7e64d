// AETHER - secp256k1 Implementation
// Copyright (c) 2024 AETHER Developers
// MIT License

#include <aether/crypto/secp256k1.h>
#include "openssl_util.h"

#include <openssl/obj_mac.h>

#include <stdexcept>

namespace aether {
namespace secp256k1 {

namespace {

ossl::ECGroupPtr NewGroup() {
    ossl::ECGroupPtr group(EC_GROUP_new_by_curve_name(NID_secp256k1));
    if (!group) {
        throw std::runtime_error("secp256k1: curve unavailable");
    }
    return group;
}

/// Build an EC_KEY carrying both halves of the pair
ossl::ECKeyPtr KeyFromPrivate(const Bytes& privateKey) {
    ossl::ECKeyPtr key(EC_KEY_new_by_curve_name(NID_secp256k1));
    if (!key) {
        throw std::runtime_error("secp256k1: key allocation failed");
    }
    const EC_GROUP* group = EC_KEY_get0_group(key.get());

    ossl::BNPtr k(BN_bin2bn(privateKey.data(), static_cast<int>(privateKey.size()), nullptr));
    ossl::ECPointPtr pub(EC_POINT_new(group));
    ossl::BNCtxPtr ctx(BN_CTX_new());
    if (!k || !pub || !ctx ||
        EC_POINT_mul(group, pub.get(), k.get(), nullptr, nullptr, ctx.get()) != 1 ||
        EC_KEY_set_private_key(key.get(), k.get()) != 1 ||
        EC_KEY_set_public_key(key.get(), pub.get()) != 1) {
        throw std::runtime_error("secp256k1: key setup failed");
    }
    return key;
}

} // anonymous namespace

// ============================================================================
// Keys
// ============================================================================

bool IsValidPrivateKey(const Byte* key) {
    auto group = NewGroup();
    const BIGNUM* order = EC_GROUP_get0_order(group.get());

    ossl::BNPtr k(BN_bin2bn(key, static_cast<int>(PRIVATE_KEY_SIZE), nullptr));
    if (!k) {
        throw std::runtime_error("secp256k1: bignum allocation failed");
    }
    return !BN_is_zero(k.get()) && BN_cmp(k.get(), order) < 0;
}

std::optional<Bytes> DerivePublicKey(const Bytes& privateKey, bool compressed) {
    if (!IsValidPrivateKey(privateKey)) {
        return std::nullopt;
    }

    auto group = NewGroup();
    ossl::BNCtxPtr ctx(BN_CTX_new());
    ossl::BNPtr k(BN_bin2bn(privateKey.data(), static_cast<int>(privateKey.size()), nullptr));
    ossl::ECPointPtr pub(EC_POINT_new(group.get()));
    if (!ctx || !k || !pub ||
        EC_POINT_mul(group.get(), pub.get(), k.get(), nullptr, nullptr, ctx.get()) != 1) {
        throw std::runtime_error("secp256k1: point multiplication failed");
    }

    point_conversion_form_t form = compressed ? POINT_CONVERSION_COMPRESSED
                                              : POINT_CONVERSION_UNCOMPRESSED;
    size_t len = EC_POINT_point2oct(group.get(), pub.get(), form, nullptr, 0, ctx.get());
    Bytes out(len);
    if (len == 0 ||
        EC_POINT_point2oct(group.get(), pub.get(), form, out.data(), len, ctx.get()) != len) {
        throw std::runtime_error("secp256k1: point serialization failed");
    }
    return out;
}

// ============================================================================
// ECDSA
// ============================================================================

std::optional<Bytes> SignCompact(const Hash256& hash, const Bytes& privateKey) {
    if (!IsValidPrivateKey(privateKey)) {
        return std::nullopt;
    }

    auto key = KeyFromPrivate(privateKey);
    ossl::ECDSASigPtr sig(ECDSA_do_sign(hash.data(), static_cast<int>(hash.size()), key.get()));
    if (!sig) {
        throw std::runtime_error("secp256k1: signing failed");
    }

    const BIGNUM* r = nullptr;
    const BIGNUM* s = nullptr;
    ECDSA_SIG_get0(sig.get(), &r, &s);

    // Low-S: s and n - s both verify; keep the smaller
    const BIGNUM* order = EC_GROUP_get0_order(EC_KEY_get0_group(key.get()));
    ossl::BNPtr half(BN_dup(order));
    ossl::BNPtr sNorm(BN_dup(s));
    if (!half || !sNorm || BN_rshift1(half.get(), half.get()) != 1) {
        throw std::runtime_error("secp256k1: bignum allocation failed");
    }
    if (BN_cmp(sNorm.get(), half.get()) > 0 &&
        BN_sub(sNorm.get(), order, sNorm.get()) != 1) {
        throw std::runtime_error("secp256k1: s normalization failed");
    }

    Bytes out(COMPACT_SIGNATURE_SIZE);
    if (BN_bn2binpad(r, out.data(), 32) != 32 ||
        BN_bn2binpad(sNorm.get(), out.data() + 32, 32) != 32) {
        throw std::runtime_error("secp256k1: signature serialization failed");
    }
    return out;
}

bool VerifyCompact(const Hash256& hash, const Bytes& signature, const Bytes& publicKey) {
    if (signature.size() != COMPACT_SIGNATURE_SIZE || publicKey.empty()) {
        return false;
    }

    ossl::ECKeyPtr key(EC_KEY_new_by_curve_name(NID_secp256k1));
    if (!key) {
        throw std::runtime_error("secp256k1: key allocation failed");
    }
    const EC_GROUP* group = EC_KEY_get0_group(key.get());
    ossl::ECPointPtr point(EC_POINT_new(group));
    if (!point ||
        EC_POINT_oct2point(group, point.get(), publicKey.data(), publicKey.size(), nullptr) != 1 ||
        EC_KEY_set_public_key(key.get(), point.get()) != 1) {
        return false;
    }

    ossl::BNPtr r(BN_bin2bn(signature.data(), 32, nullptr));
    ossl::BNPtr s(BN_bin2bn(signature.data() + 32, 32, nullptr));
    ossl::ECDSASigPtr sig(ECDSA_SIG_new());
    if (!r || !s || !sig) {
        throw std::runtime_error("secp256k1: signature allocation failed");
    }
    // set0 takes ownership of r and s
    if (ECDSA_SIG_set0(sig.get(), r.get(), s.get()) != 1) {
        return false;
    }
    r.release();
    s.release();

    return ECDSA_do_verify(hash.data(), static_cast<int>(hash.size()), sig.get(), key.get()) == 1;
}

} // namespace secp256k1
} // namespace aether
