// AETHER - HMAC Implementation
// Copyright (c) 2024 AETHER Developers
// MIT License

#include <aether/crypto/hmac.h>
#include <aether/core/hex.h>

#include <openssl/core_names.h>
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/params.h>

#include <stdexcept>

namespace aether {

namespace {

struct MacFree { void operator()(EVP_MAC* p) const { EVP_MAC_free(p); } };
struct MacCtxFree { void operator()(EVP_MAC_CTX* p) const { EVP_MAC_CTX_free(p); } };

// EVP_MAC_init rejects a null key pointer even for zero length
const unsigned char EMPTY_KEY[1] = {0};

} // anonymous namespace

struct HMAC_SHA256::Impl {
    std::unique_ptr<EVP_MAC, MacFree> mac;
    std::unique_ptr<EVP_MAC_CTX, MacCtxFree> ctx;
    Bytes key;

    ~Impl() {
        if (!key.empty()) {
            OPENSSL_cleanse(key.data(), key.size());
        }
    }

    void Init() {
        char digest[] = "SHA256";
        OSSL_PARAM params[] = {
            OSSL_PARAM_construct_utf8_string(OSSL_MAC_PARAM_DIGEST, digest, 0),
            OSSL_PARAM_construct_end()
        };
        const unsigned char* k = key.empty() ? EMPTY_KEY : key.data();
        if (EVP_MAC_init(ctx.get(), k, key.size(), params) != 1) {
            throw std::runtime_error("HMAC_SHA256: init failed");
        }
    }
};

HMAC_SHA256::HMAC_SHA256(const Byte* key, size_t keyLen)
    : impl_(std::make_unique<Impl>()) {
    impl_->mac.reset(EVP_MAC_fetch(nullptr, "HMAC", nullptr));
    if (!impl_->mac) {
        throw std::runtime_error("HMAC_SHA256: HMAC unavailable");
    }
    impl_->ctx.reset(EVP_MAC_CTX_new(impl_->mac.get()));
    if (!impl_->ctx) {
        throw std::runtime_error("HMAC_SHA256: context allocation failed");
    }
    if (keyLen > 0) {
        impl_->key.assign(key, key + keyLen);
    }
    impl_->Init();
}

HMAC_SHA256::~HMAC_SHA256() = default;

HMAC_SHA256& HMAC_SHA256::Write(const Byte* data, size_t len) {
    if (len > 0 && EVP_MAC_update(impl_->ctx.get(), data, len) != 1) {
        throw std::runtime_error("HMAC_SHA256: update failed");
    }
    return *this;
}

Hash256 HMAC_SHA256::Finalize() {
    Hash256 out;
    size_t outLen = 0;
    if (EVP_MAC_final(impl_->ctx.get(), out.data(), &outLen, out.size()) != 1 ||
        outLen != OUTPUT_SIZE) {
        throw std::runtime_error("HMAC_SHA256: final failed");
    }
    return out;
}

HMAC_SHA256& HMAC_SHA256::Reset() {
    impl_->Init();
    return *this;
}

// ============================================================================
// Convenience Functions
// ============================================================================

Hash256 ComputeHMAC_SHA256(const Bytes& key, const Bytes& data) {
    HMAC_SHA256 hmac(key);
    hmac.Write(data.data(), data.size());
    return hmac.Finalize();
}

std::string HMACSHA256Hex(const std::string& key, const std::string& data) {
    HMAC_SHA256 hmac(reinterpret_cast<const Byte*>(key.data()), key.size());
    hmac.Write(data);
    Hash256 mac = hmac.Finalize();
    return BytesToHex(mac.data(), mac.size());
}

} // namespace aether
