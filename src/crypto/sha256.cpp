// AETHER - SHA256 Implementation
// Copyright (c) 2024 AETHER Developers
// MIT License

#include <aether/crypto/sha256.h>
#include <aether/core/hex.h>
#include "openssl_util.h"

#include <stdexcept>

namespace aether {

struct SHA256::Impl {
    ossl::MdCtxPtr ctx{EVP_MD_CTX_new()};

    void Init() {
        if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
            throw std::runtime_error("SHA256: digest init failed");
        }
    }
};

SHA256::SHA256() : impl_(std::make_unique<Impl>()) {
    impl_->Init();
}

SHA256::~SHA256() = default;

SHA256& SHA256::Write(const Byte* data, size_t len) {
    if (len > 0 && EVP_DigestUpdate(impl_->ctx.get(), data, len) != 1) {
        throw std::runtime_error("SHA256: digest update failed");
    }
    return *this;
}

void SHA256::Finalize(Byte hash[OUTPUT_SIZE]) {
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(impl_->ctx.get(), hash, &len) != 1 || len != OUTPUT_SIZE) {
        throw std::runtime_error("SHA256: digest final failed");
    }
}

SHA256& SHA256::Reset() {
    impl_->Init();
    return *this;
}

// ============================================================================
// Convenience Functions
// ============================================================================

Hash256 SHA256Hash(const Byte* data, size_t len) {
    Hash256 out;
    ossl::Digest(EVP_sha256(), data, len, out.data());
    return out;
}

std::string SHA256Hex(const std::string& data) {
    Hash256 h = SHA256Hash(data);
    return BytesToHex(h.data(), h.size());
}

std::string SHA256Hex(const Bytes& data) {
    Hash256 h = SHA256Hash(data);
    return BytesToHex(h.data(), h.size());
}

} // namespace aether
