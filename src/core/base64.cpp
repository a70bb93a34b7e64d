// AETHER - Base64 Implementation
// Copyright (c) 2024 AETHER Developers
// MIT License

#include <aether/core/base64.h>

#include <openssl/evp.h>

#include <cctype>

namespace aether {

namespace {

bool IsBase64Char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '/';
}

} // anonymous namespace

std::string EncodeBase64(const Bytes& data) {
    if (data.empty()) {
        return "";
    }

    std::string out(4 * ((data.size() + 2) / 3), '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                                  data.data(), static_cast<int>(data.size()));
    if (written < 0) {
        return "";
    }
    out.resize(static_cast<size_t>(written));
    return out;
}

std::optional<Bytes> DecodeBase64(const std::string& encoded) {
    if (encoded.empty()) {
        return Bytes{};
    }
    if (encoded.size() % 4 != 0) {
        return std::nullopt;
    }

    // EVP_DecodeBlock tolerates surrounding whitespace; we do not
    size_t padding = 0;
    for (size_t i = 0; i < encoded.size(); ++i) {
        char c = encoded[i];
        if (c == '=') {
            if (i < encoded.size() - 2) {
                return std::nullopt;
            }
            ++padding;
        } else if (padding > 0 || !IsBase64Char(c)) {
            return std::nullopt;
        }
    }

    Bytes out(3 * (encoded.size() / 4));
    int written = EVP_DecodeBlock(out.data(),
                                  reinterpret_cast<const unsigned char*>(encoded.data()),
                                  static_cast<int>(encoded.size()));
    if (written < 0 || static_cast<size_t>(written) < padding) {
        return std::nullopt;
    }
    out.resize(static_cast<size_t>(written) - padding);
    return out;
}

} // namespace aether
