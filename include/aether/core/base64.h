// AETHER - Base64 Encoding/Decoding
// Copyright (c) 2024 AETHER Developers
// MIT License
//
// Standard (RFC 4648) base64 with padding, backed by OpenSSL's EVP block
// encoder. Used for every ciphertext the library emits.

#ifndef AETHER_CORE_BASE64_H
#define AETHER_CORE_BASE64_H

#include <aether/core/types.h>

#include <optional>
#include <string>

namespace aether {

/// Encode bytes as padded base64
std::string EncodeBase64(const Bytes& data);

/// Encode a string's bytes as padded base64
inline std::string EncodeBase64(const std::string& data) {
    return EncodeBase64(StringToBytes(data));
}

/// Decode padded base64
/// @return Decoded bytes, or nullopt if the input is not canonical base64
std::optional<Bytes> DecodeBase64(const std::string& encoded);

} // namespace aether

#endif // AETHER_CORE_BASE64_H
