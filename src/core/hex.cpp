// AETHER - Hex Encoding/Decoding Implementation
// Copyright (c) 2024 AETHER Developers
// MIT License

#include <aether/core/hex.h>

namespace aether {

namespace {
    constexpr char HEX_CHARS[] = "0123456789abcdef";
}

int HexDigitValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string BytesToHex(const Byte* data, size_t len) {
    std::string result;
    result.reserve(len * 2);

    for (size_t i = 0; i < len; ++i) {
        result.push_back(HEX_CHARS[data[i] >> 4]);
        result.push_back(HEX_CHARS[data[i] & 0x0F]);
    }

    return result;
}

std::string BytesToHex(const Bytes& data) {
    return BytesToHex(data.data(), data.size());
}

Bytes HexToBytes(const std::string& hex) {
    if (hex.length() % 2 != 0) {
        throw std::invalid_argument("Hex string must have even length");
    }

    Bytes result;
    result.reserve(hex.length() / 2);

    for (size_t i = 0; i < hex.length(); i += 2) {
        int high = HexDigitValue(hex[i]);
        int low = HexDigitValue(hex[i + 1]);

        if (high < 0 || low < 0) {
            throw std::invalid_argument("Invalid hex character");
        }

        result.push_back(static_cast<Byte>((high << 4) | low));
    }

    return result;
}

bool IsValidHex(const std::string& str) {
    if (str.empty() || str.length() % 2 != 0) {
        return false;
    }

    for (char c : str) {
        if (HexDigitValue(c) < 0) {
            return false;
        }
    }

    return true;
}

uint64_t ParseHexNumber(const std::string& hex) {
    if (hex.empty() || hex.length() > 15) {
        throw std::invalid_argument("Hex number must have 1 to 15 digits");
    }

    uint64_t value = 0;
    for (char c : hex) {
        int nibble = HexDigitValue(c);
        if (nibble < 0) {
            throw std::invalid_argument("Invalid hex character");
        }
        value = (value << 4) | static_cast<uint64_t>(nibble);
    }
    return value;
}

std::string Strip0x(const std::string& hex) {
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
        return hex.substr(2);
    }
    return hex;
}

} // namespace aether
