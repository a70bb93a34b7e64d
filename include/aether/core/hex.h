// AETHER - Hex Encoding/Decoding Utilities
// Copyright (c) 2024 AETHER Developers
// MIT License

#ifndef AETHER_CORE_HEX_H
#define AETHER_CORE_HEX_H

#include <aether/core/types.h>

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace aether {

/// Convert bytes to lowercase hex string
std::string BytesToHex(const Byte* data, size_t len);
std::string BytesToHex(const Bytes& data);

/// Convert hex string to bytes
/// @throws std::invalid_argument on odd length or non-hex characters
Bytes HexToBytes(const std::string& hex);

/// Check if string is non-empty, even-length hex
bool IsValidHex(const std::string& str);

/// Value of a single hex digit, or -1
int HexDigitValue(char c);

/// Parse an unsigned big-endian hex number of at most 15 digits
/// @throws std::invalid_argument on empty, oversized or non-hex input
uint64_t ParseHexNumber(const std::string& hex);

/// Prepend "0x"
inline std::string With0x(const std::string& hex) {
    return "0x" + hex;
}

/// Strip a leading "0x"/"0X" if present
std::string Strip0x(const std::string& hex);

} // namespace aether

#endif // AETHER_CORE_HEX_H
