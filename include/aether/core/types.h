// AETHER - Core Types Header
// Copyright (c) 2024 AETHER Developers
// MIT License
//
// Fundamental types and small helpers shared by every layer.

#ifndef AETHER_CORE_TYPES_H
#define AETHER_CORE_TYPES_H

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace aether {

// ============================================================================
// Basic Types
// ============================================================================

/// Single byte type
using Byte = uint8_t;

/// Owned byte buffer
using Bytes = std::vector<Byte>;

/// 256-bit digest
using Hash256 = std::array<Byte, 32>;

// ============================================================================
// Time Functions
// ============================================================================

/// Get current Unix timestamp
inline int64_t GetTime() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

/// Get current time in milliseconds
inline int64_t GetTimeMillis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

// ============================================================================
// String <-> Bytes
// ============================================================================

/// View the UTF-8 code units of a string as bytes
inline Bytes StringToBytes(const std::string& str) {
    return Bytes(str.begin(), str.end());
}

/// Reinterpret a byte buffer as a string
inline std::string BytesToString(const Bytes& data) {
    return std::string(data.begin(), data.end());
}

/// Check that a byte sequence is well-formed UTF-8
/// Rejects overlong encodings, surrogates and code points above U+10FFFF.
bool IsValidUTF8(const std::string& str);

} // namespace aether

#endif // AETHER_CORE_TYPES_H
