// AETHER - Secure Random Number Generation Header
// Copyright (c) 2024 AETHER Developers
// MIT License
//
// Cryptographically secure random bytes from the OS entropy source.
// Only wallet creation draws on it; every derivation after that is
// deterministic.

#ifndef AETHER_CORE_RANDOM_H
#define AETHER_CORE_RANDOM_H

#include <aether/core/types.h>

#include <cstddef>
#include <cstdint>

namespace aether {

/// Fill buffer with cryptographically secure random bytes
/// Uses getrandom on Linux, arc4random_buf on macOS/BSD
/// @throws std::runtime_error if the OS refuses to supply entropy
void GetRandBytes(uint8_t* buf, size_t len);

/// Return @p len fresh random bytes
Bytes GetRandBytes(size_t len);

namespace detail {

/// Get entropy from OS; returns false on failure
bool GetOSEntropy(uint8_t* buf, size_t len);

} // namespace detail

} // namespace aether

#endif // AETHER_CORE_RANDOM_H
