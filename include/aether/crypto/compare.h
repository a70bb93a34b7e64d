// AETHER - Constant-Time Comparison
// Copyright (c) 2024 AETHER Developers
// MIT License

#ifndef AETHER_CRYPTO_COMPARE_H
#define AETHER_CRYPTO_COMPARE_H

#include <string>

namespace aether {

/**
 * Constant-time string comparison.
 *
 * Strings of unequal length fail immediately (length is public: every
 * digest compared here has a fixed size). Equal-length strings are
 * XOR-accumulated over their full length, so time does not depend on
 * where they differ.
 */
bool ConstantTimeEquals(const std::string& a, const std::string& b);

} // namespace aether

#endif // AETHER_CRYPTO_COMPARE_H
