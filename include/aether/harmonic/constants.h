// AETHER - Harmonic Constants
// Copyright (c) 2024 AETHER Developers
// MIT License
//
// Fixed numeric table shared by the harmonic and quantum layers. Values are
// compile-time constants; index only through the accessors below, which wrap
// the index around the table size.

#ifndef AETHER_HARMONIC_CONSTANTS_H
#define AETHER_HARMONIC_CONSTANTS_H

#include <cstddef>
#include <cstdint>
#include <string>

namespace aether {
namespace harmonic {

// ============================================================================
// Tables
// ============================================================================

/// A ratio with the exact decimal text used when it is mixed into a hash
struct SacredRatio {
    double value;
    const char* text;
};

constexpr size_t OCTAVE_COUNT = 12;
constexpr size_t PHASE_SHIFT_COUNT = 3;
constexpr size_t RATIO_COUNT = 9;

/// Twelve harmonic frequencies in Hz
constexpr uint32_t HARMONIC_OCTAVES[OCTAVE_COUNT] = {
    174, 285, 396, 417, 432, 528, 639, 741, 852, 963, 1074, 1185
};

constexpr double PHASE_SHIFTS[PHASE_SHIFT_COUNT] = {
    0.0, 1.0 / 3.0, 2.0 / 3.0
};

constexpr SacredRatio PHI{1.618033988749895, "1.618033988749895"};
constexpr SacredRatio PHI_CONJUGATE{0.618033988749895, "0.618033988749895"};
constexpr SacredRatio SQRT_TWO{1.4142135623730951, "1.4142135623730951"};
constexpr SacredRatio SQRT_THREE{1.7320508075688772, "1.7320508075688772"};
constexpr SacredRatio SQRT_FIVE{2.23606797749979, "2.23606797749979"};
constexpr SacredRatio PI{3.141592653589793, "3.141592653589793"};
constexpr SacredRatio E{2.718281828459045, "2.718281828459045"};
constexpr SacredRatio FIBONACCI_12{144.0, "144"};
constexpr SacredRatio FIBONACCI_13{233.0, "233"};

/// Ordered as they are consumed by seed and state derivation
constexpr SacredRatio SACRED_RATIOS[RATIO_COUNT] = {
    PHI, PHI_CONJUGATE, SQRT_TWO, SQRT_THREE, SQRT_FIVE,
    PI, E, FIBONACCI_12, FIBONACCI_13
};

/// Domain separator appended to passphrases before hashing
constexpr const char* HARMONIC_SALT = "aether:torus-field:harmonic";

// ============================================================================
// Accessors
// ============================================================================

constexpr uint32_t Octave(size_t i) {
    return HARMONIC_OCTAVES[i % OCTAVE_COUNT];
}

constexpr double PhaseShift(size_t i) {
    return PHASE_SHIFTS[i % PHASE_SHIFT_COUNT];
}

constexpr const SacredRatio& Ratio(size_t i) {
    return SACRED_RATIOS[i % RATIO_COUNT];
}

/// Shortest decimal text (15 to 17 significant digits) that reads back to the
/// same double, as mixed into lattice salts
std::string FormatNumber(double value);

} // namespace harmonic
} // namespace aether

#endif // AETHER_HARMONIC_CONSTANTS_H
