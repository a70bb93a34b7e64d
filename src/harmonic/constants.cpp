// AETHER - Harmonic Constants
// Copyright (c) 2024 AETHER Developers
// MIT License

#include <aether/harmonic/constants.h>

#include <cstdio>
#include <cstdlib>

namespace aether {
namespace harmonic {

std::string FormatNumber(double value) {
    char buf[32];
    for (int precision = 15; precision <= 17; ++precision) {
        int n = std::snprintf(buf, sizeof(buf), "%.*g", precision, value);
        if (n < 0 || static_cast<size_t>(n) >= sizeof(buf)) {
            return "";
        }
        // 17 significant digits always read back exactly
        if (precision == 17 || std::strtod(buf, nullptr) == value) {
            return std::string(buf, static_cast<size_t>(n));
        }
    }
    return "";
}

} // namespace harmonic
} // namespace aether
