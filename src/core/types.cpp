// AETHER - Core Types Implementation
// Copyright (c) 2024 AETHER Developers
// MIT License

#include <aether/core/types.h>

namespace aether {

bool IsValidUTF8(const std::string& str) {
    const auto* s = reinterpret_cast<const unsigned char*>(str.data());
    size_t len = str.size();
    size_t i = 0;

    while (i < len) {
        unsigned char c = s[i];
        if (c < 0x80) {
            ++i;
            continue;
        }

        size_t need;
        uint32_t cp;
        if ((c & 0xE0) == 0xC0) {
            need = 1;
            cp = c & 0x1F;
        } else if ((c & 0xF0) == 0xE0) {
            need = 2;
            cp = c & 0x0F;
        } else if ((c & 0xF8) == 0xF0) {
            need = 3;
            cp = c & 0x07;
        } else {
            return false;
        }

        if (i + need >= len) {
            return false;
        }
        for (size_t k = 1; k <= need; ++k) {
            unsigned char cc = s[i + k];
            if ((cc & 0xC0) != 0x80) {
                return false;
            }
            cp = (cp << 6) | (cc & 0x3F);
        }

        // Overlong forms
        if ((need == 1 && cp < 0x80) ||
            (need == 2 && cp < 0x800) ||
            (need == 3 && cp < 0x10000)) {
            return false;
        }
        if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
            return false;
        }

        i += need + 1;
    }

    return true;
}

} // namespace aether
