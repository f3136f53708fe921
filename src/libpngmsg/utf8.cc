//
// Created by igor on 04/09/2025.
//

#include "utf8.hh"
#include <cstdint>

namespace pngmsg {

    std::size_t find_invalid_utf8(const std::byte* data, std::size_t size) {
        std::size_t i = 0;
        while (i < size) {
            auto c = static_cast<std::uint8_t>(data[i]);
            if (c < 0x80) {
                ++i;
                continue;
            }

            std::size_t extra;
            std::uint8_t lo = 0x80;
            std::uint8_t hi = 0xBF;
            if (c >= 0xC2 && c <= 0xDF) {
                extra = 1;
            } else if (c >= 0xE0 && c <= 0xEF) {
                extra = 2;
                if (c == 0xE0) {
                    lo = 0xA0;      // overlong
                } else if (c == 0xED) {
                    hi = 0x9F;      // surrogates
                }
            } else if (c >= 0xF0 && c <= 0xF4) {
                extra = 3;
                if (c == 0xF0) {
                    lo = 0x90;      // overlong
                } else if (c == 0xF4) {
                    hi = 0x8F;      // above U+10FFFF
                }
            } else {
                return i;
            }

            if (size - i <= extra) {
                return i;
            }
            for (std::size_t k = 1; k <= extra; ++k) {
                auto cc = static_cast<std::uint8_t>(data[i + k]);
                // only the first continuation byte has a narrowed range
                if (k == 1 ? (cc < lo || cc > hi) : (cc < 0x80 || cc > 0xBF)) {
                    return i;
                }
            }
            i += extra + 1;
        }
        return size;
    }
}
