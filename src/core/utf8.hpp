#pragma once

#include <string>
#include <cstdint>
#include <cstddef>

namespace minimap {

namespace utf8 {

inline bool is_continuation_byte(unsigned char c) {
    return (c & 0xC0) == 0x80;
}

// Length of the sequence introduced by a lead byte; 1 for ASCII and stray bytes.
inline size_t sequence_length(unsigned char c) {
    if (c < 0x80) return 1;
    if ((c & 0xE0) == 0xC0) return 2;
    if ((c & 0xF0) == 0xE0) return 3;
    if ((c & 0xF8) == 0xF0) return 4;
    return 1;
}

inline size_t count_codepoints(const std::string& s) {
    size_t count = 0;
    size_t i = 0;
    while (i < s.size()) {
        unsigned char c = static_cast<unsigned char>(s[i]);
        size_t len = sequence_length(c);
        if (len > 1) {
            if (i + len > s.size()) return count + 1;
            for (size_t k = 1; k < len; ++k) {
                if (!is_continuation_byte(static_cast<unsigned char>(s[i + k]))) {
                    len = 1;
                    break;
                }
            }
        }
        i += len;
        ++count;
    }
    return count;
}

inline std::string encode(uint32_t cp) {
    std::string result;
    if (cp < 0x80) {
        result += static_cast<char>(cp);
    } else if (cp < 0x800) {
        result += static_cast<char>(0xC0 | (cp >> 6));
        result += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        result += static_cast<char>(0xE0 | (cp >> 12));
        result += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        result += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        result += static_cast<char>(0xF0 | (cp >> 18));
        result += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        result += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        result += static_cast<char>(0x80 | (cp & 0x3F));
    }
    return result;
}

}

}
