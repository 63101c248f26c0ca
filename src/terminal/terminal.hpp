#pragma once

#include "core/types.hpp"
#include <string>
#include <cstdio>
#include <cstdint>

namespace minimap {

enum class ColorMode {
    None,
    Ansi256,
    Truecolor
};

const char* color_mode_name(ColorMode mode);

// A color the terminal can actually display for the active ColorMode.
struct TermColor {
    enum class Kind : uint8_t {
        Default,
        Indexed,
        Rgb
    };

    Kind kind = Kind::Default;
    uint8_t index = 0;
    uint8_t r = 0, g = 0, b = 0;

    static TermColor none() { return TermColor{}; }
    static TermColor indexed(uint8_t idx) {
        TermColor c;
        c.kind = Kind::Indexed;
        c.index = idx;
        return c;
    }
    static TermColor rgb(const Color& color) {
        TermColor c;
        c.kind = Kind::Rgb;
        c.r = color.r;
        c.g = color.g;
        c.b = color.b;
        return c;
    }

    bool operator==(const TermColor& other) const {
        if (kind != other.kind) return false;
        switch (kind) {
            case Kind::Default: return true;
            case Kind::Indexed: return index == other.index;
            case Kind::Rgb: return r == other.r && g == other.g && b == other.b;
        }
        return false;
    }
    bool operator!=(const TermColor& other) const { return !(*this == other); }
};

class Terminal {
public:
    explicit Terminal(std::FILE* out = stdout);
    ~Terminal();

    Terminal(const Terminal&) = delete;
    Terminal& operator=(const Terminal&) = delete;

    static ColorMode detect_color_mode();
    static ColorMode detect_color_mode(const char* colorterm, const char* term, const char* no_color);

    Result write(const std::string& s);
    Result flush();
    bool broken() const { return broken_; }

    static std::string color_code(const TermColor& color, bool fg = true);
    static const char* reset_code() { return "\033[0m"; }
    static uint8_t rgb_to_256(uint8_t r, uint8_t g, uint8_t b);
    static Color palette_256(uint8_t index);

private:
    std::FILE* out_;
    bool broken_ = false;

    Result check_stream_error(const char* op);
};

}
