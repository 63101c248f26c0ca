#include "terminal.hpp"
#include <cstdlib>
#include <cstring>
#include <cerrno>
#include <climits>
#include <array>

namespace minimap {

namespace {
    struct Color256Lookup {
        std::array<uint8_t, 256> r{};
        std::array<uint8_t, 256> g{};
        std::array<uint8_t, 256> b{};

        Color256Lookup() {
            const uint8_t palette[16][3] = {
                {0, 0, 0}, {128, 0, 0}, {0, 128, 0}, {128, 128, 0},
                {0, 0, 128}, {128, 0, 128}, {0, 128, 128}, {192, 192, 192},
                {128, 128, 128}, {255, 0, 0}, {0, 255, 0}, {255, 255, 0},
                {0, 0, 255}, {255, 0, 255}, {0, 255, 255}, {255, 255, 255}
            };

            for (int i = 0; i < 16; ++i) {
                r[i] = palette[i][0];
                g[i] = palette[i][1];
                b[i] = palette[i][2];
            }

            for (int i = 16; i < 232; ++i) {
                int idx = i - 16;
                int rv = idx / 36;
                int gv = (idx % 36) / 6;
                int bv = idx % 6;
                r[i] = rv ? static_cast<uint8_t>(55 + rv * 40) : 0;
                g[i] = gv ? static_cast<uint8_t>(55 + gv * 40) : 0;
                b[i] = bv ? static_cast<uint8_t>(55 + bv * 40) : 0;
            }

            for (int i = 232; i < 256; ++i) {
                uint8_t gray = static_cast<uint8_t>(8 + (i - 232) * 10);
                r[i] = g[i] = b[i] = gray;
            }
        }
    };

    const Color256Lookup& color256_lookup() {
        static const Color256Lookup lookup;
        return lookup;
    }

    // The 16 system colors are user-configurable in most terminals, so quantization
    // only targets the fixed cube and grayscale ramp.
    constexpr int FIRST_STABLE_INDEX = 16;
}

const char* color_mode_name(ColorMode mode) {
    switch (mode) {
        case ColorMode::None: return "none";
        case ColorMode::Ansi256: return "256";
        case ColorMode::Truecolor: return "truecolor";
    }
    return "none";
}

Terminal::Terminal(std::FILE* out) : out_(out) {}

Terminal::~Terminal() {
    if (!broken_ && out_) {
        std::fflush(out_);
    }
}

ColorMode Terminal::detect_color_mode() {
    return detect_color_mode(std::getenv("COLORTERM"), std::getenv("TERM"), std::getenv("NO_COLOR"));
}

ColorMode Terminal::detect_color_mode(const char* colorterm, const char* term, const char* no_color) {
    if (colorterm) {
        std::string ct(colorterm);
        if (ct == "truecolor" || ct == "24bit") {
            return ColorMode::Truecolor;
        }
    }

    if (no_color && *no_color) {
        return ColorMode::None;
    }

    if (!term || !*term) {
        return ColorMode::None;
    }

    std::string t(term);
    if (t == "dumb") {
        return ColorMode::None;
    }

    return ColorMode::Ansi256;
}

Result Terminal::write(const std::string& s) {
    if (broken_) {
        return Result::fail(ErrorCode::BROKEN_PIPE, "output closed");
    }
    if (s.empty()) return Result::ok();

    errno = 0;
    size_t written = std::fwrite(s.data(), 1, s.size(), out_);
    if (written != s.size()) {
        return check_stream_error("write");
    }
    return Result::ok();
}

Result Terminal::flush() {
    if (broken_) {
        return Result::fail(ErrorCode::BROKEN_PIPE, "output closed");
    }
    errno = 0;
    if (std::fflush(out_) != 0) {
        return check_stream_error("flush");
    }
    return Result::ok();
}

Result Terminal::check_stream_error(const char* op) {
    int err = errno;
    broken_ = true;
    std::clearerr(out_);
    if (err == EPIPE) {
        return Result::fail(ErrorCode::BROKEN_PIPE, "output closed");
    }
    std::string msg = std::string(op) + " to output failed";
    if (err != 0) {
        msg += ": ";
        msg += std::strerror(err);
    }
    return Result::fail(ErrorCode::OUTPUT_ERROR, msg);
}

std::string Terminal::color_code(const TermColor& color, bool fg) {
    char buf[32];
    switch (color.kind) {
        case TermColor::Kind::Default:
            return "";
        case TermColor::Kind::Indexed:
            std::snprintf(buf, sizeof(buf), fg ? "\033[38;5;%dm" : "\033[48;5;%dm", color.index);
            return buf;
        case TermColor::Kind::Rgb:
            std::snprintf(buf, sizeof(buf), fg ? "\033[38;2;%d;%d;%dm" : "\033[48;2;%d;%d;%dm",
                          color.r, color.g, color.b);
            return buf;
    }
    return "";
}

uint8_t Terminal::rgb_to_256(uint8_t r, uint8_t g, uint8_t b) {
    const Color256Lookup& lookup = color256_lookup();
    uint8_t best_idx = FIRST_STABLE_INDEX;
    uint32_t best_dist = UINT32_MAX;

    for (int i = FIRST_STABLE_INDEX; i < 256; ++i) {
        int dr = r - lookup.r[i];
        int dg = g - lookup.g[i];
        int db = b - lookup.b[i];
        uint32_t dist = static_cast<uint32_t>(dr*dr + dg*dg + db*db);
        if (dist < best_dist) {
            best_dist = dist;
            best_idx = static_cast<uint8_t>(i);
        }
    }

    return best_idx;
}

Color Terminal::palette_256(uint8_t index) {
    const Color256Lookup& lookup = color256_lookup();
    return {lookup.r[index], lookup.g[index], lookup.b[index]};
}

}
