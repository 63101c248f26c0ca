#pragma once

#include "terminal/terminal.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace minimap {

// U+2580 UPPER HALF BLOCK
constexpr uint32_t DEFAULT_GLYPH_CODEPOINT = 0x2580;

std::string default_glyph();

struct RenderedCell {
    TermColor color;
    bool blank = false;
};

struct RenderedLine {
    std::vector<RenderedCell> cells;
};

class MinimapEmitter {
public:
    explicit MinimapEmitter(ColorMode mode, std::string glyph = default_glyph());

    // Appends one terminal row, terminator included. Runs of equal color share a
    // single escape and a row that set a color always ends with a reset.
    void emit(const RenderedLine& line, std::string& out) const;

    ColorMode mode() const { return mode_; }
    const std::string& glyph() const { return glyph_; }

private:
    ColorMode mode_;
    std::string glyph_;
};

}
