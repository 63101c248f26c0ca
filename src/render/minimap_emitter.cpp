#include "minimap_emitter.hpp"
#include "core/utf8.hpp"
#include <utility>

namespace minimap {

std::string default_glyph() {
    return utf8::encode(DEFAULT_GLYPH_CODEPOINT);
}

MinimapEmitter::MinimapEmitter(ColorMode mode, std::string glyph)
    : mode_(mode), glyph_(std::move(glyph)) {
    if (glyph_.empty()) {
        glyph_ = default_glyph();
    }
}

void MinimapEmitter::emit(const RenderedLine& line, std::string& out) const {
    const bool colored = mode_ != ColorMode::None;
    bool color_active = false;
    TermColor active;

    for (const RenderedCell& cell : line.cells) {
        if (cell.blank) {
            if (color_active) {
                out += Terminal::reset_code();
                color_active = false;
            }
            out += ' ';
            continue;
        }

        if (colored && cell.color.kind != TermColor::Kind::Default) {
            if (!color_active || cell.color != active) {
                out += Terminal::color_code(cell.color);
                active = cell.color;
                color_active = true;
            }
        } else if (color_active) {
            out += Terminal::reset_code();
            color_active = false;
        }
        out += glyph_;
    }

    if (color_active) {
        out += Terminal::reset_code();
    }
    out += '\n';
}

}
