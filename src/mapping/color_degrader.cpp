#include "color_degrader.hpp"

namespace minimap {

ColorDegrader::ColorDegrader(ColorMode mode) : mode_(mode) {}

TermColor ColorDegrader::degrade(const Color& color) const {
    switch (mode_) {
        case ColorMode::None:
            return TermColor::none();
        case ColorMode::Ansi256: {
            uint32_t key = color.packed();
            auto it = cache_.find(key);
            if (it != cache_.end()) {
                return TermColor::indexed(it->second);
            }
            uint8_t idx = Terminal::rgb_to_256(color.r, color.g, color.b);
            cache_.emplace(key, idx);
            return TermColor::indexed(idx);
        }
        case ColorMode::Truecolor:
        default:
            return TermColor::rgb(color);
    }
}

}
