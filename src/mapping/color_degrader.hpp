#pragma once

#include "core/types.hpp"
#include "terminal/terminal.hpp"
#include <unordered_map>
#include <cstdint>

namespace minimap {

class ColorDegrader {
public:
    explicit ColorDegrader(ColorMode mode);

    ColorMode mode() const { return mode_; }

    TermColor degrade(const Color& color) const;

private:
    ColorMode mode_;

    // Themes only hold a handful of colors, so palette searches are memoised.
    mutable std::unordered_map<uint32_t, uint8_t> cache_;
};

}
