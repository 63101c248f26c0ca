#pragma once

#include "core/types.hpp"
#include <array>
#include <map>
#include <optional>
#include <string>

namespace minimap {

struct Theme {
    std::array<Color, SYNTAX_CLASS_COUNT> colors{};

    // Monokai Extended palette.
    static Theme defaults();

    Color get(SyntaxClass cls) const;
    void set(SyntaxClass cls, const Color& color);

    // Applies "<class> = #rrggbb" overrides; stops at the first bad entry.
    bool apply_overrides(const std::map<std::string, std::string>& overrides, std::string& error);
};

class ColorMapper {
public:
    explicit ColorMapper(const Theme& theme = Theme::defaults());

    Color map(SyntaxClass cls) const;
    const Theme& theme() const { return theme_; }

    static std::optional<Color> parse_hex(const std::string& s);
    static std::string to_hex(const Color& c);

private:
    Theme theme_;
};

}
