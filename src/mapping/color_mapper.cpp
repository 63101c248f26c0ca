#include "color_mapper.hpp"
#include <cctype>
#include <cstdio>

namespace minimap {

namespace {

int hex_digit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

}

Theme Theme::defaults() {
    Theme theme;
    theme.set(SyntaxClass::Default, {248, 248, 242});
    theme.set(SyntaxClass::Keyword, {249, 38, 114});
    theme.set(SyntaxClass::Type, {102, 217, 239});
    theme.set(SyntaxClass::String, {230, 219, 116});
    theme.set(SyntaxClass::Comment, {117, 113, 94});
    theme.set(SyntaxClass::Number, {174, 129, 255});
    theme.set(SyntaxClass::Function, {166, 226, 46});
    theme.set(SyntaxClass::Identifier, {248, 248, 242});
    theme.set(SyntaxClass::Operator, {249, 38, 114});
    theme.set(SyntaxClass::Punctuation, {204, 204, 199});
    theme.set(SyntaxClass::Preprocessor, {249, 38, 114});
    theme.set(SyntaxClass::Attribute, {253, 151, 31});
    theme.set(SyntaxClass::Tag, {249, 38, 114});
    return theme;
}

Color Theme::get(SyntaxClass cls) const {
    size_t idx = static_cast<size_t>(cls);
    if (idx >= SYNTAX_CLASS_COUNT) {
        idx = static_cast<size_t>(SyntaxClass::Default);
    }
    return colors[idx];
}

void Theme::set(SyntaxClass cls, const Color& color) {
    size_t idx = static_cast<size_t>(cls);
    if (idx < SYNTAX_CLASS_COUNT) {
        colors[idx] = color;
    }
}

bool Theme::apply_overrides(const std::map<std::string, std::string>& overrides, std::string& error) {
    for (const auto& [name, value] : overrides) {
        auto cls = parse_syntax_class(name);
        if (!cls) {
            error = "theme: unknown syntax class '" + name + "'";
            return false;
        }
        auto color = ColorMapper::parse_hex(value);
        if (!color) {
            error = "theme." + name + ": expected a color like #rrggbb, got '" + value + "'";
            return false;
        }
        set(*cls, *color);
    }
    return true;
}

ColorMapper::ColorMapper(const Theme& theme) : theme_(theme) {}

Color ColorMapper::map(SyntaxClass cls) const {
    return theme_.get(cls);
}

std::optional<Color> ColorMapper::parse_hex(const std::string& s) {
    std::string hex = s;
    if (!hex.empty() && hex[0] == '#') {
        hex = hex.substr(1);
    }

    if (hex.size() == 3) {
        std::string expanded;
        for (char c : hex) {
            expanded += c;
            expanded += c;
        }
        hex = expanded;
    }

    if (hex.size() != 6) return std::nullopt;

    uint8_t channels[3];
    for (int i = 0; i < 3; ++i) {
        int hi = hex_digit(hex[i * 2]);
        int lo = hex_digit(hex[i * 2 + 1]);
        if (hi < 0 || lo < 0) return std::nullopt;
        channels[i] = static_cast<uint8_t>(hi * 16 + lo);
    }
    return Color(channels[0], channels[1], channels[2]);
}

std::string ColorMapper::to_hex(const Color& c) {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "#%02x%02x%02x", c.r, c.g, c.b);
    return buf;
}

}
