#pragma once

#include "core/types.hpp"
#include "terminal/terminal.hpp"
#include <map>
#include <optional>
#include <string>

namespace minimap {

struct Args;

constexpr int CONFIG_VERSION = 1;

constexpr int MAX_COLUMNS = 100000;
constexpr int MAX_TAB_WIDTH = 64;

enum class ColorSetting {
    Auto,
    None,
    Ansi256,
    Truecolor
};

std::optional<ColorSetting> parse_color_setting(const std::string& s);
const char* color_setting_name(ColorSetting setting);

struct ConfigRender {
    int columns = 0;
    int tabs = 4;
    std::string glyph;  // empty = U+2580
    bool blank_whitespace = false;
};

struct ConfigColor {
    ColorSetting mode = ColorSetting::Auto;
};

struct Config {
    int version = CONFIG_VERSION;
    ConfigRender render;
    ConfigColor color;
    std::map<std::string, std::string> theme;       // class name -> "#rrggbb"
    std::map<std::string, std::string> extensions;  // extension -> language
    bool verbose = false;

    std::string config_path;

    bool validate(std::string& error) const;

    // Resolved terminal capability: the configured mode, or detection for "auto".
    ColorMode resolve_color_mode() const;

    static Config defaults();
    // Returns nullopt and fills `error` when the file is missing or malformed.
    static std::optional<Config> load(const std::string& path, std::string* error = nullptr);
    // A missing default file yields nullopt with an empty error.
    static std::optional<Config> load_default(std::string* error = nullptr);
    static std::string default_config_path();
    static std::string default_config_dir();
};

Config apply_cli_overrides(Config config, const Args& args);

}
