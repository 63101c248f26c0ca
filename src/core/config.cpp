#include "core/config.hpp"
#include "cli/args.hpp"
#include "core/utf8.hpp"
#include "mapping/color_mapper.hpp"
#include <toml++/toml.hpp>

#include <cstdlib>
#include <filesystem>
#include <sstream>

#include <unistd.h>
#include <pwd.h>

namespace minimap {

namespace {

std::string get_home_dir() {
    const char* home = std::getenv("HOME");
    if (home && *home) return std::string(home);
    struct passwd* pw = getpwuid(getuid());
    if (pw) return std::string(pw->pw_dir);
    return ".";
}

std::string get_config_home() {
    const char* xdg_config = std::getenv("XDG_CONFIG_HOME");
    if (xdg_config && *xdg_config) return std::string(xdg_config);
    return get_home_dir() + "/.config";
}

void set_error(std::string* error, const std::string& msg) {
    if (error) *error = msg;
}

}

std::optional<ColorSetting> parse_color_setting(const std::string& s) {
    if (s == "auto") return ColorSetting::Auto;
    if (s == "none") return ColorSetting::None;
    if (s == "256") return ColorSetting::Ansi256;
    if (s == "truecolor") return ColorSetting::Truecolor;
    return std::nullopt;
}

const char* color_setting_name(ColorSetting setting) {
    switch (setting) {
        case ColorSetting::Auto: return "auto";
        case ColorSetting::None: return "none";
        case ColorSetting::Ansi256: return "256";
        case ColorSetting::Truecolor: return "truecolor";
    }
    return "auto";
}

Config Config::defaults() {
    Config cfg;
    cfg.version = CONFIG_VERSION;
    return cfg;
}

std::string Config::default_config_dir() {
    return get_config_home() + "/code-minimap";
}

std::string Config::default_config_path() {
    return default_config_dir() + "/config.toml";
}

bool Config::validate(std::string& error) const {
    if (version != CONFIG_VERSION) {
        error = "config_version must be " + std::to_string(CONFIG_VERSION);
        return false;
    }
    if (render.columns < 0 || render.columns > MAX_COLUMNS) {
        error = "render.columns must be between 0 and " + std::to_string(MAX_COLUMNS);
        return false;
    }
    if (render.tabs < 0 || render.tabs > MAX_TAB_WIDTH) {
        error = "render.tabs must be between 0 and " + std::to_string(MAX_TAB_WIDTH);
        return false;
    }
    if (!render.glyph.empty() && utf8::count_codepoints(render.glyph) != 1) {
        error = "render.glyph must be a single character";
        return false;
    }
    if (!render.glyph.empty() && static_cast<unsigned char>(render.glyph[0]) < 0x20) {
        error = "render.glyph must be a printable character";
        return false;
    }

    Theme theme_check = Theme::defaults();
    std::string theme_error;
    if (!theme_check.apply_overrides(theme, theme_error)) {
        error = theme_error;
        return false;
    }

    for (const auto& [ext, lang] : extensions) {
        if (ext.empty() || ext == ".") {
            error = "languages.extensions: empty extension";
            return false;
        }
        if (lang.empty()) {
            error = "languages.extensions: no language given for '" + ext + "'";
            return false;
        }
    }
    return true;
}

ColorMode Config::resolve_color_mode() const {
    switch (color.mode) {
        case ColorSetting::None: return ColorMode::None;
        case ColorSetting::Ansi256: return ColorMode::Ansi256;
        case ColorSetting::Truecolor: return ColorMode::Truecolor;
        case ColorSetting::Auto: break;
    }
    return Terminal::detect_color_mode();
}

std::optional<Config> Config::load(const std::string& path, std::string* error) {
    std::error_code ec;
    if (!std::filesystem::exists(std::filesystem::path(path), ec) || ec) {
        set_error(error, path + ": file not found");
        return std::nullopt;
    }

    try {
        auto tbl = toml::parse_file(path);

        Config cfg = defaults();
        cfg.config_path = path;

        if (auto node = tbl["config_version"]) {
            auto v = node.value<int>();
            if (!v || *v != CONFIG_VERSION) {
                set_error(error, path + ": unsupported config_version (expected " +
                                     std::to_string(CONFIG_VERSION) + ")");
                return std::nullopt;
            }
            cfg.version = *v;
        }

        if (auto render = tbl["render"]) {
            if (auto node = render["columns"]) {
                auto v = node.value<int>();
                if (!v) {
                    set_error(error, path + ": render.columns must be an integer");
                    return std::nullopt;
                }
                cfg.render.columns = *v;
            }
            if (auto node = render["tabs"]) {
                auto v = node.value<int>();
                if (!v) {
                    set_error(error, path + ": render.tabs must be an integer");
                    return std::nullopt;
                }
                cfg.render.tabs = *v;
            }
            if (auto v = render["glyph"].value<std::string>()) cfg.render.glyph = *v;
            if (auto v = render["blank_whitespace"].value<bool>()) cfg.render.blank_whitespace = *v;
        }

        if (auto color = tbl["color"]) {
            if (auto v = color["mode"].value<std::string>()) {
                auto setting = parse_color_setting(*v);
                if (!setting) {
                    set_error(error, path + ": color.mode must be one of auto, none, 256, truecolor");
                    return std::nullopt;
                }
                cfg.color.mode = *setting;
            }
        }

        if (auto theme = tbl["theme"].as_table()) {
            for (auto&& [key, node] : *theme) {
                auto v = node.value<std::string>();
                if (!v) {
                    set_error(error, path + ": theme." + std::string(key.str()) + " must be a string");
                    return std::nullopt;
                }
                cfg.theme[std::string(key.str())] = *v;
            }
        }

        if (auto exts = tbl["languages"]["extensions"].as_table()) {
            for (auto&& [key, node] : *exts) {
                auto v = node.value<std::string>();
                if (!v) {
                    set_error(error, path + ": languages.extensions." + std::string(key.str()) +
                                         " must be a string");
                    return std::nullopt;
                }
                cfg.extensions[std::string(key.str())] = *v;
            }
        }

        if (auto v = tbl["verbose"].value<bool>()) cfg.verbose = *v;

        std::string validation_error;
        if (!cfg.validate(validation_error)) {
            set_error(error, path + ": " + validation_error);
            return std::nullopt;
        }

        return cfg;
    } catch (const toml::parse_error& e) {
        std::ostringstream msg;
        msg << path << ":" << e.source().begin.line << ": " << e.description();
        set_error(error, msg.str());
        return std::nullopt;
    }
}

std::optional<Config> Config::load_default(std::string* error) {
    std::string path = default_config_path();
    std::error_code ec;
    if (!std::filesystem::exists(std::filesystem::path(path), ec) || ec) {
        set_error(error, "");
        return std::nullopt;
    }
    return load(path, error);
}

Config apply_cli_overrides(Config config, const Args& args) {
    if (args.columns >= 0) config.render.columns = args.columns;
    if (args.tabs >= 0) config.render.tabs = args.tabs;
    if (args.glyph) config.render.glyph = *args.glyph;
    if (args.blank_whitespace) config.render.blank_whitespace = true;
    if (args.color) config.color.mode = *args.color;
    if (args.verbose) config.verbose = true;
    if (!args.config_path.empty()) config.config_path = args.config_path;
    return config;
}

}
