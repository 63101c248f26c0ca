#pragma once

#include "core/config.hpp"
#include <optional>
#include <string>
#include <vector>

namespace minimap {

constexpr const char* VERSION_STRING = "0.6.0";

struct Args {
    std::vector<std::string> inputs;  // empty = stdin
    std::optional<std::string> language;
    std::string config_path;
    std::optional<std::string> glyph;
    std::optional<ColorSetting> color;

    int columns = -1;  // -1 = not given
    int tabs = -1;

    bool blank_whitespace = false;
    bool verbose = false;
    bool list_languages = false;
    bool show_help = false;
    bool show_version = false;

    // Set on a usage error; the caller reports it and exits with status 2.
    std::string error;

    bool reads_stdin() const { return inputs.empty(); }
};

Args parse_args(int argc, char* argv[]);
void print_help(const char* prog);
void print_version();

}
