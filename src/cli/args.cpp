#include "args.hpp"
#include <charconv>
#include <cstdio>
#include <cstring>

namespace minimap {

static bool parse_int(const char* s, int min_val, int max_val, int& out) {
    const char* end = s + std::strlen(s);
    int value = 0;
    auto res = std::from_chars(s, end, value);
    if (res.ec != std::errc() || res.ptr != end) return false;
    if (value < min_val || value > max_val) return false;
    out = value;
    return true;
}

// Accepts both "--opt VALUE" and "--opt=VALUE".
static bool take_value(int argc, char* argv[], int& i, const char* name, const char* short_name,
                       const char*& value) {
    const char* arg = argv[i];
    if (strcmp(arg, name) == 0 || (short_name && strcmp(arg, short_name) == 0)) {
        if (i + 1 < argc) {
            value = argv[++i];
        } else {
            value = nullptr;
        }
        return true;
    }
    size_t len = strlen(name);
    if (strncmp(arg, name, len) == 0 && arg[len] == '=') {
        value = arg + len + 1;
        return true;
    }
    return false;
}

Args parse_args(int argc, char* argv[]) {
    Args args;
    bool saw_stdin = false;
    bool options_done = false;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        const char* value = nullptr;

        if (options_done || arg[0] != '-' || strcmp(arg, "-") == 0) {
            if (strcmp(arg, "-") == 0) {
                saw_stdin = true;
            } else {
                args.inputs.emplace_back(arg);
            }
            continue;
        }

        if (strcmp(arg, "--") == 0) {
            options_done = true;
        }
        else if (strcmp(arg, "-h") == 0 || strcmp(arg, "--help") == 0) {
            args.show_help = true;
            return args;
        }
        else if (strcmp(arg, "-V") == 0 || strcmp(arg, "--version") == 0) {
            args.show_version = true;
            return args;
        }
        else if (strcmp(arg, "-v") == 0 || strcmp(arg, "--verbose") == 0) {
            args.verbose = true;
        }
        else if (strcmp(arg, "--blank-whitespace") == 0) {
            args.blank_whitespace = true;
        }
        else if (strcmp(arg, "--list-languages") == 0) {
            args.list_languages = true;
        }
        else if (take_value(argc, argv, i, "--language", "-l", value)) {
            if (!value || !*value) {
                args.error = "--language requires a name";
                return args;
            }
            args.language = std::string(value);
        }
        else if (take_value(argc, argv, i, "--columns", "-c", value)) {
            if (!value || !parse_int(value, 0, MAX_COLUMNS, args.columns)) {
                args.error = "--columns expects an integer between 0 and " + std::to_string(MAX_COLUMNS);
                return args;
            }
        }
        else if (take_value(argc, argv, i, "--tabs", "-t", value)) {
            if (!value || !parse_int(value, 0, MAX_TAB_WIDTH, args.tabs)) {
                args.error = "--tabs expects an integer between 0 and " + std::to_string(MAX_TAB_WIDTH);
                return args;
            }
        }
        else if (take_value(argc, argv, i, "--color", nullptr, value)) {
            auto setting = value ? parse_color_setting(value) : std::nullopt;
            if (!setting) {
                args.error = "--color expects one of auto, none, 256, truecolor";
                return args;
            }
            args.color = setting;
        }
        else if (take_value(argc, argv, i, "--glyph", nullptr, value)) {
            if (!value || !*value) {
                args.error = "--glyph requires a character";
                return args;
            }
            args.glyph = std::string(value);
        }
        else if (take_value(argc, argv, i, "--config", nullptr, value)) {
            if (!value || !*value) {
                args.error = "--config requires a file path";
                return args;
            }
            args.config_path = value;
        }
        else {
            args.error = std::string("unknown option '") + arg + "'";
            return args;
        }
    }

    if (saw_stdin && !args.inputs.empty()) {
        args.error = "'-' (standard input) cannot be combined with file paths";
    }
    return args;
}

void print_help(const char* prog) {
    printf("Usage: %s [OPTIONS] [FILE]...\n\n", prog);
    printf("Render a colored minimap of source code in the terminal.\n\n");
    printf("FILE:\n");
    printf("  Files to render, in order. Reads standard input when none is given or for \"-\"\n\n");
    printf("OPTIONS:\n");
    printf("  -l, --language <NAME>   Language name, alias or extension (e.g. rust, py, .hpp)\n");
    printf("  -c, --columns <N>       Maximum columns per row (default: 0 = unbounded)\n");
    printf("  -t, --tabs <N>          Tab width (default: 4, 0 = one column per tab)\n");
    printf("      --color <MODE>      Color mode: auto, none, 256, truecolor (default: auto)\n");
    printf("      --glyph <CHAR>      Block glyph (default: \xE2\x96\x80)\n");
    printf("      --blank-whitespace  Render spaces and tabs as blanks\n");
    printf("      --config <FILE>     Config file path\n");
    printf("      --list-languages    List known languages and exit\n");
    printf("  -v, --verbose           Report recovered problems on stderr\n");
    printf("  -V, --version           Show version\n");
    printf("  -h, --help              Show this help\n");
    printf("\nENVIRONMENT:\n");
    printf("  COLORTERM=truecolor|24bit enables 24-bit color; NO_COLOR or TERM=dumb disables color\n");
    printf("\nCONFIG FILE:\n");
    printf("  Default location: $XDG_CONFIG_HOME/code-minimap/config.toml\n");
    printf("                    (~/.config/code-minimap/config.toml)\n");
}

void print_version() {
    printf("code-minimap %s\n", VERSION_STRING);
}

}
