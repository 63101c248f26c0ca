#include "cli/args.hpp"
#include "core/config.hpp"
#include "core/pipeline.hpp"
#include "core/runner.hpp"
#include "core/types.hpp"
#include "lang/language.hpp"
#include "lang/lexical_classifier.hpp"
#include "lang/resolver.hpp"
#include "mapping/color_degrader.hpp"
#include "mapping/color_mapper.hpp"
#include "render/minimap_emitter.hpp"
#include "terminal/terminal.hpp"

#include <algorithm>
#include <csignal>
#include <cstdio>
#include <iostream>

namespace minimap {

static void print_languages(const LanguageRegistry& registry) {
    for (const Language& lang : registry.languages()) {
        std::string line = lang.name;
        line.resize(std::max<size_t>(line.size() + 1, 12), ' ');
        line += lang.display_name;
        if (!lang.extensions.empty()) {
            line.resize(std::max<size_t>(line.size() + 1, 26), ' ');
            for (size_t i = 0; i < lang.extensions.size(); ++i) {
                if (i > 0) line += ", ";
                line += "." + lang.extensions[i];
            }
        }
        std::printf("%s\n", line.c_str());
    }
}

}

int main(int argc, char* argv[]) {
    minimap::Args args = minimap::parse_args(argc, argv);

    if (!args.error.empty()) {
        std::cerr << "Error: " << args.error << "\n";
        std::cerr << "Try '" << argv[0] << " --help' for more information.\n";
        return minimap::EXIT_USAGE;
    }
    if (args.show_help) {
        minimap::print_help(argv[0]);
        return minimap::EXIT_OK;
    }
    if (args.show_version) {
        minimap::print_version();
        return minimap::EXIT_OK;
    }

    minimap::LanguageRegistry registry;
    if (args.list_languages) {
        minimap::print_languages(registry);
        return minimap::EXIT_OK;
    }

    minimap::Config config = minimap::Config::defaults();
    std::string config_error;
    if (!args.config_path.empty()) {
        auto loaded = minimap::Config::load(args.config_path, &config_error);
        if (!loaded) {
            std::cerr << "Error: Failed to load config file: " << config_error << "\n";
            return minimap::EXIT_FAILURE_INPUT;
        }
        config = *loaded;
    } else if (auto loaded_default = minimap::Config::load_default(&config_error)) {
        config = *loaded_default;
    } else if (!config_error.empty()) {
        std::cerr << "Warning: Ignoring config file: " << config_error << "\n";
    }

    config = minimap::apply_cli_overrides(config, args);
    if (!config.validate(config_error)) {
        std::cerr << "Error: Invalid config: " << config_error << "\n";
        return minimap::EXIT_FAILURE_INPUT;
    }

    for (const auto& [ext, lang_name] : config.extensions) {
        if (!registry.add_extension(ext, lang_name)) {
            std::cerr << "Error: Invalid config: unknown language '" << lang_name
                      << "' for extension '" << ext << "'\n";
            return minimap::EXIT_FAILURE_INPUT;
        }
    }

    minimap::Theme theme = minimap::Theme::defaults();
    if (!theme.apply_overrides(config.theme, config_error)) {
        std::cerr << "Error: Invalid config: " << config_error << "\n";
        return minimap::EXIT_FAILURE_INPUT;
    }

    // Resolved once; everything downstream receives it by value.
    const minimap::ColorMode color_mode = config.resolve_color_mode();

    // Broken pipes surface as EPIPE from the writes instead of killing the process.
    std::signal(SIGPIPE, SIG_IGN);

    minimap::Terminal terminal(stdout);
    minimap::ColorMapper mapper(theme);
    minimap::ColorDegrader degrader(color_mode);
    minimap::LexicalClassifier classifier;

    minimap::Pipeline::Config pipeline_cfg;
    pipeline_cfg.columns = config.render.columns;
    pipeline_cfg.tab_width = config.render.tabs;
    pipeline_cfg.glyph = config.render.glyph.empty() ? minimap::default_glyph() : config.render.glyph;
    pipeline_cfg.blank_whitespace = config.render.blank_whitespace;
    minimap::Pipeline pipeline(pipeline_cfg, mapper, degrader, classifier);

    minimap::LanguageResolver resolver(registry);

    minimap::Runner::Options options;
    options.language = args.language;
    options.verbose = config.verbose;
    minimap::Runner runner(pipeline, resolver, terminal, std::cerr, options);

    return runner.run(args.inputs);
}
