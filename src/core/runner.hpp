#pragma once

#include "core/pipeline.hpp"
#include "core/types.hpp"
#include "lang/resolver.hpp"
#include "terminal/terminal.hpp"
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace minimap {

constexpr const char* STDIN_NAME = "stdin";

// Exit statuses of the command-line tool.
constexpr int EXIT_OK = 0;
constexpr int EXIT_FAILURE_INPUT = 1;
constexpr int EXIT_USAGE = 2;

Result read_input(const std::string& path, std::string& data);

// Renders every input in argument order. Per-input failures are reported and
// the batch continues; a closed output pipe ends the run silently.
class Runner {
public:
    struct Options {
        std::optional<std::string> language;
        bool verbose = false;
    };

    // Output is handed to the terminal in chunks of this many bytes.
    static constexpr size_t FLUSH_CHUNK = 64 * 1024;

    Runner(const Pipeline& pipeline, const LanguageResolver& resolver, Terminal& term,
           std::ostream& err, Options options);

    // An empty list renders standard input.
    int run(const std::vector<std::string>& inputs);

    // Renders already-read content; `name` is used for diagnostics and, unless it
    // is STDIN_NAME, for filename-based language detection.
    Result render_source(const std::string& name, std::string_view data, std::string& out);

private:
    const Pipeline& pipeline_;
    const LanguageResolver& resolver_;
    Terminal& term_;
    std::ostream& err_;
    Options options_;

    Result write_chunked(const std::string& data);
    void report_error(const std::string& name, const std::string& cause);
    void report_warning(const std::string& name, const std::string& cause);
};

}
