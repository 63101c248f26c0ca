#include "pipeline.hpp"
#include <cstring>

namespace minimap {

Pipeline::Pipeline(const Config& config, const ColorMapper& mapper, const ColorDegrader& degrader,
                   const TokenClassifier& classifier)
    : config_(config),
      mapper_(mapper),
      degrader_(degrader),
      classifier_(classifier),
      emitter_(degrader.mode(), config.glyph) {}

Pipeline::Stats Pipeline::render(std::string_view source, const Language& language,
                                 std::string& out) const {
    const size_t mark = out.size();
    out.reserve(out.size() + source.size() * 4);
    return run(
        source, language,
        [&](const RenderedLine& line) { emitter_.emit(line, out); },
        [&]() { out.resize(mark); });
}

std::vector<RenderedLine> Pipeline::render_lines(std::string_view source, const Language& language,
                                                 Stats* stats) const {
    std::vector<RenderedLine> lines;
    Stats s = run(
        source, language,
        [&](const RenderedLine& line) { lines.push_back(line); },
        [&]() { lines.clear(); });
    if (stats) *stats = s;
    return lines;
}

Pipeline::Stats Pipeline::run(std::string_view source, const Language& language,
                              const LineSink& sink, const std::function<void()>& rollback) const {
    Stats stats;
    try {
        run_with(classifier_, source, language, sink, stats);
    } catch (const ClassifierError& e) {
        rollback();
        stats = Stats{};
        stats.classifier_fallback = true;
        stats.fallback_reason = e.what();
        PlainClassifier plain;
        run_with(plain, source, language, sink, stats);
    }
    return stats;
}

void Pipeline::run_with(const TokenClassifier& classifier, std::string_view source,
                        const Language& language, const LineSink& sink, Stats& stats) const {
    if (source.empty()) return;

    LineCompressor::Config comp_cfg;
    comp_cfg.columns = config_.columns;
    comp_cfg.tab_width = config_.tab_width;
    comp_cfg.blank_whitespace = config_.blank_whitespace;
    LineCompressor compressor(comp_cfg);

    RenderedLine line;
    auto flush_line = [&](bool at_newline) {
        compressor.finish_line(at_newline);
        line.cells.clear();
        for (const ColorCell& cell : compressor.cells()) {
            RenderedCell rc;
            rc.blank = cell.blank;
            if (!cell.blank) rc.color = degrader_.degrade(cell.color);
            line.cells.push_back(rc);
        }
        sink(line);
        compressor.reset();
        ++stats.rows;
    };

    auto stream = normalize_tokens(classifier.classify(source, language), source.size());
    Token tok;
    while (stream->next(tok)) {
        ++stats.tokens;
        const Color color = mapper_.map(tok.cls);
        size_t i = tok.start;
        while (i < tok.end) {
            char c = source[i];
            if (c == '\n') {
                flush_line(true);
                ++i;
                continue;
            }
            if (compressor.full()) {
                // Rest of the line is dropped; resume at the next newline in this token.
                const void* nl = std::memchr(source.data() + i, '\n', tok.end - i);
                if (!nl) break;
                i = static_cast<size_t>(static_cast<const char*>(nl) - source.data());
                continue;
            }
            compressor.push(c, color);
            ++i;
        }
    }
    flush_line(false);
}

}
