#pragma once

#include "core/types.hpp"
#include "lang/classifier.hpp"
#include "lang/language.hpp"
#include "mapping/color_degrader.hpp"
#include "mapping/color_mapper.hpp"
#include "render/line_compressor.hpp"
#include "render/minimap_emitter.hpp"
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace minimap {

// bytes -> tokens -> colors -> cells -> degraded cells -> terminal rows
class Pipeline {
public:
    struct Config {
        int columns = 0;
        int tab_width = 4;
        std::string glyph = default_glyph();
        bool blank_whitespace = false;
    };

    struct Stats {
        size_t rows = 0;
        size_t tokens = 0;
        bool classifier_fallback = false;
        std::string fallback_reason;
    };

    Pipeline(const Config& config, const ColorMapper& mapper, const ColorDegrader& degrader,
             const TokenClassifier& classifier);

    // Appends the rendered rows to `out`. A ClassifierError discards whatever this
    // call appended and re-renders the input as a single default-class token.
    Stats render(std::string_view source, const Language& language, std::string& out) const;

    std::vector<RenderedLine> render_lines(std::string_view source, const Language& language,
                                           Stats* stats = nullptr) const;

    const Config& config() const { return config_; }

private:
    using LineSink = std::function<void(const RenderedLine&)>;

    Config config_;
    const ColorMapper& mapper_;
    const ColorDegrader& degrader_;
    const TokenClassifier& classifier_;
    MinimapEmitter emitter_;

    Stats run(std::string_view source, const Language& language, const LineSink& sink,
              const std::function<void()>& rollback) const;
    void run_with(const TokenClassifier& classifier, std::string_view source,
                  const Language& language, const LineSink& sink, Stats& stats) const;
};

}
