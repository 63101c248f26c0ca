#pragma once

#include "core/types.hpp"
#include <vector>

namespace minimap {

struct ColorCell {
    Color color;
    bool blank = false;
};

// Turns the bytes of one source line into display cells: tabs expand to the next
// tab stop, each codepoint takes one column and nothing past the column limit is kept.
class LineCompressor {
public:
    struct Config {
        int columns = 0;    // 0 = unbounded
        int tab_width = 4;  // 0 = a tab is a single column
        bool blank_whitespace = false;
    };

    explicit LineCompressor(const Config& config);

    // '\n' must not be pushed; call finish_line() instead.
    void push(char byte, const Color& color);

    // A carriage return still pending when the line ends at a newline is dropped.
    void finish_line(bool at_newline);
    void reset();

    const std::vector<ColorCell>& cells() const { return cells_; }
    int column() const { return column_; }
    bool full() const { return config_.columns > 0 && column_ >= config_.columns; }

private:
    Config config_;
    std::vector<ColorCell> cells_;
    int column_ = 0;
    bool pending_cr_ = false;
    Color pending_cr_color_;

    void emit(const Color& color, bool blank, int count);
    void flush_pending_cr();
};

}
