#include "line_compressor.hpp"
#include "core/utf8.hpp"

namespace minimap {

LineCompressor::LineCompressor(const Config& config) : config_(config) {
    if (config_.columns < 0) config_.columns = 0;
    if (config_.tab_width < 0) config_.tab_width = 0;
    if (config_.columns > 0) {
        cells_.reserve(static_cast<size_t>(config_.columns));
    }
}

void LineCompressor::emit(const Color& color, bool blank, int count) {
    for (int i = 0; i < count; ++i) {
        if (!full()) {
            cells_.push_back(ColorCell{color, blank});
        }
        ++column_;
    }
}

void LineCompressor::flush_pending_cr() {
    if (!pending_cr_) return;
    pending_cr_ = false;
    emit(pending_cr_color_, false, 1);
}

void LineCompressor::push(char byte, const Color& color) {
    flush_pending_cr();

    if (utf8::is_continuation_byte(static_cast<unsigned char>(byte))) {
        return;
    }

    if (byte == '\r') {
        pending_cr_ = true;
        pending_cr_color_ = color;
        return;
    }

    if (byte == '\t') {
        int width = 1;
        if (config_.tab_width > 0) {
            width = config_.tab_width - (column_ % config_.tab_width);
        }
        emit(color, config_.blank_whitespace, width);
        return;
    }

    emit(color, config_.blank_whitespace && byte == ' ', 1);
}

void LineCompressor::finish_line(bool at_newline) {
    if (at_newline) {
        pending_cr_ = false;
    } else {
        flush_pending_cr();
    }
}

void LineCompressor::reset() {
    cells_.clear();
    column_ = 0;
    pending_cr_ = false;
}

}
