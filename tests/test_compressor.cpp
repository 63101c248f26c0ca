#include <iostream>
#include <cassert>
#include <string>
#include <stdexcept>

#include "../src/core/types.hpp"
#include "../src/core/utf8.hpp"
#include "../src/render/line_compressor.hpp"
#include "../src/render/minimap_emitter.hpp"

using namespace minimap;

#define TEST(name) static void test_##name()
#define RUN_TEST(name) do { \
    std::cout << "Running " #name "... "; \
    try { \
        test_##name(); \
        std::cout << "PASSED\n"; \
    } catch (const std::exception& e) { \
        std::cout << "FAILED: " << e.what() << "\n"; \
        failures++; \
    } catch (...) { \
        std::cout << "FAILED: unknown exception\n"; \
        failures++; \
    } \
} while(0)

int failures = 0;

static const Color RED(255, 0, 0);
static const Color BLUE(0, 0, 255);
static const char* BLOCK = "\xe2\x96\x80";

static void push_all(LineCompressor& lc, const std::string& s, const Color& color = RED) {
    for (char c : s) lc.push(c, color);
}

static LineCompressor::Config compressor_config(int columns, int tab_width, bool blank = false) {
    LineCompressor::Config cfg;
    cfg.columns = columns;
    cfg.tab_width = tab_width;
    cfg.blank_whitespace = blank;
    return cfg;
}

static RenderedLine make_line(std::initializer_list<RenderedCell> cells) {
    RenderedLine line;
    line.cells = cells;
    return line;
}

static RenderedCell cell(const TermColor& color, bool blank = false) {
    RenderedCell c;
    c.color = color;
    c.blank = blank;
    return c;
}

static std::string repeat(const std::string& s, int n) {
    std::string out;
    for (int i = 0; i < n; ++i) out += s;
    return out;
}

TEST(one_cell_per_byte) {
    LineCompressor lc(compressor_config(0, 4));
    push_all(lc, "abc");
    lc.finish_line(true);
    assert(lc.cells().size() == 3);
    assert(lc.column() == 3);
    assert(lc.cells()[0].color == RED);
    assert(!lc.cells()[0].blank);
}

TEST(tab_at_line_start) {
    LineCompressor lc(compressor_config(0, 4));
    lc.push('\t', BLUE);
    assert(lc.cells().size() == 4);
    for (const ColorCell& c : lc.cells()) {
        assert(c.color == BLUE);
    }
}

TEST(tab_advances_to_next_stop) {
    LineCompressor lc(compressor_config(0, 4));
    push_all(lc, "ab");
    lc.push('\t', BLUE);
    assert(lc.cells().size() == 4);
    assert(lc.cells()[2].color == BLUE);
    assert(lc.cells()[3].color == BLUE);

    lc.push('x', RED);
    lc.push('\t', RED);
    assert(lc.column() == 8);
}

TEST(tab_width_zero_is_one_column) {
    LineCompressor lc(compressor_config(0, 0));
    push_all(lc, "\t\ta");
    assert(lc.cells().size() == 3);
}

TEST(column_limit_truncates) {
    LineCompressor lc(compressor_config(3, 4));
    push_all(lc, "ab");
    assert(!lc.full());
    push_all(lc, "cdef");
    assert(lc.full());
    assert(lc.cells().size() == 3);
    assert(lc.column() == 6);
}

TEST(tab_crossing_column_limit) {
    LineCompressor lc(compressor_config(6, 4));
    push_all(lc, "abcde");
    lc.push('\t', BLUE);
    assert(lc.cells().size() == 6);
    assert(lc.cells()[5].color == BLUE);
}

TEST(carriage_return_before_newline_dropped) {
    LineCompressor lc(compressor_config(0, 4));
    push_all(lc, "ab\r");
    lc.finish_line(true);
    assert(lc.cells().size() == 2);
}

TEST(carriage_return_inside_line_kept) {
    LineCompressor lc(compressor_config(0, 4));
    push_all(lc, "a\rb");
    lc.finish_line(true);
    assert(lc.cells().size() == 3);

    LineCompressor tail(compressor_config(0, 4));
    push_all(tail, "a\r");
    tail.finish_line(false);
    assert(tail.cells().size() == 2);
}

TEST(utf8_counts_codepoints) {
    LineCompressor lc(compressor_config(0, 4));
    push_all(lc, "\xc3\xa9");
    assert(lc.cells().size() == 1);

    lc.reset();
    push_all(lc, "\xe6\x97\xa5\xe6\x9c\xac");
    assert(lc.cells().size() == 2);
    assert(lc.column() == 2);
}

TEST(blank_whitespace) {
    LineCompressor lc(compressor_config(0, 2, true));
    push_all(lc, "a \tb");
    assert(lc.cells().size() == 5);
    assert(!lc.cells()[0].blank);
    assert(lc.cells()[1].blank);
    assert(lc.cells()[2].blank);
    assert(lc.cells()[3].blank);
    assert(!lc.cells()[4].blank);
}

TEST(reset_clears_state) {
    LineCompressor lc(compressor_config(2, 4));
    push_all(lc, "abcd\r");
    lc.reset();
    assert(lc.cells().empty());
    assert(lc.column() == 0);
    assert(!lc.full());
    lc.finish_line(false);
    assert(lc.cells().empty());
}

TEST(default_glyph_is_upper_half_block) {
    assert(default_glyph() == BLOCK);
    assert(default_glyph() == utf8::encode(0x2580));
    assert(utf8::count_codepoints(default_glyph()) == 1);
}

TEST(emit_single_run) {
    MinimapEmitter emitter(ColorMode::Ansi256);
    TermColor red = TermColor::indexed(196);
    std::string out;
    emitter.emit(make_line({cell(red), cell(red), cell(red)}), out);
    assert(out == "\033[38;5;196m" + repeat(BLOCK, 3) + "\033[0m\n");
}

TEST(emit_color_changes) {
    MinimapEmitter emitter(ColorMode::Truecolor);
    TermColor a = TermColor::rgb(Color(1, 2, 3));
    TermColor b = TermColor::rgb(Color(4, 5, 6));
    std::string out;
    emitter.emit(make_line({cell(a), cell(b), cell(b), cell(a)}), out);
    std::string expected = "\033[38;2;1;2;3m" + std::string(BLOCK) +
                           "\033[38;2;4;5;6m" + repeat(BLOCK, 2) +
                           "\033[38;2;1;2;3m" + BLOCK + "\033[0m\n";
    assert(out == expected);
}

TEST(emit_empty_line) {
    MinimapEmitter emitter(ColorMode::Truecolor);
    std::string out;
    emitter.emit(RenderedLine{}, out);
    assert(out == "\n");
}

TEST(emit_no_color_mode) {
    MinimapEmitter emitter(ColorMode::None);
    std::string out;
    emitter.emit(make_line({cell(TermColor::none()), cell(TermColor::none(), true), cell(TermColor::none())}), out);
    assert(out == std::string(BLOCK) + " " + BLOCK + "\n");
    assert(out.find('\033') == std::string::npos);
}

TEST(emit_blank_resets_active_color) {
    MinimapEmitter emitter(ColorMode::Ansi256);
    TermColor red = TermColor::indexed(196);
    std::string out;
    emitter.emit(make_line({cell(red), cell(TermColor::none(), true), cell(red)}), out);
    std::string expected = "\033[38;5;196m" + std::string(BLOCK) + "\033[0m " +
                           "\033[38;5;196m" + BLOCK + "\033[0m\n";
    assert(out == expected);
}

TEST(emit_trailing_blanks_need_no_final_reset) {
    MinimapEmitter emitter(ColorMode::Ansi256);
    std::string out;
    emitter.emit(make_line({cell(TermColor::indexed(1)), cell(TermColor::none(), true)}), out);
    assert(out == "\033[38;5;1m" + std::string(BLOCK) + "\033[0m \n");
}

TEST(emit_custom_glyph) {
    MinimapEmitter emitter(ColorMode::None, "#");
    std::string out;
    emitter.emit(make_line({cell(TermColor::none()), cell(TermColor::none())}), out);
    assert(out == "##\n");

    MinimapEmitter fallback(ColorMode::None, "");
    assert(fallback.glyph() == BLOCK);
}

int main() {
    std::cout << "=== Compressor Tests ===\n\n";

    std::cout << "--- Line Compressor Tests ---\n";
    RUN_TEST(one_cell_per_byte);
    RUN_TEST(tab_at_line_start);
    RUN_TEST(tab_advances_to_next_stop);
    RUN_TEST(tab_width_zero_is_one_column);
    RUN_TEST(column_limit_truncates);
    RUN_TEST(tab_crossing_column_limit);
    RUN_TEST(carriage_return_before_newline_dropped);
    RUN_TEST(carriage_return_inside_line_kept);
    RUN_TEST(utf8_counts_codepoints);
    RUN_TEST(blank_whitespace);
    RUN_TEST(reset_clears_state);

    std::cout << "\n--- Emitter Tests ---\n";
    RUN_TEST(default_glyph_is_upper_half_block);
    RUN_TEST(emit_single_run);
    RUN_TEST(emit_color_changes);
    RUN_TEST(emit_empty_line);
    RUN_TEST(emit_no_color_mode);
    RUN_TEST(emit_blank_resets_active_color);
    RUN_TEST(emit_trailing_blanks_need_no_final_reset);
    RUN_TEST(emit_custom_glyph);

    std::cout << "\n=== Test Summary ===\n";
    std::cout << "Failures: " << failures << "\n";

    if (failures == 0) {
        std::cout << "\n✓ All tests passed!\n";
        return 0;
    } else {
        std::cout << "\n✗ Some tests failed!\n";
        return 1;
    }
}
