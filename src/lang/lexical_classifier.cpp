#include "lexical_classifier.hpp"
#include <algorithm>
#include <cctype>
#include <cstring>
#include <string>

namespace minimap {

namespace {

inline bool is_ws(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v';
}

inline bool is_digit(char c) {
    return c >= '0' && c <= '9';
}

inline bool is_alpha(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

// Non-ASCII bytes are treated as identifier characters so that UTF-8 text is
// never split inside a codepoint.
inline bool is_ident_start(char c) {
    return is_alpha(c) || c == '_' || static_cast<unsigned char>(c) >= 0x80;
}

inline bool is_ident_char(char c) {
    return is_ident_start(c) || is_digit(c);
}

inline bool is_operator_char(char c) {
    return std::strchr("+-*/%=<>!&|^~?:", c) != nullptr && c != '\0';
}

class LexStream : public TokenStream {
public:
    LexStream(std::string_view src, const Language& lang)
        : src_(src), lang_(lang), rules_(lang.rules) {
        size_t nul = src_.find('\0');
        end_ = nul == std::string_view::npos ? src_.size() : nul;
    }

    bool next(Token& token) override {
        if (pos_ >= src_.size()) return false;
        if (pos_ >= end_) {
            throw ClassifierError("NUL byte at offset " + std::to_string(pos_));
        }

        size_t start = pos_;
        SyntaxClass cls;
        if (rules_.markdown) {
            cls = scan_markdown();
        } else if (rules_.markup) {
            cls = scan_markup();
        } else {
            cls = scan_code();
        }
        if (pos_ == start) {
            ++pos_;
        }
        token = Token{start, pos_, cls};
        return true;
    }

private:
    std::string_view src_;
    const Language& lang_;
    const LexicalRules& rules_;
    size_t pos_ = 0;
    size_t end_ = 0;
    bool in_tag_ = false;
    bool in_fence_ = false;

    char peek(size_t offset = 0) const {
        size_t i = pos_ + offset;
        return i < end_ ? src_[i] : '\0';
    }

    bool starts_with(const std::string& s) const {
        if (s.empty() || pos_ + s.size() > end_) return false;
        return src_.compare(pos_, s.size(), s) == 0;
    }

    char prev() const {
        return pos_ > 0 ? src_[pos_ - 1] : '\0';
    }

    bool at_line_start() const {
        size_t i = pos_;
        while (i > 0) {
            char c = src_[i - 1];
            if (c == '\n') return true;
            if (c != ' ' && c != '\t') return false;
            --i;
        }
        return true;
    }

    void skip_to_eol() {
        while (pos_ < end_ && src_[pos_] != '\n') ++pos_;
    }

    void skip_whitespace() {
        while (pos_ < end_ && is_ws(src_[pos_])) ++pos_;
    }

    void skip_identifier() {
        while (pos_ < end_) {
            char c = src_[pos_];
            if (is_ident_char(c)) {
                ++pos_;
            } else if (c == '-' && rules_.dash_in_identifiers && pos_ + 1 < end_ &&
                       is_ident_char(src_[pos_ + 1])) {
                ++pos_;
            } else {
                break;
            }
        }
    }

    char next_non_blank() const {
        size_t i = pos_;
        while (i < end_ && (src_[i] == ' ' || src_[i] == '\t')) ++i;
        return i < end_ ? src_[i] : '\0';
    }

    // Consumes through `close`, or to the end of input when unterminated.
    void skip_block(const std::string& open, const std::string& close, bool nested) {
        pos_ += open.size();
        int depth = 1;
        while (pos_ < end_) {
            if (starts_with(close)) {
                pos_ += close.size();
                if (--depth == 0) return;
            } else if (nested && starts_with(open)) {
                pos_ += open.size();
                ++depth;
            } else {
                ++pos_;
            }
        }
    }

    void skip_quoted(char quote, bool multiline, bool escapes) {
        ++pos_;
        while (pos_ < end_) {
            char c = src_[pos_];
            if (escapes && c == '\\') {
                pos_ = std::min(pos_ + 2, end_);
                continue;
            }
            if (c == quote) {
                ++pos_;
                return;
            }
            if (c == '\n' && !multiline) return;
            ++pos_;
        }
    }

    SyntaxClass scan_code() {
        char c = peek();

        if (is_ws(c)) {
            skip_whitespace();
            return SyntaxClass::Default;
        }

        if (!rules_.block_open.empty() && starts_with(rules_.block_open) &&
            (rules_.block_open[0] != '=' || at_line_start())) {
            skip_block(rules_.block_open, rules_.block_close, rules_.nested_block_comments);
            return SyntaxClass::Comment;
        }

        if (is_line_comment(rules_.line_comment) || is_line_comment(rules_.alt_line_comment)) {
            skip_to_eol();
            return SyntaxClass::Comment;
        }

        if (c == '#' && rules_.preprocessor && at_line_start()) {
            scan_preprocessor();
            return SyntaxClass::Preprocessor;
        }

        if (c == '[' && rules_.section_headers && at_line_start()) {
            while (pos_ < end_ && src_[pos_] != ']' && src_[pos_] != '\n') ++pos_;
            while (pos_ < end_ && src_[pos_] == ']') ++pos_;
            return SyntaxClass::Tag;
        }

        if (c == '#' && (peek(1) == '[' || (peek(1) == '!' && peek(2) == '['))) {
            scan_bracketed_attribute();
            return SyntaxClass::Attribute;
        }

        if (rules_.triple_quoted_strings && (starts_with("\"\"\"") || starts_with("'''"))) {
            scan_triple_quoted();
            return SyntaxClass::String;
        }

        if (!rules_.string_prefixes.empty() && !is_ident_char(prev()) && scan_prefixed_string()) {
            return SyntaxClass::String;
        }

        if (c == '"') {
            skip_quoted('"', rules_.multiline_strings, true);
            return SyntaxClass::String;
        }

        if (c == '\'') {
            return scan_single_quote();
        }

        if (c == '`' && rules_.backtick_strings) {
            skip_quoted('`', true, true);
            return SyntaxClass::String;
        }

        if (c == '$' && rules_.dollar_variables) {
            return scan_dollar();
        }

        if (c == '@' && rules_.decorators && is_ident_start(peek(1))) {
            ++pos_;
            skip_identifier();
            while (peek() == '.' && is_ident_start(peek(1))) {
                ++pos_;
                skip_identifier();
            }
            return SyntaxClass::Attribute;
        }

        if (is_digit(c) || (c == '.' && is_digit(peek(1)) && !is_ident_char(prev()))) {
            scan_number();
            return SyntaxClass::Number;
        }

        if (is_ident_start(c)) {
            return scan_word();
        }

        if (c == '#' && (is_ident_char(peek(1)))) {
            ++pos_;
            skip_identifier();
            return SyntaxClass::Tag;
        }

        if (is_operator_char(c)) {
            while (pos_ < end_ && is_operator_char(src_[pos_]) &&
                   !is_line_comment(rules_.line_comment) &&
                   !(starts_with(rules_.block_open))) {
                ++pos_;
            }
            return SyntaxClass::Operator;
        }

        ++pos_;
        return SyntaxClass::Punctuation;
    }

    bool is_line_comment(const std::string& marker) const {
        if (marker.empty() || !starts_with(marker)) return false;
        if (marker == "#") {
            // "$#" and "${#x}" in shell, "a#b" inside words are not comments
            char p = prev();
            if (is_ident_char(p) || p == '$' || p == '{') return false;
        }
        return true;
    }

    void scan_preprocessor() {
        while (pos_ < end_ && src_[pos_] != '\n') {
            if (src_[pos_] == '\\' && pos_ + 1 < end_ && src_[pos_ + 1] == '\n') {
                pos_ += 2;
                continue;
            }
            if (src_[pos_] == '\\' && pos_ + 2 < end_ && src_[pos_ + 1] == '\r' &&
                src_[pos_ + 2] == '\n') {
                pos_ += 3;
                continue;
            }
            ++pos_;
        }
    }

    void scan_bracketed_attribute() {
        int depth = 0;
        while (pos_ < end_ && src_[pos_] != '\n') {
            char c = src_[pos_++];
            if (c == '[') {
                ++depth;
            } else if (c == ']' && --depth == 0) {
                return;
            }
        }
    }

    void scan_triple_quoted() {
        std::string delim(3, src_[pos_]);
        pos_ += 3;
        while (pos_ < end_) {
            if (src_[pos_] == '\\') {
                pos_ = std::min(pos_ + 2, end_);
                continue;
            }
            if (starts_with(delim)) {
                pos_ += 3;
                return;
            }
            ++pos_;
        }
    }

    // r"..", b'x', f"..", u8"..", R"d(..)d", r#".."#, @"..", $"..".
    bool scan_prefixed_string() {
        size_t j = pos_;
        while (j < end_ && j - pos_ < 3 &&
               rules_.string_prefixes.find(src_[j]) != std::string::npos) {
            ++j;
        }
        if (j == pos_ || j >= end_) return false;

        std::string_view prefix = src_.substr(pos_, j - pos_);
        char q = src_[j];

        bool has_lower_r = prefix.find('r') != std::string_view::npos;
        if (q == '#' && has_lower_r) {
            size_t hashes = 0;
            size_t k = j;
            while (k < end_ && src_[k] == '#') {
                ++hashes;
                ++k;
            }
            if (k >= end_ || src_[k] != '"') return false;
            std::string close = "\"" + std::string(hashes, '#');
            pos_ = k + 1;
            while (pos_ < end_ && !starts_with(close)) ++pos_;
            pos_ = std::min(pos_ + close.size(), end_);
            return true;
        }

        if (q != '"' && q != '\'') return false;

        if (prefix.back() == 'R' && q == '"') {
            size_t paren = src_.find('(', j + 1);
            if (paren == std::string_view::npos || paren >= end_ || paren - j - 1 > 16) {
                return false;
            }
            std::string close = ")" + std::string(src_.substr(j + 1, paren - j - 1)) + "\"";
            pos_ = paren + 1;
            while (pos_ < end_ && !starts_with(close)) ++pos_;
            pos_ = std::min(pos_ + close.size(), end_);
            return true;
        }

        pos_ = j;
        if (rules_.triple_quoted_strings && (starts_with("\"\"\"") || starts_with("'''"))) {
            scan_triple_quoted();
            return true;
        }

        bool verbatim = prefix.find('@') != std::string_view::npos;
        if (verbatim) {
            ++pos_;
            while (pos_ < end_) {
                if (src_[pos_] == q) {
                    if (pos_ + 1 < end_ && src_[pos_ + 1] == q) {
                        pos_ += 2;
                        continue;
                    }
                    ++pos_;
                    break;
                }
                ++pos_;
            }
            return true;
        }

        skip_quoted(q, rules_.multiline_strings, !has_lower_r);
        return true;
    }

    SyntaxClass scan_single_quote() {
        if (!rules_.char_literals) {
            if (is_ident_char(prev())) {
                ++pos_;
                return SyntaxClass::Punctuation;
            }
            skip_quoted('\'', rules_.multiline_strings, true);
            return SyntaxClass::String;
        }

        // 'x', '\n', '\u{1F600}', or a lifetime / label such as 'a
        size_t j = pos_ + 1;
        if (j < end_ && src_[j] == '\\') {
            size_t k = j + 1;
            while (k < end_ && k - j < 12 && src_[k] != '\'' && src_[k] != '\n') ++k;
            if (k < end_ && src_[k] == '\'' && k > j + 1) {
                pos_ = k + 1;
                return SyntaxClass::String;
            }
        } else if (j < end_ && src_[j] != '\'' && src_[j] != '\n') {
            size_t k = j + 1;
            while (k < end_ && (static_cast<unsigned char>(src_[k]) & 0xC0) == 0x80) ++k;
            if (k < end_ && src_[k] == '\'') {
                pos_ = k + 1;
                return SyntaxClass::String;
            }
        }

        if (is_ident_start(peek(1))) {
            ++pos_;
            skip_identifier();
            return SyntaxClass::Attribute;
        }
        ++pos_;
        return SyntaxClass::Punctuation;
    }

    SyntaxClass scan_dollar() {
        char n = peek(1);
        if (n == '{') {
            pos_ += 2;
            int depth = 1;
            while (pos_ < end_ && src_[pos_] != '\n') {
                char c = src_[pos_++];
                if (c == '{') {
                    ++depth;
                } else if (c == '}' && --depth == 0) {
                    break;
                }
            }
            return SyntaxClass::Identifier;
        }
        if (is_ident_start(n)) {
            ++pos_;
            skip_identifier();
            return SyntaxClass::Identifier;
        }
        if (is_digit(n) || (n != '\0' && std::strchr("@*#?$!-_", n))) {
            pos_ += 2;
            return SyntaxClass::Identifier;
        }
        ++pos_;
        return SyntaxClass::Punctuation;
    }

    void scan_number() {
        if (peek() == '0' && (peek(1) == 'x' || peek(1) == 'X' || peek(1) == 'b' ||
                              peek(1) == 'B' || peek(1) == 'o' || peek(1) == 'O')) {
            pos_ += 2;
            while (pos_ < end_ && (std::isxdigit(static_cast<unsigned char>(src_[pos_])) ||
                                   src_[pos_] == '_' || src_[pos_] == '\'')) {
                ++pos_;
            }
        } else {
            while (pos_ < end_ && (is_digit(src_[pos_]) || src_[pos_] == '_' ||
                                   (src_[pos_] == '\'' && pos_ + 1 < end_ &&
                                    is_digit(src_[pos_ + 1])))) {
                ++pos_;
            }
            if (peek() == '.' && is_digit(peek(1))) {
                ++pos_;
                while (pos_ < end_ && (is_digit(src_[pos_]) || src_[pos_] == '_')) ++pos_;
            }
            if ((peek() == 'e' || peek() == 'E') &&
                (is_digit(peek(1)) || ((peek(1) == '+' || peek(1) == '-') && is_digit(peek(2))))) {
                pos_ += 2;
                while (pos_ < end_ && is_digit(src_[pos_])) ++pos_;
            }
        }
        // suffixes: 10u, 1.0f, 42i64, 3L
        while (pos_ < end_ && (is_alpha(src_[pos_]) || is_digit(src_[pos_]) || src_[pos_] == '_')) {
            ++pos_;
        }
    }

    SyntaxClass scan_word() {
        bool line_start = at_line_start();
        size_t start = pos_;
        skip_identifier();
        std::string word(src_.substr(start, pos_ - start));

        std::string key = rules_.case_insensitive_keywords ? to_lower(word) : word;
        if (lang_.keywords.count(key)) return SyntaxClass::Keyword;
        if (lang_.types.count(key)) return SyntaxClass::Type;

        char after = next_non_blank();
        if (after == '(') return SyntaxClass::Function;
        if (peek() == '!' && (peek(1) == '(' || peek(1) == '[' || peek(1) == '{')) {
            ++pos_;
            return SyntaxClass::Function;
        }

        if (rules_.dash_in_identifiers && line_start && (after == ':' || after == '=')) {
            return SyntaxClass::Attribute;
        }

        // Foo and T are types, FOO_BAR is a constant
        if (rules_.capitalized_types && std::isupper(static_cast<unsigned char>(word[0]))) {
            if (word.size() == 1) return SyntaxClass::Type;
            for (char ch : word) {
                if (std::islower(static_cast<unsigned char>(ch))) return SyntaxClass::Type;
            }
        }
        return SyntaxClass::Identifier;
    }

    SyntaxClass scan_markup() {
        char c = peek();

        if (is_ws(c)) {
            skip_whitespace();
            return SyntaxClass::Default;
        }

        if (starts_with(rules_.block_open)) {
            skip_block(rules_.block_open, rules_.block_close, false);
            return SyntaxClass::Comment;
        }

        if (starts_with("<![CDATA[")) {
            skip_block("<![CDATA[", "]]>", false);
            return SyntaxClass::String;
        }

        if (in_tag_) {
            if (c == '>') {
                ++pos_;
                in_tag_ = false;
                return SyntaxClass::Tag;
            }
            if ((c == '/' || c == '?') && peek(1) == '>') {
                pos_ += 2;
                in_tag_ = false;
                return SyntaxClass::Tag;
            }
            if (c == '"' || c == '\'') {
                skip_quoted(c, true, false);
                return SyntaxClass::String;
            }
            if (is_ident_start(c)) {
                while (pos_ < end_ && (is_ident_char(src_[pos_]) || src_[pos_] == '-' ||
                                       src_[pos_] == ':' || src_[pos_] == '.')) {
                    ++pos_;
                }
                return SyntaxClass::Attribute;
            }
            if (c == '=') {
                ++pos_;
                return SyntaxClass::Operator;
            }
            ++pos_;
            return SyntaxClass::Punctuation;
        }

        if (c == '<' && (is_alpha(peek(1)) || peek(1) == '/' || peek(1) == '!' || peek(1) == '?')) {
            ++pos_;
            if (peek() == '/' || peek() == '!' || peek() == '?') ++pos_;
            while (pos_ < end_ && (is_ident_char(src_[pos_]) || src_[pos_] == '-' ||
                                   src_[pos_] == ':' || src_[pos_] == '.')) {
                ++pos_;
            }
            in_tag_ = true;
            return SyntaxClass::Tag;
        }

        if (c == '&') {
            size_t semi = src_.find(';', pos_);
            if (semi != std::string_view::npos && semi < end_ && semi - pos_ <= 10) {
                bool entity = true;
                for (size_t i = pos_ + 1; i < semi; ++i) {
                    if (!is_ident_char(src_[i]) && src_[i] != '#') entity = false;
                }
                if (entity && semi > pos_ + 1) {
                    pos_ = semi + 1;
                    return SyntaxClass::Keyword;
                }
            }
            ++pos_;
            return SyntaxClass::Default;
        }

        while (pos_ < end_ && !is_ws(src_[pos_]) && src_[pos_] != '<' && src_[pos_] != '&') {
            ++pos_;
        }
        return SyntaxClass::Default;
    }

    bool fence_marker() const {
        return starts_with("```") || starts_with("~~~");
    }

    SyntaxClass scan_markdown() {
        char c = peek();

        if (in_fence_) {
            bool closing = at_line_start() && fence_marker();
            skip_to_eol();
            if (pos_ < end_) ++pos_;
            if (closing) in_fence_ = false;
            return SyntaxClass::String;
        }

        if (is_ws(c)) {
            skip_whitespace();
            return SyntaxClass::Default;
        }

        if (starts_with(rules_.block_open)) {
            skip_block(rules_.block_open, rules_.block_close, false);
            return SyntaxClass::Comment;
        }

        if (at_line_start()) {
            if (fence_marker()) {
                skip_to_eol();
                in_fence_ = true;
                return SyntaxClass::String;
            }
            if (c == '#') {
                size_t j = pos_;
                while (j < end_ && src_[j] == '#') ++j;
                if (j - pos_ <= 6 && (j >= end_ || src_[j] == ' ' || src_[j] == '\n')) {
                    skip_to_eol();
                    return SyntaxClass::Keyword;
                }
            }
            if (c == '>') {
                skip_to_eol();
                return SyntaxClass::Comment;
            }
            if ((c == '-' || c == '*' || c == '+') && (peek(1) == ' ' || peek(1) == '\t')) {
                ++pos_;
                return SyntaxClass::Punctuation;
            }
            if (is_digit(c)) {
                size_t j = pos_;
                while (j < end_ && is_digit(src_[j])) ++j;
                if (j < end_ && (src_[j] == '.' || src_[j] == ')')) {
                    pos_ = j + 1;
                    return SyntaxClass::Number;
                }
            }
        }

        if (c == '`') {
            size_t close = src_.find('`', pos_ + 1);
            size_t eol = src_.find('\n', pos_ + 1);
            if (close != std::string_view::npos && close < end_ &&
                (eol == std::string_view::npos || close < eol)) {
                pos_ = close + 1;
                return SyntaxClass::String;
            }
            ++pos_;
            return SyntaxClass::Punctuation;
        }

        if (c == '*' || c == '_') {
            while (pos_ < end_ && src_[pos_] == c) ++pos_;
            return SyntaxClass::Operator;
        }

        if (std::strchr("[]()!", c)) {
            ++pos_;
            return SyntaxClass::Punctuation;
        }

        while (pos_ < end_ && !is_ws(src_[pos_]) && !std::strchr("`*_[]()!<", src_[pos_])) {
            ++pos_;
        }
        return SyntaxClass::Default;
    }
};

}

std::unique_ptr<TokenStream> LexicalClassifier::classify(std::string_view source,
                                                         const Language& language) const {
    return std::make_unique<LexStream>(source, language);
}

}
