#pragma once

#include <cstdint>
#include <cstddef>
#include <string>
#include <optional>

namespace minimap {

enum class ErrorCode {
    SUCCESS = 0,
    UNKNOWN_LANGUAGE,
    UNDETERMINED_LANGUAGE,
    CLASSIFIER_FAILURE,
    UNREADABLE_INPUT,
    BROKEN_PIPE,
    OUTPUT_ERROR,
    INVALID_ARGUMENT
};

struct Result {
    ErrorCode error = ErrorCode::SUCCESS;
    std::string message;

    bool success() const { return error == ErrorCode::SUCCESS; }
    bool failure() const { return error != ErrorCode::SUCCESS; }

    static Result ok() { return {ErrorCode::SUCCESS, ""}; }
    static Result fail(ErrorCode code, const std::string& msg) { return {code, msg}; }
};

struct Color {
    uint8_t r = 0, g = 0, b = 0;

    Color() = default;
    Color(uint8_t r, uint8_t g, uint8_t b) : r(r), g(g), b(b) {}

    bool operator==(const Color& other) const {
        return r == other.r && g == other.g && b == other.b;
    }
    bool operator!=(const Color& other) const { return !(*this == other); }

    uint32_t packed() const {
        return (static_cast<uint32_t>(r) << 16) | (static_cast<uint32_t>(g) << 8) | b;
    }
};

// Closed set of syntax classes understood by the color mapper. Every classifier
// normalises its output into this enumeration; bump the version when it changes.
constexpr int SYNTAX_CLASS_VERSION = 1;

enum class SyntaxClass : uint8_t {
    Default = 0,
    Keyword,
    Type,
    String,
    Comment,
    Number,
    Function,
    Identifier,
    Operator,
    Punctuation,
    Preprocessor,
    Attribute,
    Tag,
    Count
};

constexpr size_t SYNTAX_CLASS_COUNT = static_cast<size_t>(SyntaxClass::Count);

inline const char* syntax_class_name(SyntaxClass cls) {
    switch (cls) {
        case SyntaxClass::Default: return "default";
        case SyntaxClass::Keyword: return "keyword";
        case SyntaxClass::Type: return "type";
        case SyntaxClass::String: return "string";
        case SyntaxClass::Comment: return "comment";
        case SyntaxClass::Number: return "number";
        case SyntaxClass::Function: return "function";
        case SyntaxClass::Identifier: return "identifier";
        case SyntaxClass::Operator: return "operator";
        case SyntaxClass::Punctuation: return "punctuation";
        case SyntaxClass::Preprocessor: return "preprocessor";
        case SyntaxClass::Attribute: return "attribute";
        case SyntaxClass::Tag: return "tag";
        case SyntaxClass::Count: break;
    }
    return "default";
}

inline std::optional<SyntaxClass> parse_syntax_class(const std::string& name) {
    for (size_t i = 0; i < SYNTAX_CLASS_COUNT; ++i) {
        SyntaxClass cls = static_cast<SyntaxClass>(i);
        if (name == syntax_class_name(cls)) return cls;
    }
    return std::nullopt;
}

// Byte range [start, end) of the input tagged with a syntax class.
struct Token {
    size_t start = 0;
    size_t end = 0;
    SyntaxClass cls = SyntaxClass::Default;

    size_t length() const { return end > start ? end - start : 0; }
    bool empty() const { return end <= start; }
};

}
