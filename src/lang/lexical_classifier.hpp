#pragma once

#include "classifier.hpp"

namespace minimap {

// Table-driven lexer covering the languages of builtin_languages(). It works on
// one token at a time, so block comments and strings may span any number of lines.
// Input containing a NUL byte is rejected with ClassifierError once the stream
// reaches that byte.
class LexicalClassifier : public TokenClassifier {
public:
    std::unique_ptr<TokenStream> classify(std::string_view source,
                                          const Language& language) const override;
};

}
