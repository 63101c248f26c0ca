#pragma once

#include "core/types.hpp"
#include "language.hpp"
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>

namespace minimap {

class ClassifierError : public std::runtime_error {
public:
    explicit ClassifierError(const std::string& what) : std::runtime_error(what) {}
};

// Lazy, single-pass sequence of tokens over one input.
class TokenStream {
public:
    virtual ~TokenStream() = default;

    // Returns false once the input is exhausted. May throw ClassifierError.
    virtual bool next(Token& token) = 0;
};

class TokenClassifier {
public:
    virtual ~TokenClassifier() = default;

    // The returned stream borrows `source`; it must outlive the stream.
    virtual std::unique_ptr<TokenStream> classify(std::string_view source,
                                                  const Language& language) const = 0;
};

// Whole input as a single default-class token.
class PlainClassifier : public TokenClassifier {
public:
    std::unique_ptr<TokenStream> classify(std::string_view source,
                                          const Language& language) const override;
};

// Wraps any stream so that its tokens are contiguous, never overlap and cover
// [0, size) exactly: gaps and the tail become default-class tokens, overlapping
// or out-of-range tokens are clipped, empty ones dropped.
std::unique_ptr<TokenStream> normalize_tokens(std::unique_ptr<TokenStream> inner, size_t size);

}
