#include "classifier.hpp"
#include <algorithm>
#include <utility>

namespace minimap {

namespace {

class SingleTokenStream : public TokenStream {
public:
    explicit SingleTokenStream(size_t size) : size_(size) {}

    bool next(Token& token) override {
        if (done_ || size_ == 0) return false;
        token = Token{0, size_, SyntaxClass::Default};
        done_ = true;
        return true;
    }

private:
    size_t size_;
    bool done_ = false;
};

class NormalizingStream : public TokenStream {
public:
    NormalizingStream(std::unique_ptr<TokenStream> inner, size_t size)
        : inner_(std::move(inner)), size_(size) {}

    bool next(Token& token) override {
        if (has_pending_) {
            has_pending_ = false;
            return emit(pending_, token);
        }

        while (pos_ < size_ && inner_ && !inner_done_) {
            Token raw;
            if (!inner_->next(raw)) {
                inner_done_ = true;
                break;
            }
            size_t start = std::max(raw.start, pos_);
            size_t end = std::min(raw.end, size_);
            if (end <= start) continue;

            Token clipped{start, end, raw.cls};
            if (static_cast<size_t>(clipped.cls) >= SYNTAX_CLASS_COUNT) {
                clipped.cls = SyntaxClass::Default;
            }
            if (start > pos_) {
                pending_ = clipped;
                has_pending_ = true;
                return emit(Token{pos_, start, SyntaxClass::Default}, token);
            }
            return emit(clipped, token);
        }

        if (pos_ < size_) {
            return emit(Token{pos_, size_, SyntaxClass::Default}, token);
        }
        return false;
    }

private:
    std::unique_ptr<TokenStream> inner_;
    size_t size_;
    size_t pos_ = 0;
    bool inner_done_ = false;
    bool has_pending_ = false;
    Token pending_;

    bool emit(const Token& t, Token& out) {
        out = t;
        pos_ = t.end;
        return true;
    }
};

}

std::unique_ptr<TokenStream> PlainClassifier::classify(std::string_view source,
                                                       const Language&) const {
    return std::make_unique<SingleTokenStream>(source.size());
}

std::unique_ptr<TokenStream> normalize_tokens(std::unique_ptr<TokenStream> inner, size_t size) {
    return std::make_unique<NormalizingStream>(std::move(inner), size);
}

}
