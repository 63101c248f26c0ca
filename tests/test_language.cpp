#include <iostream>
#include <cassert>
#include <memory>
#include <string>
#include <string_view>
#include <vector>
#include <stdexcept>

#include "../src/core/types.hpp"
#include "../src/lang/language.hpp"
#include "../src/lang/resolver.hpp"
#include "../src/lang/classifier.hpp"
#include "../src/lang/lexical_classifier.hpp"

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

static const LanguageRegistry& registry() {
    static const LanguageRegistry reg;
    return reg;
}

static std::vector<Token> lex(std::string_view src, const std::string& lang_name) {
    const Language* lang = registry().find_by_name(lang_name);
    assert(lang && "language missing from builtin table");
    LexicalClassifier classifier;
    auto stream = classifier.classify(src, *lang);
    std::vector<Token> tokens;
    Token tok;
    while (stream->next(tok)) {
        tokens.push_back(tok);
    }
    return tokens;
}

static SyntaxClass class_at(const std::vector<Token>& tokens, size_t offset) {
    for (const auto& t : tokens) {
        if (offset >= t.start && offset < t.end) return t.cls;
    }
    throw std::runtime_error("offset not covered by any token");
}

static void assert_covers(const std::vector<Token>& tokens, size_t size) {
    size_t pos = 0;
    for (const auto& t : tokens) {
        assert(t.start == pos);
        assert(t.end > t.start);
        pos = t.end;
    }
    assert(pos == size);
}

class VectorStream : public TokenStream {
public:
    explicit VectorStream(std::vector<Token> tokens) : tokens_(std::move(tokens)) {}
    bool next(Token& token) override {
        if (idx_ >= tokens_.size()) return false;
        token = tokens_[idx_++];
        return true;
    }
private:
    std::vector<Token> tokens_;
    size_t idx_ = 0;
};

static Resolution resolve(const std::optional<std::string>& override_name,
                          const std::optional<std::string>& filename,
                          std::string_view head, Result* result = nullptr) {
    LanguageResolver resolver(registry());
    ResolveRequest req;
    req.override_name = override_name;
    req.filename = filename;
    req.head = head;
    Resolution res;
    Result r = resolver.resolve(req, res);
    if (result) *result = r;
    return res;
}

TEST(registry_lookup_by_token) {
    const auto& reg = registry();
    assert(reg.find_by_token("rust")->name == "rust");
    assert(reg.find_by_token("RS")->name == "rust");
    assert(reg.find_by_token(".hpp")->name == "cpp");
    assert(reg.find_by_token("c++")->name == "cpp");
    assert(reg.find_by_token("py")->name == "python");
    assert(reg.find_by_token("nope") == nullptr);
    assert(reg.find_by_token("") == nullptr);
}

TEST(registry_lookup_by_filename) {
    const auto& reg = registry();
    assert(reg.find_by_filename("src/main.rs")->name == "rust");
    assert(reg.find_by_filename("Makefile")->name == "make");
    assert(reg.find_by_filename("/work/CMakeLists.txt")->name == "cmake");
    assert(reg.find_by_filename("/home/me/.bashrc")->name == "shell");
    assert(reg.find_by_filename("notes.TXT")->name == "plain");
    assert(reg.find_by_filename("README") == nullptr);
    assert(reg.find_by_filename(".hidden") == nullptr);
    assert(reg.find_by_filename("trailing.") == nullptr);
}

TEST(registry_lookup_by_interpreter) {
    const auto& reg = registry();
    assert(reg.find_by_interpreter("python3.11")->name == "python");
    assert(reg.find_by_interpreter("bash")->name == "shell");
    assert(reg.find_by_interpreter("perl5")->name == "perl");
    assert(reg.find_by_interpreter("node")->name == "javascript");
    assert(reg.find_by_interpreter("cobol") == nullptr);
    assert(reg.find_by_interpreter("42") == nullptr);
}

TEST(registry_extra_extensions) {
    LanguageRegistry reg;
    assert(reg.find_by_filename("x.foo") == nullptr);
    assert(reg.add_extension(".foo", "rust"));
    assert(reg.find_by_filename("x.foo")->name == "rust");
    assert(reg.add_extension("h", "cpp"));
    assert(reg.find_by_filename("x.h")->name == "cpp");
    assert(!reg.add_extension("bar", "klingon"));
    assert(!reg.add_extension(".", "rust"));
}

TEST(registry_always_has_plain_text) {
    LanguageRegistry empty{std::vector<Language>{}};
    assert(empty.languages().size() == 1);
    assert(empty.plain_text().is_plain());
    assert(registry().plain_text().name == "plain");
}

TEST(builtin_table_is_unique) {
    const auto langs = builtin_languages();
    assert(langs.size() >= 30);
    for (size_t i = 0; i < langs.size(); ++i) {
        assert(!langs[i].name.empty());
        assert(!langs[i].display_name.empty());
        for (size_t j = i + 1; j < langs.size(); ++j) {
            assert(langs[i].name != langs[j].name);
        }
    }
}

TEST(override_beats_extension) {
    Result r;
    Resolution res = resolve(std::string("rust"), std::string("a.py"), "", &r);
    assert(r.success());
    assert(res.language->name == "rust");
    assert(res.source == ResolveSource::Override);
}

TEST(unknown_override_fails) {
    Result r;
    Resolution res = resolve(std::string("klingon"), std::string("a.rs"), "", &r);
    assert(r.error == ErrorCode::UNKNOWN_LANGUAGE);
    assert(r.message.find("klingon") != std::string::npos);
    assert(res.language == nullptr);
}

TEST(extension_beats_shebang) {
    Result r;
    Resolution res = resolve(std::nullopt, std::string("tool.py"), "#!/bin/bash\necho hi\n", &r);
    assert(r.success());
    assert(res.language->name == "python");
    assert(res.source == ResolveSource::Filename);
}

TEST(shebang_detection) {
    Resolution res = resolve(std::nullopt, std::nullopt, "#!/usr/bin/env python3\nprint(1)\n");
    assert(res.language->name == "python");
    assert(res.source == ResolveSource::Shebang);

    res = resolve(std::nullopt, std::string("script"), "#!/bin/sh\nls\n");
    assert(res.language->name == "shell");
    assert(res.source == ResolveSource::Shebang);

    res = resolve(std::nullopt, std::nullopt, "#! /usr/bin/env -S bash -e\n");
    assert(res.language->name == "shell");

    res = resolve(std::nullopt, std::nullopt, "#!/usr/bin/env RUBYOPT=-w ruby\n");
    assert(res.language->name == "ruby");

    res = resolve(std::nullopt, std::nullopt, "#!/usr/local/bin/perl -w\r\n");
    assert(res.language->name == "perl");
}

TEST(shebang_parsing) {
    LanguageResolver resolver(registry());
    assert(resolver.shebang_interpreter("#!/usr/bin/env node\n").value() == "node");
    assert(resolver.shebang_interpreter("#!/usr/bin/env -Spython3 -u\n").value() == "python3");
    assert(!resolver.shebang_interpreter("# not a shebang\n"));
    assert(!resolver.shebang_interpreter("#!\n"));
    assert(!resolver.shebang_interpreter("#!/usr/bin/env\n"));
}

TEST(modeline_detection) {
    Resolution res = resolve(std::nullopt, std::nullopt, "// -*- mode: C++ -*-\nint x;\n");
    assert(res.language->name == "cpp");
    assert(res.source == ResolveSource::ModeLine);
    assert(std::string(resolve_source_name(res.source)) == "modeline");

    res = resolve(std::nullopt, std::nullopt, "# vim: set ft=python:\nx = 1\n");
    assert(res.language->name == "python");

    res = resolve(std::nullopt, std::nullopt, "; -*- ruby -*-\n");
    assert(res.language->name == "ruby");

    res = resolve(std::nullopt, std::nullopt, "\n\n/* vi: syntax=c */\n");
    assert(res.language->name == "c");

    res = resolve(std::nullopt, std::nullopt, "x\n# -*- coding: utf-8; mode: shell-script -*-\n");
    assert(res.language->name == "shell");
}

TEST(modeline_only_in_first_lines) {
    Result r;
    Resolution res = resolve(std::nullopt, std::nullopt, "1\n2\n3\n4\n5\n# vim: ft=python\n", &r);
    assert(r.error == ErrorCode::UNDETERMINED_LANGUAGE);
    assert(res.language->is_plain());
}

TEST(modeline_needs_word_boundary) {
    LanguageResolver resolver(registry());
    assert(!resolver.modeline_language("see index: ft=python\n"));
    assert(resolver.modeline_language("  vim: filetype=go\n").value() == "go");
}

TEST(undetermined_falls_back_to_plain) {
    Result r;
    Resolution res = resolve(std::nullopt, std::string("notes.zzz"), "hello world\n", &r);
    assert(r.error == ErrorCode::UNDETERMINED_LANGUAGE);
    assert(res.language != nullptr);
    assert(res.language->is_plain());
    assert(res.source == ResolveSource::Fallback);
    assert(std::string(resolve_source_name(res.source)) == "fallback");
}

TEST(plain_classifier_single_token) {
    PlainClassifier plain;
    auto stream = plain.classify("abc\ndef", registry().plain_text());
    Token tok;
    assert(stream->next(tok));
    assert(tok.start == 0 && tok.end == 7);
    assert(tok.cls == SyntaxClass::Default);
    assert(!stream->next(tok));

    auto empty = plain.classify("", registry().plain_text());
    assert(!empty->next(tok));
}

TEST(normalizer_fills_gaps_and_clips) {
    std::vector<Token> raw = {
        {2, 4, SyntaxClass::Keyword},
        {3, 6, SyntaxClass::String},
        {8, 8, SyntaxClass::Number},
        {9, 20, SyntaxClass::Comment},
    };
    auto stream = normalize_tokens(std::make_unique<VectorStream>(raw), 10);
    std::vector<Token> out;
    Token tok;
    while (stream->next(tok)) out.push_back(tok);

    assert(out.size() == 5);
    assert(out[0].start == 0 && out[0].end == 2 && out[0].cls == SyntaxClass::Default);
    assert(out[1].start == 2 && out[1].end == 4 && out[1].cls == SyntaxClass::Keyword);
    assert(out[2].start == 4 && out[2].end == 6 && out[2].cls == SyntaxClass::String);
    assert(out[3].start == 6 && out[3].end == 9 && out[3].cls == SyntaxClass::Default);
    assert(out[4].start == 9 && out[4].end == 10 && out[4].cls == SyntaxClass::Comment);
}

TEST(normalizer_covers_empty_stream) {
    auto stream = normalize_tokens(std::make_unique<VectorStream>(std::vector<Token>{}), 5);
    Token tok;
    assert(stream->next(tok));
    assert(tok.start == 0 && tok.end == 5 && tok.cls == SyntaxClass::Default);
    assert(!stream->next(tok));
}

TEST(normalizer_replaces_out_of_range_class) {
    std::vector<Token> raw = {{0, 3, static_cast<SyntaxClass>(200)}};
    auto stream = normalize_tokens(std::make_unique<VectorStream>(raw), 3);
    Token tok;
    assert(stream->next(tok));
    assert(tok.cls == SyntaxClass::Default);
}

TEST(lex_rust_function) {
    std::string src = "fn main() {}\n";
    auto tokens = lex(src, "rust");
    assert_covers(tokens, src.size());
    assert(class_at(tokens, 0) == SyntaxClass::Keyword);
    assert(class_at(tokens, 1) == SyntaxClass::Keyword);
    assert(class_at(tokens, 2) == SyntaxClass::Default);
    for (size_t i = 3; i < 7; ++i) {
        assert(class_at(tokens, i) == SyntaxClass::Function);
    }
    assert(class_at(tokens, 7) == SyntaxClass::Punctuation);
    assert(class_at(tokens, 11) == SyntaxClass::Punctuation);
}

TEST(lex_rust_specifics) {
    std::string src = "#[derive(Debug)]\nstruct S<'a> { s: &'a str }\nlet r = r#\"raw\"#; println!(\"{}\", 'x');\n";
    auto tokens = lex(src, "rust");
    assert_covers(tokens, src.size());
    assert(class_at(tokens, 0) == SyntaxClass::Attribute);
    assert(class_at(tokens, src.find("struct")) == SyntaxClass::Keyword);
    assert(class_at(tokens, src.find("S<")) == SyntaxClass::Type);
    assert(class_at(tokens, src.find("'a>")) == SyntaxClass::Attribute);
    assert(class_at(tokens, src.find("str }")) == SyntaxClass::Type);
    assert(class_at(tokens, src.find("r#\"")) == SyntaxClass::String);
    assert(class_at(tokens, src.find("raw")) == SyntaxClass::String);
    assert(class_at(tokens, src.find("println")) == SyntaxClass::Function);
    assert(class_at(tokens, src.find("'x'") + 1) == SyntaxClass::String);
}

TEST(lex_cpp) {
    std::string src = "#include <vector>\nint f(); // hi\nauto s = R\"(a\"b)\"; float x = 1.5e3f;\n";
    auto tokens = lex(src, "cpp");
    assert_covers(tokens, src.size());
    assert(class_at(tokens, 0) == SyntaxClass::Preprocessor);
    assert(class_at(tokens, src.find("vector")) == SyntaxClass::Preprocessor);
    assert(class_at(tokens, src.find("int")) == SyntaxClass::Type);
    assert(class_at(tokens, src.find("f()")) == SyntaxClass::Function);
    assert(class_at(tokens, src.find("// hi")) == SyntaxClass::Comment);
    assert(class_at(tokens, src.find("auto")) == SyntaxClass::Keyword);
    assert(class_at(tokens, src.find("a\"b")) == SyntaxClass::String);
    assert(class_at(tokens, src.find("b)")) == SyntaxClass::String);
    assert(class_at(tokens, src.find("1.5e3f")) == SyntaxClass::Number);
    assert(class_at(tokens, src.find("= 1")) == SyntaxClass::Operator);
}

TEST(lex_block_comment_spans_lines) {
    std::string src = "/* a\nb */ x";
    auto tokens = lex(src, "c");
    assert_covers(tokens, src.size());
    assert(tokens[0].start == 0 && tokens[0].end == 9);
    assert(tokens[0].cls == SyntaxClass::Comment);
    assert(class_at(tokens, src.size() - 1) == SyntaxClass::Identifier);
}

TEST(lex_nested_comments) {
    std::string src = "/* a /* b */ c */x";
    auto tokens = lex(src, "rust");
    assert(tokens[0].cls == SyntaxClass::Comment);
    assert(tokens[0].end == src.size() - 1);

    auto flat = lex(src, "c");
    assert(flat[0].end == src.find("*/") + 2);
}

TEST(lex_python) {
    std::string src = "@cache\ndef f(x):\n    \"\"\"doc\nmore\"\"\"\n    return 'x'  # c\n";
    auto tokens = lex(src, "python");
    assert_covers(tokens, src.size());
    assert(class_at(tokens, 0) == SyntaxClass::Attribute);
    assert(class_at(tokens, src.find("def")) == SyntaxClass::Keyword);
    assert(class_at(tokens, src.find("f(")) == SyntaxClass::Function);
    assert(class_at(tokens, src.find("more")) == SyntaxClass::String);
    assert(class_at(tokens, src.find("'x'")) == SyntaxClass::String);
    assert(class_at(tokens, src.find("# c")) == SyntaxClass::Comment);
}

TEST(lex_shell) {
    std::string src = "echo \"$HOME\" ${#arr} $1 # note\n";
    auto tokens = lex(src, "shell");
    assert_covers(tokens, src.size());
    assert(class_at(tokens, 0) == SyntaxClass::Keyword);
    assert(class_at(tokens, src.find("\"$HOME")) == SyntaxClass::String);
    assert(class_at(tokens, src.find("${#")) == SyntaxClass::Identifier);
    assert(class_at(tokens, src.find("#arr")) == SyntaxClass::Identifier);
    assert(class_at(tokens, src.find("$1")) == SyntaxClass::Identifier);
    assert(class_at(tokens, src.find("# note")) == SyntaxClass::Comment);
}

TEST(lex_sql_case_insensitive) {
    std::string src = "SELECT id FROM t -- all\n";
    auto tokens = lex(src, "sql");
    assert(class_at(tokens, 0) == SyntaxClass::Keyword);
    assert(class_at(tokens, src.find("FROM")) == SyntaxClass::Keyword);
    assert(class_at(tokens, src.find("id")) == SyntaxClass::Identifier);
    assert(class_at(tokens, src.find("--")) == SyntaxClass::Comment);
}

TEST(lex_config_formats) {
    std::string toml = "[package]\nname = \"x\" # c\n";
    auto tokens = lex(toml, "toml");
    assert(class_at(tokens, 0) == SyntaxClass::Tag);
    assert(class_at(tokens, toml.find("name")) == SyntaxClass::Attribute);
    assert(class_at(tokens, toml.find("\"x\"")) == SyntaxClass::String);
    assert(class_at(tokens, toml.find("# c")) == SyntaxClass::Comment);

    std::string ini = "; top\n[core]\nbare = true\n";
    tokens = lex(ini, "ini");
    assert(class_at(tokens, 0) == SyntaxClass::Comment);
    assert(class_at(tokens, ini.find("[core]")) == SyntaxClass::Tag);
    assert(class_at(tokens, ini.find("true")) == SyntaxClass::Keyword);
}

TEST(lex_markup) {
    std::string src = "<!-- c -->\n<a href=\"x\">t &amp; u</a>\n";
    auto tokens = lex(src, "html");
    assert_covers(tokens, src.size());
    assert(class_at(tokens, 0) == SyntaxClass::Comment);
    assert(class_at(tokens, src.find("<a")) == SyntaxClass::Tag);
    assert(class_at(tokens, src.find("href")) == SyntaxClass::Attribute);
    assert(class_at(tokens, src.find("=\"")) == SyntaxClass::Operator);
    assert(class_at(tokens, src.find("\"x\"")) == SyntaxClass::String);
    assert(class_at(tokens, src.find(">t")) == SyntaxClass::Tag);
    assert(class_at(tokens, src.find("t &")) == SyntaxClass::Default);
    assert(class_at(tokens, src.find("&amp;")) == SyntaxClass::Keyword);
    assert(class_at(tokens, src.find("</a")) == SyntaxClass::Tag);
}

TEST(lex_markdown) {
    std::string src = "# Title\ntext `code` *em*\n```\nfenced\n```\n> quote\n";
    auto tokens = lex(src, "markdown");
    assert_covers(tokens, src.size());
    assert(class_at(tokens, 0) == SyntaxClass::Keyword);
    assert(class_at(tokens, src.find("text")) == SyntaxClass::Default);
    assert(class_at(tokens, src.find("`code`")) == SyntaxClass::String);
    assert(class_at(tokens, src.find("*em")) == SyntaxClass::Operator);
    assert(class_at(tokens, src.find("fenced")) == SyntaxClass::String);
    assert(class_at(tokens, src.find("> quote")) == SyntaxClass::Comment);
}

TEST(lex_unterminated_constructs) {
    std::string src = "/* never closed\nstill";
    auto tokens = lex(src, "c");
    assert(tokens.size() == 1);
    assert(tokens[0].cls == SyntaxClass::Comment);

    std::string str = "x = \"open\ny";
    tokens = lex(str, "c");
    assert_covers(tokens, str.size());
    assert(class_at(tokens, str.find("open")) == SyntaxClass::String);
    assert(class_at(tokens, str.size() - 1) == SyntaxClass::Identifier);
}

TEST(lex_utf8_not_split) {
    std::string src = "let é = \"日本\";";
    auto tokens = lex(src, "rust");
    assert_covers(tokens, src.size());
    size_t e = src.find("é");
    assert(class_at(tokens, e) == class_at(tokens, e + 1));
}

TEST(lex_nul_byte_raises) {
    std::string src("ab\0cd", 5);
    const Language* lang = registry().find_by_name("c");
    LexicalClassifier classifier;
    auto stream = classifier.classify(src, *lang);
    Token tok;
    assert(stream->next(tok));
    assert(tok.start == 0 && tok.end == 2);
    bool threw = false;
    try {
        stream->next(tok);
    } catch (const ClassifierError& e) {
        threw = true;
        assert(std::string(e.what()).find("offset 2") != std::string::npos);
    }
    assert(threw && "Should throw on NUL byte");
}

TEST(lex_every_language_covers_input) {
    const std::string sample =
        "#!/bin/x\n// c\n/* b */ # h\n-- d\n<tag a=\"1\">\n'q' \"s\" `t` $v @d 0x1F 3.14\n"
        "fn f(a, b) { return a+b; }\n[sec]\nkey: value\n\tTAB\r\n";
    for (const Language& lang : registry().languages()) {
        LexicalClassifier classifier;
        auto stream = classifier.classify(sample, lang);
        std::vector<Token> tokens;
        Token tok;
        while (stream->next(tok)) tokens.push_back(tok);
        assert_covers(tokens, sample.size());
    }
}

int main() {
    std::cout << "=== Language Tests ===\n\n";

    std::cout << "--- Registry Tests ---\n";
    RUN_TEST(registry_lookup_by_token);
    RUN_TEST(registry_lookup_by_filename);
    RUN_TEST(registry_lookup_by_interpreter);
    RUN_TEST(registry_extra_extensions);
    RUN_TEST(registry_always_has_plain_text);
    RUN_TEST(builtin_table_is_unique);

    std::cout << "\n--- Resolver Tests ---\n";
    RUN_TEST(override_beats_extension);
    RUN_TEST(unknown_override_fails);
    RUN_TEST(extension_beats_shebang);
    RUN_TEST(shebang_detection);
    RUN_TEST(shebang_parsing);
    RUN_TEST(modeline_detection);
    RUN_TEST(modeline_only_in_first_lines);
    RUN_TEST(modeline_needs_word_boundary);
    RUN_TEST(undetermined_falls_back_to_plain);

    std::cout << "\n--- Classifier Tests ---\n";
    RUN_TEST(plain_classifier_single_token);
    RUN_TEST(normalizer_fills_gaps_and_clips);
    RUN_TEST(normalizer_covers_empty_stream);
    RUN_TEST(normalizer_replaces_out_of_range_class);

    std::cout << "\n--- Lexer Tests ---\n";
    RUN_TEST(lex_rust_function);
    RUN_TEST(lex_rust_specifics);
    RUN_TEST(lex_cpp);
    RUN_TEST(lex_block_comment_spans_lines);
    RUN_TEST(lex_nested_comments);
    RUN_TEST(lex_python);
    RUN_TEST(lex_shell);
    RUN_TEST(lex_sql_case_insensitive);
    RUN_TEST(lex_config_formats);
    RUN_TEST(lex_markup);
    RUN_TEST(lex_markdown);
    RUN_TEST(lex_unterminated_constructs);
    RUN_TEST(lex_utf8_not_split);
    RUN_TEST(lex_nul_byte_raises);
    RUN_TEST(lex_every_language_covers_input);

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
