#pragma once

#include <string>
#include <vector>
#include <unordered_map>
#include <unordered_set>

namespace minimap {

// Lexical shape of a language, consumed by LexicalClassifier.
struct LexicalRules {
    std::string line_comment;
    std::string alt_line_comment;
    std::string block_open;
    std::string block_close;
    std::string string_prefixes;
    bool nested_block_comments = false;
    bool preprocessor = false;
    bool backtick_strings = false;
    bool triple_quoted_strings = false;
    bool char_literals = false;
    bool multiline_strings = false;
    bool dollar_variables = false;
    bool decorators = false;
    bool section_headers = false;
    bool capitalized_types = false;
    bool dash_in_identifiers = false;
    bool case_insensitive_keywords = false;
    bool markup = false;
    bool markdown = false;
};

struct Language {
    std::string name;
    std::string display_name;
    std::vector<std::string> aliases;
    std::vector<std::string> extensions;
    std::vector<std::string> filenames;
    std::vector<std::string> interpreters;
    LexicalRules rules;
    std::unordered_set<std::string> keywords;
    std::unordered_set<std::string> types;

    bool is_plain() const { return name == "plain"; }
};

std::vector<Language> builtin_languages();

class LanguageRegistry {
public:
    LanguageRegistry();
    explicit LanguageRegistry(std::vector<Language> languages);

    // Matches a name, alias or extension, case-insensitively; a leading dot is ignored.
    const Language* find_by_token(const std::string& token) const;
    const Language* find_by_name(const std::string& name) const;
    const Language* find_by_extension(const std::string& ext) const;
    const Language* find_by_filename(const std::string& path) const;
    const Language* find_by_interpreter(const std::string& interpreter) const;

    const Language& plain_text() const;
    const std::vector<Language>& languages() const { return languages_; }

    bool add_extension(const std::string& ext, const std::string& language_name);

private:
    std::vector<Language> languages_;
    std::unordered_map<std::string, size_t> by_name_;
    std::unordered_map<std::string, size_t> by_extension_;
    std::unordered_map<std::string, size_t> by_filename_;
    std::unordered_map<std::string, size_t> by_interpreter_;
    size_t plain_index_ = 0;

    void index_language(size_t idx);
};

std::string to_lower(const std::string& s);
std::string path_basename(const std::string& path);

}
