#include "language.hpp"
#include <algorithm>
#include <cctype>
#include <utility>

namespace minimap {

std::string to_lower(const std::string& s) {
    std::string out = s;
    for (char& c : out) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

std::string path_basename(const std::string& path) {
    size_t slash = path.find_last_of("/\\");
    if (slash == std::string::npos) return path;
    return path.substr(slash + 1);
}

LanguageRegistry::LanguageRegistry() : LanguageRegistry(builtin_languages()) {}

LanguageRegistry::LanguageRegistry(std::vector<Language> languages)
    : languages_(std::move(languages)) {
    bool has_plain = false;
    for (const auto& lang : languages_) {
        if (lang.is_plain()) {
            has_plain = true;
            break;
        }
    }
    if (!has_plain) {
        Language plain;
        plain.name = "plain";
        plain.display_name = "Plain Text";
        plain.aliases = {"text", "txt"};
        plain.extensions = {"txt"};
        languages_.push_back(std::move(plain));
    }

    for (size_t i = 0; i < languages_.size(); ++i) {
        index_language(i);
        if (languages_[i].is_plain()) {
            plain_index_ = i;
        }
    }
}

void LanguageRegistry::index_language(size_t idx) {
    const Language& lang = languages_[idx];
    // First registration wins so table order decides ambiguous extensions.
    by_name_.emplace(to_lower(lang.name), idx);
    for (const auto& alias : lang.aliases) {
        by_name_.emplace(to_lower(alias), idx);
    }
    for (const auto& ext : lang.extensions) {
        by_extension_.emplace(to_lower(ext), idx);
    }
    for (const auto& filename : lang.filenames) {
        by_filename_.emplace(filename, idx);
    }
    for (const auto& interp : lang.interpreters) {
        by_interpreter_.emplace(interp, idx);
    }
}

const Language* LanguageRegistry::find_by_name(const std::string& name) const {
    auto it = by_name_.find(to_lower(name));
    if (it == by_name_.end()) return nullptr;
    return &languages_[it->second];
}

const Language* LanguageRegistry::find_by_extension(const std::string& ext) const {
    std::string key = to_lower(ext);
    if (!key.empty() && key[0] == '.') key.erase(0, 1);
    auto it = by_extension_.find(key);
    if (it == by_extension_.end()) return nullptr;
    return &languages_[it->second];
}

const Language* LanguageRegistry::find_by_token(const std::string& token) const {
    if (token.empty()) return nullptr;
    std::string key = token;
    if (key[0] == '.') key.erase(0, 1);
    if (const Language* lang = find_by_name(key)) return lang;
    return find_by_extension(key);
}

const Language* LanguageRegistry::find_by_filename(const std::string& path) const {
    std::string base = path_basename(path);
    if (base.empty()) return nullptr;

    auto it = by_filename_.find(base);
    if (it != by_filename_.end()) return &languages_[it->second];

    size_t dot = base.find_last_of('.');
    if (dot == std::string::npos || dot + 1 >= base.size()) return nullptr;
    // ".bashrc" style names have no extension, only a name.
    if (dot == 0) return nullptr;
    return find_by_extension(base.substr(dot + 1));
}

const Language* LanguageRegistry::find_by_interpreter(const std::string& interpreter) const {
    auto it = by_interpreter_.find(interpreter);
    if (it != by_interpreter_.end()) return &languages_[it->second];

    // python3.11 -> python, perl5 -> perl
    std::string stripped = interpreter;
    while (!stripped.empty() &&
           (std::isdigit(static_cast<unsigned char>(stripped.back())) || stripped.back() == '.')) {
        stripped.pop_back();
    }
    if (stripped.empty() || stripped == interpreter) return nullptr;

    it = by_interpreter_.find(stripped);
    if (it != by_interpreter_.end()) return &languages_[it->second];
    return nullptr;
}

const Language& LanguageRegistry::plain_text() const {
    return languages_[plain_index_];
}

bool LanguageRegistry::add_extension(const std::string& ext, const std::string& language_name) {
    auto it = by_name_.find(to_lower(language_name));
    if (it == by_name_.end()) return false;
    std::string key = to_lower(ext);
    if (!key.empty() && key[0] == '.') key.erase(0, 1);
    if (key.empty()) return false;
    by_extension_[key] = it->second;
    return true;
}

}
