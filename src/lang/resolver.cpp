#include "resolver.hpp"
#include <cctype>
#include <vector>

namespace minimap {

namespace {

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v';
}

std::string_view trim(std::string_view s) {
    while (!s.empty() && is_space(s.front())) s.remove_prefix(1);
    while (!s.empty() && is_space(s.back())) s.remove_suffix(1);
    return s;
}

std::vector<std::string_view> split_words(std::string_view s) {
    std::vector<std::string_view> words;
    size_t i = 0;
    while (i < s.size()) {
        while (i < s.size() && is_space(s[i])) ++i;
        size_t start = i;
        while (i < s.size() && !is_space(s[i])) ++i;
        if (i > start) words.push_back(s.substr(start, i - start));
    }
    return words;
}

std::string_view basename_of(std::string_view path) {
    size_t slash = path.find_last_of('/');
    if (slash == std::string_view::npos) return path;
    return path.substr(slash + 1);
}

std::string lower(std::string_view s) {
    std::string out(s);
    for (char& c : out) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

// Emacs: "-*- mode: python; coding: utf-8 -*-" or "-*- python -*-"
std::optional<std::string> emacs_mode(std::string_view line) {
    size_t open = line.find("-*-");
    if (open == std::string_view::npos) return std::nullopt;
    size_t close = line.find("-*-", open + 3);
    if (close == std::string_view::npos) return std::nullopt;

    std::string_view body = trim(line.substr(open + 3, close - open - 3));
    if (body.empty()) return std::nullopt;

    if (body.find(':') == std::string_view::npos) {
        return std::string(body);
    }

    std::string lowered = lower(body);
    size_t pos = 0;
    while ((pos = lowered.find("mode:", pos)) != std::string::npos) {
        bool at_boundary = pos == 0 || lowered[pos - 1] == ';' || is_space(lowered[pos - 1]);
        if (at_boundary) {
            size_t value_start = pos + 5;
            size_t value_end = body.find(';', value_start);
            if (value_end == std::string_view::npos) value_end = body.size();
            std::string_view value = trim(body.substr(value_start, value_end - value_start));
            if (!value.empty()) return std::string(value);
            return std::nullopt;
        }
        pos += 5;
    }
    return std::nullopt;
}

// Vim: "vim: set ft=python:" / "vi: filetype=sh" / "ex: syntax=c"
std::optional<std::string> vim_mode(std::string_view line) {
    static const char* const markers[] = {"vim:", "vi:", "ex:"};
    size_t body_start = std::string_view::npos;
    for (const char* marker : markers) {
        std::string_view m(marker);
        size_t pos = 0;
        while ((pos = line.find(m, pos)) != std::string_view::npos) {
            if (pos == 0 || is_space(line[pos - 1])) {
                body_start = pos + m.size();
                break;
            }
            pos += m.size();
        }
        if (body_start != std::string_view::npos) break;
    }
    if (body_start == std::string_view::npos) return std::nullopt;

    std::string_view body = line.substr(body_start);
    static const char* const keys[] = {"filetype=", "ft=", "syntax=", "syn="};
    for (const char* key : keys) {
        std::string_view k(key);
        size_t pos = 0;
        while ((pos = body.find(k, pos)) != std::string_view::npos) {
            bool at_boundary = pos == 0 || is_space(body[pos - 1]) || body[pos - 1] == ':';
            if (at_boundary) {
                size_t value_start = pos + k.size();
                size_t value_end = value_start;
                while (value_end < body.size() && body[value_end] != ':' &&
                       !is_space(body[value_end])) {
                    ++value_end;
                }
                if (value_end > value_start) {
                    return std::string(body.substr(value_start, value_end - value_start));
                }
                return std::nullopt;
            }
            pos += k.size();
        }
    }
    return std::nullopt;
}

}

const char* resolve_source_name(ResolveSource source) {
    switch (source) {
        case ResolveSource::Override: return "override";
        case ResolveSource::Filename: return "filename";
        case ResolveSource::Shebang: return "shebang";
        case ResolveSource::ModeLine: return "modeline";
        case ResolveSource::Fallback: return "fallback";
    }
    return "fallback";
}

LanguageResolver::LanguageResolver(const LanguageRegistry& registry) : registry_(registry) {}

Result LanguageResolver::resolve(const ResolveRequest& request, Resolution& out) const {
    out = Resolution{};

    if (request.override_name) {
        const Language* lang = registry_.find_by_token(*request.override_name);
        if (!lang) {
            return Result::fail(ErrorCode::UNKNOWN_LANGUAGE,
                                "unknown language '" + *request.override_name + "'");
        }
        out.language = lang;
        out.source = ResolveSource::Override;
        return Result::ok();
    }

    if (request.filename) {
        if (const Language* lang = registry_.find_by_filename(*request.filename)) {
            out.language = lang;
            out.source = ResolveSource::Filename;
            return Result::ok();
        }
    }

    std::string_view head = request.head.substr(0, SNIFF_BYTES);

    if (auto interp = shebang_interpreter(head)) {
        if (const Language* lang = registry_.find_by_interpreter(*interp)) {
            out.language = lang;
            out.source = ResolveSource::Shebang;
            return Result::ok();
        }
    }

    if (auto mode = modeline_language(head)) {
        if (const Language* lang = registry_.find_by_token(*mode)) {
            out.language = lang;
            out.source = ResolveSource::ModeLine;
            return Result::ok();
        }
    }

    out.language = &registry_.plain_text();
    out.source = ResolveSource::Fallback;
    return Result::fail(ErrorCode::UNDETERMINED_LANGUAGE, "could not determine language");
}

std::optional<std::string> LanguageResolver::shebang_interpreter(std::string_view head) const {
    if (head.size() < 2 || head[0] != '#' || head[1] != '!') return std::nullopt;

    size_t eol = head.find('\n');
    std::string_view line = head.substr(2, eol == std::string_view::npos ? std::string_view::npos : eol - 2);
    std::vector<std::string_view> words = split_words(line);
    if (words.empty()) return std::nullopt;

    std::string_view interp = basename_of(words[0]);
    if (interp != "env") {
        return std::string(interp);
    }

    // env [-S] [-i] [NAME=value]... interpreter [args]
    for (size_t i = 1; i < words.size(); ++i) {
        std::string_view word = words[i];
        if (word.size() > 2 && word.substr(0, 2) == "-S") {
            return std::string(basename_of(word.substr(2)));
        }
        if (word[0] == '-') continue;
        if (word.find('=') != std::string_view::npos) continue;
        return std::string(basename_of(word));
    }
    return std::nullopt;
}

std::optional<std::string> LanguageResolver::modeline_language(std::string_view head) const {
    size_t pos = 0;
    for (int line_no = 0; line_no < MODELINE_SCAN_LINES && pos < head.size(); ++line_no) {
        size_t eol = head.find('\n', pos);
        size_t end = eol == std::string_view::npos ? head.size() : eol;
        std::string_view line = head.substr(pos, end - pos);

        if (auto mode = emacs_mode(line)) return mode;
        if (auto mode = vim_mode(line)) return mode;

        if (eol == std::string_view::npos) break;
        pos = eol + 1;
    }
    return std::nullopt;
}

}
