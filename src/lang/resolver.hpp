#pragma once

#include "core/types.hpp"
#include "language.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace minimap {

enum class ResolveSource {
    Override,
    Filename,
    Shebang,
    ModeLine,
    Fallback
};

const char* resolve_source_name(ResolveSource source);

struct ResolveRequest {
    std::optional<std::string> override_name;
    std::optional<std::string> filename;
    std::string_view head;
};

struct Resolution {
    const Language* language = nullptr;
    ResolveSource source = ResolveSource::Fallback;
};

class LanguageResolver {
public:
    // Only the first few lines are ever inspected when sniffing content.
    static constexpr size_t SNIFF_BYTES = 4096;
    static constexpr int MODELINE_SCAN_LINES = 5;

    explicit LanguageResolver(const LanguageRegistry& registry);

    // On UNDETERMINED_LANGUAGE the resolution still carries the plain-text language.
    Result resolve(const ResolveRequest& request, Resolution& out) const;

    std::optional<std::string> shebang_interpreter(std::string_view head) const;
    std::optional<std::string> modeline_language(std::string_view head) const;

private:
    const LanguageRegistry& registry_;
};

}
