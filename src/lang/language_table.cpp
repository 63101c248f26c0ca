#include "language.hpp"
#include <utility>

namespace minimap {

namespace {

LexicalRules c_like_rules() {
    LexicalRules rules;
    rules.line_comment = "//";
    rules.block_open = "/*";
    rules.block_close = "*/";
    rules.char_literals = true;
    return rules;
}

LexicalRules hash_comment_rules() {
    LexicalRules rules;
    rules.line_comment = "#";
    return rules;
}

Language make_language(std::string name, std::string display_name, LexicalRules rules) {
    Language lang;
    lang.name = std::move(name);
    lang.display_name = std::move(display_name);
    lang.rules = std::move(rules);
    return lang;
}

const std::unordered_set<std::string> C_KEYWORDS = {
    "auto", "break", "case", "const", "continue", "default", "do", "else", "enum",
    "extern", "for", "goto", "if", "inline", "register", "restrict", "return",
    "sizeof", "static", "struct", "switch", "typedef", "union", "volatile", "while",
    "_Alignas", "_Alignof", "_Atomic", "_Bool", "_Generic", "_Noreturn",
    "_Static_assert", "_Thread_local", "NULL", "true", "false",
};

const std::unordered_set<std::string> C_TYPES = {
    "void", "char", "short", "int", "long", "float", "double", "signed", "unsigned",
    "bool", "size_t", "ssize_t", "ptrdiff_t", "intptr_t", "uintptr_t",
    "int8_t", "int16_t", "int32_t", "int64_t", "uint8_t", "uint16_t", "uint32_t",
    "uint64_t", "wchar_t", "FILE",
};

const std::unordered_set<std::string> CPP_KEYWORDS = {
    "alignas", "alignof", "and", "asm", "auto", "break", "case", "catch", "class",
    "co_await", "co_return", "co_yield", "concept", "const", "const_cast", "consteval",
    "constexpr", "constinit", "continue", "decltype", "default", "delete", "do",
    "dynamic_cast", "else", "enum", "explicit", "export", "extern", "false", "final",
    "for", "friend", "goto", "if", "import", "inline", "module", "mutable", "namespace",
    "new", "noexcept", "not", "nullptr", "operator", "or", "override", "private",
    "protected", "public", "register", "reinterpret_cast", "requires", "return",
    "sizeof", "static", "static_assert", "static_cast", "struct", "switch", "template",
    "this", "thread_local", "throw", "true", "try", "typedef", "typeid", "typename",
    "union", "using", "virtual", "volatile", "while",
};

const std::unordered_set<std::string> CPP_TYPES = {
    "void", "bool", "char", "char8_t", "char16_t", "char32_t", "wchar_t", "short",
    "int", "long", "float", "double", "signed", "unsigned", "size_t", "ptrdiff_t",
    "int8_t", "int16_t", "int32_t", "int64_t", "uint8_t", "uint16_t", "uint32_t",
    "uint64_t", "string", "string_view", "vector", "map", "set", "unordered_map",
    "unordered_set", "array", "optional", "variant", "pair", "tuple", "shared_ptr",
    "unique_ptr", "weak_ptr",
};

const std::unordered_set<std::string> RUST_KEYWORDS = {
    "as", "async", "await", "break", "const", "continue", "crate", "dyn", "else",
    "enum", "extern", "false", "fn", "for", "if", "impl", "in", "let", "loop", "match",
    "mod", "move", "mut", "pub", "ref", "return", "self", "Self", "static", "struct",
    "super", "trait", "true", "type", "union", "unsafe", "use", "where", "while",
    "yield",
};

const std::unordered_set<std::string> RUST_TYPES = {
    "i8", "i16", "i32", "i64", "i128", "isize", "u8", "u16", "u32", "u64", "u128",
    "usize", "f32", "f64", "bool", "char", "str",
};

const std::unordered_set<std::string> GO_KEYWORDS = {
    "break", "case", "chan", "const", "continue", "default", "defer", "else",
    "fallthrough", "for", "func", "go", "goto", "if", "import", "interface", "map",
    "package", "range", "return", "select", "struct", "switch", "type", "var", "nil",
    "true", "false", "iota",
};

const std::unordered_set<std::string> GO_TYPES = {
    "bool", "byte", "complex64", "complex128", "error", "float32", "float64", "int",
    "int8", "int16", "int32", "int64", "rune", "string", "uint", "uint8", "uint16",
    "uint32", "uint64", "uintptr", "any",
};

const std::unordered_set<std::string> JAVA_KEYWORDS = {
    "abstract", "assert", "break", "case", "catch", "class", "const", "continue",
    "default", "do", "else", "enum", "extends", "false", "final", "finally", "for",
    "goto", "if", "implements", "import", "instanceof", "interface", "native", "new",
    "null", "package", "private", "protected", "public", "record", "return", "sealed",
    "permits", "static", "strictfp", "super", "switch", "synchronized", "this",
    "throw", "throws", "transient", "true", "try", "var", "volatile", "while", "yield",
};

const std::unordered_set<std::string> JAVA_TYPES = {
    "boolean", "byte", "char", "double", "float", "int", "long", "short", "void",
};

const std::unordered_set<std::string> CSHARP_KEYWORDS = {
    "abstract", "as", "async", "await", "base", "break", "case", "catch", "checked",
    "class", "const", "continue", "default", "delegate", "do", "else", "enum", "event",
    "explicit", "extern", "false", "finally", "fixed", "for", "foreach", "goto", "if",
    "implicit", "in", "interface", "internal", "is", "lock", "namespace", "new", "null",
    "operator", "out", "override", "params", "private", "protected", "public",
    "readonly", "record", "ref", "return", "sealed", "sizeof", "stackalloc", "static",
    "struct", "switch", "this", "throw", "true", "try", "typeof", "unchecked",
    "unsafe", "using", "var", "virtual", "volatile", "while", "yield",
};

const std::unordered_set<std::string> CSHARP_TYPES = {
    "bool", "byte", "char", "decimal", "double", "dynamic", "float", "int", "long",
    "nint", "nuint", "object", "sbyte", "short", "string", "uint", "ulong", "ushort",
    "void",
};

const std::unordered_set<std::string> JS_KEYWORDS = {
    "async", "await", "break", "case", "catch", "class", "const", "continue",
    "debugger", "default", "delete", "do", "else", "export", "extends", "false",
    "finally", "for", "from", "function", "if", "import", "in", "instanceof", "let",
    "new", "null", "of", "return", "static", "super", "switch", "this", "throw",
    "true", "try", "typeof", "undefined", "var", "void", "while", "with", "yield",
};

const std::unordered_set<std::string> TS_KEYWORDS_EXTRA = {
    "abstract", "as", "declare", "enum", "implements", "interface", "is", "keyof",
    "module", "namespace", "override", "private", "protected", "public", "readonly",
    "type",
};

const std::unordered_set<std::string> TS_TYPES = {
    "any", "bigint", "boolean", "never", "number", "object", "string", "symbol",
    "unknown", "void",
};

const std::unordered_set<std::string> SWIFT_KEYWORDS = {
    "associatedtype", "as", "break", "case", "catch", "class", "continue", "default",
    "defer", "deinit", "do", "else", "enum", "extension", "fallthrough", "false",
    "fileprivate", "for", "func", "guard", "if", "import", "in", "init", "inout",
    "internal", "is", "let", "nil", "open", "operator", "private", "protocol",
    "public", "repeat", "rethrows", "return", "self", "Self", "static", "struct",
    "subscript", "super", "switch", "throw", "throws", "true", "try", "typealias",
    "var", "where", "while", "async", "await",
};

const std::unordered_set<std::string> KOTLIN_KEYWORDS = {
    "as", "break", "class", "continue", "do", "else", "false", "for", "fun", "if",
    "in", "interface", "is", "null", "object", "package", "return", "super", "this",
    "throw", "true", "try", "typealias", "typeof", "val", "var", "when", "while",
    "by", "catch", "constructor", "data", "enum", "finally", "import", "init",
    "internal", "lateinit", "open", "override", "private", "protected", "public",
    "sealed", "suspend", "companion",
};

const std::unordered_set<std::string> PYTHON_KEYWORDS = {
    "False", "None", "True", "and", "as", "assert", "async", "await", "break",
    "class", "continue", "def", "del", "elif", "else", "except", "finally", "for",
    "from", "global", "if", "import", "in", "is", "lambda", "match", "case",
    "nonlocal", "not", "or", "pass", "raise", "return", "try", "while", "with",
    "yield", "self",
};

const std::unordered_set<std::string> PYTHON_TYPES = {
    "int", "float", "str", "bool", "bytes", "bytearray", "list", "dict", "set",
    "frozenset", "tuple", "object", "complex", "type",
};

const std::unordered_set<std::string> RUBY_KEYWORDS = {
    "BEGIN", "END", "alias", "and", "begin", "break", "case", "class", "def",
    "defined?", "do", "else", "elsif", "end", "ensure", "false", "for", "if", "in",
    "module", "next", "nil", "not", "or", "redo", "rescue", "retry", "return", "self",
    "super", "then", "true", "undef", "unless", "until", "when", "while", "yield",
    "require", "require_relative", "attr_accessor", "attr_reader", "attr_writer",
};

const std::unordered_set<std::string> SHELL_KEYWORDS = {
    "if", "then", "else", "elif", "fi", "case", "esac", "for", "select", "while",
    "until", "do", "done", "in", "function", "time", "return", "exit", "local",
    "export", "readonly", "declare", "typeset", "unset", "shift", "source", "eval",
    "exec", "trap", "set", "echo", "printf", "read", "cd", "test", "break",
    "continue",
};

const std::unordered_set<std::string> PERL_KEYWORDS = {
    "my", "our", "local", "sub", "if", "elsif", "else", "unless", "while", "until",
    "for", "foreach", "do", "last", "next", "redo", "return", "use", "no", "require",
    "package", "print", "printf", "die", "warn", "eval", "and", "or", "not", "qw",
};

const std::unordered_set<std::string> R_KEYWORDS = {
    "if", "else", "repeat", "while", "function", "for", "in", "next", "break",
    "TRUE", "FALSE", "NULL", "Inf", "NaN", "NA", "library", "return",
};

const std::unordered_set<std::string> LUA_KEYWORDS = {
    "and", "break", "do", "else", "elseif", "end", "false", "for", "function", "goto",
    "if", "in", "local", "nil", "not", "or", "repeat", "return", "then", "true",
    "until", "while",
};

const std::unordered_set<std::string> SQL_KEYWORDS = {
    "select", "from", "where", "insert", "into", "values", "update", "set", "delete",
    "create", "table", "drop", "alter", "index", "view", "join", "inner", "left",
    "right", "outer", "full", "on", "as", "and", "or", "not", "null", "is", "in",
    "like", "between", "group", "by", "order", "having", "limit", "offset", "union",
    "all", "distinct", "case", "when", "then", "else", "end", "exists", "primary",
    "key", "foreign", "references", "default", "constraint", "unique", "with",
    "begin", "commit", "rollback", "transaction", "asc", "desc",
};

const std::unordered_set<std::string> SQL_TYPES = {
    "int", "integer", "bigint", "smallint", "decimal", "numeric", "real", "float",
    "double", "char", "varchar", "text", "date", "time", "timestamp", "boolean",
    "blob",
};

const std::unordered_set<std::string> HASKELL_KEYWORDS = {
    "case", "class", "data", "default", "deriving", "do", "else", "foreign", "if",
    "import", "in", "infix", "infixl", "infixr", "instance", "let", "module",
    "newtype", "of", "then", "type", "where", "qualified", "hiding",
};

const std::unordered_set<std::string> CMAKE_KEYWORDS = {
    "if", "elseif", "else", "endif", "foreach", "endforeach", "while", "endwhile",
    "function", "endfunction", "macro", "endmacro", "return", "set", "unset",
    "option", "project", "add_executable", "add_library", "target_link_libraries",
    "target_include_directories", "target_compile_options", "find_package",
    "include", "message", "install", "enable_testing", "add_test",
    "cmake_minimum_required", "add_subdirectory", "list", "string",
};

const std::unordered_set<std::string> MAKE_KEYWORDS = {
    "ifeq", "ifneq", "ifdef", "ifndef", "else", "endif", "include", "define",
    "endef", "export", "override", "vpath",
};

const std::unordered_set<std::string> DOCKER_KEYWORDS = {
    "FROM", "RUN", "CMD", "LABEL", "EXPOSE", "ENV", "ADD", "COPY", "ENTRYPOINT",
    "VOLUME", "USER", "WORKDIR", "ARG", "ONBUILD", "STOPSIGNAL", "HEALTHCHECK",
    "SHELL", "AS",
};

const std::unordered_set<std::string> LITERAL_KEYWORDS = {
    "true", "false", "null", "yes", "no", "on", "off", "True", "False", "None",
};

std::unordered_set<std::string> merged(const std::unordered_set<std::string>& a,
                                       const std::unordered_set<std::string>& b) {
    std::unordered_set<std::string> out = a;
    out.insert(b.begin(), b.end());
    return out;
}

}

std::vector<Language> builtin_languages() {
    std::vector<Language> langs;

    {
        LexicalRules rules = c_like_rules();
        rules.preprocessor = true;
        rules.string_prefixes = "LuU8";
        Language lang = make_language("c", "C", rules);
        lang.extensions = {"c", "h"};
        lang.keywords = C_KEYWORDS;
        lang.types = C_TYPES;
        langs.push_back(std::move(lang));
    }
    {
        LexicalRules rules = c_like_rules();
        rules.preprocessor = true;
        rules.string_prefixes = "LuU8R";
        Language lang = make_language("cpp", "C++", rules);
        lang.aliases = {"c++", "cxx"};
        lang.extensions = {"cpp", "cc", "cxx", "c++", "hpp", "hh", "hxx", "h++", "ipp",
                           "tpp", "inl", "ino"};
        lang.keywords = CPP_KEYWORDS;
        lang.types = CPP_TYPES;
        langs.push_back(std::move(lang));
    }
    {
        LexicalRules rules = c_like_rules();
        rules.preprocessor = true;
        rules.decorators = true;
        rules.capitalized_types = true;
        rules.string_prefixes = "@$";
        Language lang = make_language("csharp", "C#", rules);
        lang.aliases = {"c#", "cs"};
        lang.extensions = {"cs", "csx"};
        lang.keywords = CSHARP_KEYWORDS;
        lang.types = CSHARP_TYPES;
        langs.push_back(std::move(lang));
    }
    {
        LexicalRules rules = c_like_rules();
        rules.decorators = true;
        rules.capitalized_types = true;
        rules.triple_quoted_strings = true;
        Language lang = make_language("java", "Java", rules);
        lang.extensions = {"java"};
        lang.keywords = JAVA_KEYWORDS;
        lang.types = JAVA_TYPES;
        langs.push_back(std::move(lang));
    }
    {
        LexicalRules rules = c_like_rules();
        rules.char_literals = false;
        rules.backtick_strings = true;
        rules.decorators = true;
        Language lang = make_language("javascript", "JavaScript", rules);
        lang.aliases = {"js", "node"};
        lang.extensions = {"js", "mjs", "cjs", "jsx"};
        lang.interpreters = {"node", "nodejs", "deno", "bun"};
        lang.keywords = JS_KEYWORDS;
        langs.push_back(std::move(lang));
    }
    {
        LexicalRules rules = c_like_rules();
        rules.char_literals = false;
        rules.backtick_strings = true;
        rules.decorators = true;
        rules.capitalized_types = true;
        Language lang = make_language("typescript", "TypeScript", rules);
        lang.aliases = {"ts"};
        lang.extensions = {"ts", "tsx", "mts", "cts"};
        lang.interpreters = {"ts-node"};
        lang.keywords = merged(JS_KEYWORDS, TS_KEYWORDS_EXTRA);
        lang.types = TS_TYPES;
        langs.push_back(std::move(lang));
    }
    {
        LexicalRules rules = c_like_rules();
        rules.char_literals = true;
        rules.backtick_strings = true;
        rules.capitalized_types = false;
        Language lang = make_language("go", "Go", rules);
        lang.aliases = {"golang"};
        lang.extensions = {"go"};
        lang.keywords = GO_KEYWORDS;
        lang.types = GO_TYPES;
        langs.push_back(std::move(lang));
    }
    {
        LexicalRules rules = c_like_rules();
        rules.nested_block_comments = true;
        rules.multiline_strings = true;
        rules.capitalized_types = true;
        rules.string_prefixes = "rb";
        Language lang = make_language("rust", "Rust", rules);
        lang.aliases = {"rs"};
        lang.extensions = {"rs"};
        lang.interpreters = {"rust-script"};
        lang.keywords = RUST_KEYWORDS;
        lang.types = RUST_TYPES;
        langs.push_back(std::move(lang));
    }
    {
        LexicalRules rules = c_like_rules();
        rules.char_literals = false;
        rules.nested_block_comments = true;
        rules.triple_quoted_strings = true;
        rules.decorators = true;
        rules.capitalized_types = true;
        Language lang = make_language("swift", "Swift", rules);
        lang.extensions = {"swift"};
        lang.keywords = SWIFT_KEYWORDS;
        langs.push_back(std::move(lang));
    }
    {
        LexicalRules rules = c_like_rules();
        rules.triple_quoted_strings = true;
        rules.decorators = true;
        rules.capitalized_types = true;
        rules.dollar_variables = true;
        Language lang = make_language("kotlin", "Kotlin", rules);
        lang.aliases = {"kt"};
        lang.extensions = {"kt", "kts"};
        lang.keywords = KOTLIN_KEYWORDS;
        langs.push_back(std::move(lang));
    }
    {
        LexicalRules rules;
        rules.block_open = "/*";
        rules.block_close = "*/";
        rules.dash_in_identifiers = true;
        rules.decorators = true;
        Language lang = make_language("css", "CSS", rules);
        lang.aliases = {"scss", "less"};
        lang.extensions = {"css", "scss", "less"};
        langs.push_back(std::move(lang));
    }
    {
        LexicalRules rules;
        rules.line_comment = "//";
        rules.block_open = "/*";
        rules.block_close = "*/";
        Language lang = make_language("json", "JSON", rules);
        lang.aliases = {"jsonc", "json5"};
        lang.extensions = {"json", "jsonc", "json5", "geojson"};
        lang.filenames = {".babelrc", ".eslintrc"};
        lang.keywords = {"true", "false", "null"};
        langs.push_back(std::move(lang));
    }
    {
        LexicalRules rules = hash_comment_rules();
        rules.triple_quoted_strings = true;
        rules.decorators = true;
        rules.string_prefixes = "rRbBfFuU";
        Language lang = make_language("python", "Python", rules);
        lang.aliases = {"py", "python3"};
        lang.extensions = {"py", "pyw", "pyi", "pyx"};
        lang.filenames = {"SConstruct", "SConscript"};
        lang.interpreters = {"python", "pypy"};
        lang.keywords = PYTHON_KEYWORDS;
        lang.types = PYTHON_TYPES;
        langs.push_back(std::move(lang));
    }
    {
        LexicalRules rules = hash_comment_rules();
        rules.block_open = "=begin";
        rules.block_close = "=end";
        rules.multiline_strings = true;
        rules.backtick_strings = true;
        rules.decorators = true;
        rules.dollar_variables = true;
        rules.capitalized_types = true;
        Language lang = make_language("ruby", "Ruby", rules);
        lang.aliases = {"rb"};
        lang.extensions = {"rb", "rake", "gemspec", "ru"};
        lang.filenames = {"Rakefile", "Gemfile", "Guardfile", "Vagrantfile"};
        lang.interpreters = {"ruby", "jruby", "rake"};
        lang.keywords = RUBY_KEYWORDS;
        langs.push_back(std::move(lang));
    }
    {
        LexicalRules rules = hash_comment_rules();
        rules.multiline_strings = true;
        rules.backtick_strings = true;
        rules.dollar_variables = true;
        Language lang = make_language("shell", "Shell", rules);
        lang.aliases = {"sh", "bash", "zsh", "ksh", "shell-script"};
        lang.extensions = {"sh", "bash", "zsh", "ksh", "fish", "ebuild"};
        lang.filenames = {".bashrc", ".bash_profile", ".bash_aliases", ".profile",
                          ".zshrc", ".zprofile", ".zshenv", "PKGBUILD"};
        lang.interpreters = {"sh", "bash", "zsh", "ksh", "dash", "ash", "fish"};
        lang.keywords = SHELL_KEYWORDS;
        langs.push_back(std::move(lang));
    }
    {
        LexicalRules rules = hash_comment_rules();
        rules.multiline_strings = true;
        rules.backtick_strings = true;
        rules.dollar_variables = true;
        Language lang = make_language("perl", "Perl", rules);
        lang.aliases = {"pl"};
        lang.extensions = {"pl", "pm", "t"};
        lang.interpreters = {"perl"};
        lang.keywords = PERL_KEYWORDS;
        langs.push_back(std::move(lang));
    }
    {
        LexicalRules rules = hash_comment_rules();
        Language lang = make_language("r", "R", rules);
        lang.extensions = {"r", "rmd"};
        lang.interpreters = {"Rscript"};
        lang.keywords = R_KEYWORDS;
        langs.push_back(std::move(lang));
    }
    {
        LexicalRules rules = hash_comment_rules();
        rules.section_headers = true;
        rules.triple_quoted_strings = true;
        rules.dash_in_identifiers = true;
        Language lang = make_language("toml", "TOML", rules);
        lang.extensions = {"toml"};
        lang.filenames = {"Cargo.lock", "Pipfile"};
        lang.keywords = LITERAL_KEYWORDS;
        langs.push_back(std::move(lang));
    }
    {
        LexicalRules rules = hash_comment_rules();
        rules.dash_in_identifiers = true;
        Language lang = make_language("yaml", "YAML", rules);
        lang.aliases = {"yml"};
        lang.extensions = {"yaml", "yml"};
        lang.filenames = {".clang-format", ".clang-tidy"};
        lang.keywords = LITERAL_KEYWORDS;
        langs.push_back(std::move(lang));
    }
    {
        LexicalRules rules;
        rules.line_comment = ";";
        rules.alt_line_comment = "#";
        rules.section_headers = true;
        rules.dash_in_identifiers = true;
        Language lang = make_language("ini", "INI", rules);
        lang.aliases = {"dosini", "conf"};
        lang.extensions = {"ini", "cfg", "conf", "properties", "desktop"};
        lang.filenames = {".gitconfig", ".editorconfig", ".gitmodules"};
        lang.keywords = LITERAL_KEYWORDS;
        langs.push_back(std::move(lang));
    }
    {
        LexicalRules rules = hash_comment_rules();
        rules.dollar_variables = true;
        rules.dash_in_identifiers = true;
        Language lang = make_language("make", "Makefile", rules);
        lang.aliases = {"makefile", "mk"};
        lang.extensions = {"mk", "mak", "make"};
        lang.filenames = {"Makefile", "makefile", "GNUmakefile"};
        lang.interpreters = {"make"};
        lang.keywords = MAKE_KEYWORDS;
        langs.push_back(std::move(lang));
    }
    {
        LexicalRules rules = hash_comment_rules();
        rules.dollar_variables = true;
        rules.block_open = "#[[";
        rules.block_close = "]]";
        rules.case_insensitive_keywords = true;
        Language lang = make_language("cmake", "CMake", rules);
        lang.extensions = {"cmake"};
        lang.filenames = {"CMakeLists.txt"};
        lang.keywords = CMAKE_KEYWORDS;
        langs.push_back(std::move(lang));
    }
    {
        LexicalRules rules = hash_comment_rules();
        rules.dollar_variables = true;
        Language lang = make_language("dockerfile", "Dockerfile", rules);
        lang.aliases = {"docker"};
        lang.extensions = {"dockerfile"};
        lang.filenames = {"Dockerfile", "Containerfile"};
        lang.keywords = DOCKER_KEYWORDS;
        langs.push_back(std::move(lang));
    }
    {
        LexicalRules rules;
        rules.line_comment = "--";
        rules.block_open = "--[[";
        rules.block_close = "]]";
        Language lang = make_language("lua", "Lua", rules);
        lang.extensions = {"lua"};
        lang.interpreters = {"lua", "luajit"};
        lang.keywords = LUA_KEYWORDS;
        langs.push_back(std::move(lang));
    }
    {
        LexicalRules rules;
        rules.line_comment = "--";
        rules.block_open = "/*";
        rules.block_close = "*/";
        rules.case_insensitive_keywords = true;
        Language lang = make_language("sql", "SQL", rules);
        lang.aliases = {"mysql", "postgresql", "sqlite"};
        lang.extensions = {"sql", "ddl", "dml"};
        lang.keywords = SQL_KEYWORDS;
        lang.types = SQL_TYPES;
        langs.push_back(std::move(lang));
    }
    {
        LexicalRules rules;
        rules.line_comment = "--";
        rules.block_open = "{-";
        rules.block_close = "-}";
        rules.nested_block_comments = true;
        rules.capitalized_types = true;
        Language lang = make_language("haskell", "Haskell", rules);
        lang.aliases = {"hs"};
        lang.extensions = {"hs", "lhs"};
        lang.interpreters = {"runhaskell", "runghc", "stack"};
        lang.keywords = HASKELL_KEYWORDS;
        langs.push_back(std::move(lang));
    }
    {
        LexicalRules rules;
        rules.block_open = "<!--";
        rules.block_close = "-->";
        rules.markup = true;
        rules.dash_in_identifiers = true;
        Language lang = make_language("html", "HTML", rules);
        lang.aliases = {"xhtml"};
        lang.extensions = {"html", "htm", "xhtml", "vue", "svelte"};
        langs.push_back(std::move(lang));
    }
    {
        LexicalRules rules;
        rules.block_open = "<!--";
        rules.block_close = "-->";
        rules.markup = true;
        rules.dash_in_identifiers = true;
        Language lang = make_language("xml", "XML", rules);
        lang.extensions = {"xml", "xsd", "xsl", "xslt", "svg", "plist", "csproj",
                           "vcxproj", "pom"};
        langs.push_back(std::move(lang));
    }
    {
        LexicalRules rules;
        rules.block_open = "<!--";
        rules.block_close = "-->";
        rules.markdown = true;
        Language lang = make_language("markdown", "Markdown", rules);
        lang.aliases = {"md"};
        lang.extensions = {"md", "markdown", "mdown", "mkd"};
        langs.push_back(std::move(lang));
    }
    {
        Language lang = make_language("plain", "Plain Text", LexicalRules{});
        lang.aliases = {"text", "txt", "plaintext", "fundamental"};
        lang.extensions = {"txt", "text", "log"};
        langs.push_back(std::move(lang));
    }

    return langs;
}

}
