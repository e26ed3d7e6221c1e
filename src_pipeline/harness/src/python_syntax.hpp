#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Internal to the scanner: a shallow syntax model of Python source. It is not
// a full grammar; it recognises exactly what the safety rules need (imports,
// call sites with their arguments, subscripts) and tolerates everything else.
namespace advgate::pipeline::detail::py {

enum class TokenKind { Name, Number, String, Op, Newline, End };

struct Token {
    TokenKind kind{TokenKind::End};
    std::string text;  ///< For String: the literal body with simple escapes decoded
    std::size_t line{0};
};

/// Single pass, no backtracking. Unterminated strings end at end of input.
[[nodiscard]] std::vector<Token> tokenize(std::string_view source);

struct Argument {
    std::string keyword;  ///< Empty for positional, "*" / "**" for unpacking
    std::vector<Token> tokens;
    std::optional<std::string> literal;                    ///< "a" or "a" "b"
    std::optional<std::vector<std::string>> literal_list;  ///< ["a", "b"] or ("a", "b")
    std::string dotted;                                    ///< Bare dotted name, e.g. os.environ
};

struct CallSite {
    std::string callee;  ///< Dotted name as written in the source
    std::vector<Argument> args;
    std::size_t line{0};
};

struct Subscript {
    std::string base;
    std::string key;  ///< String literal key
    std::size_t line{0};
};

struct ImportBinding {
    std::string local;   ///< Name bound in the module namespace
    std::string target;  ///< Fully qualified module or attribute
    std::string module;  ///< Module named by the statement, e.g. "urllib.request"
    std::size_t line{0};
    bool from_import{false};
};

struct StringLiteral {
    std::string value;
    std::size_t line{0};
};

struct Module {
    std::vector<ImportBinding> imports;
    std::vector<std::string> star_modules;
    std::vector<CallSite> calls;
    std::vector<Subscript> subscripts;
    std::vector<StringLiteral> strings;
};

[[nodiscard]] Module parse_module(std::string_view source);

}  // namespace advgate::pipeline::detail::py
