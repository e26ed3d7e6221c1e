#include "python_syntax.hpp"

#include <array>
#include <cctype>
#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace {

using advgate::pipeline::detail::py::Argument;
using advgate::pipeline::detail::py::CallSite;
using advgate::pipeline::detail::py::ImportBinding;
using advgate::pipeline::detail::py::Module;
using advgate::pipeline::detail::py::Subscript;
using advgate::pipeline::detail::py::Token;
using advgate::pipeline::detail::py::TokenKind;

constexpr std::array<std::string_view, 21> kTwoCharOps{{
    "!=", "%=", "&=", "**", "*=", "+=", "-=", "->", "..", "//", "/=", ":=", "<<", "<=", "<>", "==",
    ">=", ">>", "@=", "^=", "|=",
}};

bool is_name_start(unsigned char ch) {
    return std::isalpha(ch) != 0 || ch == '_' || ch >= 0x80;
}

bool is_name_char(unsigned char ch) {
    return std::isalnum(ch) != 0 || ch == '_' || ch >= 0x80;
}

bool is_string_prefix(std::string_view ident) {
    if (ident.empty() || ident.size() > 2) {
        return false;
    }
    for (char ch : ident) {
        const char lower = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
        if (lower != 'r' && lower != 'b' && lower != 'u' && lower != 'f') {
            return false;
        }
    }
    return true;
}

bool is_raw_prefix(std::string_view ident) {
    return ident.find('r') != std::string_view::npos || ident.find('R') != std::string_view::npos;
}

class Lexer {
public:
    explicit Lexer(std::string_view source) : src_(source) {}

    std::vector<Token> run() {
        while (pos_ < src_.size()) {
            const unsigned char ch = static_cast<unsigned char>(src_[pos_]);
            if (ch == '\n') {
                newline();
                continue;
            }
            if (ch == ' ' || ch == '\t' || ch == '\f' || ch == '\r') {
                ++pos_;
                continue;
            }
            if (ch == '#') {
                while (pos_ < src_.size() && src_[pos_] != '\n') {
                    ++pos_;
                }
                continue;
            }
            if (ch == '\\' && peek(1) == '\n') {
                pos_ += 2;
                ++line_;
                continue;
            }
            if (ch == '\'' || ch == '"') {
                lex_string(false);
                continue;
            }
            if (is_name_start(ch)) {
                lex_name();
                continue;
            }
            if (std::isdigit(ch) != 0 || (ch == '.' && std::isdigit(static_cast<unsigned char>(peek(1))) != 0)) {
                lex_number();
                continue;
            }
            lex_op();
        }
        if (!tokens_.empty() && tokens_.back().kind != TokenKind::Newline) {
            tokens_.push_back(Token{TokenKind::Newline, {}, line_});
        }
        tokens_.push_back(Token{TokenKind::End, {}, line_});
        return std::move(tokens_);
    }

private:
    char peek(std::size_t ahead) const {
        return pos_ + ahead < src_.size() ? src_[pos_ + ahead] : '\0';
    }

    void newline() {
        if (depth_ == 0 && !tokens_.empty() && tokens_.back().kind != TokenKind::Newline) {
            tokens_.push_back(Token{TokenKind::Newline, {}, line_});
        }
        ++pos_;
        ++line_;
    }

    void lex_name() {
        const std::size_t start = pos_;
        while (pos_ < src_.size() && is_name_char(static_cast<unsigned char>(src_[pos_]))) {
            ++pos_;
        }
        const auto ident = src_.substr(start, pos_ - start);
        if (pos_ < src_.size() && (src_[pos_] == '\'' || src_[pos_] == '"') && is_string_prefix(ident)) {
            lex_string(is_raw_prefix(ident));
            return;
        }
        tokens_.push_back(Token{TokenKind::Name, std::string{ident}, line_});
    }

    void lex_number() {
        const std::size_t start = pos_;
        while (pos_ < src_.size()) {
            const unsigned char ch = static_cast<unsigned char>(src_[pos_]);
            if (std::isalnum(ch) == 0 && ch != '.' && ch != '_') {
                break;
            }
            ++pos_;
        }
        tokens_.push_back(Token{TokenKind::Number, std::string{src_.substr(start, pos_ - start)}, line_});
    }

    void lex_string(bool raw) {
        const char quote = src_[pos_];
        const bool triple = peek(1) == quote && peek(2) == quote;
        const std::size_t start_line = line_;
        pos_ += triple ? 3 : 1;

        std::string body;
        while (pos_ < src_.size()) {
            const char ch = src_[pos_];
            if (triple && ch == quote && peek(1) == quote && peek(2) == quote) {
                pos_ += 3;
                tokens_.push_back(Token{TokenKind::String, std::move(body), start_line});
                return;
            }
            if (!triple && ch == quote) {
                ++pos_;
                tokens_.push_back(Token{TokenKind::String, std::move(body), start_line});
                return;
            }
            if (!triple && ch == '\n') {
                break;  // unterminated single-line literal
            }
            if (ch == '\\' && pos_ + 1 < src_.size()) {
                const char esc = src_[pos_ + 1];
                if (esc == '\n') {
                    ++line_;
                }
                if (raw) {
                    body.push_back(ch);
                    body.push_back(esc);
                } else {
                    switch (esc) {
                        case 'n': body.push_back('\n'); break;
                        case 't': body.push_back('\t'); break;
                        case '\n': break;
                        default: body.push_back(esc); break;
                    }
                }
                pos_ += 2;
                continue;
            }
            if (ch == '\n') {
                ++line_;
            }
            body.push_back(ch);
            ++pos_;
        }
        tokens_.push_back(Token{TokenKind::String, std::move(body), start_line});
    }

    void lex_op() {
        const char ch = src_[pos_];
        if (pos_ + 1 < src_.size()) {
            const auto two = src_.substr(pos_, 2);
            for (const auto op : kTwoCharOps) {
                if (two == op) {
                    tokens_.push_back(Token{TokenKind::Op, std::string{two}, line_});
                    pos_ += 2;
                    return;
                }
            }
        }
        if (ch == '(' || ch == '[' || ch == '{') {
            ++depth_;
        } else if ((ch == ')' || ch == ']' || ch == '}') && depth_ > 0) {
            --depth_;
        }
        tokens_.push_back(Token{TokenKind::Op, std::string(1, ch), line_});
        ++pos_;
    }

    std::string_view src_;
    std::size_t pos_{0};
    std::size_t line_{1};
    std::size_t depth_{0};
    std::vector<Token> tokens_;
};

bool is_op(const Token& tok, std::string_view text) {
    return tok.kind == TokenKind::Op && tok.text == text;
}

bool is_name(const Token& tok, std::string_view text) {
    return tok.kind == TokenKind::Name && tok.text == text;
}

bool is_open(const Token& tok) {
    return is_op(tok, "(") || is_op(tok, "[") || is_op(tok, "{");
}

bool is_close(const Token& tok) {
    return is_op(tok, ")") || is_op(tok, "]") || is_op(tok, "}");
}

using TokenRange = std::pair<std::size_t, std::size_t>;  // [begin, end)

// Reads Name ('.' Name)* starting at `i`; returns the dotted text and the index past it.
std::pair<std::string, std::size_t> read_dotted(const std::vector<Token>& toks, std::size_t i, std::size_t end) {
    std::string dotted = toks[i].text;
    std::size_t j = i + 1;
    while (j + 1 < end && is_op(toks[j], ".") && toks[j + 1].kind == TokenKind::Name) {
        dotted += '.';
        dotted += toks[j + 1].text;
        j += 2;
    }
    return {dotted, j};
}

std::size_t matching_close(const std::vector<Token>& toks, std::size_t open, std::size_t end) {
    std::size_t depth = 0;
    for (std::size_t i = open; i < end; ++i) {
        if (is_open(toks[i])) {
            ++depth;
        } else if (is_close(toks[i])) {
            if (--depth == 0) {
                return i;
            }
        }
    }
    return end;
}

std::vector<TokenRange> split_top_level(const std::vector<Token>& toks, std::size_t begin, std::size_t end) {
    std::vector<TokenRange> parts;
    std::size_t depth = 0;
    std::size_t start = begin;
    for (std::size_t i = begin; i < end; ++i) {
        if (is_open(toks[i])) {
            ++depth;
        } else if (is_close(toks[i]) && depth > 0) {
            --depth;
        } else if (depth == 0 && is_op(toks[i], ",")) {
            if (i > start) {
                parts.emplace_back(start, i);
            }
            start = i + 1;
        }
    }
    if (end > start) {
        parts.emplace_back(start, end);
    }
    return parts;
}

void analyse_value(Argument& arg) {
    const auto& toks = arg.tokens;
    if (toks.empty()) {
        return;
    }
    bool all_strings = true;
    std::string joined;
    for (const auto& tok : toks) {
        if (tok.kind != TokenKind::String) {
            all_strings = false;
            break;
        }
        joined += tok.text;
    }
    if (all_strings) {
        arg.literal = std::move(joined);
        return;
    }

    if ((is_op(toks.front(), "[") || is_op(toks.front(), "(")) && matching_close(toks, 0, toks.size()) == toks.size() - 1) {
        std::vector<std::string> items;
        bool literal_items = true;
        for (const auto& [b, e] : split_top_level(toks, 1, toks.size() - 1)) {
            std::string item;
            for (std::size_t i = b; i < e; ++i) {
                if (toks[i].kind != TokenKind::String) {
                    literal_items = false;
                    break;
                }
                item += toks[i].text;
            }
            if (!literal_items) {
                break;
            }
            items.push_back(std::move(item));
        }
        if (literal_items && !items.empty()) {
            arg.literal_list = std::move(items);
        }
        return;
    }

    if (toks.front().kind == TokenKind::Name) {
        auto [dotted, next] = read_dotted(toks, 0, toks.size());
        if (next == toks.size()) {
            arg.dotted = std::move(dotted);
        }
    }
}

std::vector<Argument> parse_arguments(const std::vector<Token>& toks, std::size_t begin, std::size_t end) {
    std::vector<Argument> args;
    for (const auto& [b, e] : split_top_level(toks, begin, end)) {
        Argument arg;
        std::size_t value_begin = b;
        if (e - b >= 2 && toks[b].kind == TokenKind::Name && is_op(toks[b + 1], "=")) {
            arg.keyword = toks[b].text;
            value_begin = b + 2;
        } else if (is_op(toks[b], "*") || is_op(toks[b], "**")) {
            arg.keyword = toks[b].text;
            value_begin = b + 1;
        }
        arg.tokens.assign(toks.begin() + static_cast<std::ptrdiff_t>(value_begin),
                          toks.begin() + static_cast<std::ptrdiff_t>(e));
        analyse_value(arg);
        args.push_back(std::move(arg));
    }
    return args;
}

void parse_import(const std::vector<Token>& toks, std::size_t begin, std::size_t end, Module& module) {
    for (const auto& [b, e] : split_top_level(toks, begin + 1, end)) {
        if (toks[b].kind != TokenKind::Name) {
            continue;
        }
        auto [dotted, next] = read_dotted(toks, b, e);
        ImportBinding binding;
        binding.line = toks[b].line;
        binding.module = dotted;
        binding.target = dotted;
        if (next + 1 < e && is_name(toks[next], "as")) {
            binding.local = toks[next + 1].text;
        } else {
            // `import a.b` binds `a`; attribute access resolves the rest.
            binding.local = dotted.substr(0, dotted.find('.'));
            binding.target = binding.local;
        }
        module.imports.push_back(std::move(binding));
    }
}

void parse_from_import(const std::vector<Token>& toks, std::size_t begin, std::size_t end, Module& module) {
    std::size_t i = begin + 1;
    std::string base;
    while (i < end && (is_op(toks[i], ".") || is_op(toks[i], ".."))) {
        base += toks[i].text;
        ++i;
    }
    if (i < end && toks[i].kind == TokenKind::Name && !is_name(toks[i], "import")) {
        auto [dotted, next] = read_dotted(toks, i, end);
        base += dotted;
        i = next;
    }
    if (i >= end || !is_name(toks[i], "import")) {
        return;
    }
    ++i;
    if (i < end && is_op(toks[i], "*")) {
        module.star_modules.push_back(base);
        return;
    }
    std::size_t list_end = end;
    if (i < end && is_op(toks[i], "(")) {
        list_end = matching_close(toks, i, end);
        ++i;
    }
    for (const auto& [b, e] : split_top_level(toks, i, list_end)) {
        if (toks[b].kind != TokenKind::Name) {
            continue;
        }
        ImportBinding binding;
        binding.line = toks[b].line;
        binding.from_import = true;
        binding.module = base;
        binding.target = base + "." + toks[b].text;
        binding.local = toks[b].text;
        if (b + 2 < e && is_name(toks[b + 1], "as")) {
            binding.local = toks[b + 2].text;
        }
        module.imports.push_back(std::move(binding));
    }
}

void collect_calls(const std::vector<Token>& toks, std::size_t begin, std::size_t end, Module& module) {
    for (std::size_t i = begin; i < end; ++i) {
        if (toks[i].kind != TokenKind::Name) {
            continue;
        }
        if (i > begin && (is_op(toks[i - 1], ".") || is_name(toks[i - 1], "def") || is_name(toks[i - 1], "class"))) {
            continue;
        }
        auto [dotted, next] = read_dotted(toks, i, end);
        if (next >= end) {
            continue;
        }
        if (is_op(toks[next], "(")) {
            const auto close = matching_close(toks, next, end);
            CallSite call;
            call.callee = std::move(dotted);
            call.line = toks[i].line;
            call.args = parse_arguments(toks, next + 1, close);
            module.calls.push_back(std::move(call));
        } else if (is_op(toks[next], "[") && next + 2 < end && toks[next + 1].kind == TokenKind::String &&
                   is_op(toks[next + 2], "]")) {
            module.subscripts.push_back(Subscript{std::move(dotted), toks[next + 1].text, toks[i].line});
        }
    }
}

}  // namespace

namespace advgate::pipeline::detail::py {

std::vector<Token> tokenize(std::string_view source) {
    return Lexer{source}.run();
}

Module parse_module(std::string_view source) {
    const auto toks = tokenize(source);
    Module module;

    for (const auto& tok : toks) {
        if (tok.kind == TokenKind::String) {
            module.strings.push_back(StringLiteral{tok.text, tok.line});
        }
    }

    std::size_t depth = 0;
    std::size_t start = 0;
    for (std::size_t i = 0; i < toks.size(); ++i) {
        const auto& tok = toks[i];
        if (is_open(tok)) {
            ++depth;
        } else if (is_close(tok) && depth > 0) {
            --depth;
        }
        const bool boundary = tok.kind == TokenKind::Newline || tok.kind == TokenKind::End ||
                              (depth == 0 && is_op(tok, ";"));
        if (!boundary) {
            continue;
        }
        if (i > start) {
            if (is_name(toks[start], "import")) {
                parse_import(toks, start, i, module);
            } else if (is_name(toks[start], "from")) {
                parse_from_import(toks, start, i, module);
            } else {
                collect_calls(toks, start, i, module);
            }
        }
        start = i + 1;
    }
    return module;
}

}  // namespace advgate::pipeline::detail::py
