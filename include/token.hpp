#pragma once

#include <algorithm>
#include <string>
#include <utility>
#include <vector>

#include "SourceManager.hpp"
#include "integer_value.hpp"

namespace pytch {

// Token types (keep in sync with token_name() in print_debug.cpp)
enum class TokenType {
    // -----------------------
    // Literals & identifiers
    // -----------------------
    IDENTIFIER,
    INT_LITERAL,
    STRING,  // single- or double-quoted; value holds the unescaped body

    // -----------------------
    // Keywords
    // -----------------------
    AND,
    DEF,
    ELSE,
    IF,
    LET,
    OR,
    THEN,

    // -----------------------
    // Operators & punctuation
    // -----------------------
    PLUS,
    MINUS,
    EQUALS,
    ARROW,     // ->
    ELLIPSIS,  // ...
    COMMA,
    LPAREN,
    RPAREN,

    // -----------------------
    // Synthetic tokens, only ever produced by the preparser
    // -----------------------
    SEMICOLON,    // sequences two statement-expressions
    DUMMY_IN,     // closes a 'let' binding
    DUMMY_ENDIF,  // closes an 'if' expression

    // -----------------------
    // file end
    // -----------------------
    EOF_TOKEN
};

enum class TriviumKind {
    WHITESPACE,
    NEWLINE,
    COMMENT,
    BYTE_ORDER_MARK
};

// Source text between tokens. Kept so the raw stream reproduces the input exactly.
struct Trivium {
    TriviumKind kind = TriviumKind::WHITESPACE;
    std::string text;

    Trivium() = default;
    Trivium(TriviumKind k, std::string t) : kind(k), text(std::move(t)) {}

    int width() const { return static_cast<int>(text.size()); }

    bool operator==(const Trivium& other) const {
        return kind == other.kind && text == other.text;
    }
};

// Small struct for token location / span in source
struct TokenLocation {
   public:
    std::string filename;  // source filename (or "<input>")
    int line = 1;          // 1-based
    int col = 1;           // 1-based column of token start (code points)
    int end_line = 1;      // line of the position just past the token
    int end_col = 1;       // column just past the token (exclusive)
    size_t offset = 0;     // byte offset of token start
    int length = 0;        // token length in bytes

    const SourceManager* src_mgr = nullptr;

    TokenLocation() = default;
    TokenLocation(const std::string& fn, int ln, int c, int len = 0, const SourceManager* mgr = nullptr)
        : filename(fn), line(ln), col(c), end_line(ln), end_col(c + len), length(len), src_mgr(mgr) {}

    // zero-width location at the start of this one (used for synthetic tokens)
    TokenLocation collapsed() const {
        TokenLocation loc = *this;
        loc.end_line = line;
        loc.end_col = col;
        loc.length = 0;
        return loc;
    }

    std::string to_string() const {
        return filename + ":" + std::to_string(line) + ":" + std::to_string(col);
    }
    std::string get_line_trace() const;
};

// Represents a single token with location
struct Token {
    TokenType type = TokenType::EOF_TOKEN;
    std::string value;  // decoded value: lexeme, unescaped string body or normalized digits
    std::string text;   // raw source text of the token (empty for synthetic tokens)
    TokenLocation loc;  // file:line:col and span

    int line_indent = 0;         // indentation level of the line this token starts on
    bool first_on_line = false;  // no earlier token starts on the same line

    std::vector<Trivium> leading;
    std::vector<Trivium> trailing;

    Token() = default;
    Token(TokenType t, const std::string& v, const TokenLocation& l)
        : type(t), value(v), loc(l) {}

    const std::string& filename() const { return loc.filename; }
    int line() const { return loc.line; }
    int col() const { return loc.col; }
    int length() const { return loc.length; }

    bool is_synthetic() const {
        return type == TokenType::SEMICOLON || type == TokenType::DUMMY_IN ||
               type == TokenType::DUMMY_ENDIF;
    }

    // Arbitrary-precision value of an INT_LITERAL token.
    IntegerValue int_value() const;

    int leading_width() const;
    int trailing_width() const;
    int full_width() const { return leading_width() + static_cast<int>(text.size()) + trailing_width(); }
    std::string full_text() const;

    bool is_followed_by_newline() const {
        return std::any_of(trailing.begin(), trailing.end(),
            [](const Trivium& t) { return t.kind == TriviumKind::NEWLINE; });
    }
};

inline std::string TokenLocation::get_line_trace() const {
    if (!src_mgr) {
        return "(source context unavailable)";
    }
    int width = (end_line == line && end_col > col) ? end_col - col : 1;
    return src_mgr->format_error_context(line, col, width);
}

}  // namespace pytch
