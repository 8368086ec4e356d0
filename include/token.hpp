#pragma once

#include <algorithm>
#include <memory>
#include <optional>
#include <string>
#include <variant>

#include "SourceManager.hpp"

// Token types (keep in sync with the lexer keyword table)
enum class TokenType {
    // -----------------------
    // Single-character punctuation
    // -----------------------
    OPENPARENTHESIS,
    CLOSEPARENTHESIS,
    OPENBRACE,
    CLOSEBRACE,
    COMMA,
    DOT,
    SEMICOLON,

    // -----------------------
    // Arithmetic
    // -----------------------
    MINUS,
    PLUS,
    SLASH,
    STAR,

    // -----------------------
    // One or two character operators
    // -----------------------
    NOT,                 // !
    NOTEQUAL,            // !=
    ASSIGN,              // =
    EQUALITY,            // ==
    GREATERTHAN,         // >
    GREATEROREQUALTHAN,  // >=
    LESSTHAN,            // <
    LESSOREQUALTHAN,     // <=

    // -----------------------
    // Literals & identifiers
    // -----------------------
    IDENTIFIER,
    STRING,
    NUMBER,
    BOOLEAN,  // 'true' / 'false'
    NIL,

    // -----------------------
    // Keywords
    // -----------------------
    AND,
    OR,
    CLASS,
    SUPER,
    THIS,
    FUN,
    RETURN,
    VAR,
    PRINT,
    IF,
    ELSE,
    WHILE,
    FOR,
    BREAK,

    EOF_TOKEN
};

// Literal payload carried by NUMBER, STRING, BOOLEAN and NIL tokens.
// std::monostate is the nil literal.
using Literal = std::variant<std::monostate, double, std::string, bool>;

// Small struct for token location / span in source
struct TokenLocation {
   public:
    std::string filename;  // source filename (or "<repl>")
    int line = 1;          // 1-based
    int col = 1;           // 1-based column of token start
    int length = 0;        // token length in characters

    std::shared_ptr<const SourceManager> src_mgr;

    TokenLocation() = default;
    TokenLocation(const std::string& fn, int ln, int c, int len = 0, std::shared_ptr<const SourceManager> mgr = nullptr)
        : filename(fn), line(ln), col(c), length(len), src_mgr(std::move(mgr)) {}

    int end_col() const { return col + std::max(0, length - 1); }

    std::string to_string() const {
        return filename + ":" + std::to_string(line) + ":" + std::to_string(col);
    }
    std::string get_line_trace() const;
};

// Represents a single token with location
struct Token {
    TokenType type = TokenType::EOF_TOKEN;
    std::string value;  // lexeme exactly as written in the source
    std::optional<Literal> literal;
    TokenLocation loc;

    Token() = default;
    Token(TokenType t, const std::string& v, const TokenLocation& l)
        : type(t), value(v), loc(l) {}
    Token(TokenType t, const std::string& v, Literal lit, const TokenLocation& l)
        : type(t), value(v), literal(std::move(lit)), loc(l) {}

    const std::string& filename() const { return loc.filename; }
    int line() const { return loc.line; }
    int col() const { return loc.col; }
    int length() const { return loc.length; }

    std::string debug_string() const {
        return loc.to_string() + " [" + value + "]";
    }
};

inline std::string TokenLocation::get_line_trace() const {
    if (!src_mgr) {
        return "(source context unavailable)";
    }
    return src_mgr->format_error_context(line, col, length);
}

// Name of a token type as printed by token dumps and diagnostics.
std::string token_type_name(TokenType t);
