#include "lexer.hpp"

#include <cctype>
#include <string>
#include <unordered_map>

static const std::unordered_map<std::string, TokenType>& keyword_table() {
    static const std::unordered_map<std::string, TokenType> keywords = {
        {"and", TokenType::AND},
        {"break", TokenType::BREAK},
        {"class", TokenType::CLASS},
        {"else", TokenType::ELSE},
        {"false", TokenType::BOOLEAN},
        {"for", TokenType::FOR},
        {"fun", TokenType::FUN},
        {"if", TokenType::IF},
        {"nil", TokenType::NIL},
        {"or", TokenType::OR},
        {"print", TokenType::PRINT},
        {"return", TokenType::RETURN},
        {"super", TokenType::SUPER},
        {"this", TokenType::THIS},
        {"true", TokenType::BOOLEAN},
        {"var", TokenType::VAR},
        {"while", TokenType::WHILE}};
    return keywords;
}

static bool is_ident_start(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

static bool is_ident_continue(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

static bool is_digit(char c) {
    return c >= '0' && c <= '9';
}

// Constructor
Lexer::Lexer(const std::string& source,
    const std::string& filename,
    ErrorReporter& reporter,
    std::shared_ptr<const SourceManager> mgr)
    : src(source), filename(filename), reporter(reporter), src_mgr(std::move(mgr)), i(0), line(1), col(1) {}

bool Lexer::eof() const {
    return i >= src.size();
}
char Lexer::peek(size_t offset) const {
    size_t idx = i + offset;
    if (idx >= src.size()) return '\0';
    return src[idx];
}
char Lexer::peek_next() const {
    return peek(1);
}

char Lexer::advance() {
    if (eof()) return '\0';
    char c = src[i++];
    if (c == '\n') {
        line++;
        col = 1;
    } else {
        col++;
    }
    return c;
}

bool Lexer::match(char expected) {
    if (peek() != expected) return false;
    advance();
    return true;
}

void Lexer::add_token(std::vector<Token>& out, TokenType type, const std::string& value, int tok_line, int tok_col, int tok_length) {
    int len = tok_length >= 0 ? tok_length : static_cast<int>(value.size());
    TokenLocation loc(filename.empty() ? "<repl>" : filename, tok_line, tok_col, len, src_mgr);
    out.emplace_back(type, value, loc);
}

void Lexer::add_literal_token(std::vector<Token>& out, TokenType type, const std::string& value, Literal literal, int tok_line, int tok_col, int tok_length) {
    int len = tok_length >= 0 ? tok_length : static_cast<int>(value.size());
    TokenLocation loc(filename.empty() ? "<repl>" : filename, tok_line, tok_col, len, src_mgr);
    out.emplace_back(type, value, std::move(literal), loc);
}

void Lexer::skip_line_comment() {
    while (!eof() && peek() != '\n') advance();
}

// Strings are single-line and have no escape sequences. The token value is
// the full lexeme (quotes included); the literal is the text between them.
void Lexer::scan_string(std::vector<Token>& out, int tok_line, int tok_col, size_t start_index) {
    advance();  // opening quote
    while (!eof() && peek() != '"' && peek() != '\n') advance();

    if (eof() || peek() == '\n') {
        reporter.error(tok_line, "Unterminated string.");
        return;
    }

    advance();  // closing quote
    std::string lexeme = src.substr(start_index, i - start_index);
    std::string text = lexeme.substr(1, lexeme.size() - 2);
    add_literal_token(out, TokenType::STRING, lexeme, Literal{text}, tok_line, tok_col);
}

void Lexer::scan_number(std::vector<Token>& out, int tok_line, int tok_col, size_t start_index) {
    while (is_digit(peek())) advance();

    // fractional part only when a digit follows the dot ("1." is NUMBER DOT)
    if (peek() == '.' && is_digit(peek_next())) {
        advance();
        while (is_digit(peek())) advance();
    }

    std::string lexeme = src.substr(start_index, i - start_index);
    add_literal_token(out, TokenType::NUMBER, lexeme, Literal{std::stod(lexeme)}, tok_line, tok_col);
}

void Lexer::scan_identifier_or_keyword(std::vector<Token>& out, int tok_line, int tok_col, size_t start_index) {
    while (is_ident_continue(peek())) advance();
    std::string lexeme = src.substr(start_index, i - start_index);

    const auto& keywords = keyword_table();
    auto it = keywords.find(lexeme);
    if (it == keywords.end()) {
        add_token(out, TokenType::IDENTIFIER, lexeme, tok_line, tok_col);
        return;
    }

    switch (it->second) {
        case TokenType::BOOLEAN:
            add_literal_token(out, TokenType::BOOLEAN, lexeme, Literal{lexeme == "true"}, tok_line, tok_col);
            break;
        case TokenType::NIL:
            add_literal_token(out, TokenType::NIL, lexeme, Literal{std::monostate{}}, tok_line, tok_col);
            break;
        default:
            add_token(out, it->second, lexeme, tok_line, tok_col);
            break;
    }
}

void Lexer::scan_token(std::vector<Token>& out) {
    int tok_line = line;
    int tok_col = col;
    size_t start_index = i;
    char c = peek();

    // whitespace
    if (c == ' ' || c == '\t' || c == '\r' || c == '\n') {
        advance();
        return;
    }

    if (c == '"') {
        scan_string(out, tok_line, tok_col, start_index);
        return;
    }

    if (is_digit(c)) {
        scan_number(out, tok_line, tok_col, start_index);
        return;
    }

    if (is_ident_start(c)) {
        scan_identifier_or_keyword(out, tok_line, tok_col, start_index);
        return;
    }

    advance();
    switch (c) {
        case '(':
            add_token(out, TokenType::OPENPARENTHESIS, "(", tok_line, tok_col);
            break;
        case ')':
            add_token(out, TokenType::CLOSEPARENTHESIS, ")", tok_line, tok_col);
            break;
        case '{':
            add_token(out, TokenType::OPENBRACE, "{", tok_line, tok_col);
            break;
        case '}':
            add_token(out, TokenType::CLOSEBRACE, "}", tok_line, tok_col);
            break;
        case ',':
            add_token(out, TokenType::COMMA, ",", tok_line, tok_col);
            break;
        case '.':
            add_token(out, TokenType::DOT, ".", tok_line, tok_col);
            break;
        case '-':
            add_token(out, TokenType::MINUS, "-", tok_line, tok_col);
            break;
        case '+':
            add_token(out, TokenType::PLUS, "+", tok_line, tok_col);
            break;
        case ';':
            add_token(out, TokenType::SEMICOLON, ";", tok_line, tok_col);
            break;
        case '*':
            add_token(out, TokenType::STAR, "*", tok_line, tok_col);
            break;

        // longest match for the two-character operators
        case '!':
            if (match('='))
                add_token(out, TokenType::NOTEQUAL, "!=", tok_line, tok_col);
            else
                add_token(out, TokenType::NOT, "!", tok_line, tok_col);
            break;
        case '=':
            if (match('='))
                add_token(out, TokenType::EQUALITY, "==", tok_line, tok_col);
            else
                add_token(out, TokenType::ASSIGN, "=", tok_line, tok_col);
            break;
        case '<':
            if (match('='))
                add_token(out, TokenType::LESSOREQUALTHAN, "<=", tok_line, tok_col);
            else
                add_token(out, TokenType::LESSTHAN, "<", tok_line, tok_col);
            break;
        case '>':
            if (match('='))
                add_token(out, TokenType::GREATEROREQUALTHAN, ">=", tok_line, tok_col);
            else
                add_token(out, TokenType::GREATERTHAN, ">", tok_line, tok_col);
            break;

        case '/':
            if (peek() == '/') {
                skip_line_comment();
            } else {
                add_token(out, TokenType::SLASH, "/", tok_line, tok_col);
            }
            break;

        default:
            reporter.error(tok_line, "Unexpected character.");
            break;
    }
}

std::vector<Token> Lexer::tokenize() {
    std::vector<Token> out;

    // skip UTF-8 BOM if present
    if (src.size() >= 3 && (unsigned char)src[0] == 0xEF && (unsigned char)src[1] == 0xBB && (unsigned char)src[2] == 0xBF) {
        i = 3;
        col = 4;
    }

    while (!eof()) scan_token(out);

    // final EOF token
    add_token(out, TokenType::EOF_TOKEN, "", line, col, 0);

    return out;
}
