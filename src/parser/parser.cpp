// src/parser/parser.cpp
#include "parser.hpp"

Parser::Parser(const std::vector<Token>& tokens, ErrorReporter& reporter)
    : tokens(tokens), reporter(reporter) {
    if (this->tokens.empty() || this->tokens.back().type != TokenType::EOF_TOKEN) {
        int line = this->tokens.empty() ? 1 : this->tokens.back().line();
        this->tokens.emplace_back(TokenType::EOF_TOKEN, "", TokenLocation("<eof>", line, 0, 0));
    }
}

// Return current token; the stream always ends in EOF so this never overruns
Token Parser::peek() const {
    if (position < tokens.size()) return tokens[position];
    return tokens.back();
}

Token Parser::peek_next(size_t offset) const {
    if (position + offset < tokens.size()) {
        return tokens[position + offset];
    }
    return tokens.back();
}

Token Parser::previous() const {
    if (position == 0) return tokens.front();
    return tokens[position - 1];
}

bool Parser::check(TokenType t) const {
    return peek().type == t;
}

bool Parser::at_end() const {
    return peek().type == TokenType::EOF_TOKEN;
}

// Consume and return the next token; EOF is never consumed
Token Parser::consume() {
    if (!at_end()) position++;
    return previous();
}

bool Parser::match(TokenType t) {
    if (check(t)) {
        consume();
        return true;
    }
    return false;
}

Token Parser::expect(TokenType t, const std::string& errMsg) {
    if (check(t)) return consume();
    throw error(peek(), errMsg);
}

ParseError Parser::error(const Token& tok, const std::string& message) {
    return ParseError(tok, message);
}

void Parser::check_nesting() {
    if (stack.near_limit()) throw error(peek(), "Too much nesting.");
}

// Discard tokens until a likely statement boundary: just after a ';' or
// before a keyword that starts a declaration or statement.
void Parser::synchronize() {
    consume();
    while (!at_end()) {
        if (previous().type == TokenType::SEMICOLON) return;

        switch (peek().type) {
            case TokenType::CLASS:
            case TokenType::FUN:
            case TokenType::VAR:
            case TokenType::FOR:
            case TokenType::IF:
            case TokenType::WHILE:
            case TokenType::PRINT:
            case TokenType::RETURN:
                return;
            default:
                break;
        }
        consume();
    }
}

std::unique_ptr<ProgramNode> Parser::parse() {
    auto program = std::make_unique<ProgramNode>();
    program->token = peek();
    stack.mark();

    while (!at_end()) {
        auto stmt = parse_declaration();
        if (stmt) program->body.push_back(std::move(stmt));
    }

    return program;
}

// Returns nullptr when the declaration had a syntax error.
std::unique_ptr<StatementNode> Parser::parse_declaration() {
    try {
        if (match(TokenType::CLASS)) return parse_class_declaration();
        if (match(TokenType::FUN)) return parse_function_declaration();
        if (match(TokenType::VAR)) return parse_variable_declaration();
        return parse_statement();
    } catch (const ParseError& e) {
        reporter.error(e.token(), e.what());
        synchronize();
        return nullptr;
    }
}
