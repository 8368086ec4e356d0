// src/parser/statements.cpp
#include "parser.hpp"

std::unique_ptr<StatementNode> Parser::parse_statement() {
    check_nesting();
    Token p = peek();

    switch (p.type) {
        case TokenType::PRINT:
            consume();
            return parse_print_statement();
        case TokenType::RETURN:
            consume();
            return parse_return_statement();
        case TokenType::BREAK:
            consume();
            return parse_break_statement();
        case TokenType::IF:
            consume();
            return parse_if_statement();
        case TokenType::WHILE:
            consume();
            return parse_while_statement();
        case TokenType::FOR:
            consume();
            return parse_for_statement();
        case TokenType::OPENBRACE: {
            consume();
            auto block = std::make_unique<BlockStatementNode>();
            block->token = p;
            block->body = parse_block();
            return block;
        }
        default:
            return parse_expression_statement();
    }
}

std::unique_ptr<StatementNode> Parser::parse_variable_declaration() {
    Token nameTok = expect(TokenType::IDENTIFIER, "Expect variable name.");

    auto node = std::make_unique<VariableDeclarationNode>();
    node->token = nameTok;
    node->identifier = nameTok.value;

    if (match(TokenType::ASSIGN)) {
        node->value = parse_expression();
    }

    expect(TokenType::SEMICOLON, "Expect ';' after variable declaration.");
    return node;
}

std::unique_ptr<StatementNode> Parser::parse_print_statement() {
    Token printTok = previous();
    auto node = std::make_unique<PrintStatementNode>();
    node->token = printTok;
    node->expression = parse_expression();
    expect(TokenType::SEMICOLON, "Expect ';' after value.");
    return node;
}

std::unique_ptr<StatementNode> Parser::parse_expression_statement() {
    Token start = peek();
    auto node = std::make_unique<ExpressionStatementNode>();
    node->token = start;
    node->expression = parse_expression();
    expect(TokenType::SEMICOLON, "Expect ';' after expression.");
    return node;
}

std::unique_ptr<StatementNode> Parser::parse_return_statement() {
    Token returnTok = previous();

    if (current_function == FunctionKind::NONE) {
        reporter.error(returnTok, "Can't return from top-level code.");
    }

    auto node = std::make_unique<ReturnStatementNode>();
    node->token = returnTok;

    if (!check(TokenType::SEMICOLON)) {
        if (current_function == FunctionKind::INITIALIZER) {
            reporter.error(returnTok, "Can't return a value from an initializer.");
        }
        node->value = parse_expression();
    }

    expect(TokenType::SEMICOLON, "Expect ';' after return value.");
    return node;
}

std::unique_ptr<StatementNode> Parser::parse_break_statement() {
    Token breakTok = previous();

    if (loop_depth == 0) {
        reporter.error(breakTok, "Can't use 'break' outside of a loop.");
    }

    expect(TokenType::SEMICOLON, "Expect ';' after 'break'.");
    auto node = std::make_unique<BreakStatementNode>();
    node->token = breakTok;
    return node;
}

std::unique_ptr<StatementNode> Parser::parse_function_declaration() {
    auto node = std::make_unique<FunctionDeclarationNode>();
    node->function = parse_function(FunctionKind::FUNCTION);
    node->token = node->function->token;
    return node;
}
