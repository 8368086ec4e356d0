// src/parser/control_flow.cpp
#include "parser.hpp"

std::unique_ptr<StatementNode> Parser::parse_if_statement() {
    Token ifTok = previous();
    expect(TokenType::OPENPARENTHESIS, "Expect '(' after 'if'.");
    auto cond = parse_expression();
    expect(TokenType::CLOSEPARENTHESIS, "Expect ')' after if condition.");

    auto node = std::make_unique<IfStatementNode>();
    node->token = ifTok;
    node->condition = std::move(cond);
    node->then_branch = parse_statement();

    // dangling else binds to the nearest if
    if (match(TokenType::ELSE)) {
        node->else_branch = parse_statement();
    }

    return node;
}

std::unique_ptr<StatementNode> Parser::parse_while_statement() {
    Token whileTok = previous();
    expect(TokenType::OPENPARENTHESIS, "Expect '(' after 'while'.");
    auto cond = parse_expression();
    expect(TokenType::CLOSEPARENTHESIS, "Expect ')' after condition.");

    auto node = std::make_unique<WhileStatementNode>();
    node->token = whileTok;
    node->condition = std::move(cond);

    ScopedValue<int> in_loop(loop_depth, loop_depth + 1);
    node->body = parse_statement();

    return node;
}

// for (init; cond; incr) body  ==>  { init; while (cond) { body; incr; } }
std::unique_ptr<StatementNode> Parser::parse_for_statement() {
    Token forTok = previous();
    expect(TokenType::OPENPARENTHESIS, "Expect '(' after 'for'.");

    std::unique_ptr<StatementNode> init;
    if (match(TokenType::SEMICOLON)) {
        // no initializer
    } else if (match(TokenType::VAR)) {
        init = parse_variable_declaration();
    } else {
        init = parse_expression_statement();
    }

    std::unique_ptr<ExpressionNode> cond;
    if (!check(TokenType::SEMICOLON)) {
        cond = parse_expression();
    }
    expect(TokenType::SEMICOLON, "Expect ';' after loop condition.");

    std::unique_ptr<ExpressionNode> incr;
    if (!check(TokenType::CLOSEPARENTHESIS)) {
        incr = parse_expression();
    }
    Token closeTok = expect(TokenType::CLOSEPARENTHESIS, "Expect ')' after for clauses.");

    std::unique_ptr<StatementNode> body;
    {
        ScopedValue<int> in_loop(loop_depth, loop_depth + 1);
        body = parse_statement();
    }

    if (incr) {
        auto incrStmt = std::make_unique<ExpressionStatementNode>();
        incrStmt->token = closeTok;
        incrStmt->expression = std::move(incr);

        auto wrapped = std::make_unique<BlockStatementNode>();
        wrapped->token = body->token;
        wrapped->body.push_back(std::move(body));
        wrapped->body.push_back(std::move(incrStmt));
        body = std::move(wrapped);
    }

    if (!cond) {
        auto always = std::make_unique<LiteralNode>();
        always->token = forTok;
        always->value = true;
        cond = std::move(always);
    }

    auto loop = std::make_unique<WhileStatementNode>();
    loop->token = forTok;
    loop->condition = std::move(cond);
    loop->body = std::move(body);

    if (!init) return loop;

    auto outer = std::make_unique<BlockStatementNode>();
    outer->token = forTok;
    outer->body.push_back(std::move(init));
    outer->body.push_back(std::move(loop));
    return outer;
}
