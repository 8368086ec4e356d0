// src/parser/expressions.cpp
#include "parser.hpp"

std::unique_ptr<ExpressionNode> Parser::parse_expression() {
    check_nesting();
    return parse_assignment();
}

// Right-associative. The target is parsed as an ordinary expression first and
// only afterwards checked to be a variable or a property access.
std::unique_ptr<ExpressionNode> Parser::parse_assignment() {
    auto expr = parse_logical_or();

    if (match(TokenType::ASSIGN)) {
        Token equals = previous();
        check_nesting();
        auto value = parse_assignment();

        if (auto var = dynamic_cast<VariableNode*>(expr.get())) {
            auto node = std::make_unique<AssignmentNode>();
            node->token = var->token;
            node->name = var->name;
            node->value = std::move(value);
            return node;
        }

        if (auto get = dynamic_cast<GetExpressionNode*>(expr.get())) {
            auto node = std::make_unique<SetExpressionNode>();
            node->token = get->token;
            node->object = std::move(get->object);
            node->property = get->property;
            node->value = std::move(value);
            return node;
        }

        reporter.error(equals, "Invalid assignment target.");
    }

    return expr;
}

std::unique_ptr<ExpressionNode> Parser::parse_logical_or() {
    auto left = parse_logical_and();
    while (match(TokenType::OR)) {
        Token op = previous();
        auto node = std::make_unique<LogicalExpressionNode>();
        node->op = op.value;
        node->token = op;
        node->left = std::move(left);
        node->right = parse_logical_and();
        left = std::move(node);
    }
    return left;
}

std::unique_ptr<ExpressionNode> Parser::parse_logical_and() {
    auto left = parse_equality();
    while (match(TokenType::AND)) {
        Token op = previous();
        auto node = std::make_unique<LogicalExpressionNode>();
        node->op = op.value;
        node->token = op;
        node->left = std::move(left);
        node->right = parse_equality();
        left = std::move(node);
    }
    return left;
}

std::unique_ptr<ExpressionNode> Parser::parse_equality() {
    auto left = parse_comparison();
    while (check(TokenType::EQUALITY) || check(TokenType::NOTEQUAL)) {
        Token op = consume();
        auto right = parse_comparison();
        auto node = std::make_unique<BinaryExpressionNode>();
        node->op = op.value;
        node->left = std::move(left);
        node->right = std::move(right);
        node->token = op;
        left = std::move(node);
    }
    return left;
}

std::unique_ptr<ExpressionNode> Parser::parse_comparison() {
    auto left = parse_additive();
    while (check(TokenType::GREATERTHAN) ||
        check(TokenType::GREATEROREQUALTHAN) ||
        check(TokenType::LESSTHAN) ||
        check(TokenType::LESSOREQUALTHAN)) {
        Token op = consume();
        auto right = parse_additive();
        auto node = std::make_unique<BinaryExpressionNode>();
        node->op = op.value;
        node->left = std::move(left);
        node->right = std::move(right);
        node->token = op;
        left = std::move(node);
    }
    return left;
}

std::unique_ptr<ExpressionNode> Parser::parse_additive() {
    auto left = parse_multiplicative();
    while (check(TokenType::PLUS) || check(TokenType::MINUS)) {
        Token op = consume();
        auto right = parse_multiplicative();
        auto node = std::make_unique<BinaryExpressionNode>();
        node->op = op.value;
        node->left = std::move(left);
        node->right = std::move(right);
        node->token = op;
        left = std::move(node);
    }
    return left;
}

std::unique_ptr<ExpressionNode> Parser::parse_multiplicative() {
    auto left = parse_unary();
    while (check(TokenType::STAR) || check(TokenType::SLASH)) {
        Token op = consume();
        auto right = parse_unary();
        auto node = std::make_unique<BinaryExpressionNode>();
        node->op = op.value;
        node->left = std::move(left);
        node->right = std::move(right);
        node->token = op;
        left = std::move(node);
    }
    return left;
}

std::unique_ptr<ExpressionNode> Parser::parse_unary() {
    if (check(TokenType::NOT) || check(TokenType::MINUS)) {
        check_nesting();
        Token op = consume();
        auto node = std::make_unique<UnaryExpressionNode>();
        node->op = op.value;
        node->token = op;
        node->operand = parse_unary();
        return node;
    }
    return parse_call_chain();
}

// primary followed by any mix of `(args)` and `.name`
std::unique_ptr<ExpressionNode> Parser::parse_call_chain() {
    auto expr = parse_primary();

    while (true) {
        if (match(TokenType::OPENPARENTHESIS)) {
            expr = finish_call(std::move(expr));
        } else if (match(TokenType::DOT)) {
            Token nameTok = expect(TokenType::IDENTIFIER, "Expect property name after '.'.");
            auto node = std::make_unique<GetExpressionNode>();
            node->token = nameTok;
            node->object = std::move(expr);
            node->property = nameTok.value;
            expr = std::move(node);
        } else {
            break;
        }
    }

    return expr;
}

std::unique_ptr<ExpressionNode> Parser::finish_call(std::unique_ptr<ExpressionNode> callee) {
    auto call = std::make_unique<CallExpressionNode>();
    call->callee = std::move(callee);

    if (!check(TokenType::CLOSEPARENTHESIS)) {
        do {
            if (call->arguments.size() >= MAX_ARGUMENTS) {
                reporter.error(peek(), "Can't have more than 255 arguments.");
            }
            call->arguments.push_back(parse_expression());
        } while (match(TokenType::COMMA));
    }

    call->token = expect(TokenType::CLOSEPARENTHESIS, "Expect ')' after arguments.");
    return call;
}

std::unique_ptr<ExpressionNode> Parser::parse_primary() {
    Token t = peek();

    switch (t.type) {
        case TokenType::BOOLEAN:
        case TokenType::NIL:
        case TokenType::NUMBER:
        case TokenType::STRING: {
            consume();
            auto node = std::make_unique<LiteralNode>();
            node->token = t;
            node->value = t.literal.value_or(Literal{});
            return node;
        }

        case TokenType::THIS: {
            consume();
            if (current_class == ClassKind::NONE) {
                reporter.error(t, "Can't use 'this' outside of a class.");
            }
            auto node = std::make_unique<ThisExpressionNode>();
            node->token = t;
            return node;
        }

        case TokenType::SUPER: {
            consume();
            if (current_class == ClassKind::NONE) {
                reporter.error(t, "Can't use 'super' outside of a class.");
            } else if (current_class != ClassKind::SUBCLASS) {
                reporter.error(t, "Can't use 'super' in a class with no superclass.");
            }
            expect(TokenType::DOT, "Expect '.' after 'super'.");
            Token method = expect(TokenType::IDENTIFIER, "Expect superclass method name.");
            auto node = std::make_unique<SuperExpressionNode>();
            node->token = t;
            node->method = method.value;
            return node;
        }

        case TokenType::IDENTIFIER: {
            consume();
            auto node = std::make_unique<VariableNode>();
            node->token = t;
            node->name = t.value;
            return node;
        }

        case TokenType::OPENPARENTHESIS: {
            consume();
            auto node = std::make_unique<GroupingNode>();
            node->token = t;
            node->expression = parse_expression();
            expect(TokenType::CLOSEPARENTHESIS, "Expect ')' after expression.");
            return node;
        }

        default:
            throw error(t, "Expect expression.");
    }
}
