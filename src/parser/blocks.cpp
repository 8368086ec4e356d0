// src/parser/blocks.cpp
#include "parser.hpp"

// Caller has consumed the '{'. Each declaration recovers from its own
// errors, so one bad line does not discard the whole block.
std::vector<std::unique_ptr<StatementNode>> Parser::parse_block() {
    std::vector<std::unique_ptr<StatementNode>> body;

    while (!check(TokenType::CLOSEBRACE) && !at_end()) {
        auto stmt = parse_declaration();
        if (stmt) body.push_back(std::move(stmt));
    }

    expect(TokenType::CLOSEBRACE, "Expect '}' after block.");
    return body;
}

std::shared_ptr<FunctionNode> Parser::parse_function(FunctionKind kind) {
    const std::string kindName = kind == FunctionKind::FUNCTION ? "function" : "method";

    Token nameTok = expect(TokenType::IDENTIFIER, "Expect " + kindName + " name.");
    auto fn = std::make_shared<FunctionNode>();
    fn->token = nameTok;
    fn->name = nameTok.value;

    expect(TokenType::OPENPARENTHESIS, "Expect '(' after " + kindName + " name.");
    if (!check(TokenType::CLOSEPARENTHESIS)) {
        do {
            if (fn->params.size() >= MAX_ARGUMENTS) {
                reporter.error(peek(), "Can't have more than 255 parameters.");
            }
            fn->params.push_back(expect(TokenType::IDENTIFIER, "Expect parameter name."));
        } while (match(TokenType::COMMA));
    }
    expect(TokenType::CLOSEPARENTHESIS, "Expect ')' after parameters.");

    expect(TokenType::OPENBRACE, "Expect '{' before " + kindName + " body.");

    // a loop around a function body does not make `break` legal inside it
    ScopedValue<FunctionKind> in_function(current_function, kind);
    ScopedValue<int> no_loop(loop_depth, 0);
    fn->body = parse_block();

    return fn;
}

std::unique_ptr<StatementNode> Parser::parse_class_declaration() {
    Token nameTok = expect(TokenType::IDENTIFIER, "Expect class name.");

    auto node = std::make_unique<ClassDeclarationNode>();
    node->token = nameTok;
    node->name = nameTok.value;

    if (match(TokenType::LESSTHAN)) {
        Token superTok = expect(TokenType::IDENTIFIER, "Expect superclass name.");
        if (superTok.value == nameTok.value) {
            reporter.error(superTok, "A class can't inherit from itself.");
        }
        auto superclass = std::make_unique<VariableNode>();
        superclass->token = superTok;
        superclass->name = superTok.value;
        node->superclass = std::move(superclass);
    }

    ScopedValue<ClassKind> in_class(current_class, node->superclass ? ClassKind::SUBCLASS : ClassKind::CLASS);

    expect(TokenType::OPENBRACE, "Expect '{' before class body.");
    while (!check(TokenType::CLOSEBRACE) && !at_end()) {
        bool is_init = peek().type == TokenType::IDENTIFIER && peek().value == "init";
        node->methods.push_back(parse_function(is_init ? FunctionKind::INITIALIZER : FunctionKind::METHOD));
    }
    expect(TokenType::CLOSEBRACE, "Expect '}' after class body.");

    return node;
}
