#pragma once
#include <memory>
#include <vector>

#include "ErrorReporter.hpp"
#include "StackGuard.hpp"
#include "ast.hpp"
#include "token.hpp"

// Restores a piece of parser state when the current production is left,
// including by a ParseError unwinding to the enclosing declaration.
template <typename T>
class ScopedValue {
   public:
    ScopedValue(T& slot, T value) : slot(slot), saved(slot) { slot = value; }
    ~ScopedValue() { slot = saved; }
    ScopedValue(const ScopedValue&) = delete;
    ScopedValue& operator=(const ScopedValue&) = delete;

   private:
    T& slot;
    T saved;
};

class Parser {
   public:
    Parser(const std::vector<Token>& tokens, ErrorReporter& reporter);

    // Never throws on bad input: every syntax error is reported and the
    // declaration it occurred in is dropped from the result.
    std::unique_ptr<ProgramNode> parse();

   private:
    enum class FunctionKind { NONE, FUNCTION, METHOD, INITIALIZER };
    enum class ClassKind { NONE, CLASS, SUBCLASS };

    std::vector<Token> tokens;
    ErrorReporter& reporter;
    size_t position = 0;

    FunctionKind current_function = FunctionKind::NONE;
    ClassKind current_class = ClassKind::NONE;
    int loop_depth = 0;

    StackGuard stack;

    static constexpr size_t MAX_ARGUMENTS = 255;

    Token peek() const;
    Token peek_next(size_t offset = 1) const;
    Token previous() const;
    bool check(TokenType t) const;
    bool at_end() const;

    Token consume();
    bool match(TokenType t);
    Token expect(TokenType t, const std::string& errMsg);

    ParseError error(const Token& tok, const std::string& message);
    void synchronize();
    // throws "Too much nesting." before a recursive rule can exhaust the stack
    void check_nesting();

    // declarations
    std::unique_ptr<StatementNode> parse_declaration();
    std::unique_ptr<StatementNode> parse_class_declaration();
    std::unique_ptr<StatementNode> parse_function_declaration();
    std::unique_ptr<StatementNode> parse_variable_declaration();
    std::shared_ptr<FunctionNode> parse_function(FunctionKind kind);

    // statements
    std::unique_ptr<StatementNode> parse_statement();
    std::unique_ptr<StatementNode> parse_print_statement();
    std::unique_ptr<StatementNode> parse_expression_statement();
    std::unique_ptr<StatementNode> parse_return_statement();
    std::unique_ptr<StatementNode> parse_break_statement();

    // control-flow parsing
    std::unique_ptr<StatementNode> parse_if_statement();
    std::unique_ptr<StatementNode> parse_while_statement();
    std::unique_ptr<StatementNode> parse_for_statement();  // desugared into a while loop

    // `{ ... }` after the opening brace has been consumed
    std::vector<std::unique_ptr<StatementNode>> parse_block();

    // expression parsing (precedence chain)
    std::unique_ptr<ExpressionNode> parse_expression();
    std::unique_ptr<ExpressionNode> parse_assignment();
    std::unique_ptr<ExpressionNode> parse_logical_or();
    std::unique_ptr<ExpressionNode> parse_logical_and();
    std::unique_ptr<ExpressionNode> parse_equality();
    std::unique_ptr<ExpressionNode> parse_comparison();
    std::unique_ptr<ExpressionNode> parse_additive();
    std::unique_ptr<ExpressionNode> parse_multiplicative();
    std::unique_ptr<ExpressionNode> parse_unary();
    std::unique_ptr<ExpressionNode> parse_call_chain();
    std::unique_ptr<ExpressionNode> parse_primary();
    std::unique_ptr<ExpressionNode> finish_call(std::unique_ptr<ExpressionNode> callee);
};
