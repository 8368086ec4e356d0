#pragma once
#include <memory>
#include <string>
#include <vector>

#include "token.hpp"

// Base class for all AST nodes
struct Node {
    virtual ~Node() = default;
    Token token;  // filename, line, column for this node (set by the parser)
};

// Expressions
struct ExpressionNode : public Node {
    // Moves owned subexpressions into `out`; nodes without children add nothing.
    virtual void release_children(std::vector<std::unique_ptr<ExpressionNode>>& out) { (void)out; }
};

// Destroys expressions with an explicit work list. Operator and call chains
// are built by loops in the parser and can be far deeper than the native
// stack allows nested destructors to go.
void destroy_expressions(std::vector<std::unique_ptr<ExpressionNode>> pending);

// number, string, true/false and nil literals; the value comes from the token
struct LiteralNode : public ExpressionNode {
    Literal value;
};

struct VariableNode : public ExpressionNode {
    std::string name;
};

// Plain variable assignment: `name = value`. Property writes use SetExpressionNode.
struct AssignmentNode : public ExpressionNode {
    std::string name;
    std::unique_ptr<ExpressionNode> value;
};

struct UnaryExpressionNode : public ExpressionNode {
    std::string op;  // "!" or "-"
    std::unique_ptr<ExpressionNode> operand;
};

struct BinaryExpressionNode : public ExpressionNode {
    std::string op;  // e.g. "+", "*", "==", "<="
    std::unique_ptr<ExpressionNode> left;
    std::unique_ptr<ExpressionNode> right;

    ~BinaryExpressionNode() override;
    void release_children(std::vector<std::unique_ptr<ExpressionNode>>& out) override;
};

// `and` / `or`, kept apart from BinaryExpressionNode because they short-circuit
struct LogicalExpressionNode : public ExpressionNode {
    std::string op;  // "and" or "or"
    std::unique_ptr<ExpressionNode> left;
    std::unique_ptr<ExpressionNode> right;

    ~LogicalExpressionNode() override;
    void release_children(std::vector<std::unique_ptr<ExpressionNode>>& out) override;
};

struct GroupingNode : public ExpressionNode {
    std::unique_ptr<ExpressionNode> expression;
};

// token is the closing parenthesis; runtime errors in the call report its line
struct CallExpressionNode : public ExpressionNode {
    std::unique_ptr<ExpressionNode> callee;
    std::vector<std::unique_ptr<ExpressionNode>> arguments;

    ~CallExpressionNode() override;
    void release_children(std::vector<std::unique_ptr<ExpressionNode>>& out) override;
};

// object.property
struct GetExpressionNode : public ExpressionNode {
    std::unique_ptr<ExpressionNode> object;
    std::string property;

    ~GetExpressionNode() override;
    void release_children(std::vector<std::unique_ptr<ExpressionNode>>& out) override;
};

// object.property = value
struct SetExpressionNode : public ExpressionNode {
    std::unique_ptr<ExpressionNode> object;
    std::string property;
    std::unique_ptr<ExpressionNode> value;
};

struct ThisExpressionNode : public ExpressionNode {};

// super.method
struct SuperExpressionNode : public ExpressionNode {
    std::string method;
};

// Statements
struct StatementNode : public Node {};

struct ExpressionStatementNode : public StatementNode {
    std::unique_ptr<ExpressionNode> expression;
};

struct PrintStatementNode : public StatementNode {
    std::unique_ptr<ExpressionNode> expression;
};

struct VariableDeclarationNode : public StatementNode {
    std::string identifier;
    std::unique_ptr<ExpressionNode> value;  // optional; nil when absent
};

struct BlockStatementNode : public StatementNode {
    std::vector<std::unique_ptr<StatementNode>> body;
};

struct IfStatementNode : public StatementNode {
    std::unique_ptr<ExpressionNode> condition;
    std::unique_ptr<StatementNode> then_branch;
    std::unique_ptr<StatementNode> else_branch;  // optional
};

// `for` loops are desugared into a while inside a block by the parser.
struct WhileStatementNode : public StatementNode {
    std::unique_ptr<ExpressionNode> condition;
    std::unique_ptr<StatementNode> body;
};

struct BreakStatementNode : public StatementNode {};

struct ReturnStatementNode : public StatementNode {
    std::unique_ptr<ExpressionNode> value;  // optional
};

// A function or method body. Shared so that function values created from it
// stay valid after the program that declared them is gone (interactive mode
// discards each entry's AST once it has run).
struct FunctionNode : public Node {
    std::string name;
    std::vector<Token> params;
    std::vector<std::unique_ptr<StatementNode>> body;
};

struct FunctionDeclarationNode : public StatementNode {
    std::shared_ptr<FunctionNode> function;
};

struct ClassDeclarationNode : public StatementNode {
    std::string name;
    std::unique_ptr<VariableNode> superclass;  // optional
    std::vector<std::shared_ptr<FunctionNode>> methods;
};

// Program root
struct ProgramNode : public Node {
    std::vector<std::unique_ptr<StatementNode>> body;
};
