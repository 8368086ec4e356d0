#pragma once
#include <string>

#include "ast.hpp"
#include "token.hpp"

// Parenthesized prefix rendering of the AST, used by `lox --ast` and the
// parser tests: `1 + 2 * 3` prints as `(+ 1 (* 2 3))`.
std::string format_expression(ExpressionNode* expr);
std::string format_statement(StatementNode* stmt);

// One line per top-level statement, newline separated.
std::string format_program(ProgramNode* program);

// Shortest round-trip form; integral values below 1e15 print without a
// fraction, and non-finite values as nan, inf and -inf.
std::string format_number(double d);

// Literal as it would be written in source: strings quoted, integral
// numbers without a fraction.
std::string format_literal(const Literal& lit);
