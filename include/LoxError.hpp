#pragma once
#include <stdexcept>
#include <string>

#include "token.hpp"

// Base class of every diagnostic the interpreter raises. what() is the bare
// message; detailed() adds the kind, location and the quoted source line.
class LoxError : public std::runtime_error {
   public:
    LoxError(const std::string& type,
        const std::string& message,
        const Token& token) : std::runtime_error(message), type_(type), token_(token) {}

    const std::string& type() const { return type_; }
    const Token& token() const { return token_; }
    int line() const { return token_.line(); }

    std::string detailed() const {
        return type_ + " at " + token_.loc.to_string() + "\n" +
            what() + "\n" +
            " --> Traced at:\n" +
            token_.loc.get_line_trace();
    }

   private:
    std::string type_;
    Token token_;
};

// Raised by the parser; caught per declaration so parsing can resynchronize.
class ParseError : public LoxError {
   public:
    ParseError(const Token& token, const std::string& message)
        : LoxError("SyntaxError", message, token) {}
};

// Raised by the evaluator; fatal to the current run.
class RuntimeError : public LoxError {
   public:
    RuntimeError(const Token& token, const std::string& message)
        : LoxError("RuntimeError", message, token) {}
};
