#pragma once
#include <cstddef>
#include <iostream>
#include <string>

#include "LoxError.hpp"
#include "token.hpp"

// Diagnostics sink shared by the lexer, parser and evaluator. Tracks whether a
// static (scan/parse) or runtime error happened so the driver can decide
// whether to run the program and which exit code to use.
class ErrorReporter {
   public:
    explicit ErrorReporter(std::ostream& out = std::cerr);

    // scan errors: no token exists yet
    void error(int line, const std::string& message);
    // parse errors: "at 'lexeme'" or "at end"
    void error(const Token& token, const std::string& message);
    void report(int line, const std::string& where, const std::string& message);

    void runtime_error(const RuntimeError& err);

    bool had_error() const { return had_error_; }
    bool had_runtime_error() const { return had_runtime_error_; }
    size_t error_count() const { return error_count_; }

    // Interactive mode clears the flags before every entry.
    void reset();

    std::ostream& stream() { return out_; }

    void set_color(bool enabled) { use_color_ = enabled; }
    void set_show_trace(bool enabled) { show_trace_ = enabled; }

   private:
    std::ostream& out_;
    bool had_error_ = false;
    bool had_runtime_error_ = false;
    size_t error_count_ = 0;
    bool use_color_ = false;
    bool show_trace_ = true;

    std::string paint(const std::string& color, const std::string& text) const;
};
