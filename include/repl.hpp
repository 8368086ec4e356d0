#pragma once
#include <iostream>
#include <string>

#include "ErrorReporter.hpp"
#include "cli_commands.hpp"
#include "evaluator.hpp"

// One interactive session: a persistent evaluator fed one line at a time.
// Lines are buffered while brackets are unbalanced; a single expression
// statement has its value printed.
class ReplSession {
   public:
    enum class Status { COMPLETE,
        NEED_MORE,
        EXIT };

    explicit ReplSession(std::ostream& out = std::cout,
        std::ostream& err = std::cerr,
        lox::cli::RunOptions opts = {});

    Status feed_line(const std::string& line);

    bool has_pending_input() const { return !buffer.empty(); }
    const char* prompt() const { return buffer.empty() ? "> " : "... "; }

    Evaluator& evaluator() { return evaluator_; }
    ErrorReporter& reporter() { return reporter_; }

   private:
    std::ostream& out;
    std::ostream& err;
    lox::cli::RunOptions opts;
    ErrorReporter reporter_;
    Evaluator evaluator_;
    std::string buffer;

    void run_entry(const std::string& source);
};

void run_repl_mode(const lox::cli::RunOptions& opts = {});
