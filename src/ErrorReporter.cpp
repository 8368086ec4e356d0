#include "ErrorReporter.hpp"

#include "colors.hpp"

ErrorReporter::ErrorReporter(std::ostream& out)
    : out_(out), use_color_(&out == &std::cerr && Color::supports_color(STDERR_FILENO)) {}

std::string ErrorReporter::paint(const std::string& color, const std::string& text) const {
    return use_color_ ? color + text + Color::reset : text;
}

void ErrorReporter::error(int line, const std::string& message) {
    report(line, "", message);
}

void ErrorReporter::error(const Token& token, const std::string& message) {
    if (token.type == TokenType::EOF_TOKEN) {
        report(token.line(), " at end", message);
    } else {
        report(token.line(), " at '" + token.value + "'", message);
    }
}

void ErrorReporter::report(int line, const std::string& where, const std::string& message) {
    out_ << paint(Color::bright_black, "[line " + std::to_string(line) + "]")
         << " " << paint(Color::bright_red, "Error" + where) << ": " << message << std::endl;
    had_error_ = true;
    ++error_count_;
}

void ErrorReporter::runtime_error(const RuntimeError& err) {
    out_ << paint(Color::red, err.what()) << "\n"
         << paint(Color::bright_black, "[line " + std::to_string(err.line()) + "]") << std::endl;
    if (show_trace_ && err.token().loc.src_mgr) {
        out_ << paint(Color::bright_black, err.token().loc.get_line_trace()) << std::endl;
    }
    had_runtime_error_ = true;
    ++error_count_;
}

void ErrorReporter::reset() {
    had_error_ = false;
    had_runtime_error_ = false;
    error_count_ = 0;
}
