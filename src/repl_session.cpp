#include <cctype>
#include <memory>

#include "SourceManager.hpp"
#include "format/format.hpp"
#include "lexer.hpp"
#include "parser.hpp"
#include "print_tokens.hpp"
#include "repl.hpp"

// Count of unclosed '{' and '(' outside strings and line comments.
static int unclosed_brackets_depth(const std::string& s) {
    int braces = 0, paren = 0;
    bool in_string = false;
    for (size_t i = 0; i < s.size(); ++i) {
        char c = s[i];
        if (in_string) {
            if (c == '"' || c == '\n') in_string = false;
            continue;
        }
        if (c == '"') {
            in_string = true;
            continue;
        }
        if (c == '/' && i + 1 < s.size() && s[i + 1] == '/') {
            while (i < s.size() && s[i] != '\n') ++i;
            continue;
        }

        if (c == '{')
            ++braces;
        else if (c == '}')
            --braces;
        else if (c == '(')
            ++paren;
        else if (c == ')')
            --paren;
    }

    int openOnly = 0;
    if (braces > 0) openOnly += braces;
    if (paren > 0) openOnly += paren;
    return openOnly;  // zero if all balanced (or more closes than opens)
}

static char last_non_ws_char(const std::string& s) {
    for (size_t i = s.size(); i > 0; --i) {
        unsigned char ch = static_cast<unsigned char>(s[i - 1]);
        if (!std::isspace(ch)) return static_cast<char>(ch);
    }
    return '\0';
}

// True when the last non-blank line ends in a `//` comment. Strings never span
// lines, so the scan starts fresh at the beginning of that line.
static bool ends_in_comment(const std::string& s) {
    size_t end = s.find_last_not_of(" \t\r\n");
    if (end == std::string::npos) return false;
    size_t line_start = s.rfind('\n', end);
    size_t start = line_start == std::string::npos ? 0 : line_start + 1;

    bool in_string = false;
    for (size_t i = start; i < end; ++i) {
        char c = s[i];
        if (in_string) {
            if (c == '"') in_string = false;
            continue;
        }
        if (c == '"') {
            in_string = true;
            continue;
        }
        if (c == '/' && s[i + 1] == '/') return true;
    }
    return false;
}

ReplSession::ReplSession(std::ostream& out, std::ostream& err, lox::cli::RunOptions opts)
    : out(out), err(err), opts(opts), reporter_(err), evaluator_(reporter_, out) {}

ReplSession::Status ReplSession::feed_line(const std::string& line) {
    if (buffer.empty() && (line == "exit" || line == "quit")) return Status::EXIT;

    buffer += line;
    buffer.push_back('\n');

    if (unclosed_brackets_depth(buffer) > 0) return Status::NEED_MORE;

    std::string source;
    source.swap(buffer);

    char last = last_non_ws_char(source);
    if (last == '\0') return Status::COMPLETE;

    // `1 + 2` at the prompt is accepted as `1 + 2;`
    if (last != ';' && last != '}' && !ends_in_comment(source)) {
        source.insert(source.size() - 1, ";");
    }

    run_entry(source);
    return Status::COMPLETE;
}

void ReplSession::run_entry(const std::string& source) {
    reporter_.reset();

    auto src_mgr = std::make_shared<SourceManager>("<repl>", source);
    Lexer lexer(source, "<repl>", reporter_, src_mgr);
    std::vector<Token> tokens = lexer.tokenize();

    if (opts.dump_tokens) print_tokens(tokens, err);

    Parser parser(tokens, reporter_);
    std::unique_ptr<ProgramNode> ast = parser.parse();
    if (reporter_.had_error()) return;

    if (opts.print_ast) {
        out << format_program(ast.get()) << "\n";
        return;
    }

    if (ast->body.size() == 1) {
        if (auto exprStmt = dynamic_cast<ExpressionStatementNode*>(ast->body[0].get())) {
            try {
                Value v = evaluator_.evaluate_expression(exprStmt->expression.get());
                out << evaluator_.value_to_string(v) << "\n";
            } catch (const RuntimeError& e) {
                reporter_.runtime_error(e);
            }
            out.flush();
            return;
        }
    }

    evaluator_.interpret(ast.get());
}
