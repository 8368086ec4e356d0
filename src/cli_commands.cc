#include "cli_commands.hpp"

#include <fstream>
#include <memory>
#include <sstream>

#include "SourceManager.hpp"
#include "format/format.hpp"
#include "lexer.hpp"
#include "parser.hpp"
#include "print_tokens.hpp"

#ifndef LOX_VERSION
#define LOX_VERSION "0.0.0-dev"
#endif

namespace fs = std::filesystem;

namespace lox {
namespace cli {

static int code(ExitCode c) {
    return static_cast<int>(c);
}

std::string version_text() {
    return std::string("lox v") + LOX_VERSION;
}

std::string usage_text() {
    std::ostringstream ss;
    ss << "Usage: lox [options] [script]\n"
       << "Options:\n"
       << "  -v, --version    Print version and exit\n"
       << "  -i               Start REPL (interactive)\n"
       << "  -h, --help       Show this help message\n"
       << "  --tokens         Dump the token stream to stderr\n"
       << "  --ast            Print the syntax tree instead of running\n"
       << "\n"
       << "Without a script, lox starts the REPL.\n"
       << "If a script name starts with '-', use `--` to end options:\n"
       << "  lox -- -weird.lox\n";
    return ss.str();
}

// Simple options parser: flags until the first non-option or `--`.
CliOptions parse_arguments(const std::vector<std::string>& args) {
    CliOptions opts;
    bool seen_double_dash = false;

    for (const auto& arg : args) {
        if (!seen_double_dash && arg == "--") {
            seen_double_dash = true;
            continue;
        }

        if (!seen_double_dash && !arg.empty() && arg[0] == '-') {
            if (arg == "-v" || arg == "--version") {
                opts.show_version = true;
            } else if (arg == "-h" || arg == "--help") {
                opts.show_help = true;
            } else if (arg == "-i") {
                opts.interactive = true;
            } else if (arg == "--tokens") {
                opts.run.dump_tokens = true;
            } else if (arg == "--ast") {
                opts.run.print_ast = true;
            } else {
                opts.error = "lox: unknown option '" + arg + "'\nTry 'lox --help' for more information.";
                return opts;
            }
            continue;
        }

        if (opts.script) {
            opts.error = "lox: expected at most one script, got '" + *opts.script + "' and '" + arg + "'\n" + usage_text();
            return opts;
        }
        opts.script = arg;
    }

    return opts;
}

// Accepts the path as given, or the same name with a `.lox` extension.
std::optional<fs::path> resolve_script_path(const std::string& path) {
    fs::path p(path);
    std::error_code ec;
    if (fs::exists(p, ec)) return p;
    if (p.has_extension()) return std::nullopt;

    fs::path candidate = p;
    candidate += ".lox";
    if (fs::exists(candidate, ec)) return candidate;
    return std::nullopt;
}

std::optional<std::string> read_source_file(const fs::path& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) return std::nullopt;

    std::ifstream file(path, std::ios::in | std::ios::binary);
    if (!file.is_open()) return std::nullopt;

    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) return std::nullopt;
    return buffer.str();
}

CommandResult run_source(const std::string& source,
    const std::string& filename,
    Evaluator& evaluator,
    ErrorReporter& reporter,
    const RunOptions& opts) {
    auto src_mgr = std::make_shared<SourceManager>(filename, source);

    Lexer lexer(source, filename, reporter, src_mgr);
    std::vector<Token> tokens = lexer.tokenize();

    if (opts.dump_tokens) print_tokens(tokens, reporter.stream());

    // parse even after scan errors so that syntax errors are reported too
    Parser parser(tokens, reporter);
    std::unique_ptr<ProgramNode> ast = parser.parse();

    if (reporter.had_error()) return {code(ExitCode::DATA_ERROR), ""};

    if (opts.print_ast) {
        std::string text = format_program(ast.get());
        evaluator.output() << text;
        if (!text.empty()) evaluator.output() << "\n";
        evaluator.output().flush();
        return {code(ExitCode::OK), ""};
    }

    if (!evaluator.interpret(ast.get())) return {code(ExitCode::SOFTWARE), ""};
    return {code(ExitCode::OK), ""};
}

CommandResult run_file(const std::string& path,
    const RunOptions& opts,
    std::ostream& out,
    std::ostream& err) {
    auto resolved = resolve_script_path(path);
    if (!resolved) {
        return {code(ExitCode::NO_INPUT), "Error: File not found: " + path};
    }

    auto source = read_source_file(*resolved);
    if (!source) {
        return {code(ExitCode::IO_ERROR), "Error: Could not read file " + resolved->string()};
    }

    ErrorReporter reporter(err);
    Evaluator evaluator(reporter, out);
    return run_source(*source, resolved->string(), evaluator, reporter, opts);
}

}  // namespace cli
}  // namespace lox
