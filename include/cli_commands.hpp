#ifndef LOX_CLI_COMMANDS_HPP
#define LOX_CLI_COMMANDS_HPP

#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "ErrorReporter.hpp"
#include "evaluator.hpp"

namespace lox {
namespace cli {

// Process exit statuses, sysexits(3) style
enum class ExitCode : int {
    OK = 0,
    USAGE = 64,
    DATA_ERROR = 65,  // scan or parse error
    NO_INPUT = 66,    // script not found
    SOFTWARE = 70,    // runtime error
    IO_ERROR = 74
};

// Command result structure
struct CommandResult {
    int exit_code;
    std::string message;  // printed to stderr by the caller when non-empty
};

// Pipeline switches shared by file mode and interactive mode
struct RunOptions {
    bool dump_tokens = false;  // --tokens: token dump on stderr before parsing
    bool print_ast = false;    // --ast: print the tree instead of running it
};

// Result of parsing the command line
struct CliOptions {
    bool show_help = false;
    bool show_version = false;
    bool interactive = false;
    RunOptions run;
    std::optional<std::string> script;
    std::string error;  // non-empty on a usage error
};

CliOptions parse_arguments(const std::vector<std::string>& args);
std::string usage_text();
std::string version_text();

// Scan, parse and run one compilation unit against an existing evaluator.
// Diagnostics go through the reporter; the exit code says which stage failed.
CommandResult run_source(const std::string& source,
    const std::string& filename,
    Evaluator& evaluator,
    ErrorReporter& reporter,
    const RunOptions& opts = {});

// Read a script and run it on a fresh evaluator.
CommandResult run_file(const std::string& path,
    const RunOptions& opts = {},
    std::ostream& out = std::cout,
    std::ostream& err = std::cerr);

// Helper functions
std::optional<std::filesystem::path> resolve_script_path(const std::string& path);
std::optional<std::string> read_source_file(const std::filesystem::path& path);

}  // namespace cli
}  // namespace lox

#endif  // LOX_CLI_COMMANDS_HPP
