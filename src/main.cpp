#include <exception>
#include <iostream>
#include <string>
#include <vector>

#include "cli_commands.hpp"
#include "repl.hpp"

int main(int argc, char* argv[]) {
    using namespace lox::cli;

    std::vector<std::string> args(argv + 1, argv + argc);
    CliOptions opts = parse_arguments(args);

    if (!opts.error.empty()) {
        std::cerr << opts.error << std::endl;
        return static_cast<int>(ExitCode::USAGE);
    }
    if (opts.show_help) {
        std::cout << usage_text();
        return 0;
    }
    if (opts.show_version) {
        std::cout << version_text() << std::endl;
        return 0;
    }

    try {
        if (opts.interactive || !opts.script) {
            run_repl_mode(opts.run);
            return 0;
        }

        CommandResult result = run_file(*opts.script, opts.run);
        if (!result.message.empty()) std::cerr << result.message << std::endl;
        return result.exit_code;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return static_cast<int>(ExitCode::SOFTWARE);
    }
}
