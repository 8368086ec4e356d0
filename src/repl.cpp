#include <cstdlib>
#include <filesystem>
#include <optional>

#include "linenoise.h"
#include "repl.hpp"

namespace fs = std::filesystem;

static std::optional<fs::path> get_home_dir() {
    const char* home = std::getenv("HOME");
    if (home && home[0] != '\0') return fs::path(home);
    return std::nullopt;
}

static fs::path history_file_in_home() {
    auto home = get_home_dir();
    if (home.has_value()) {
        return home.value() / ".lox_history";
    }
    return fs::current_path() / ".lox_history";
}

void run_repl_mode(const lox::cli::RunOptions& opts) {
    ReplSession session(std::cout, std::cerr, opts);

    std::cout << lox::cli::version_text() << " | built on " << __DATE__ << "\n";
    std::cout << "Type 'exit' or Ctrl-D to quit\n";

    fs::path history_path = history_file_in_home();
    linenoiseHistoryLoad(history_path.string().c_str());

    std::string last_added_history;

    while (true) {
        char* raw = linenoise(session.prompt());
        if (!raw) {  // EOF (Ctrl-D) or error
            std::cout << "\n";
            break;
        }

        std::string line(raw);
        linenoiseFree(raw);

        if (!line.empty() && line != last_added_history) {
            linenoiseHistoryAdd(line.c_str());
            last_added_history = line;
        }

        if (session.feed_line(line) == ReplSession::Status::EXIT) break;
    }

    if (linenoiseHistorySave(history_path.string().c_str()) != 0) {
        std::cerr << "warning: could not save history to " << history_path.string() << "\n";
    }
}
