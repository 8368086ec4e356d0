#pragma once
#include <map>
#include <sstream>
#include <string>

// Keeps the text of one compilation unit (a file or a REPL entry) so that
// diagnostics can quote the offending line.
class SourceManager {
   public:
    std::string filename;
    std::string source;
    std::map<int, std::string> lines;

    SourceManager(const std::string& fname, const std::string& src)
        : filename(fname), source(src) {
        build_line_map();
    }

    std::string get_line(int line_num) const {
        auto it = lines.find(line_num);
        return it != lines.end() ? it->second : "";
    }

    int line_count() const { return static_cast<int>(lines.size()); }

    // " * 3 | print a + ;"
    // "              ^"
    std::string format_error_context(int line, int col, int length = 1) const {
        std::ostringstream prefix;
        prefix << " * " << line << " | ";
        std::string gutter = prefix.str();
        std::string line_text = get_line(line);

        std::string marker(static_cast<size_t>(col > 1 ? col - 1 : 0), ' ');
        marker += "^";
        if (length > 1) marker += std::string(static_cast<size_t>(length - 1), '~');

        return gutter + line_text + "\n" + std::string(gutter.size(), ' ') + marker;
    }

   private:
    void build_line_map() {
        int line_num = 1;
        std::string current_line;

        for (char c : source) {
            if (c == '\n') {
                lines[line_num] = current_line;
                current_line.clear();
                line_num++;
            } else if (c != '\r') {
                current_line += c;
            }
        }
        if (!current_line.empty()) {
            lines[line_num] = current_line;
        }
    }
};
