#pragma once
#include <map>
#include <sstream>
#include <string>

namespace formula {

// Keeps the source of one expression (or file of expressions) so located
// errors can quote the offending line with a caret under the column.
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

    // Streamed input (stdin): record one more line, returns its number
    int append_line(const std::string& text) {
        source += text;
        source += '\n';
        int line_num = static_cast<int>(lines.size()) + 1;
        lines[line_num] = text;
        return line_num;
    }

    std::string format_error_context(int line, int col) const {
        std::stringstream ss;
        ss << " * " << line << " | ";
        std::string prefix = ss.str();
        ss << get_line(line) << "\n";
        ss << std::string(prefix.size() + (col > 0 ? col - 1 : 0), ' ') << "^";
        return ss.str();
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
            } else {
                current_line += c;
            }
        }
        if (!current_line.empty()) {
            lines[line_num] = current_line;
        }
    }
};

}  // namespace formula
