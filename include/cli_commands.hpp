#ifndef FORMULA_CLI_COMMANDS_HPP
#define FORMULA_CLI_COMMANDS_HPP

#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "state.hpp"

namespace formula {
namespace cli {

// Structure to hold parsed formula.json data
struct ProjectConfig {
    std::string root;          // directory holding formula.json
    std::string context_file;  // resolved against root, empty when unset
    bool builtins = true;
    bool json_output = false;
    bool color = true;
    Context variables;

    bool is_valid = false;
};

// Parsed command line
struct Options {
    std::vector<std::string> expressions;
    std::string context_file;
    std::string source_file;
    std::string ast_file;
    std::vector<std::pair<std::string, std::string>> defines;  // -D name=value, in order
    bool json_output = false;
    bool no_builtins = false;
    bool dump_tokens = false;
    bool print_ast = false;
    bool show_version = false;
    bool show_help = false;
};

// Command result structure
struct CommandResult {
    int exit_code;
    std::string message;
};

// Bad flags, unreadable context files, broken formula.json. Exit status 2.
class UsageError : public std::runtime_error {
   public:
    explicit UsageError(const std::string& message) : std::runtime_error(message) {}
};

// Everything one run needs after options and config are merged
struct Session {
    State state;
    bool json_output = false;
    bool color = false;
    bool dump_tokens = false;
    bool print_ast = false;
};

Options parse_arguments(const std::vector<std::string>& args);

// Merges options over config (options win) and loads every context source:
// config context file, config variables, -c file, then -D values.
Session build_session(const Options& opts, const std::optional<ProjectConfig>& config, bool tty);

// Each returns true when every formula evaluated. Results go to `out`,
// diagnostics to `err`.
bool evaluate_line(const Session& session,
    const std::string& source,
    const std::string& filename,
    std::ostream& out,
    std::ostream& err);
bool run_expressions(const Session& session, const std::vector<std::string>& expressions, std::ostream& out, std::ostream& err);
bool run_file(const Session& session, const std::string& path, std::ostream& out, std::ostream& err);
bool run_ast_file(const Session& session, const std::string& path, std::ostream& out, std::ostream& err);
bool run_stream(const Session& session, std::istream& in, std::ostream& out, std::ostream& err);

// Main command dispatcher (after --help / --version are handled)
CommandResult execute_command(const Options& opts,
    std::istream& in,
    std::ostream& out,
    std::ostream& err,
    bool tty,
    const std::string& start_dir = ".");

// Helper functions
std::optional<ProjectConfig> find_and_parse_formula_json(const std::string& start_dir = ".");
std::optional<ProjectConfig> parse_formula_json(const std::string& filepath);
std::string get_project_root(const std::string& start_dir = ".");
Context load_context_file(const std::string& path);
Value parse_define_value(const std::string& text);

}  // namespace cli
}  // namespace formula

#endif  // FORMULA_CLI_COMMANDS_HPP
