#include <unistd.h>

#include <iostream>
#include <string>
#include <vector>

#include "cli_commands.hpp"
#include "colors.hpp"

using namespace formula;

int main(int argc, char* argv[]) {
    auto print_usage = []() {
        std::cout << "Usage: formula [options] [expression...]\n"
                  << "Options:\n"
                  << "  -c, --context FILE   JSON object used as the evaluation context\n"
                  << "  -f, --file FILE      Evaluate each non-empty, non-'#' line of FILE\n"
                  << "  -a, --ast FILE       Evaluate an ESTree-shaped JSON AST\n"
                  << "  -D name=value        Add or override one context variable (JSON, else string)\n"
                  << "  -j, --json           Print results as JSON\n"
                  << "      --no-builtins    Do not register the builtin functions\n"
                  << "      --tokens         Dump tokens before evaluating\n"
                  << "      --print-ast      Dump the parsed AST before evaluating\n"
                  << "  -v, --version        Print version and exit\n"
                  << "  -h, --help           Show this help message\n"
                  << "\n"
                  << "Without an expression, --file or --ast, formulas are read from stdin one per line.\n"
                  << "Settings may also come from a formula.json in this or any parent directory.\n"
                  << "If an expression starts with '-', use `--` to end options:\n"
                  << "  formula -- '-price * qty'\n";
    };

    std::vector<std::string> args(argv + 1, argv + argc);

    cli::Options opts;
    try {
        opts = cli::parse_arguments(args);
    } catch (const cli::UsageError& e) {
        std::cerr << "formula: " << e.what() << "\n";
        std::cerr << "Try 'formula --help' for more information.\n";
        return 2;
    }

    if (opts.show_help) {
        print_usage();
        return 0;
    }
    if (opts.show_version) {
        std::cout << "formula v" << FORMULA_VERSION << std::endl;
        return 0;
    }

    bool tty = Color::supports_color(STDOUT_FILENO);
    cli::CommandResult result = cli::execute_command(opts, std::cin, std::cout, std::cerr, tty);
    if (!result.message.empty()) {
        std::cerr << Color::paint(Color::red, "Error: ", Color::supports_color(STDERR_FILENO)) << result.message << std::endl;
    }
    return result.exit_code;
}
