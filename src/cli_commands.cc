#include "cli_commands.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>
#include <sstream>

#include "FormulaError.hpp"
#include "SourceManager.hpp"
#include "builtins.hpp"
#include "colors.hpp"
#include "evaluator.hpp"
#include "json_bridge.hpp"
#include "lexer.hpp"
#include "parser.hpp"
#include "print_debug.hpp"

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace formula {
namespace cli {

// ----------------- formula.json -----------------

// Parse formula.json with nlohmann/json. A missing file is not an error;
// a file that is there but broken is.
std::optional<ProjectConfig> parse_formula_json(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        return std::nullopt;
    }

    json j;
    try {
        j = json::parse(file);
    } catch (const json::parse_error& e) {
        throw UsageError("JSON parse error in " + filepath + ": " + e.what());
    }
    if (!j.is_object()) {
        throw UsageError(filepath + ": top level must be an object");
    }

    ProjectConfig config;
    config.root = fs::absolute(filepath).parent_path().string();

    auto read_bool = [&](const char* key, bool& target) {
        if (!j.contains(key)) return;
        if (!j[key].is_boolean()) {
            throw UsageError(filepath + ": '" + key + "' must be a boolean");
        }
        target = j[key].get<bool>();
    };
    read_bool("builtins", config.builtins);
    read_bool("json_output", config.json_output);
    read_bool("color", config.color);

    if (j.contains("context")) {
        if (!j["context"].is_string()) {
            throw UsageError(filepath + ": 'context' must be a string");
        }
        fs::path ctx = j["context"].get<std::string>();
        config.context_file = ctx.is_absolute() ? ctx.string() : (fs::path(config.root) / ctx).string();
    }

    if (j.contains("variables")) {
        if (!j["variables"].is_object()) {
            throw UsageError(filepath + ": 'variables' must be an object");
        }
        config.variables = context_from_json(j["variables"]);
    }

    config.is_valid = true;
    return config;
}

std::string get_project_root(const std::string& start_dir) {
    fs::path current = fs::absolute(start_dir);

    while (true) {
        fs::path config_path = current / "formula.json";
        if (fs::exists(config_path)) {
            return current.string();
        }

        if (!current.has_parent_path() || current == current.parent_path()) {
            break;
        }
        current = current.parent_path();
    }

    return "";
}

std::optional<ProjectConfig> find_and_parse_formula_json(const std::string& start_dir) {
    std::string root = get_project_root(start_dir);
    if (root.empty()) {
        return std::nullopt;
    }

    return parse_formula_json((fs::path(root) / "formula.json").string());
}

// ----------------- context sources -----------------

Context load_context_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw UsageError("Could not open context file " + path);
    }
    try {
        return context_from_json(json::parse(file));
    } catch (const json::parse_error& e) {
        throw UsageError("JSON parse error in " + path + ": " + e.what());
    } catch (const std::invalid_argument& e) {
        throw UsageError(path + ": " + e.what());
    }
}

// -D rate=0.2 gives a number, -D name=bob (not valid JSON) a string
Value parse_define_value(const std::string& text) {
    json j = json::parse(text, nullptr, false);
    if (j.is_discarded()) {
        return text;
    }
    return value_from_json(j);
}

// ----------------- command line -----------------

Options parse_arguments(const std::vector<std::string>& args) {
    Options opts;
    bool seen_double_dash = false;

    auto take_value = [&](size_t& i, const std::string& flag) -> std::string {
        if (i + 1 >= args.size()) {
            throw UsageError("option '" + flag + "' requires an argument");
        }
        return args[++i];
    };

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        // After `--` everything is an expression, even "-1 + x"
        if (seen_double_dash || arg.empty() || arg[0] != '-' || arg == "-") {
            opts.expressions.push_back(arg);
            continue;
        }

        if (arg == "--") {
            seen_double_dash = true;
        } else if (arg == "-h" || arg == "--help") {
            opts.show_help = true;
        } else if (arg == "-v" || arg == "--version") {
            opts.show_version = true;
        } else if (arg == "-c" || arg == "--context") {
            opts.context_file = take_value(i, arg);
        } else if (arg == "-f" || arg == "--file") {
            opts.source_file = take_value(i, arg);
        } else if (arg == "-a" || arg == "--ast") {
            opts.ast_file = take_value(i, arg);
        } else if (arg == "-j" || arg == "--json") {
            opts.json_output = true;
        } else if (arg == "--no-builtins") {
            opts.no_builtins = true;
        } else if (arg == "--tokens") {
            opts.dump_tokens = true;
        } else if (arg == "--print-ast") {
            opts.print_ast = true;
        } else if (arg.rfind("-D", 0) == 0) {
            std::string def = arg.size() > 2 ? arg.substr(2) : take_value(i, arg);
            auto eq = def.find('=');
            if (eq == std::string::npos || eq == 0) {
                throw UsageError("-D expects name=value, got '" + def + "'");
            }
            opts.defines.emplace_back(def.substr(0, eq), def.substr(eq + 1));
        } else {
            throw UsageError("unknown option '" + arg + "'");
        }
    }

    int sources = (opts.expressions.empty() ? 0 : 1) + (opts.source_file.empty() ? 0 : 1) + (opts.ast_file.empty() ? 0 : 1);
    if (sources > 1) {
        throw UsageError("give expressions, --file or --ast, not more than one of them");
    }
    return opts;
}

Session build_session(const Options& opts, const std::optional<ProjectConfig>& config, bool tty) {
    Context ctx;

    std::string context_file = opts.context_file;
    if (context_file.empty() && config) context_file = config->context_file;
    if (!context_file.empty()) ctx = load_context_file(context_file);

    if (config) {
        for (const auto& kv : config->variables) ctx[kv.first] = kv.second;
    }
    for (const auto& def : opts.defines) {
        ctx[def.first] = parse_define_value(def.second);
    }

    Session session;
    session.state = create_state(std::move(ctx));

    bool builtins = !opts.no_builtins && (!config || config->builtins);
    if (builtins) session.state = register_builtins(session.state);

    session.json_output = opts.json_output || (config && config->json_output);
    session.color = tty && (!config || config->color);
    session.dump_tokens = opts.dump_tokens;
    session.print_ast = opts.print_ast;
    return session;
}

// ----------------- running formulas -----------------

static void print_result(const Session& session, const Value& v, std::ostream& out) {
    if (session.json_output) {
        out << value_to_json(v).dump() << "\n";
    } else {
        out << print_value(v, session.color) << "\n";
    }
}

static void print_error(const Session& session, const std::string& message, std::ostream& err) {
    err << Color::paint(Color::red, "Error: ", session.color) << message << std::endl;
}

static bool evaluate_program(const Session& session, const ProgramNode& program, std::ostream& out, std::ostream& err) {
    if (session.print_ast) print_program_debug(program, out);
    try {
        print_result(session, evaluate(program, session.state), out);
        return true;
    } catch (const ExpressionError& e) {
        print_error(session, e.what(), err);
    } catch (const std::exception& e) {
        // host function failures pass through the evaluator unchanged
        print_error(session, e.what(), err);
    }
    return false;
}

static bool evaluate_located(const Session& session,
    const std::string& source,
    const std::string& filename,
    const SourceManager& src_mgr,
    int line,
    std::ostream& out,
    std::ostream& err) {
    ProgramNode program;
    try {
        Lexer lexer(source, filename, &src_mgr, line);
        std::vector<Token> tokens = lexer.tokenize();
        if (session.dump_tokens) print_tokens(tokens, out);

        Parser parser(tokens);
        program = parser.parse();
    } catch (const SyntaxError& e) {
        print_error(session, e.what(), err);
        return false;
    }
    return evaluate_program(session, program, out, err);
}

bool evaluate_line(const Session& session,
    const std::string& source,
    const std::string& filename,
    std::ostream& out,
    std::ostream& err) {
    SourceManager src_mgr(filename, source);
    return evaluate_located(session, source, filename, src_mgr, 1, out, err);
}

bool run_expressions(const Session& session, const std::vector<std::string>& expressions, std::ostream& out, std::ostream& err) {
    bool ok = true;
    for (const auto& expr : expressions) {
        ok = evaluate_line(session, expr, "<expr>", out, err) && ok;
    }
    return ok;
}

static bool is_skipped_line(const std::string& line) {
    size_t first = line.find_first_not_of(" \t\r");
    return first == std::string::npos || line[first] == '#';
}

bool run_file(const Session& session, const std::string& path, std::ostream& out, std::ostream& err) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw UsageError("Could not open file " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    std::string source_code = buffer.str();

    SourceManager src_mgr(path, source_code);
    std::istringstream lines(source_code);
    std::string line;
    int line_num = 0;
    bool ok = true;
    while (std::getline(lines, line)) {
        ++line_num;
        if (is_skipped_line(line)) continue;
        ok = evaluate_located(session, line, path, src_mgr, line_num, out, err) && ok;
    }
    return ok;
}

bool run_ast_file(const Session& session, const std::string& path, std::ostream& out, std::ostream& err) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw UsageError("Could not open AST file " + path);
    }

    ProgramNode program;
    try {
        program = program_from_json(json::parse(file));
    } catch (const json::parse_error& e) {
        print_error(session, "JSON parse error in " + path + ": " + e.what(), err);
        return false;
    } catch (const std::invalid_argument& e) {
        print_error(session, "Malformed AST in " + path + ": " + e.what(), err);
        return false;
    }
    return evaluate_program(session, program, out, err);
}

bool run_stream(const Session& session, std::istream& in, std::ostream& out, std::ostream& err) {
    SourceManager src_mgr("<stdin>", "");
    std::string line;
    bool ok = true;
    while (std::getline(in, line)) {
        int line_num = src_mgr.append_line(line);
        if (is_skipped_line(line)) continue;
        ok = evaluate_located(session, line, "<stdin>", src_mgr, line_num, out, err) && ok;
    }
    return ok;
}

CommandResult execute_command(const Options& opts,
    std::istream& in,
    std::ostream& out,
    std::ostream& err,
    bool tty,
    const std::string& start_dir) {
    try {
        auto config = find_and_parse_formula_json(start_dir);
        Session session = build_session(opts, config, tty);

        bool ok;
        if (!opts.ast_file.empty()) {
            ok = run_ast_file(session, opts.ast_file, out, err);
        } else if (!opts.source_file.empty()) {
            ok = run_file(session, opts.source_file, out, err);
        } else if (!opts.expressions.empty()) {
            ok = run_expressions(session, opts.expressions, out, err);
        } else {
            ok = run_stream(session, in, out, err);
        }
        return {ok ? 0 : 1, ""};
    } catch (const UsageError& e) {
        return {2, e.what()};
    }
}

}  // namespace cli
}  // namespace formula
