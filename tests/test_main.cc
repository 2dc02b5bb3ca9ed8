#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>

#include "cli_commands.hpp"

using namespace formula;
namespace fs = std::filesystem;

class FileExecutionTest : public ::testing::Test {
   protected:
    void SetUp() override {
        test_dir = fs::temp_directory_path() / ("formula_test_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::remove_all(test_dir);
        fs::create_directories(test_dir);
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    fs::path test_dir;

    std::string createTestFile(const std::string& filename, const std::string& content) {
        fs::path filepath = test_dir / filename;
        fs::create_directories(filepath.parent_path());
        std::ofstream file(filepath);
        file << content;
        file.close();
        return filepath.string();
    }

    cli::CommandResult run(const std::vector<std::string>& args, const std::string& stdin_text = "") {
        out.str("");
        err.str("");
        std::istringstream in(stdin_text);
        cli::Options opts = cli::parse_arguments(args);
        return cli::execute_command(opts, in, out, err, false, test_dir.string());
    }

    std::ostringstream out;
    std::ostringstream err;
};

// ============================================================================
// ARGUMENT PARSING
// ============================================================================

TEST(CliArgumentsTest, ParsesFlags) {
    auto opts = cli::parse_arguments({"-c", "ctx.json", "-j", "--no-builtins", "-D", "rate=0.2", "-Dname=bob", "a + b"});
    EXPECT_EQ(opts.context_file, "ctx.json");
    EXPECT_TRUE(opts.json_output);
    EXPECT_TRUE(opts.no_builtins);
    ASSERT_EQ(opts.defines.size(), 2u);
    EXPECT_EQ(opts.defines[0].first, "rate");
    EXPECT_EQ(opts.defines[0].second, "0.2");
    EXPECT_EQ(opts.defines[1].second, "bob");
    ASSERT_EQ(opts.expressions.size(), 1u);
    EXPECT_EQ(opts.expressions[0], "a + b");
}

TEST(CliArgumentsTest, DoubleDashEndsOptions) {
    auto opts = cli::parse_arguments({"--", "-x * 2", "--json"});
    EXPECT_FALSE(opts.json_output);
    EXPECT_EQ(opts.expressions, (std::vector<std::string>{"-x * 2", "--json"}));
}

TEST(CliArgumentsTest, RejectsBadUsage) {
    EXPECT_THROW(cli::parse_arguments({"--bogus"}), cli::UsageError);
    EXPECT_THROW(cli::parse_arguments({"-c"}), cli::UsageError);
    EXPECT_THROW(cli::parse_arguments({"-D", "novalue"}), cli::UsageError);
    EXPECT_THROW(cli::parse_arguments({"-f", "a.fx", "1 + 1"}), cli::UsageError);
}

TEST(CliArgumentsTest, DefineValuesAreJsonOrText) {
    EXPECT_DOUBLE_EQ(std::get<double>(cli::parse_define_value("0.2")), 0.2);
    EXPECT_EQ(std::get<bool>(cli::parse_define_value("true")), true);
    EXPECT_EQ(std::get<std::string>(cli::parse_define_value("\"quoted\"")), "quoted");
    EXPECT_EQ(std::get<std::string>(cli::parse_define_value("plain text")), "plain text");
    EXPECT_TRUE(std::holds_alternative<ArrayPtr>(cli::parse_define_value("[1,2]")));
}

// ============================================================================
// EXPRESSIONS AND CONTEXT
// ============================================================================

TEST_F(FileExecutionTest, EvaluatesExpressionArguments) {
    auto result = run({"1 + 2", "'a' + 1"});
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(out.str(), "3\na1\n");
    EXPECT_TRUE(err.str().empty());
}

TEST_F(FileExecutionTest, UsesContextFileAndDefines) {
    std::string ctx = createTestFile("ctx.json", R"({"price": 10, "qty": 3, "user": {"name": "ana"}})");
    auto result = run({"-c", ctx, "-D", "qty=4", "price * qty", "user.name"});
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(out.str(), "40\nana\n");
}

TEST_F(FileExecutionTest, PrintsJson) {
    auto result = run({"--json", "-D", "o={\"a\":[1,null]}", "o", "'x'", "1 / 0"});
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(out.str(), "{\"a\":[1,null]}\n\"x\"\nnull\n");
}

TEST_F(FileExecutionTest, BuiltinsCanBeDisabled) {
    EXPECT_EQ(run({"@sum(1, 2)"}).exit_code, 0);
    EXPECT_EQ(out.str(), "3\n");

    auto result = run({"--no-builtins", "@sum(1, 2)"});
    EXPECT_EQ(result.exit_code, 1);
    EXPECT_NE(err.str().find("Error: Evaluation error: Undefined function: sum"), std::string::npos);
}

TEST_F(FileExecutionTest, ReportsErrorsAndKeepsGoing) {
    auto result = run({"missing", "1 == 1", "2 * 2"});
    EXPECT_EQ(result.exit_code, 1);
    EXPECT_EQ(out.str(), "4\n");
    EXPECT_NE(err.str().find("Undefined variable: missing"), std::string::npos);
    EXPECT_NE(err.str().find("SyntaxError at <expr>:1:3"), std::string::npos);
}

TEST_F(FileExecutionTest, MissingContextFileIsUsageError) {
    auto result = run({"-c", (test_dir / "nope.json").string(), "1"});
    EXPECT_EQ(result.exit_code, 2);
    EXPECT_NE(result.message.find("Could not open context file"), std::string::npos);
}

TEST_F(FileExecutionTest, NonObjectContextIsUsageError) {
    std::string ctx = createTestFile("ctx.json", "[1, 2]");
    auto result = run({"-c", ctx, "1"});
    EXPECT_EQ(result.exit_code, 2);
}

// ============================================================================
// FILE, AST AND STDIN MODES
// ============================================================================

TEST_F(FileExecutionTest, EvaluatesEachLineOfFile) {
    std::string path = createTestFile("rules.fx", "# totals\n1 + 1\n\n  @max(1, 5)\n");
    auto result = run({"-f", path});
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(out.str(), "2\n5\n");
}

TEST_F(FileExecutionTest, FileErrorsReportTheirLine) {
    std::string path = createTestFile("rules.fx", "1\n\n2 +\n");
    auto result = run({"-f", path});
    EXPECT_EQ(result.exit_code, 1);
    EXPECT_NE(err.str().find(path + ":3:"), std::string::npos);
    EXPECT_NE(err.str().find(" * 3 | 2 +"), std::string::npos);
}

TEST_F(FileExecutionTest, HandlesFileNotFound) {
    auto result = run({"-f", (test_dir / "nonexistent.fx").string()});
    EXPECT_EQ(result.exit_code, 2);
}

TEST_F(FileExecutionTest, EvaluatesAstFile) {
    std::string path = createTestFile("ast.json", R"({"type": "Program", "body": {
        "type": "BinaryExpression", "operator": "*",
        "left": {"type": "Identifier", "name": "x"},
        "right": {"type": "Literal", "value": 3}}})");
    auto result = run({"-D", "x=5", "-a", path});
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(out.str(), "15\n");
}

TEST_F(FileExecutionTest, UnsupportedAstNodeFails) {
    std::string path = createTestFile("ast.json", R"({"type": "ArrayExpression", "elements": []})");
    auto result = run({"-a", path});
    EXPECT_EQ(result.exit_code, 1);
    EXPECT_NE(err.str().find("Unsupported node type: ArrayExpression"), std::string::npos);
}

TEST_F(FileExecutionTest, MalformedAstFails) {
    std::string path = createTestFile("ast.json", R"({"type": "Identifier"})");
    EXPECT_EQ(run({"-a", path}).exit_code, 1);
    EXPECT_NE(err.str().find("Malformed AST"), std::string::npos);
}

TEST_F(FileExecutionTest, ReadsStdinWhenNoInputGiven) {
    auto result = run({"-D", "n=2"}, "n * 21\n# skip\n\n'done'\n");
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(out.str(), "42\ndone\n");
}

TEST_F(FileExecutionTest, DumpsTokensAndAst) {
    auto result = run({"--tokens", "--print-ast", "a"}, "");
    EXPECT_EQ(result.exit_code, 1);
    EXPECT_NE(out.str().find("\"type\": \"IDENTIFIER\""), std::string::npos);
    EXPECT_NE(out.str().find("\"type\": \"Identifier\""), std::string::npos);
}

// ============================================================================
// formula.json
// ============================================================================

TEST_F(FileExecutionTest, FindsConfigInParentDirectory) {
    createTestFile("formula.json", R"({"builtins": false})");
    fs::create_directories(test_dir / "a" / "b");

    std::string root = cli::get_project_root((test_dir / "a" / "b").string());
    EXPECT_EQ(fs::path(root), fs::absolute(test_dir));

    auto config = cli::find_and_parse_formula_json((test_dir / "a" / "b").string());
    ASSERT_TRUE(config.has_value());
    EXPECT_TRUE(config->is_valid);
    EXPECT_FALSE(config->builtins);
}

TEST_F(FileExecutionTest, ParsesAllConfigFields) {
    std::string path = createTestFile("formula.json", R"({
        "context": "data/ctx.json",
        "builtins": true,
        "json_output": true,
        "color": false,
        "variables": {"rate": 0.25}
    })");
    auto config = cli::parse_formula_json(path);
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(fs::path(config->context_file), fs::absolute(test_dir) / "data" / "ctx.json");
    EXPECT_TRUE(config->json_output);
    EXPECT_FALSE(config->color);
    EXPECT_DOUBLE_EQ(std::get<double>(config->variables.at("rate")), 0.25);
}

TEST_F(FileExecutionTest, ConfigSuppliesContextAndVariables) {
    createTestFile("data/ctx.json", R"({"base": 100})");
    createTestFile("formula.json", R"({"context": "data/ctx.json", "variables": {"rate": 0.5}})");

    auto result = run({"base * rate"});
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(out.str(), "50\n");

    result = run({"-D", "rate=2", "base * rate"});
    EXPECT_EQ(out.str(), "200\n");
}

TEST_F(FileExecutionTest, ConfigControlsOutputAndBuiltins) {
    createTestFile("formula.json", R"({"builtins": false, "json_output": true})");
    auto result = run({"'a'"});
    EXPECT_EQ(out.str(), "\"a\"\n");

    result = run({"@sum(1)"});
    EXPECT_EQ(result.exit_code, 1);
}

TEST_F(FileExecutionTest, BrokenConfigIsUsageError) {
    createTestFile("formula.json", "{ not json");
    auto result = run({"1"});
    EXPECT_EQ(result.exit_code, 2);
    EXPECT_NE(result.message.find("JSON parse error"), std::string::npos);

    createTestFile("formula.json", R"({"builtins": "yes"})");
    result = run({"1"});
    EXPECT_EQ(result.exit_code, 2);
    EXPECT_NE(result.message.find("'builtins' must be a boolean"), std::string::npos);
}

TEST_F(FileExecutionTest, MissingConfigIsFine) {
    EXPECT_FALSE(cli::parse_formula_json((test_dir / "formula.json").string()).has_value());
}
