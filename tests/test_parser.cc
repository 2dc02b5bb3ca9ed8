#include <gtest/gtest.h>

#include "FormulaError.hpp"
#include "lexer.hpp"
#include "parser.hpp"

using namespace formula;

// Helper to parse source code
ProgramNode parseSource(const std::string& source) {
    SourceManager mgr("<test>", source);
    Lexer lexer(source, "<test>", &mgr);
    auto tokens = lexer.tokenize();
    Parser parser(tokens);
    return parser.parse();
}

std::string render(const std::string& source) {
    return to_string(parseSource(source));
}

// Literals
TEST(ParserTest, ParsesNumberLiteral) {
    auto ast = parseSource("42");
    ASSERT_NE(ast.body.get(), nullptr);

    auto* lit = std::get_if<LiteralNode>(&ast.body->kind);
    ASSERT_NE(lit, nullptr);
    EXPECT_DOUBLE_EQ(std::get<double>(lit->value), 42.0);
}

TEST(ParserTest, RendersNumbersInShortestForm) {
    EXPECT_EQ(render("0.30000000000000004 + 1.5"), "(0.30000000000000004 + 1.5)");
    EXPECT_EQ(render("1e-7"), "1e-7");
}

TEST(ParserTest, ParsesStringLiteral) {
    auto ast = parseSource("'abc'");
    auto* lit = std::get_if<LiteralNode>(&ast.body->kind);
    ASSERT_NE(lit, nullptr);
    EXPECT_EQ(std::get<std::string>(lit->value), "abc");
}

TEST(ParserTest, ParsesBooleanAndNullLiterals) {
    auto t = parseSource("true");
    EXPECT_TRUE(std::get<bool>(std::get<LiteralNode>(t.body->kind).value));

    auto n = parseSource("null");
    EXPECT_TRUE(std::holds_alternative<std::monostate>(std::get<LiteralNode>(n.body->kind).value));
}

TEST(ParserTest, ParsesIdentifier) {
    auto ast = parseSource("price");
    auto* id = std::get_if<IdentifierNode>(&ast.body->kind);
    ASSERT_NE(id, nullptr);
    EXPECT_EQ(id->name, "price");
    EXPECT_EQ(node_type_name(*ast.body), "Identifier");
}

// Precedence and associativity
TEST(ParserTest, MultiplicationBindsTighterThanAddition) {
    EXPECT_EQ(render("1 + 2 * 3"), "(1 + (2 * 3))");
    EXPECT_EQ(render("(1 + 2) * 3"), "((1 + 2) * 3)");
}

TEST(ParserTest, BinaryOperatorsAreLeftAssociative) {
    EXPECT_EQ(render("10 - 4 - 3"), "((10 - 4) - 3)");
    EXPECT_EQ(render("8 / 4 % 3"), "((8 / 4) % 3)");
}

TEST(ParserTest, ComparisonBelowArithmetic) {
    EXPECT_EQ(render("a + 1 > b * 2"), "((a + 1) > (b * 2))");
}

TEST(ParserTest, EqualityBelowComparison) {
    EXPECT_EQ(render("a < b === c >= d"), "((a < b) === (c >= d))");
}

TEST(ParserTest, AndBindsTighterThanOr) {
    EXPECT_EQ(render("a || b && c"), "(a || (b && c))");
}

TEST(ParserTest, ConditionalIsRightAssociative) {
    EXPECT_EQ(render("a ? b : c ? d : e"), "(a ? b : (c ? d : e))");
    EXPECT_EQ(render("a || b ? 1 : 2"), "((a || b) ? 1 : 2)");
}

TEST(ParserTest, ParsesPrefixOperators) {
    EXPECT_EQ(render("-x"), "(-x)");
    EXPECT_EQ(render("!!flag"), "(!(!flag))");
    EXPECT_EQ(render("-a * b"), "((-a) * b)");
}

TEST(ParserTest, UnaryNodeIsPrefix) {
    auto ast = parseSource("-5");
    auto* un = std::get_if<UnaryExpressionNode>(&ast.body->kind);
    ASSERT_NE(un, nullptr);
    EXPECT_EQ(un->op, "-");
    EXPECT_TRUE(un->prefix);
}

// Member access
TEST(ParserTest, ParsesDotMemberAccess) {
    auto ast = parseSource("data.value");
    auto* mem = std::get_if<MemberExpressionNode>(&ast.body->kind);
    ASSERT_NE(mem, nullptr);
    EXPECT_FALSE(mem->computed);
    EXPECT_EQ(std::get<IdentifierNode>(mem->property->kind).name, "value");
}

TEST(ParserTest, ParsesComputedMemberAccess) {
    auto ast = parseSource("data[\"value\"]");
    auto* mem = std::get_if<MemberExpressionNode>(&ast.body->kind);
    ASSERT_NE(mem, nullptr);
    EXPECT_TRUE(mem->computed);
    EXPECT_EQ(render("rows[i + 1].total"), "rows[(i + 1)].total");
}

TEST(ParserTest, KeywordsAreValidPropertyNames) {
    EXPECT_EQ(render("flags.true"), "flags.true");
    EXPECT_EQ(render("row.null"), "row.null");
}

TEST(ParserTest, MemberAccessBindsTighterThanUnary) {
    EXPECT_EQ(render("-a.b"), "(-a.b)");
}

// Calls
TEST(ParserTest, ParsesFunctionCall) {
    auto ast = parseSource("@sum(1, x, 'a')");
    auto* call = std::get_if<CallExpressionNode>(&ast.body->kind);
    ASSERT_NE(call, nullptr);
    EXPECT_EQ(call->callee.name, "sum");
    EXPECT_EQ(call->arguments.size(), 3u);
}

TEST(ParserTest, ParsesCallWithoutArguments) {
    auto ast = parseSource("@now()");
    auto* call = std::get_if<CallExpressionNode>(&ast.body->kind);
    ASSERT_NE(call, nullptr);
    EXPECT_TRUE(call->arguments.empty());
}

TEST(ParserTest, ParsesNestedCallsAndMembers) {
    EXPECT_EQ(render("@max(@min(a, b), c.d) + 1"), "(@max(@min(a, b), c.d) + 1)");
    EXPECT_EQ(render("@get(x).y"), "@get(x).y");
}

// Errors
TEST(ParserTest, RejectsLooseEquality) {
    try {
        parseSource("a == b");
        FAIL() << "expected SyntaxError";
    } catch (const SyntaxError& e) {
        EXPECT_NE(std::string(e.what()).find("Use '===' for equality"), std::string::npos);
    }
    EXPECT_THROW(parseSource("a != b"), SyntaxError);
}

TEST(ParserTest, RejectsEmptyInput) {
    EXPECT_THROW(parseSource(""), SyntaxError);
    EXPECT_THROW(parseSource("   "), SyntaxError);
}

TEST(ParserTest, RejectsTrailingTokens) {
    try {
        parseSource("1 2");
        FAIL() << "expected SyntaxError";
    } catch (const SyntaxError& e) {
        EXPECT_EQ(e.location().col, 3);
        EXPECT_NE(std::string(e.what()).find("Unexpected token after expression"), std::string::npos);
    }
}

TEST(ParserTest, RejectsMissingClosers) {
    EXPECT_THROW(parseSource("(1 + 2"), SyntaxError);
    EXPECT_THROW(parseSource("a[1"), SyntaxError);
    EXPECT_THROW(parseSource("@f(1, 2"), SyntaxError);
    EXPECT_THROW(parseSource("a ? b"), SyntaxError);
}

TEST(ParserTest, RejectsMalformedCalls) {
    EXPECT_THROW(parseSource("@(1)"), SyntaxError);
    EXPECT_THROW(parseSource("@f"), SyntaxError);
    EXPECT_THROW(parseSource("@f(1,)"), SyntaxError);
}

TEST(ParserTest, RejectsDanglingOperator) {
    try {
        parseSource("1 +");
        FAIL() << "expected SyntaxError";
    } catch (const SyntaxError& e) {
        EXPECT_NE(std::string(e.what()).find("end of input"), std::string::npos);
    }
}

TEST(ParserTest, RecordsNodeLocations) {
    auto ast = parseSource("a +\n  b");
    auto& bin = std::get<BinaryExpressionNode>(ast.body->kind);
    EXPECT_EQ(ast.body->token.loc.line, 1);
    EXPECT_EQ(ast.body->token.loc.col, 3);
    EXPECT_EQ(bin.right->token.loc.line, 2);
}
