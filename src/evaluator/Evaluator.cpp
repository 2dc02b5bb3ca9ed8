// src/evaluator/Evaluator.cpp
#include "evaluator.hpp"

#include <vector>

#include "lexer.hpp"
#include "parser.hpp"

namespace formula {

// ----------------- Program evaluation -----------------

Value Evaluator::evaluate(const ProgramNode& program) {
    return evaluate_child(program.body);
}

Value Evaluator::evaluate_child(const NodePtr& child) {
    if (!child) {
        throw ExpressionError(ErrorKind::UnsupportedNodeType, "Unsupported node type: <missing>");
    }
    return evaluate_node(*child);
}

Value Evaluator::evaluate_node(const Node& node) {
    struct Dispatch {
        Evaluator& ev;
        Value operator()(const LiteralNode& n) const { return ev.evaluate_literal(n); }
        Value operator()(const IdentifierNode& n) const { return ev.evaluate_identifier(n); }
        Value operator()(const MemberExpressionNode& n) const { return ev.evaluate_member(n); }
        Value operator()(const CallExpressionNode& n) const { return ev.evaluate_call(n); }
        Value operator()(const BinaryExpressionNode& n) const { return ev.evaluate_binary(n); }
        Value operator()(const UnaryExpressionNode& n) const { return ev.evaluate_unary(n); }
        Value operator()(const ConditionalExpressionNode& n) const { return ev.evaluate_conditional(n); }
        Value operator()(const UnsupportedNode& n) const { return ev.evaluate_unsupported(n); }
    };

    try {
        return std::visit(Dispatch{*this}, node.kind);
    } catch (const ExpressionError& e) {
        throw e.wrapped();
    }
}

// ----------------- Entry points -----------------

Value evaluate(const ProgramNode& program, const State& state, const std::optional<Context>& context_override) {
    if (context_override) {
        State effective = with_context(state, *context_override);
        Evaluator evaluator(effective);
        return evaluator.evaluate(program);
    }
    Evaluator evaluator(state);
    return evaluator.evaluate(program);
}

Value evaluate_source(const std::string& source,
    const State& state,
    const std::optional<Context>& context_override,
    const std::string& filename) {
    SourceManager src_mgr(filename, source);
    Lexer lexer(source, filename, &src_mgr);
    std::vector<Token> tokens = lexer.tokenize();

    Parser parser(tokens);
    ProgramNode program = parser.parse();

    return evaluate(program, state, context_override);
}

}  // namespace formula
