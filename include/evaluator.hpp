#pragma once

#include <optional>
#include <string>

#include "FormulaError.hpp"
#include "ast.hpp"
#include "state.hpp"
#include "value.hpp"

namespace formula {

// Walks one AST against one State. An Evaluator lives for a single
// evaluate() call and keeps nothing besides the State reference.
class Evaluator {
   public:
    explicit Evaluator(const State& state) : state(state) {}

    Value evaluate(const ProgramNode& program);

    // Dispatch on node kind. Any ExpressionError raised below this node is
    // re-raised here with an "Evaluation error: " prefix; other exception
    // types (host function failures) pass through untouched.
    Value evaluate_node(const Node& node);

   private:
    const State& state;

    Value evaluate_child(const NodePtr& child);

    Value evaluate_literal(const LiteralNode& lit);
    Value evaluate_identifier(const IdentifierNode& id);
    Value evaluate_member(const MemberExpressionNode& mem);
    Value evaluate_call(const CallExpressionNode& call);
    Value evaluate_binary(const BinaryExpressionNode& bin);
    Value evaluate_unary(const UnaryExpressionNode& un);
    Value evaluate_conditional(const ConditionalExpressionNode& cond);
    Value evaluate_unsupported(const UnsupportedNode& node);
};

// Evaluate `program` against `state`. When `context_override` is given the
// call sees it merged over the state's context; `state` itself is unchanged.
Value evaluate(const ProgramNode& program,
    const State& state,
    const std::optional<Context>& context_override = std::nullopt);

// Lex, parse and evaluate one formula. Throws SyntaxError for malformed text.
Value evaluate_source(const std::string& source,
    const State& state,
    const std::optional<Context>& context_override = std::nullopt,
    const std::string& filename = "<expr>");

}  // namespace formula
