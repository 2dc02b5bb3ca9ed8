#pragma once
#include <memory>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "token.hpp"

namespace formula {

struct Node;
using NodePtr = std::unique_ptr<Node>;

// number | string | boolean | null (std::monostate)
using LiteralValue = std::variant<std::monostate, double, std::string, bool>;

struct LiteralNode {
    LiteralValue value;
};

struct IdentifierNode {
    std::string name;
};

// obj.prop (computed == false, property is an IdentifierNode)
// obj[expr] (computed == true, property is any expression)
struct MemberExpressionNode {
    NodePtr object;
    NodePtr property;
    bool computed = false;
};

// @name(arg, ...)
struct CallExpressionNode {
    IdentifierNode callee;
    std::vector<NodePtr> arguments;
};

struct BinaryExpressionNode {
    std::string op;  // e.g. "+", "===", "&&"
    NodePtr left;
    NodePtr right;
};

struct UnaryExpressionNode {
    std::string op;  // "!" or "-"
    bool prefix = true;
    NodePtr argument;
};

// test ? consequent : alternate
struct ConditionalExpressionNode {
    NodePtr test;
    NodePtr consequent;
    NodePtr alternate;
};

// A node kind outside the grammar (e.g. an ESTree "ArrayExpression" read
// from a JSON AST). Kept so evaluation can reject it by name.
struct UnsupportedNode {
    std::string type;
};

struct Node {
    using Kind = std::variant<
        LiteralNode,
        IdentifierNode,
        MemberExpressionNode,
        CallExpressionNode,
        BinaryExpressionNode,
        UnaryExpressionNode,
        ConditionalExpressionNode,
        UnsupportedNode>;

    Kind kind;
    Token token;  // filename, line, column for this node (set by the producer)
};

// AST root: wraps exactly one top-level expression
struct ProgramNode {
    NodePtr body;
    Token token;
};

// ESTree-style type name of the node ("Literal", "MemberExpression", ...)
std::string node_type_name(const Node& node);

// Source-like rendering, fully parenthesised: "((a + b) > 1)"
std::string to_string(const Node& node);
std::string to_string(const ProgramNode& program);

// ----------------- construction helpers -----------------

inline NodePtr make_node(Node::Kind kind, const Token& token = Token()) {
    auto n = std::make_unique<Node>();
    n->kind = std::move(kind);
    n->token = token;
    return n;
}

inline NodePtr make_literal(LiteralValue value) {
    return make_node(LiteralNode{std::move(value)});
}

inline NodePtr make_identifier(const std::string& name) {
    return make_node(IdentifierNode{name});
}

inline NodePtr make_member(NodePtr object, NodePtr property, bool computed = false) {
    return make_node(MemberExpressionNode{std::move(object), std::move(property), computed});
}

inline NodePtr make_call(const std::string& callee, std::vector<NodePtr> arguments = {}) {
    return make_node(CallExpressionNode{IdentifierNode{callee}, std::move(arguments)});
}

inline NodePtr make_binary(const std::string& op, NodePtr left, NodePtr right) {
    return make_node(BinaryExpressionNode{op, std::move(left), std::move(right)});
}

inline NodePtr make_unary(const std::string& op, NodePtr argument, bool prefix = true) {
    return make_node(UnaryExpressionNode{op, prefix, std::move(argument)});
}

inline NodePtr make_conditional(NodePtr test, NodePtr consequent, NodePtr alternate) {
    return make_node(ConditionalExpressionNode{std::move(test), std::move(consequent), std::move(alternate)});
}

inline ProgramNode make_program(NodePtr body) {
    ProgramNode program;
    program.body = std::move(body);
    return program;
}

}  // namespace formula
