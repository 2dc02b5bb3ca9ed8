#include "ast.hpp"

#include "value.hpp"

namespace formula {

std::string node_type_name(const Node& node) {
    struct Name {
        std::string operator()(const LiteralNode&) const { return "Literal"; }
        std::string operator()(const IdentifierNode&) const { return "Identifier"; }
        std::string operator()(const MemberExpressionNode&) const { return "MemberExpression"; }
        std::string operator()(const CallExpressionNode&) const { return "CallExpression"; }
        std::string operator()(const BinaryExpressionNode&) const { return "BinaryExpression"; }
        std::string operator()(const UnaryExpressionNode&) const { return "UnaryExpression"; }
        std::string operator()(const ConditionalExpressionNode&) const { return "ConditionalExpression"; }
        std::string operator()(const UnsupportedNode& n) const { return n.type; }
    };
    return std::visit(Name{}, node.kind);
}

static std::string child_string(const NodePtr& child) {
    return child ? to_string(*child) : "<null>";
}

static std::string literal_string(const LiteralValue& value) {
    if (std::holds_alternative<std::monostate>(value)) return "null";
    if (auto b = std::get_if<bool>(&value)) return *b ? "true" : "false";
    if (auto s = std::get_if<std::string>(&value)) return "\"" + *s + "\"";
    return number_to_string(std::get<double>(value));
}

std::string to_string(const Node& node) {
    struct Render {
        std::string operator()(const LiteralNode& n) const { return literal_string(n.value); }
        std::string operator()(const IdentifierNode& n) const { return n.name; }
        std::string operator()(const MemberExpressionNode& n) const {
            if (n.computed) return child_string(n.object) + "[" + child_string(n.property) + "]";
            return child_string(n.object) + "." + child_string(n.property);
        }
        std::string operator()(const CallExpressionNode& n) const {
            std::string args;
            for (size_t i = 0; i < n.arguments.size(); ++i) {
                if (i) args += ", ";
                args += child_string(n.arguments[i]);
            }
            return "@" + n.callee.name + "(" + args + ")";
        }
        std::string operator()(const BinaryExpressionNode& n) const {
            return "(" + child_string(n.left) + " " + n.op + " " + child_string(n.right) + ")";
        }
        std::string operator()(const UnaryExpressionNode& n) const {
            if (!n.prefix) return "(" + child_string(n.argument) + n.op + ")";
            return "(" + n.op + child_string(n.argument) + ")";
        }
        std::string operator()(const ConditionalExpressionNode& n) const {
            return "(" + child_string(n.test) + " ? " + child_string(n.consequent) + " : " + child_string(n.alternate) + ")";
        }
        std::string operator()(const UnsupportedNode& n) const { return "<" + n.type + ">"; }
    };
    return std::visit(Render{}, node.kind);
}

std::string to_string(const ProgramNode& program) {
    return child_string(program.body);
}

}  // namespace formula
