#include <cctype>
#include <cmath>
#include <string>
#include <vector>

#include "FormulaError.hpp"
#include "evaluator.hpp"

namespace formula {

// Canonical array index: "0" or digits without a leading zero.
static bool parse_index(const std::string& key, size_t& out) {
    if (key.empty() || key.size() > 18) return false;
    if (key.size() > 1 && key[0] == '0') return false;
    size_t idx = 0;
    for (char c : key) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
        idx = idx * 10 + static_cast<size_t>(c - '0');
    }
    out = idx;
    return true;
}

// Property lookup on a non-null value. Missing keys yield Undefined.
static Value get_property(const Value& object, const Value& key) {
    std::string k = to_string_value(key);

    if (std::holds_alternative<ObjectPtr>(object)) {
        ObjectPtr obj = std::get<ObjectPtr>(object);
        if (!obj) return Undefined{};
        auto it = obj->properties.find(k);
        if (it == obj->properties.end()) return Undefined{};
        return it->second;
    }

    if (std::holds_alternative<ArrayPtr>(object)) {
        ArrayPtr arr = std::get<ArrayPtr>(object);
        if (!arr) return Undefined{};
        if (k == "length") return static_cast<double>(arr->elements.size());
        size_t idx = 0;
        if (parse_index(k, idx) && idx < arr->elements.size()) return arr->elements[idx];
        return Undefined{};
    }

    if (std::holds_alternative<std::string>(object)) {
        const std::string& s = std::get<std::string>(object);
        if (k == "length") return static_cast<double>(utf8_length(s));
        size_t idx = 0;
        std::string ch;
        if (parse_index(k, idx) && utf8_char_at(s, idx, ch)) return ch;
        return Undefined{};
    }

    // numbers and booleans carry no properties
    return Undefined{};
}

Value Evaluator::evaluate_literal(const LiteralNode& lit) {
    return std::visit([](const auto& v) -> Value { return v; }, lit.value);
}

Value Evaluator::evaluate_identifier(const IdentifierNode& id) {
    const Value* found = state.find_variable(id.name);
    if (!found) {
        throw ExpressionError(ErrorKind::UndefinedVariable, "Undefined variable: " + id.name);
    }
    return *found;
}

// data.value  -> property "value"
// data[key]   -> property named by the value of `key`
Value Evaluator::evaluate_member(const MemberExpressionNode& mem) {
    Value object = evaluate_child(mem.object);
    if (is_nullish(object)) {
        throw ExpressionError(ErrorKind::NullPropertyAccess, "Cannot access property of null or undefined");
    }

    Value key;
    if (mem.computed) {
        key = evaluate_child(mem.property);
    } else {
        const IdentifierNode* name = mem.property ? std::get_if<IdentifierNode>(&mem.property->kind) : nullptr;
        if (!name) {
            std::string kind = mem.property ? node_type_name(*mem.property) : "<missing>";
            throw ExpressionError(ErrorKind::UnsupportedNodeType,
                "Unsupported node type: " + kind + " (non-computed property must be an Identifier)");
        }
        key = name->name;
    }

    return get_property(object, key);
}

// @sum(1, 2) -> functions["sum"]({1, 2})
Value Evaluator::evaluate_call(const CallExpressionNode& call) {
    const Function* fn = state.find_function(call.callee.name);
    if (!fn || !*fn) {
        throw ExpressionError(ErrorKind::UndefinedFunction, "Undefined function: " + call.callee.name);
    }

    std::vector<Value> args;
    args.reserve(call.arguments.size());
    for (const auto& arg : call.arguments) {
        args.push_back(evaluate_child(arg));
    }

    // host failures are not ours to classify
    return (*fn)(args);
}

Value Evaluator::evaluate_binary(const BinaryExpressionNode& bin) {
    // Both operands are always evaluated: '&&' and '||' do not short-circuit.
    Value left = evaluate_child(bin.left);
    Value right = evaluate_child(bin.right);
    const std::string& op = bin.op;

    if (op == "+") {
        if (std::holds_alternative<double>(left) && std::holds_alternative<double>(right)) {
            return std::get<double>(left) + std::get<double>(right);
        }
        return to_string_value(left) + to_string_value(right);
    }
    if (op == "-") return to_number(left) - to_number(right);
    if (op == "*") return to_number(left) * to_number(right);
    if (op == "/") return to_number(left) / to_number(right);
    if (op == "%") return std::fmod(to_number(left), to_number(right));

    if (op == "===") return is_strict_equal(left, right);
    if (op == "!==") return !is_strict_equal(left, right);

    if (op == ">") return to_number(left) > to_number(right);
    if (op == ">=") return to_number(left) >= to_number(right);
    if (op == "<") return to_number(left) < to_number(right);
    if (op == "<=") return to_number(left) <= to_number(right);

    if (op == "&&") return to_bool(left) && to_bool(right);
    if (op == "||") return to_bool(left) || to_bool(right);

    throw ExpressionError(ErrorKind::UnknownOperator, "Unknown operator: " + op);
}

Value Evaluator::evaluate_unary(const UnaryExpressionNode& un) {
    Value argument = evaluate_child(un.argument);

    if (!un.prefix) {
        // the grammar has no postfix operators
        throw ExpressionError(ErrorKind::UnsupportedPostfix, "Postfix operators are not supported: " + un.op);
    }

    if (un.op == "!") {
        return !to_bool(argument);
    }
    if (un.op == "-") {
        if (!std::holds_alternative<double>(argument)) {
            throw ExpressionError(ErrorKind::NonNumericNegation,
                "Cannot apply unary - to non-number: " + to_string_value(argument));
        }
        return -std::get<double>(argument);
    }

    throw ExpressionError(ErrorKind::UnknownOperator, "Unknown operator: " + un.op);
}

Value Evaluator::evaluate_conditional(const ConditionalExpressionNode& cond) {
    // Only the taken branch is evaluated.
    if (to_bool(evaluate_child(cond.test))) {
        return evaluate_child(cond.consequent);
    }
    return evaluate_child(cond.alternate);
}

Value Evaluator::evaluate_unsupported(const UnsupportedNode& node) {
    throw ExpressionError(ErrorKind::UnsupportedNodeType, "Unsupported node type: " + node.type);
}

}  // namespace formula
