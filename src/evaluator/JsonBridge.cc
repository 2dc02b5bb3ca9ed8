#include <cmath>
#include <cstdint>
#include <stdexcept>

#include "json_bridge.hpp"

using json = nlohmann::json;

namespace formula {

Value value_from_json(const json& j) {
    switch (j.type()) {
        case json::value_t::null:
            return std::monostate{};
        case json::value_t::boolean:
            return j.get<bool>();
        case json::value_t::number_integer:
        case json::value_t::number_unsigned:
        case json::value_t::number_float:
            return j.get<double>();
        case json::value_t::string:
            return j.get<std::string>();
        case json::value_t::array: {
            auto arr = make_array();
            arr->elements.reserve(j.size());
            for (const auto& el : j) arr->elements.push_back(value_from_json(el));
            return arr;
        }
        case json::value_t::object: {
            auto obj = make_object();
            for (auto it = j.begin(); it != j.end(); ++it) {
                obj->properties[it.key()] = value_from_json(it.value());
            }
            return obj;
        }
        default:
            // binary / discarded values have no counterpart
            return Undefined{};
    }
}

Context context_from_json(const json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument(std::string("Context must be a JSON object, got ") + j.type_name());
    }
    Context ctx;
    for (auto it = j.begin(); it != j.end(); ++it) {
        ctx[it.key()] = value_from_json(it.value());
    }
    return ctx;
}

json value_to_json(const Value& v) {
    struct ToJson {
        json operator()(std::monostate) const { return nullptr; }
        json operator()(Undefined) const { return nullptr; }
        json operator()(double d) const {
            if (!std::isfinite(d)) return nullptr;
            // integral values print as 3, not 3.0
            if (std::trunc(d) == d && std::fabs(d) < 9007199254740992.0) return static_cast<std::int64_t>(d);
            return d;
        }
        json operator()(const std::string& s) const { return s; }
        json operator()(bool b) const { return b; }
        json operator()(const ObjectPtr& obj) const {
            json out = json::object();
            if (!obj) return out;
            for (const auto& kv : obj->properties) out[kv.first] = value_to_json(kv.second);
            return out;
        }
        json operator()(const ArrayPtr& arr) const {
            json out = json::array();
            if (!arr) return out;
            for (const auto& el : arr->elements) out.push_back(value_to_json(el));
            return out;
        }
    };
    return std::visit(ToJson{}, v);
}

// ----------------- AST reader -----------------

static const json& require(const json& node, const char* field, const std::string& type) {
    auto it = node.find(field);
    if (it == node.end()) {
        throw std::invalid_argument(type + " node is missing '" + field + "'");
    }
    return *it;
}

static std::string require_string(const json& node, const char* field, const std::string& type) {
    const json& v = require(node, field, type);
    if (!v.is_string()) {
        throw std::invalid_argument(type + "." + field + " must be a string");
    }
    return v.get<std::string>();
}

static bool optional_bool(const json& node, const char* field, bool fallback, const std::string& type) {
    auto it = node.find(field);
    if (it == node.end()) return fallback;
    if (!it->is_boolean()) {
        throw std::invalid_argument(type + "." + field + " must be a boolean");
    }
    return it->get<bool>();
}

static NodePtr node_from_json(const json& j);

static NodePtr child_from_json(const json& node, const char* field, const std::string& type) {
    const json& child = require(node, field, type);
    if (!child.is_object()) {
        throw std::invalid_argument(type + "." + field + " must be a node object");
    }
    return node_from_json(child);
}

static LiteralValue literal_from_json(const json& v) {
    switch (v.type()) {
        case json::value_t::null:
            return std::monostate{};
        case json::value_t::boolean:
            return v.get<bool>();
        case json::value_t::number_integer:
        case json::value_t::number_unsigned:
        case json::value_t::number_float:
            return v.get<double>();
        case json::value_t::string:
            return v.get<std::string>();
        default:
            throw std::invalid_argument(std::string("Literal.value must be a scalar, got ") + v.type_name());
    }
}

static NodePtr node_from_json(const json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument(std::string("AST node must be an object, got ") + j.type_name());
    }
    const std::string type = require_string(j, "type", "AST");

    if (type == "ExpressionStatement") {
        return child_from_json(j, "expression", type);
    }
    if (type == "Literal") {
        return make_literal(literal_from_json(require(j, "value", type)));
    }
    if (type == "Identifier") {
        return make_identifier(require_string(j, "name", type));
    }
    if (type == "MemberExpression") {
        bool computed = optional_bool(j, "computed", false, type);
        auto object = child_from_json(j, "object", type);
        auto property = child_from_json(j, "property", type);
        return make_member(std::move(object), std::move(property), computed);
    }
    if (type == "CallExpression") {
        const json& callee = require(j, "callee", type);
        if (!callee.is_object()) {
            throw std::invalid_argument("CallExpression.callee must be a node object");
        }
        std::string name = require_string(callee, "name", "CallExpression.callee");

        const json& args = require(j, "arguments", type);
        if (!args.is_array()) {
            throw std::invalid_argument("CallExpression.arguments must be an array");
        }
        std::vector<NodePtr> arguments;
        for (const auto& a : args) arguments.push_back(node_from_json(a));
        return make_call(name, std::move(arguments));
    }
    if (type == "BinaryExpression" || type == "LogicalExpression") {
        std::string op = require_string(j, "operator", type);
        auto left = child_from_json(j, "left", type);
        auto right = child_from_json(j, "right", type);
        return make_binary(op, std::move(left), std::move(right));
    }
    if (type == "UnaryExpression") {
        std::string op = require_string(j, "operator", type);
        bool prefix = optional_bool(j, "prefix", true, type);
        return make_unary(op, child_from_json(j, "argument", type), prefix);
    }
    if (type == "ConditionalExpression") {
        auto test = child_from_json(j, "test", type);
        auto consequent = child_from_json(j, "consequent", type);
        auto alternate = child_from_json(j, "alternate", type);
        return make_conditional(std::move(test), std::move(consequent), std::move(alternate));
    }

    return make_node(UnsupportedNode{type});
}

ProgramNode program_from_json(const json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument(std::string("AST document must be an object, got ") + j.type_name());
    }
    auto type = j.find("type");
    if (type == j.end() || !type->is_string() || type->get<std::string>() != "Program") {
        return make_program(node_from_json(j));
    }

    const json& body = require(j, "body", "Program");
    if (body.is_array()) {
        if (body.size() != 1) {
            throw std::invalid_argument("Program.body must hold exactly one expression, got " + std::to_string(body.size()));
        }
        return make_program(node_from_json(body[0]));
    }
    return make_program(node_from_json(body));
}

}  // namespace formula
