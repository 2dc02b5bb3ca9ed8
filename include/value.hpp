#pragma once

#include <initializer_list>
#include <memory>
#include <string>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace formula {

// Absence of a value (missing property). Distinct from null.
struct Undefined {};

// Forward-declare the structured values so Value can hold pointers to them
struct ObjectValue;
using ObjectPtr = std::shared_ptr<ObjectValue>;

struct ArrayValue;
using ArrayPtr = std::shared_ptr<ArrayValue>;

// std::monostate is null
using Value = std::variant<
    std::monostate,
    Undefined,
    double,
    std::string,
    bool,
    ObjectPtr,
    ArrayPtr>;

// Host-provided structured values. The evaluator only reads them.
struct ObjectValue {
    std::unordered_map<std::string, Value> properties;
};

struct ArrayValue {
    std::vector<Value> elements;
};

inline ObjectPtr make_object(std::initializer_list<std::pair<const std::string, Value>> props = {}) {
    auto obj = std::make_shared<ObjectValue>();
    obj->properties.insert(props.begin(), props.end());
    return obj;
}

inline ArrayPtr make_array(std::vector<Value> elements = {}) {
    auto arr = std::make_shared<ArrayValue>();
    arr->elements = std::move(elements);
    return arr;
}

inline bool is_nullish(const Value& v) {
    return std::holds_alternative<std::monostate>(v) || std::holds_alternative<Undefined>(v);
}

// ----------------- coercions (EvaluatorHelper.cpp) -----------------

// "null", "undefined", "number", "string", "boolean", "object", "array"
std::string type_name(const Value& v);

// Truthiness: false, 0, NaN, "", null and undefined are falsy.
bool to_bool(const Value& v);

// Numeric coercion. Never throws: unconvertible values become NaN.
double to_number(const Value& v);

// Shortest decimal form that reads back to the same double.
std::string number_to_string(double d);

// Strings are UTF-8; length and indexing count code points.
size_t utf8_length(const std::string& s);
bool utf8_char_at(const std::string& s, size_t index, std::string& out);

// String form used by '+' concatenation and computed property keys.
std::string to_string_value(const Value& v);

// No coercion: different runtime types are never equal, structured
// values compare by identity.
bool is_strict_equal(const Value& a, const Value& b);

// Human readable rendering for the command line (quotes nested strings).
std::string print_value(const Value& v, bool use_color = false);

}  // namespace formula
