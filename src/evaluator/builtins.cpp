#include "builtins.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>

namespace formula {

static const double NaN = std::numeric_limits<double>::quiet_NaN();

// missing arguments read as undefined
static Value arg(const std::vector<Value>& args, size_t i) {
    return i < args.size() ? args[i] : Value{Undefined{}};
}

static double num_arg(const std::vector<Value>& args, size_t i) {
    return to_number(arg(args, i));
}

template <typename F>
static Function unary_math(F fn) {
    return [fn](const std::vector<Value>& args) -> Value {
        return fn(num_arg(args, 0));
    };
}

static Value builtin_sum(const std::vector<Value>& args) {
    double total = 0.0;
    for (const auto& a : args) total += to_number(a);
    return total;
}

static Value builtin_min(const std::vector<Value>& args) {
    if (args.empty()) return NaN;
    double best = std::numeric_limits<double>::infinity();
    for (const auto& a : args) {
        double d = to_number(a);
        if (std::isnan(d)) return NaN;
        best = std::min(best, d);
    }
    return best;
}

static Value builtin_max(const std::vector<Value>& args) {
    if (args.empty()) return NaN;
    double best = -std::numeric_limits<double>::infinity();
    for (const auto& a : args) {
        double d = to_number(a);
        if (std::isnan(d)) return NaN;
        best = std::max(best, d);
    }
    return best;
}

static Value builtin_avg(const std::vector<Value>& args) {
    if (args.empty()) return NaN;
    return std::get<double>(builtin_sum(args)) / static_cast<double>(args.size());
}

// rounds half up like Math.round: round(-2.5) == -2
static Value builtin_round(const std::vector<Value>& args) {
    double d = num_arg(args, 0);
    if (!std::isfinite(d)) return d;
    double down = std::floor(d);
    return d - down >= 0.5 ? down + 1.0 : down;
}

static Value builtin_len(const std::vector<Value>& args) {
    Value v = arg(args, 0);
    if (auto s = std::get_if<std::string>(&v)) return static_cast<double>(utf8_length(*s));
    if (auto arr = std::get_if<ArrayPtr>(&v)) return *arr ? static_cast<double>((*arr)->elements.size()) : 0.0;
    if (auto obj = std::get_if<ObjectPtr>(&v)) return *obj ? static_cast<double>((*obj)->properties.size()) : 0.0;
    return 0.0;
}

template <typename F>
static Function string_transform(F fn) {
    return [fn](const std::vector<Value>& args) -> Value {
        std::string s = to_string_value(arg(args, 0));
        return fn(s);
    };
}

static std::string upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

static std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

static std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

static Value builtin_coalesce(const std::vector<Value>& args) {
    for (const auto& a : args) {
        if (!is_nullish(a)) return a;
    }
    return std::monostate{};
}

State register_builtins(const State& state) {
    const std::vector<std::pair<std::string, Function>> library = {
        {"sum", builtin_sum},
        {"min", builtin_min},
        {"max", builtin_max},
        {"avg", builtin_avg},
        {"abs", unary_math([](double d) { return std::fabs(d); })},
        {"round", builtin_round},
        {"floor", unary_math([](double d) { return std::floor(d); })},
        {"ceil", unary_math([](double d) { return std::ceil(d); })},
        {"sqrt", unary_math([](double d) { return std::sqrt(d); })},
        {"pow", [](const std::vector<Value>& args) -> Value {
             return std::pow(num_arg(args, 0), num_arg(args, 1));
         }},
        {"len", builtin_len},
        {"upper", string_transform(upper)},
        {"lower", string_transform(lower)},
        {"trim", string_transform(trim)},
        {"str", [](const std::vector<Value>& args) -> Value {
             return to_string_value(arg(args, 0));
         }},
        {"num", [](const std::vector<Value>& args) -> Value {
             return to_number(arg(args, 0));
         }},
        {"coalesce", builtin_coalesce},
    };

    State out = state;
    for (const auto& entry : library) {
        out = set_function(out, entry.first, entry.second);
    }
    return out;
}

}  // namespace formula
