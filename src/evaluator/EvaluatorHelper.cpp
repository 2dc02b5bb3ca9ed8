#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <limits>
#include <sstream>
#include <vector>

#include "colors.hpp"
#include "value.hpp"

namespace formula {

// ----------------- Value helpers -----------------

std::string type_name(const Value& v) {
    if (std::holds_alternative<std::monostate>(v)) return "null";
    if (std::holds_alternative<Undefined>(v)) return "undefined";
    if (std::holds_alternative<double>(v)) return "number";
    if (std::holds_alternative<std::string>(v)) return "string";
    if (std::holds_alternative<bool>(v)) return "boolean";
    if (std::holds_alternative<ObjectPtr>(v)) return "object";
    if (std::holds_alternative<ArrayPtr>(v)) return "array";
    return "unknown";
}

bool to_bool(const Value& v) {
    if (std::holds_alternative<bool>(v)) return std::get<bool>(v);
    if (std::holds_alternative<double>(v)) return !std::isnan(std::get<double>(v)) && std::get<double>(v) != 0.0;
    if (std::holds_alternative<std::string>(v)) return !std::get<std::string>(v).empty();
    if (is_nullish(v)) return false;
    // objects and arrays are truthy even when empty
    return true;
}

static std::string trim_copy(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

static double string_to_number(const std::string& raw) {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    std::string s = trim_copy(raw);
    if (s.empty()) return 0.0;

    if (s == "Infinity" || s == "+Infinity") return std::numeric_limits<double>::infinity();
    if (s == "-Infinity") return -std::numeric_limits<double>::infinity();

    // strtod also accepts "inf", "nan" and hex floats; formulas only take decimals
    for (char c : s) {
        if (std::isalpha(static_cast<unsigned char>(c)) && c != 'e' && c != 'E') return nan;
    }

    char* end = nullptr;
    double d = std::strtod(s.c_str(), &end);
    if (end == s.c_str() || *end != '\0') return nan;
    return d;
}

double to_number(const Value& v) {
    if (std::holds_alternative<double>(v)) return std::get<double>(v);
    if (std::holds_alternative<bool>(v)) return std::get<bool>(v) ? 1.0 : 0.0;
    if (std::holds_alternative<std::monostate>(v)) return 0.0;
    if (std::holds_alternative<std::string>(v)) return string_to_number(std::get<std::string>(v));
    return std::numeric_limits<double>::quiet_NaN();
}

std::string number_to_string(double d) {
    if (std::isnan(d)) return "NaN";
    if (std::isinf(d)) return d > 0 ? "Infinity" : "-Infinity";
    if (d == 0.0) return "0";  // also -0

    std::string sign = d < 0 ? "-" : "";
    double magnitude = std::fabs(d);

    // shortest precision that round-trips, in d.ddde+NN form
    std::string sci;
    for (int precision = 1; precision <= 17; ++precision) {
        std::ostringstream attempt;
        attempt << std::scientific << std::setprecision(precision - 1) << magnitude;
        sci = attempt.str();
        if (std::strtod(sci.c_str(), nullptr) == magnitude) break;
    }

    size_t e = sci.find('e');
    std::string digits = sci.substr(0, 1);
    if (e > 2) digits += sci.substr(2, e - 2);
    while (digits.size() > 1 && digits.back() == '0') digits.pop_back();
    int k = static_cast<int>(digits.size());
    int n = std::atoi(sci.c_str() + e + 1) + 1;  // position of the decimal point

    if (k <= n && n <= 21) return sign + digits + std::string(n - k, '0');
    if (0 < n && n <= 21) return sign + digits.substr(0, n) + "." + digits.substr(n);
    if (-6 < n && n <= 0) return sign + "0." + std::string(-n, '0') + digits;

    std::string out = sign + digits.substr(0, 1);
    if (k > 1) out += "." + digits.substr(1);
    out += n - 1 >= 0 ? "e+" : "e-";
    out += std::to_string(std::abs(n - 1));
    return out;
}

static bool is_continuation(unsigned char c) {
    return (c & 0xC0) == 0x80;
}

size_t utf8_length(const std::string& s) {
    size_t count = 0;
    for (unsigned char c : s) {
        if (!is_continuation(c)) ++count;
    }
    return count;
}

bool utf8_char_at(const std::string& s, size_t index, std::string& out) {
    size_t seen = 0;
    for (size_t i = 0; i < s.size(); ++i) {
        if (is_continuation(static_cast<unsigned char>(s[i]))) continue;
        if (seen++ != index) continue;
        size_t end = i + 1;
        while (end < s.size() && is_continuation(static_cast<unsigned char>(s[end]))) ++end;
        out = s.substr(i, end - i);
        return true;
    }
    return false;
}

std::string to_string_value(const Value& v) {
    if (std::holds_alternative<std::monostate>(v)) return "null";
    if (std::holds_alternative<Undefined>(v)) return "undefined";
    if (std::holds_alternative<double>(v)) return number_to_string(std::get<double>(v));
    if (std::holds_alternative<std::string>(v)) return std::get<std::string>(v);
    if (std::holds_alternative<bool>(v)) return std::get<bool>(v) ? "true" : "false";
    if (std::holds_alternative<ArrayPtr>(v)) {
        ArrayPtr arr = std::get<ArrayPtr>(v);
        if (!arr) return "";
        std::string out;
        for (size_t i = 0; i < arr->elements.size(); ++i) {
            if (i) out += ",";
            // null and undefined elements join as empty strings
            if (!is_nullish(arr->elements[i])) out += to_string_value(arr->elements[i]);
        }
        return out;
    }
    return "[object Object]";
}

bool is_strict_equal(const Value& a, const Value& b) {
    if (a.index() != b.index()) return false;

    if (std::holds_alternative<std::monostate>(a)) return true;
    if (std::holds_alternative<Undefined>(a)) return true;

    if (auto pa = std::get_if<double>(&a)) {
        // NaN is not equal to itself
        return *pa == std::get<double>(b);
    }
    if (auto sa = std::get_if<std::string>(&a)) {
        return *sa == std::get<std::string>(b);
    }
    if (auto ba = std::get_if<bool>(&a)) {
        return *ba == std::get<bool>(b);
    }
    if (auto oa = std::get_if<ObjectPtr>(&a)) {
        return oa->get() == std::get<ObjectPtr>(b).get();
    }
    if (auto aa = std::get_if<ArrayPtr>(&a)) {
        return aa->get() == std::get<ArrayPtr>(b).get();
    }
    return false;
}

static std::string print_nested(const Value& v, bool use_color, bool top_level) {
    if (std::holds_alternative<std::monostate>(v)) return Color::paint(Color::bright_black, "null", use_color);
    if (std::holds_alternative<Undefined>(v)) return Color::paint(Color::bright_black, "undefined", use_color);
    if (std::holds_alternative<double>(v)) return Color::paint(Color::yellow, number_to_string(std::get<double>(v)), use_color);
    if (std::holds_alternative<bool>(v)) return Color::paint(Color::bright_magenta, std::get<bool>(v) ? "true" : "false", use_color);
    if (std::holds_alternative<std::string>(v)) {
        const std::string& s = std::get<std::string>(v);
        if (top_level) return s;
        return Color::paint(Color::green, "\"" + s + "\"", use_color);
    }
    if (std::holds_alternative<ArrayPtr>(v)) {
        ArrayPtr arr = std::get<ArrayPtr>(v);
        if (!arr || arr->elements.empty()) return "[]";
        std::string out = "[";
        for (size_t i = 0; i < arr->elements.size(); ++i) {
            if (i) out += ", ";
            out += print_nested(arr->elements[i], use_color, false);
        }
        return out + "]";
    }
    if (std::holds_alternative<ObjectPtr>(v)) {
        ObjectPtr obj = std::get<ObjectPtr>(v);
        if (!obj || obj->properties.empty()) return "{}";

        // unordered storage; print keys sorted so output is stable
        std::vector<std::string> keys;
        keys.reserve(obj->properties.size());
        for (const auto& kv : obj->properties) keys.push_back(kv.first);
        std::sort(keys.begin(), keys.end());

        std::string out = "{ ";
        for (size_t i = 0; i < keys.size(); ++i) {
            if (i) out += ", ";
            out += Color::paint(Color::cyan, keys[i], use_color) + ": " +
                print_nested(obj->properties.at(keys[i]), use_color, false);
        }
        return out + " }";
    }
    return "";
}

std::string print_value(const Value& v, bool use_color) {
    return print_nested(v, use_color, true);
}

}  // namespace formula
