#pragma once
#include <stdexcept>
#include <string>

#include "token.hpp"

namespace formula {

// Located error raised by the lexer and parser.
class SyntaxError : public std::runtime_error {
   public:
    SyntaxError(const std::string& message,
        const TokenLocation& loc) : std::runtime_error(format_message(message, loc)), loc_(loc) {}

    const TokenLocation& location() const { return loc_; }

   private:
    TokenLocation loc_;

    static std::string format_message(const std::string& message,
        const TokenLocation& loc) {
        return "SyntaxError at " + loc.to_string() + "\n" +
            message + "\n" +
            " --> Traced at:\n" +
            loc.get_line_trace();
    }
};

enum class ErrorKind {
    UndefinedVariable,
    NullPropertyAccess,
    UndefinedFunction,
    NonNumericNegation,
    UnsupportedPostfix,
    UnknownOperator,
    UnsupportedNodeType
};

// Raised by the evaluator for any semantic problem in an expression.
// Each dispatch frame the error unwinds through wraps it into a new
// ExpressionError of the same kind with an "Evaluation error: " prefix.
class ExpressionError : public std::runtime_error {
   public:
    ExpressionError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

    // New error of the same kind, one evaluation frame further out.
    ExpressionError wrapped() const {
        return ExpressionError(kind_, "Evaluation error: " + std::string(what()));
    }

   private:
    ErrorKind kind_;
};

}  // namespace formula
