#pragma once
#include <memory>
#include <string>
#include <vector>

#include "ast.hpp"
#include "token.hpp"

namespace formula {

class Parser {
   public:
    Parser(const std::vector<Token>& tokens);
    ProgramNode parse();

   private:
    std::vector<Token> tokens;
    size_t position = 0;

    Token peek() const;

    Token consume();
    bool match(TokenType t);
    Token expect(TokenType t, const std::string& errMsg);
    [[noreturn]] void error_at(const Token& tok, const std::string& message) const;

    // expression parsing (precedence chain)
    NodePtr parse_expression();
    NodePtr parse_ternary();
    NodePtr parse_logical_or();
    NodePtr parse_logical_and();
    NodePtr parse_equality();
    NodePtr parse_comparison();
    NodePtr parse_additive();
    NodePtr parse_multiplicative();
    NodePtr parse_unary();
    NodePtr parse_postfix(NodePtr node);
    NodePtr parse_primary();
    NodePtr parse_call(const Token& atTok);
};

}  // namespace formula
