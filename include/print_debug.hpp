#pragma once
#include <iostream>
#include <vector>

#include "ast.hpp"
#include "token.hpp"

namespace formula {

std::string token_type_name(TokenType t);

void print_tokens(const std::vector<Token>& tokens, std::ostream& out = std::cout);

// ESTree-shaped JSON dump; readable back with program_from_json
void print_program_debug(const ProgramNode& ast, std::ostream& out = std::cout, int indent = 0);

}  // namespace formula
