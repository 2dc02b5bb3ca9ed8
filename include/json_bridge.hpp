#pragma once

#include <nlohmann/json.hpp>

#include "ast.hpp"
#include "state.hpp"
#include "value.hpp"

namespace formula {

// JSON objects and arrays become ObjectPtr / ArrayPtr, JSON null becomes null.
Value value_from_json(const nlohmann::json& j);

// Throws std::invalid_argument unless `j` is a JSON object.
Context context_from_json(const nlohmann::json& j);

// Undefined and non-finite numbers are written as null.
nlohmann::json value_to_json(const Value& v);

// Reads an ESTree-shaped AST: {"type": "Program", "body": ...} or a bare
// expression node. Unknown node types become UnsupportedNode; missing or
// mistyped fields throw std::invalid_argument.
ProgramNode program_from_json(const nlohmann::json& j);

}  // namespace formula
