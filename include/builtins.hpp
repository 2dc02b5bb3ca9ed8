#pragma once
#include "state.hpp"

namespace formula {

// Returns a copy of `state` with the builtin function library registered:
// sum min max avg abs round floor ceil sqrt pow len upper lower trim str num coalesce.
// Functions already present in `state` under the same name are replaced.
State register_builtins(const State& state);

}  // namespace formula
