#pragma once

#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "value.hpp"

namespace formula {

using Context = std::unordered_map<std::string, Value>;
using Function = std::function<Value(const std::vector<Value>&)>;
using Functions = std::unordered_map<std::string, Function>;

// Snapshot of the variables and functions visible to an expression.
// A State is never modified after construction: every update returns a new
// State and leaves the maps of the old one untouched, so one State can be
// shared by any number of concurrent evaluations.
class State {
   public:
    State();
    State(Context context, Functions functions);

    const Context& context() const { return *context_; }
    const Functions& functions() const { return *functions_; }

    bool has_variable(const std::string& name) const;
    bool has_function(const std::string& name) const;

    // nullptr when absent
    const Value* find_variable(const std::string& name) const;
    const Function* find_function(const std::string& name) const;

   private:
    friend State set_function(const State& state, const std::string& name, Function fn);
    friend State with_context(const State& state, const Context& overrides);

    std::shared_ptr<const Context> context_;
    std::shared_ptr<const Functions> functions_;
};

State create_state(Context context = {}, Functions functions = {});

// Returns a copy of `state` whose function table maps `name` to `fn`
// (inserted or overwritten). The context map is shared, not copied.
State set_function(const State& state, const std::string& name, Function fn);

// Returns a copy of `state` whose context is `overrides` merged over the
// existing context (override keys win). Functions are shared.
State with_context(const State& state, const Context& overrides);

}  // namespace formula
