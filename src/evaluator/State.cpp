// src/evaluator/State.cpp
#include "state.hpp"

#include <utility>

namespace formula {

State::State()
    : context_(std::make_shared<const Context>()),
      functions_(std::make_shared<const Functions>()) {}

State::State(Context context, Functions functions)
    : context_(std::make_shared<const Context>(std::move(context))),
      functions_(std::make_shared<const Functions>(std::move(functions))) {}

bool State::has_variable(const std::string& name) const {
    return context_->find(name) != context_->end();
}

bool State::has_function(const std::string& name) const {
    return functions_->find(name) != functions_->end();
}

const Value* State::find_variable(const std::string& name) const {
    auto it = context_->find(name);
    if (it == context_->end()) return nullptr;
    return &it->second;
}

const Function* State::find_function(const std::string& name) const {
    auto it = functions_->find(name);
    if (it == functions_->end()) return nullptr;
    return &it->second;
}

State create_state(Context context, Functions functions) {
    return State(std::move(context), std::move(functions));
}

State set_function(const State& state, const std::string& name, Function fn) {
    auto functions = std::make_shared<Functions>(*state.functions_);
    (*functions)[name] = std::move(fn);

    State next = state;
    next.functions_ = std::move(functions);
    return next;
}

State with_context(const State& state, const Context& overrides) {
    if (overrides.empty()) return state;

    auto context = std::make_shared<Context>(*state.context_);
    for (const auto& kv : overrides) {
        (*context)[kv.first] = kv.second;
    }

    State next = state;
    next.context_ = std::move(context);
    return next;
}

}  // namespace formula
