#include <gtest/gtest.h>

#include "state.hpp"

using namespace formula;

static Function constant(double value) {
    return [value](const std::vector<Value>&) -> Value { return value; };
}

TEST(StateTest, DefaultStateIsEmpty) {
    State state;
    EXPECT_TRUE(state.context().empty());
    EXPECT_TRUE(state.functions().empty());
    EXPECT_EQ(state.find_variable("x"), nullptr);
    EXPECT_EQ(state.find_function("f"), nullptr);
}

TEST(StateTest, CreateStateHoldsGivenMaps) {
    State state = create_state({{"x", 1.0}}, {{"f", constant(2.0)}});
    EXPECT_TRUE(state.has_variable("x"));
    EXPECT_TRUE(state.has_function("f"));
    EXPECT_FALSE(state.has_variable("f"));

    const Function* fn = state.find_function("f");
    ASSERT_NE(fn, nullptr);
    EXPECT_DOUBLE_EQ(std::get<double>((*fn)({})), 2.0);
}

TEST(StateTest, SetFunctionDoesNotMutateInput) {
    State s1 = create_state({{"x", 1.0}});
    State s2 = set_function(s1, "f", constant(1.0));

    EXPECT_FALSE(s1.has_function("f"));
    EXPECT_TRUE(s2.has_function("f"));
    EXPECT_TRUE(s2.has_variable("x"));
}

TEST(StateTest, SetFunctionOverwritesExistingName) {
    State s1 = set_function(State(), "f", constant(1.0));
    State s2 = set_function(s1, "f", constant(2.0));

    EXPECT_DOUBLE_EQ(std::get<double>((*s1.find_function("f"))({})), 1.0);
    EXPECT_DOUBLE_EQ(std::get<double>((*s2.find_function("f"))({})), 2.0);
}

TEST(StateTest, SetFunctionSharesContext) {
    State s1 = create_state({{"x", 1.0}});
    State s2 = set_function(s1, "f", constant(1.0));
    EXPECT_EQ(&s1.context(), &s2.context());
    EXPECT_NE(&s1.functions(), &s2.functions());
}

TEST(StateTest, WithContextMergesOverrides) {
    State base = create_state({{"x", 1.0}, {"y", 2.0}});
    State merged = with_context(base, {{"x", 10.0}, {"z", 3.0}});

    EXPECT_DOUBLE_EQ(std::get<double>(*merged.find_variable("x")), 10.0);
    EXPECT_DOUBLE_EQ(std::get<double>(*merged.find_variable("y")), 2.0);
    EXPECT_DOUBLE_EQ(std::get<double>(*merged.find_variable("z")), 3.0);

    EXPECT_DOUBLE_EQ(std::get<double>(*base.find_variable("x")), 1.0);
    EXPECT_FALSE(base.has_variable("z"));
    EXPECT_EQ(&base.functions(), &merged.functions());
}

TEST(StateTest, WithEmptyContextSharesEverything) {
    State base = create_state({{"x", 1.0}});
    State same = with_context(base, {});
    EXPECT_EQ(&base.context(), &same.context());
}

TEST(StateTest, CopiesShareImmutableMaps) {
    State a = create_state({{"x", 1.0}});
    State b = a;
    EXPECT_EQ(&a.context(), &b.context());
}
