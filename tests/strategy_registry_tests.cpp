#include <gtest/gtest.h>

#include <stdexcept>
#include <vector>

#include "core/strategy_registry.hpp"

namespace {

core::StrategyOutcome always_pass(std::string_view, std::string_view, const core::CompareConfig&,
                                  const core::CompareOverrides&) {
    return core::StrategyOutcome{true, {}, std::nullopt};
}

core::StrategyOutcome always_fail(std::string_view, std::string_view, const core::CompareConfig&,
                                  const core::CompareOverrides&) {
    return core::StrategyOutcome{false, {}, std::string("nope")};
}

std::vector<core::ComparisonMode> modes_of(const std::vector<core::Strategy>& strategies) {
    std::vector<core::ComparisonMode> out;
    for (const auto& s : strategies) {
        out.push_back(s.mode);
    }
    return out;
}

TEST(StrategyRegistryTest, BuiltinOrder) {
    const auto& reg = core::default_registry();
    EXPECT_EQ(reg.size(), 6u);
    const std::vector<core::ComparisonMode> expected{
        core::ComparisonMode::Strict,           core::ComparisonMode::TrimEol,
        core::ComparisonMode::NormaliseWhitespace, core::ComparisonMode::CanonicalLiteral,
        core::ComparisonMode::FloatEps,         core::ComparisonMode::TokenSet};
    EXPECT_EQ(reg.list_modes(), expected);
    EXPECT_EQ(modes_of(reg.for_mode(std::nullopt)), expected);
    EXPECT_EQ(modes_of(reg.for_mode(core::ComparisonMode::Auto)), expected);
}

TEST(StrategyRegistryTest, SpecificModeSelectsOne) {
    const auto& reg = core::default_registry();
    const auto only = reg.for_mode(core::ComparisonMode::FloatEps);
    ASSERT_EQ(only.size(), 1u);
    EXPECT_EQ(only[0].mode, core::ComparisonMode::FloatEps);
    EXPECT_EQ(only[0].priority, 40);
}

TEST(StrategyRegistryTest, UnregisteredModeYieldsNothing) {
    core::StrategyRegistry reg;
    reg.register_strategy(core::Strategy{core::ComparisonMode::Strict, &always_pass, 0, true});
    EXPECT_TRUE(reg.for_mode(core::ComparisonMode::TokenSet).empty());
    EXPECT_TRUE(reg.for_mode(core::ComparisonMode::HashSha256).empty());
    EXPECT_FALSE(reg.strategy(core::ComparisonMode::TokenSet).has_value());
    EXPECT_TRUE(reg.strategy(core::ComparisonMode::Strict).has_value());
}

TEST(StrategyRegistryTest, DuplicateRegistrationReplaces) {
    core::StrategyRegistry reg;
    reg.register_strategy(core::Strategy{core::ComparisonMode::Strict, &always_pass, 0, true});
    reg.register_strategy(core::Strategy{core::ComparisonMode::TokenSet, &always_pass, 5, true});
    reg.register_strategy(core::Strategy{core::ComparisonMode::Strict, &always_fail, 10, true});
    EXPECT_EQ(reg.size(), 2u);

    const auto all = reg.for_mode(std::nullopt);
    ASSERT_EQ(all.size(), 2u);
    EXPECT_EQ(all[0].mode, core::ComparisonMode::TokenSet);
    EXPECT_EQ(all[1].mode, core::ComparisonMode::Strict);
    EXPECT_EQ(all[1].handler, &always_fail);
}

TEST(StrategyRegistryTest, EqualPrioritiesOrderByName) {
    core::StrategyRegistry reg;
    reg.register_strategy(core::Strategy{core::ComparisonMode::TokenSet, &always_pass, 1, true});
    reg.register_strategy(core::Strategy{core::ComparisonMode::FloatEps, &always_pass, 1, true});
    reg.register_strategy(core::Strategy{core::ComparisonMode::Strict, &always_pass, 1, true});
    const std::vector<core::ComparisonMode> expected{
        core::ComparisonMode::FloatEps, core::ComparisonMode::Strict, core::ComparisonMode::TokenSet};
    EXPECT_EQ(reg.list_modes(), expected);
}

TEST(StrategyRegistryTest, AutoSkipsExcludedStrategies) {
    core::StrategyRegistry reg;
    reg.register_strategy(core::Strategy{core::ComparisonMode::Strict, &always_pass, 0, true});
    reg.register_strategy(core::Strategy{core::ComparisonMode::TokenSet, &always_pass, 1, false});
    EXPECT_EQ(reg.for_mode(std::nullopt).size(), 1u);
    EXPECT_EQ(reg.for_mode(core::ComparisonMode::TokenSet).size(), 1u);
    EXPECT_EQ(reg.list_modes().size(), 2u);
}

TEST(StrategyRegistryTest, RejectsInvalidRegistrations) {
    core::StrategyRegistry reg;
    EXPECT_THROW(reg.register_strategy(core::Strategy{core::ComparisonMode::Auto, &always_pass, 0, true}),
                 std::invalid_argument);
    EXPECT_THROW(reg.register_strategy(core::Strategy{core::ComparisonMode::HashSha256, &always_pass, 0, true}),
                 std::invalid_argument);
    EXPECT_THROW(reg.register_strategy(core::Strategy{core::ComparisonMode::Strict, nullptr, 0, true}),
                 std::invalid_argument);
    EXPECT_EQ(reg.size(), 0u);
}

} // namespace
