#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

#include "core/evaluator.hpp"
#include "util/log.hpp"

namespace {

core::StrategyOutcome pass_with_label(std::string_view, std::string_view, const core::CompareConfig&,
                                      const core::CompareOverrides&) {
    return core::StrategyOutcome{true, {"custom"}, std::nullopt};
}

core::StrategyOutcome fail_no_reason(std::string_view, std::string_view, const core::CompareConfig&,
                                     const core::CompareOverrides&) {
    return core::StrategyOutcome{false, {"tried"}, std::nullopt};
}

core::StrategyOutcome fail_with_reason(std::string_view, std::string_view, const core::CompareConfig&,
                                       const core::CompareOverrides&) {
    return core::StrategyOutcome{false, {}, std::string("specific")};
}

core::StrategyOutcome abstain(std::string_view, std::string_view, const core::CompareConfig&,
                              const core::CompareOverrides&) {
    return core::StrategyOutcome{std::nullopt, {"looked"}, std::nullopt};
}

core::StrategyOutcome explode(std::string_view, std::string_view, const core::CompareConfig&,
                              const core::CompareOverrides&) {
    throw std::runtime_error("boom");
}

core::CompareAttempt attempt(core::ComparisonMode mode, int priority, std::optional<bool> passed,
                             std::vector<std::string> labels = {}, std::optional<std::string> reason = {}) {
    core::CompareAttempt a;
    a.mode = mode;
    a.priority = priority;
    a.passed = passed;
    a.normalisations = std::move(labels);
    a.reason = std::move(reason);
    return a;
}

const std::vector<std::string> base{"unicode_nfc"};

TEST(SelectResultTest, FirstPassWinsOverEarlierFail) {
    std::vector<core::CompareAttempt> attempts{
        attempt(core::ComparisonMode::Strict, 0, false, {}, "Mismatch under STRICT"),
        attempt(core::ComparisonMode::TrimEol, 10, std::nullopt, {"trim_eol"}),
        attempt(core::ComparisonMode::TokenSet, 50, true, {"token_set"}),
    };
    const auto r = core::select_result(attempts, base);
    EXPECT_TRUE(r.passed);
    EXPECT_EQ(r.mode_applied, core::ComparisonMode::TokenSet);
    const std::vector<std::string> labels{"unicode_nfc", "token_set"};
    EXPECT_EQ(r.normalisations_applied, labels);
    EXPECT_FALSE(r.reason.has_value());
    EXPECT_EQ(r.attempts.size(), 3u);
}

TEST(SelectResultTest, FirstFailWhenNothingPasses) {
    std::vector<core::CompareAttempt> attempts{
        attempt(core::ComparisonMode::TrimEol, 10, std::nullopt, {"trim_eol"}),
        attempt(core::ComparisonMode::CanonicalLiteral, 30, false, {"literal"}, "Literal structures differ"),
        attempt(core::ComparisonMode::TokenSet, 50, false, {"token_set"}, "Token sets differ"),
    };
    const auto r = core::select_result(attempts, base);
    EXPECT_FALSE(r.passed);
    EXPECT_EQ(r.mode_applied, core::ComparisonMode::CanonicalLiteral);
    EXPECT_EQ(r.reason, "Literal structures differ");
    const std::vector<std::string> labels{"unicode_nfc", "literal"};
    EXPECT_EQ(r.normalisations_applied, labels);
}

TEST(SelectResultTest, FailWithoutReasonNamesMode) {
    const auto r = core::select_result({attempt(core::ComparisonMode::FloatEps, 40, false)}, base);
    EXPECT_EQ(r.reason, "Mismatch under FLOAT_EPS");
}

TEST(SelectResultTest, AllAbstainIsNoMatch) {
    const auto r = core::select_result({attempt(core::ComparisonMode::TrimEol, 10, std::nullopt, {"trim_eol"}),
                                        attempt(core::ComparisonMode::NormaliseWhitespace, 20, std::nullopt,
                                                {"ws_checked"})},
                                       base);
    EXPECT_FALSE(r.passed);
    EXPECT_FALSE(r.mode_applied.has_value());
    EXPECT_EQ(r.reason, "No comparator matched");
    EXPECT_EQ(r.normalisations_applied, base);
}

class EvaluatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        saved_ = util::log_level();
        util::set_log_level(util::LogLevel::Error);
    }
    void TearDown() override { util::set_log_level(saved_); }

    core::CompareConfig cfg_{core::default_compare_config()};
    core::CompareOverrides ov_{};
    util::LogLevel saved_{util::LogLevel::Warn};
};

TEST_F(EvaluatorTest, ThrowingStrategyIsInconclusive) {
    const core::Strategy s{core::ComparisonMode::Strict, &explode, 0, true};
    const auto a = core::run_strategy(s, "x", "y", cfg_, ov_);
    EXPECT_EQ(a.mode, core::ComparisonMode::Strict);
    EXPECT_FALSE(a.passed.has_value());
    EXPECT_TRUE(a.normalisations.empty());
    EXPECT_FALSE(a.reason.has_value());
    EXPECT_GE(a.duration.count(), 0);
}

TEST_F(EvaluatorTest, ThrowingStrategyDoesNotBlockOthers) {
    const std::vector<core::Strategy> strategies{
        {core::ComparisonMode::Strict, &explode, 0, true},
        {core::ComparisonMode::TrimEol, &abstain, 10, true},
        {core::ComparisonMode::TokenSet, &pass_with_label, 50, true},
    };
    const auto attempts = core::evaluate_strategies(strategies, "x", "y", cfg_, ov_);
    ASSERT_EQ(attempts.size(), 3u);
    const auto r = core::select_result(attempts, base);
    EXPECT_TRUE(r.passed);
    EXPECT_EQ(r.mode_applied, core::ComparisonMode::TokenSet);
}

TEST_F(EvaluatorTest, AttemptsSortedByPriorityThenName) {
    // Deliberately out of order.
    const std::vector<core::Strategy> strategies{
        {core::ComparisonMode::TokenSet, &fail_with_reason, 5, true},
        {core::ComparisonMode::FloatEps, &fail_no_reason, 5, true},
        {core::ComparisonMode::Strict, &abstain, 1, true},
    };
    for (int round = 0; round < 20; ++round) {
        const auto attempts = core::evaluate_strategies(strategies, "a", "b", cfg_, ov_);
        ASSERT_EQ(attempts.size(), 3u);
        EXPECT_EQ(attempts[0].mode, core::ComparisonMode::Strict);
        EXPECT_EQ(attempts[1].mode, core::ComparisonMode::FloatEps);
        EXPECT_EQ(attempts[2].mode, core::ComparisonMode::TokenSet);

        const auto r = core::select_result(attempts, base);
        EXPECT_FALSE(r.passed);
        EXPECT_EQ(r.mode_applied, core::ComparisonMode::FloatEps);
        EXPECT_EQ(r.reason, "Mismatch under FLOAT_EPS");
    }
}

TEST_F(EvaluatorTest, EmptyStrategyListYieldsNoAttempts) {
    EXPECT_TRUE(core::evaluate_strategies({}, "a", "b", cfg_, ov_).empty());
}

} // namespace
