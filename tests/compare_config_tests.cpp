#include <gtest/gtest.h>

#include <type_traits>

#include "core/compare_config.hpp"

namespace {

TEST(CompareConfigTest, DefaultValues) {
    const core::CompareConfig cfg{};
    EXPECT_DOUBLE_EQ(cfg.float_eps, 1e-6);
    EXPECT_EQ(cfg.unicode_form, core::UnicodeForm::NFC);
    EXPECT_EQ(cfg.large_output_threshold, 2u * 1024u * 1024u);
    EXPECT_EQ(cfg.token_set_size_limit, 512u);
}

TEST(CompareConfigTest, IsTriviallyCopyable) {
    static_assert(std::is_trivially_copyable_v<core::CompareConfig>, "CompareConfig must be trivially copyable");
}

TEST(CompareConfigTest, DefaultCompareConfigFunction) {
    constexpr auto cfg = core::default_compare_config();
    EXPECT_DOUBLE_EQ(cfg.float_eps, core::default_float_eps);
    EXPECT_EQ(cfg.large_output_threshold, core::default_large_output_threshold);
    EXPECT_EQ(cfg.token_set_size_limit, core::default_token_set_size_limit);
}

TEST(CompareOverridesTest, EmptyOverridesKeepBase) {
    core::CompareConfig base{};
    base.float_eps = 0.5;
    const core::CompareOverrides none{};
    EXPECT_TRUE(none.empty());
    const auto cfg = core::apply_overrides(base, none);
    EXPECT_DOUBLE_EQ(cfg.float_eps, 0.5);
    EXPECT_EQ(cfg.unicode_form, base.unicode_form);
}

TEST(CompareOverridesTest, OverridesApplyToCopyOnly) {
    const core::CompareConfig base{};
    core::CompareOverrides ov;
    ov.float_eps = 1e-3;
    ov.unicode_form = core::UnicodeForm::NFKD;
    ov.large_output_threshold = 0;
    ov.token_set_limit = 7;
    EXPECT_FALSE(ov.empty());

    const auto cfg = core::apply_overrides(base, ov);
    EXPECT_DOUBLE_EQ(cfg.float_eps, 1e-3);
    EXPECT_EQ(cfg.unicode_form, core::UnicodeForm::NFKD);
    EXPECT_EQ(cfg.large_output_threshold, 0u);
    EXPECT_EQ(cfg.token_set_size_limit, 7u);

    EXPECT_DOUBLE_EQ(base.float_eps, core::default_float_eps);
    EXPECT_EQ(base.unicode_form, core::UnicodeForm::NFC);
}

TEST(CompareOverridesTest, StrategyOnlyEpsStaysOutOfConfig) {
    core::CompareOverrides ov;
    ov.strategy_float_eps = 0.25;
    EXPECT_FALSE(ov.empty());
    const auto cfg = core::apply_overrides(core::CompareConfig{}, ov);
    EXPECT_DOUBLE_EQ(cfg.float_eps, core::default_float_eps);
}

TEST(UnicodeFormTest, ParseAndName) {
    EXPECT_EQ(core::parse_unicode_form("nfc"), core::UnicodeForm::NFC);
    EXPECT_EQ(core::parse_unicode_form(" NFD "), core::UnicodeForm::NFD);
    EXPECT_EQ(core::parse_unicode_form("Nfkc"), core::UnicodeForm::NFKC);
    EXPECT_EQ(core::parse_unicode_form("NFKD"), core::UnicodeForm::NFKD);
    EXPECT_FALSE(core::parse_unicode_form("NF").has_value());
    EXPECT_FALSE(core::parse_unicode_form("NFX").has_value());
    EXPECT_FALSE(core::parse_unicode_form("").has_value());

    EXPECT_STREQ(core::unicode_form_name(core::UnicodeForm::NFKC), "NFKC");
}

} // namespace
