#include <gtest/gtest.h>

#include "util/log.hpp"

namespace {

class LogLevelTest : public ::testing::Test {
protected:
    void SetUp() override { saved_ = util::log_level(); }
    void TearDown() override { util::set_log_level(saved_); }

    util::LogLevel saved_{util::LogLevel::Warn};
};

TEST_F(LogLevelTest, DefaultIsWarn) {
    util::set_log_level(util::LogLevel::Warn);
    EXPECT_FALSE(util::log_enabled(util::LogLevel::Debug));
    EXPECT_FALSE(util::log_enabled(util::LogLevel::Info));
    EXPECT_TRUE(util::log_enabled(util::LogLevel::Warn));
    EXPECT_TRUE(util::log_enabled(util::LogLevel::Error));
}

TEST_F(LogLevelTest, LoweringThresholdEnablesDebug) {
    util::set_log_level(util::LogLevel::Debug);
    EXPECT_EQ(util::log_level(), util::LogLevel::Debug);
    EXPECT_TRUE(util::log_enabled(util::LogLevel::Debug));
    EXPECT_FALSE(util::log_enabled(util::LogLevel::Trace));
}

TEST_F(LogLevelTest, FilteredMessagesAreDropped) {
    util::set_log_level(util::LogLevel::Error);
    ::testing::internal::CaptureStderr();
    LOG_SLOW_WARN("should not appear %d", 1);
    LOG_SLOW_ERROR("visible %s", "line");
    const std::string err = ::testing::internal::GetCapturedStderr();
    EXPECT_EQ(err.find("should not appear"), std::string::npos);
    EXPECT_NE(err.find("ERROR: visible line"), std::string::npos);
}

TEST(LogLevelParse, AcceptsNamesCaseInsensitively) {
    EXPECT_EQ(util::parse_log_level("debug"), util::LogLevel::Debug);
    EXPECT_EQ(util::parse_log_level("INFO"), util::LogLevel::Info);
    EXPECT_EQ(util::parse_log_level("Warning"), util::LogLevel::Warn);
    EXPECT_EQ(util::parse_log_level("error"), util::LogLevel::Error);
    EXPECT_EQ(util::parse_log_level("trace"), util::LogLevel::Trace);
}

TEST(LogLevelParse, RejectsUnknown) {
    EXPECT_FALSE(util::parse_log_level("").has_value());
    EXPECT_FALSE(util::parse_log_level("verbose").has_value());
    EXPECT_FALSE(util::parse_log_level("warningsss").has_value());
}

} // namespace
