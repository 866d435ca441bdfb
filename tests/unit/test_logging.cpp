/**
 * @file test_logging.cpp
 * @brief Unit tests for host-routable logging.
 */

#include <gtest/gtest.h>
#include <vcxbridge/logging.h>

#include <string>
#include <vector>

using namespace vcxbridge;

namespace {

struct CapturedLine {
    vcxbridge_log_level level;
    std::string subsystem;
    std::string message;
};

void capture(vcxbridge_log_level level, const char* subsystem, const char* message,
             void* userdata) {
    static_cast<std::vector<CapturedLine>*>(userdata)->push_back({level, subsystem, message});
}

} // namespace

class LoggingTest : public ::testing::Test {
protected:
    void SetUp() override {
        saved_level_ = vcxbridge_get_log_level();
        vcxbridge_set_log_callback(&capture, &lines_);
        vcxbridge_set_log_level(VCXBRIDGE_LOG_LEVEL_TRACE);
    }

    void TearDown() override {
        vcxbridge_set_log_callback(nullptr, nullptr);
        vcxbridge_set_log_level(saved_level_);
    }

    std::vector<CapturedLine> lines_;
    vcxbridge_log_level saved_level_ = VCXBRIDGE_LOG_LEVEL_INFO;
};

TEST_F(LoggingTest, MacrosRouteToHostCallback) {
    VCXBRIDGE_LOG_WARN("BRIDGE", "token %u dropped", 42u);

    ASSERT_EQ(lines_.size(), 1u);
    EXPECT_EQ(lines_[0].level, VCXBRIDGE_LOG_LEVEL_WARN);
    EXPECT_EQ(lines_[0].subsystem, "BRIDGE");
    EXPECT_EQ(lines_[0].message, "token 42 dropped");
}

TEST_F(LoggingTest, LevelFiltersMessages) {
    vcxbridge_set_log_level(VCXBRIDGE_LOG_LEVEL_WARN);

    VCXBRIDGE_LOG_ERROR("RUNTIME", "kept");
    VCXBRIDGE_LOG_INFO("RUNTIME", "dropped");
    VCXBRIDGE_LOG_TRACE("RUNTIME", "dropped");

    ASSERT_EQ(lines_.size(), 1u);
    EXPECT_EQ(lines_[0].message, "kept");
    EXPECT_TRUE(VCXBRIDGE_LOG_LEVEL_ENABLED(Warn));
    EXPECT_FALSE(VCXBRIDGE_LOG_LEVEL_ENABLED(Debug));
}

TEST_F(LoggingTest, RawMessagesAreTruncatedNotOverflowed) {
    const std::string huge(4096, 'x');
    VCXBRIDGE_LOG_RAW(Info, "HANDLES", huge);

    ASSERT_EQ(lines_.size(), 1u);
    EXPECT_LT(lines_[0].message.size(), huge.size());
    EXPECT_EQ(lines_[0].message.find_first_not_of('x'), std::string::npos);
}

TEST_F(LoggingTest, LevelNames) {
    EXPECT_STREQ(log_level_name(LogLevel::Error), "ERROR");
    EXPECT_STREQ(log_level_name(LogLevel::Warn), "WARN");
    EXPECT_STREQ(log_level_name(LogLevel::Info), "INFO");
    EXPECT_STREQ(log_level_name(LogLevel::Debug), "DEBUG");
    EXPECT_STREQ(log_level_name(LogLevel::Trace), "TRACE");
}
