#include <airgap/core/logger.hpp>

#include <gtest/gtest.h>

#include <cstdio>
#include <string>

using namespace airgap;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        saved_level_ = Logger::instance().level();
        file_ = tmpfile();
        ASSERT_TRUE(file_ != NULL);
        Logger::instance().set_output(file_);
        Logger::instance().set_color(false);
    }

    void TearDown() override {
        Logger::instance().set_output(NULL);
        Logger::instance().set_level(saved_level_);
        if (file_) fclose(file_);
    }

    std::string contents() {
        fflush(file_);
        rewind(file_);
        std::string out;
        char buf[512];
        size_t n;
        while ((n = fread(buf, 1, sizeof(buf), file_)) > 0) {
            out.append(buf, n);
        }
        return out;
    }

    FILE* file_;
    LogLevel saved_level_;
};

TEST_F(LoggerTest, FiltersBelowLevel) {
    Logger::instance().set_level(LogLevel::WARN);
    LOG_INFO("hidden %d", 1);
    LOG_WARN("shown %d", 2);

    std::string out = contents();
    EXPECT_EQ(out.find("hidden"), std::string::npos);
    EXPECT_NE(out.find("[WARN] shown 2"), std::string::npos);
}

TEST_F(LoggerTest, DebugIncludesSourceLocation) {
    Logger::instance().set_level(LogLevel::DEBUG);
    LOG_DEBUG("details");

    std::string out = contents();
    EXPECT_NE(out.find("[DEBUG]"), std::string::npos);
    EXPECT_NE(out.find("test_logger.cpp:"), std::string::npos);
    EXPECT_EQ(out.find("\033["), std::string::npos);
}

TEST(LogLevelTest, ParsesNames) {
    LogLevel level = LogLevel::INFO;
    EXPECT_TRUE(parse_log_level("debug", level));
    EXPECT_EQ(level, LogLevel::DEBUG);
    EXPECT_TRUE(parse_log_level(" Warning ", level));
    EXPECT_EQ(level, LogLevel::WARN);
    EXPECT_TRUE(parse_log_level("ERROR", level));
    EXPECT_EQ(level, LogLevel::ERROR);

    EXPECT_FALSE(parse_log_level("verbose", level));
    EXPECT_EQ(level, LogLevel::ERROR);

    EXPECT_STREQ(log_level_name(LogLevel::INFO), "INFO");
}
