#include <gtest/gtest.h>

#include <spdlog/spdlog.h>

#include "diffline/error/exception.hpp"
#include "diffline/log/logging.hpp"

using namespace diffline;
using namespace diffline::log;

class LoggingTest : public ::testing::Test {
protected:
    void TearDown() override { spdlog::set_level(spdlog::level::off); }
};

TEST_F(LoggingTest, ParsesLevelNames) {
    EXPECT_EQ(parseLogLevel("trace"), spdlog::level::trace);
    EXPECT_EQ(parseLogLevel("DEBUG"), spdlog::level::debug);
    EXPECT_EQ(parseLogLevel("Info"), spdlog::level::info);
    EXPECT_EQ(parseLogLevel("warning"), spdlog::level::warn);
    EXPECT_EQ(parseLogLevel("err"), spdlog::level::err);
    EXPECT_EQ(parseLogLevel("fatal"), spdlog::level::critical);
    EXPECT_EQ(parseLogLevel("off"), spdlog::level::off);
}

TEST_F(LoggingTest, UnknownLevelThrows) {
    EXPECT_THROW((void)parseLogLevel("verbose"), error::InvalidArgument);
    EXPECT_THROW((void)parseLogLevel(""), error::InvalidArgument);
}

TEST_F(LoggingTest, ConfigureSetsDefaultLoggerLevel) {
    configureLogging(LoggingConfig{"warn", ""});
    EXPECT_EQ(spdlog::get_level(), spdlog::level::warn);

    EXPECT_THROW(configureLogging(LoggingConfig{"loud", ""}),
                 error::InvalidArgument);
    EXPECT_EQ(spdlog::get_level(), spdlog::level::warn);
}
