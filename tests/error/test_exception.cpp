#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <thread>

#include "diffline/error/exception.hpp"

using namespace diffline::error;

namespace {

[[noreturn]] void failWithCount(int count) {
    THROW_INVALID_ARGUMENT("Bad count {}", count);
}

}  // namespace

TEST(ExceptionTest, MacroRecordsLocationAndMessage) {
    try {
        THROW_RUNTIME_ERROR("Something broke: {} of {}", 3, "items");
        FAIL() << "Expected RuntimeError";
    } catch (const RuntimeError& e) {
        EXPECT_EQ(e.getMessage(), "Something broke: 3 of items");
        EXPECT_NE(e.getFile().find("test_exception.cpp"), std::string::npos);
        EXPECT_GT(e.getLine(), 0);
        EXPECT_EQ(e.getFunction(), "TestBody");
        EXPECT_EQ(e.getThreadId(), std::this_thread::get_id());
    }
}

TEST(ExceptionTest, WhatContainsFullReport) {
    try {
        failWithCount(-1);
        FAIL() << "Expected InvalidArgument";
    } catch (const Exception& e) {
        const std::string report = e.what();
        EXPECT_EQ(report.rfind(e.brief(), 0), 0u);
        EXPECT_NE(report.find("stack trace:"), std::string::npos);
        EXPECT_NE(report.find("thread "), std::string::npos);

        EXPECT_EQ(e.location(), e.getFile() + ":" +
                                    std::to_string(e.getLine()) +
                                    " in failWithCount()");
        EXPECT_EQ(e.brief(), e.location() + ": Bad count -1");
    }
}

TEST(ExceptionTest, MessageOfStripsTheReport) {
    try {
        failWithCount(7);
    } catch (const std::exception& e) {
        EXPECT_EQ(messageOf(e), "Bad count 7");
    }
    EXPECT_EQ(messageOf(std::runtime_error("plain")), "plain");
}

TEST(ExceptionTest, SubclassesAreCatchableAsStdException) {
    EXPECT_THROW(THROW_FILE_NOT_READABLE("missing {}", "a.json"),
                 std::exception);
    EXPECT_THROW(THROW_INVALID_ARGUMENT("nope"), Exception);
}
