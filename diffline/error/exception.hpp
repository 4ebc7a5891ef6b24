/*
 * exception.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-18

Description: Exception hierarchy carrying source location and stack trace

**************************************************/

#ifndef DIFFLINE_ERROR_EXCEPTION_HPP
#define DIFFLINE_ERROR_EXCEPTION_HPP

#include <exception>
#include <string>
#include <thread>
#include <utility>

#include <fmt/format.h>

#include "diffline/error/stacktrace.hpp"

#define DIFFLINE_FILE_NAME __FILE__
#define DIFFLINE_FILE_LINE __LINE__
#define DIFFLINE_FUNC_NAME __func__

namespace diffline::error {

/**
 * @brief Base exception of the library.
 *
 * Records where it was thrown, from which thread, and the call stack at the
 * throw site. The message is built with fmt, so every THROW_* macro takes a
 * format string followed by its arguments.
 */
class Exception : public std::exception {
public:
    template <typename... Args>
    Exception(const char* file, int line, const char* func,
              fmt::format_string<Args...> format, Args&&... args)
        : file_(file),
          line_(line),
          func_(func),
          message_(fmt::format(format, std::forward<Args>(args)...)),
          thread_id_(std::this_thread::get_id()) {}

    /**
     * @brief Full report: location, message, thread and stack trace.
     */
    [[nodiscard]] auto what() const noexcept -> const char* override;

    /// "file:line in func(): message", one line for logs.
    [[nodiscard]] auto brief() const -> std::string;
    [[nodiscard]] auto location() const -> std::string;

    [[nodiscard]] auto getFile() const -> std::string;
    [[nodiscard]] auto getLine() const -> int;
    [[nodiscard]] auto getFunction() const -> std::string;
    [[nodiscard]] auto getMessage() const -> std::string;
    [[nodiscard]] auto getThreadId() const -> std::thread::id;

private:
    std::string file_;
    int line_;
    std::string func_;
    std::string message_;
    mutable std::string full_message_;
    std::thread::id thread_id_;
    StackTrace stack_trace_;
};

class RuntimeError : public Exception {
public:
    using Exception::Exception;
};

class InvalidArgument : public Exception {
public:
    using Exception::Exception;
};

class FileNotReadable : public Exception {
public:
    using Exception::Exception;
};

/**
 * @brief The bare message of e, without the report what() adds for
 * diffline exceptions. Used where one error is folded into another.
 */
[[nodiscard]] auto messageOf(const std::exception& e) -> std::string;

}  // namespace diffline::error

#define THROW_EXCEPTION(...)                                               \
    throw diffline::error::Exception(DIFFLINE_FILE_NAME, DIFFLINE_FILE_LINE, \
                                     DIFFLINE_FUNC_NAME, __VA_ARGS__)

#define THROW_RUNTIME_ERROR(...)                                       \
    throw diffline::error::RuntimeError(DIFFLINE_FILE_NAME,            \
                                        DIFFLINE_FILE_LINE,            \
                                        DIFFLINE_FUNC_NAME, __VA_ARGS__)

#define THROW_INVALID_ARGUMENT(...)                                       \
    throw diffline::error::InvalidArgument(DIFFLINE_FILE_NAME,            \
                                           DIFFLINE_FILE_LINE,            \
                                           DIFFLINE_FUNC_NAME, __VA_ARGS__)

#define THROW_FILE_NOT_READABLE(...)                                      \
    throw diffline::error::FileNotReadable(DIFFLINE_FILE_NAME,            \
                                           DIFFLINE_FILE_LINE,            \
                                           DIFFLINE_FUNC_NAME, __VA_ARGS__)

#endif  // DIFFLINE_ERROR_EXCEPTION_HPP
