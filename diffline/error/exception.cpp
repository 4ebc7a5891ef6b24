/*
 * exception.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-18

Description: Exception hierarchy carrying source location and stack trace

**************************************************/

#include "exception.hpp"

#include <fmt/ostream.h>

namespace diffline::error {

auto Exception::what() const noexcept -> const char* {
    if (full_message_.empty()) {
        full_message_ = fmt::format("{}\n  thread {}\n  stack trace:\n{}",
                                    brief(), fmt::streamed(thread_id_),
                                    stack_trace_.toString());
    }
    return full_message_.c_str();
}

auto Exception::brief() const -> std::string {
    return fmt::format("{}: {}", location(), message_);
}

auto Exception::location() const -> std::string {
    return fmt::format("{}:{} in {}()", file_, line_, func_);
}

auto Exception::getFile() const -> std::string { return file_; }
auto Exception::getLine() const -> int { return line_; }
auto Exception::getFunction() const -> std::string { return func_; }
auto Exception::getMessage() const -> std::string { return message_; }
auto Exception::getThreadId() const -> std::thread::id { return thread_id_; }

auto messageOf(const std::exception& e) -> std::string {
    if (const auto* own = dynamic_cast<const Exception*>(&e)) {
        return own->getMessage();
    }
    return e.what();
}

}  // namespace diffline::error
