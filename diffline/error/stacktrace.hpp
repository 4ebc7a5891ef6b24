/*
 * stacktrace.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-18

Description: Captures the call stack attached to diffline exceptions

**************************************************/

#ifndef DIFFLINE_ERROR_STACKTRACE_HPP
#define DIFFLINE_ERROR_STACKTRACE_HPP

#include <cstdlib>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace diffline::error {

/**
 * @brief Captures the stack of the current thread at construction time.
 *
 * Symbols are resolved lazily in toString(), so constructing a StackTrace
 * only costs the backtrace() walk.
 */
class StackTrace {
public:
    StackTrace();

    /**
     * @brief Get the string representation of the captured frames.
     */
    [[nodiscard]] auto toString() const -> std::string;

private:
    void capture();

    [[nodiscard]] auto processFrame(void* frame, int frameIndex) const
        -> std::string;

#if defined(__APPLE__) || defined(__linux__)
    std::shared_ptr<char*> symbols_;  ///< Shared so exceptions stay copyable
    std::vector<void*> frames_;
    int num_frames_ = 0;
    mutable std::unordered_map<void*, std::string> symbolCache_;
#endif
};

}  // namespace diffline::error

#endif  // DIFFLINE_ERROR_STACKTRACE_HPP
