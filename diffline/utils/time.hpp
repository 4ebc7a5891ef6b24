/*
 * time.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-21

Description: ISO-8601 timestamp helpers

**************************************************/

#ifndef DIFFLINE_UTILS_TIME_HPP
#define DIFFLINE_UTILS_TIME_HPP

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

#include "diffline/error/exception.hpp"

namespace diffline::utils {

class TimeConvertException : public error::Exception {
public:
    using error::Exception::Exception;
};

#define THROW_TIME_CONVERT_ERROR(...)                           \
    throw diffline::utils::TimeConvertException(                \
        DIFFLINE_FILE_NAME, DIFFLINE_FILE_LINE, DIFFLINE_FUNC_NAME, \
        __VA_ARGS__)

using TimePoint = std::chrono::system_clock::time_point;

/**
 * @brief Parse an ISO-8601 timestamp into a UTC time point.
 *
 * Accepts "2024-12-21T10:00:00Z", "2024-12-21T10:00:00.123Z",
 * "2024-12-21 10:00:00+00:00" and "+0800"-style offsets. A missing zone
 * means UTC. Fractions are kept to millisecond precision.
 *
 * @return std::nullopt if the text is not a timestamp.
 */
[[nodiscard]] auto parseIsoTimestamp(std::string_view text)
    -> std::optional<TimePoint>;

/**
 * @brief Format a time point as "YYYY-MM-DDTHH:MM:SS.mmmZ".
 * @throws TimeConvertException if the time cannot be broken down.
 */
[[nodiscard]] auto toIsoTimestamp(TimePoint time) -> std::string;

}  // namespace diffline::utils

#endif  // DIFFLINE_UTILS_TIME_HPP
