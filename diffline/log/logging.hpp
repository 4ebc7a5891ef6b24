/*
 * logging.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-22

Description: Process-wide spdlog setup

**************************************************/

#ifndef DIFFLINE_LOG_LOGGING_HPP
#define DIFFLINE_LOG_LOGGING_HPP

#include <string>
#include <string_view>

#include <spdlog/common.h>

namespace diffline::log {

struct LoggingConfig {
    std::string level = "info";
    std::string pattern;  ///< Empty keeps spdlog's default pattern
};

/**
 * @brief Map a level name ("trace", "debug", "info", "warn"/"warning",
 * "error"/"err", "critical"/"fatal", "off"), case-insensitive.
 * @throws error::InvalidArgument for anything else.
 */
[[nodiscard]] auto parseLogLevel(std::string_view level)
    -> spdlog::level::level_enum;

/**
 * @brief Apply level and pattern to the default logger.
 */
void configureLogging(const LoggingConfig& config);

}  // namespace diffline::log

#endif  // DIFFLINE_LOG_LOGGING_HPP
