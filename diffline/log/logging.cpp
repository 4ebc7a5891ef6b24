/*
 * logging.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "logging.hpp"

#include <algorithm>
#include <cctype>

#include <spdlog/spdlog.h>

#include "diffline/error/exception.hpp"

namespace diffline::log {

auto parseLogLevel(std::string_view levelStr) -> spdlog::level::level_enum {
    std::string level(levelStr);
    std::transform(level.begin(), level.end(), level.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (level == "trace") {
        return spdlog::level::trace;
    }
    if (level == "debug") {
        return spdlog::level::debug;
    }
    if (level == "info") {
        return spdlog::level::info;
    }
    if (level == "warn" || level == "warning") {
        return spdlog::level::warn;
    }
    if (level == "error" || level == "err") {
        return spdlog::level::err;
    }
    if (level == "critical" || level == "fatal") {
        return spdlog::level::critical;
    }
    if (level == "off") {
        return spdlog::level::off;
    }
    THROW_INVALID_ARGUMENT("Unknown log level '{}'", levelStr);
}

void configureLogging(const LoggingConfig& config) {
    spdlog::set_level(parseLogLevel(config.level));
    if (!config.pattern.empty()) {
        spdlog::set_pattern(config.pattern);
    }
    spdlog::debug("Logging configured: level={}", config.level);
}

}  // namespace diffline::log
