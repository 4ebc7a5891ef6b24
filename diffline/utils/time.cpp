/*
 * time.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-21

Description: ISO-8601 timestamp helpers

**************************************************/

#include "time.hpp"

#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

#include "diffline/type/numeric.hpp"

namespace diffline::utils {
namespace {

constexpr int K_MILLISECONDS_IN_SECOND = 1000;
constexpr int K_SECONDS_PER_MINUTE = 60;
constexpr int K_SECONDS_PER_HOUR = 3600;
constexpr usize K_DATE_TIME_LENGTH = 19;  // YYYY-MM-DDTHH:MM:SS

// Safe conversion of time to UTC tm structure
auto safeGmTime(const time_t* time) -> std::optional<std::tm> {
    std::tm result{};
    if (gmtime_r(time, &result) == nullptr) {
        return std::nullopt;
    }
    return result;
}

auto readDigits(std::string_view text, usize pos, usize count)
    -> std::optional<int> {
    if (pos + count > text.size()) {
        return std::nullopt;
    }
    int value = 0;
    for (usize i = pos; i < pos + count; ++i) {
        if (std::isdigit(static_cast<unsigned char>(text[i])) == 0) {
            return std::nullopt;
        }
        value = value * 10 + (text[i] - '0');
    }
    return value;
}

}  // namespace

auto parseIsoTimestamp(std::string_view text) -> std::optional<TimePoint> {
    if (text.size() < K_DATE_TIME_LENGTH) {
        return std::nullopt;
    }

    std::string dateTime(text.substr(0, K_DATE_TIME_LENGTH));
    if (dateTime[10] != 'T' && dateTime[10] != 't' && dateTime[10] != ' ') {
        return std::nullopt;
    }
    dateTime[10] = ' ';

    std::tm tm{};
    std::istringstream stream(dateTime);
    stream >> std::get_time(&tm, "%Y-%m-%d %H:%M:%S");
    if (stream.fail()) {
        return std::nullopt;
    }

    usize pos = K_DATE_TIME_LENGTH;
    int millis = 0;
    if (pos < text.size() && (text[pos] == '.' || text[pos] == ',')) {
        ++pos;
        int scale = 100;
        const usize fractionStart = pos;
        while (pos < text.size() &&
               std::isdigit(static_cast<unsigned char>(text[pos])) != 0) {
            millis += (text[pos] - '0') * scale;
            scale /= 10;
            ++pos;
        }
        if (pos == fractionStart) {
            return std::nullopt;
        }
    }

    int offsetSeconds = 0;
    if (pos < text.size()) {
        const char zone = text[pos];
        if (zone == 'Z' || zone == 'z') {
            ++pos;
        } else if (zone == '+' || zone == '-') {
            const int sign = zone == '+' ? 1 : -1;
            ++pos;
            const auto hours = readDigits(text, pos, 2);
            if (!hours) {
                return std::nullopt;
            }
            pos += 2;
            if (pos < text.size() && text[pos] == ':') {
                ++pos;
            }
            const auto minutes = readDigits(text, pos, 2);
            if (!minutes) {
                return std::nullopt;
            }
            pos += 2;
            offsetSeconds =
                sign * (*hours * K_SECONDS_PER_HOUR +
                        *minutes * K_SECONDS_PER_MINUTE);
        }
    }
    if (pos != text.size()) {
        return std::nullopt;
    }

    const time_t seconds = timegm(&tm);
    if (seconds == static_cast<time_t>(-1)) {
        return std::nullopt;
    }
    return std::chrono::system_clock::from_time_t(seconds - offsetSeconds) +
           std::chrono::milliseconds(millis);
}

auto toIsoTimestamp(TimePoint time) -> std::string {
    using namespace std::chrono;

    const auto sinceEpoch = duration_cast<milliseconds>(time.time_since_epoch());
    auto ms = sinceEpoch.count() % K_MILLISECONDS_IN_SECOND;
    auto seconds = static_cast<time_t>(sinceEpoch.count() /
                                       K_MILLISECONDS_IN_SECOND);
    if (ms < 0) {
        ms += K_MILLISECONDS_IN_SECOND;
        --seconds;
    }

    const auto timeInfo = safeGmTime(&seconds);
    if (!timeInfo) {
        THROW_TIME_CONVERT_ERROR("Failed to convert {} to UTC", seconds);
    }

    std::ostringstream stream;
    stream << std::put_time(&*timeInfo, "%Y-%m-%dT%H:%M:%S") << '.'
           << std::setfill('0') << std::setw(3) << ms << 'Z';
    return stream.str();
}

}  // namespace diffline::utils
