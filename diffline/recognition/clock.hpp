/*
 * clock.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-21

Description: Injectable time source for the polling loop

**************************************************/

#ifndef DIFFLINE_RECOGNITION_CLOCK_HPP
#define DIFFLINE_RECOGNITION_CLOCK_HPP

#include <chrono>

namespace diffline::recognition {

class Clock {
public:
    using time_point = std::chrono::system_clock::time_point;

    virtual ~Clock() = default;

    [[nodiscard]] virtual auto now() const -> time_point = 0;
    virtual void sleepFor(std::chrono::milliseconds duration) = 0;
};

class SystemClock final : public Clock {
public:
    [[nodiscard]] auto now() const -> time_point override;
    void sleepFor(std::chrono::milliseconds duration) override;
};

}  // namespace diffline::recognition

#endif  // DIFFLINE_RECOGNITION_CLOCK_HPP
