/*
 * clock.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "clock.hpp"

#include <thread>

namespace diffline::recognition {

auto SystemClock::now() const -> time_point {
    return std::chrono::system_clock::now();
}

void SystemClock::sleepFor(std::chrono::milliseconds duration) {
    std::this_thread::sleep_for(duration);
}

}  // namespace diffline::recognition
