/*
 * morphology.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "morphology.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

namespace diffline::algorithm {

namespace {
void validateRadius(i32 radius) {
    if (radius < 0) {
        THROW_INVALID_ARGUMENT("Structuring element radius must be >= 0, got {}",
                               radius);
    }
}
}  // namespace

auto erode(const BinaryMask& mask, i32 radius) -> BinaryMask {
    validateRadius(radius);
    if (radius == 0) {
        return mask;
    }
    spdlog::debug("Eroding {}x{} mask with radius {}", mask.width(),
                  mask.height(), radius);

    BinaryMask result(mask.width(), mask.height());
    for (i32 y = radius; y < mask.height() - radius; ++y) {
        for (i32 x = radius; x < mask.width() - radius; ++x) {
            if (!mask.test(x, y)) {
                continue;
            }
            bool allSet = true;
            for (i32 dy = -radius; dy <= radius && allSet; ++dy) {
                for (i32 dx = -radius; dx <= radius; ++dx) {
                    if (!mask.test(x + dx, y + dy)) {
                        allSet = false;
                        break;
                    }
                }
            }
            if (allSet) {
                result.set(x, y);
            }
        }
    }
    return result;
}

auto dilate(const BinaryMask& mask, i32 radius) -> BinaryMask {
    validateRadius(radius);
    if (radius == 0) {
        return mask;
    }
    spdlog::debug("Dilating {}x{} mask with radius {}", mask.width(),
                  mask.height(), radius);

    BinaryMask result = mask;
    for (i32 y = 0; y < mask.height(); ++y) {
        for (i32 x = 0; x < mask.width(); ++x) {
            if (!mask.test(x, y)) {
                continue;
            }
            const i32 top = std::max(0, y - radius);
            const i32 bottom = std::min(mask.height() - 1, y + radius);
            const i32 left = std::max(0, x - radius);
            const i32 right = std::min(mask.width() - 1, x + radius);
            for (i32 ny = top; ny <= bottom; ++ny) {
                for (i32 nx = left; nx <= right; ++nx) {
                    result.set(nx, ny);
                }
            }
        }
    }
    return result;
}

}  // namespace diffline::algorithm
