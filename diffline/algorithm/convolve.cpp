/*
 * convolve.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-18

Description: Implementation of 3x3 correlation, Sobel magnitude and windowed
variance.

**************************************************/

#include "convolve.hpp"

#include <algorithm>
#include <cmath>

namespace diffline::algorithm {

namespace {
void validatePlane(std::span<const f64> plane, i32 width, i32 height) {
    if (width < 0 || height < 0) {
        THROW_CONVOLVE_ERROR("Negative plane dimensions: {}x{}", width,
                             height);
    }
    const usize expected =
        static_cast<usize>(width) * static_cast<usize>(height);
    if (plane.size() != expected) {
        THROW_CONVOLVE_ERROR("Plane has {} cells, expected {}x{} = {}",
                             plane.size(), width, height, expected);
    }
}

// Rounding noise on flat areas; real luma texture is orders of magnitude
// above this.
constexpr f64 VARIANCE_EPSILON = 1e-6;

inline auto cellIndex(i32 x, i32 y, i32 width) -> usize {
    return static_cast<usize>(y) * static_cast<usize>(width) +
           static_cast<usize>(x);
}
}  // namespace

auto convolve3x3(std::span<const f64> plane, i32 width, i32 height,
                 const Kernel3x3& kernel) -> std::vector<f64> {
    validatePlane(plane, width, height);
    std::vector<f64> output(plane.size(), 0.0);

    for (i32 y = 1; y < height - 1; ++y) {
        for (i32 x = 1; x < width - 1; ++x) {
            f64 sum = 0.0;
            for (i32 ky = -1; ky <= 1; ++ky) {
                for (i32 kx = -1; kx <= 1; ++kx) {
                    sum += plane[cellIndex(x + kx, y + ky, width)] *
                           kernel[static_cast<usize>(ky + 1)]
                                 [static_cast<usize>(kx + 1)];
                }
            }
            output[cellIndex(x, y, width)] = sum;
        }
    }
    return output;
}

auto gradientMagnitude(std::span<const f64> plane, i32 width, i32 height)
    -> std::vector<u8> {
    const auto gx = convolve3x3(plane, width, height, SOBEL_X);
    const auto gy = convolve3x3(plane, width, height, SOBEL_Y);

    std::vector<u8> magnitude(plane.size(), 0);
    for (usize i = 0; i < magnitude.size(); ++i) {
        const f64 value = std::round(std::sqrt(gx[i] * gx[i] + gy[i] * gy[i]));
        magnitude[i] = static_cast<u8>(std::min(255.0, value));
    }
    return magnitude;
}

auto localVariance(std::span<const f64> plane, i32 width, i32 height,
                   i32 windowSize) -> std::vector<f64> {
    validatePlane(plane, width, height);
    if (windowSize <= 0 || windowSize % 2 == 0) {
        THROW_CONVOLVE_ERROR("Window size must be a positive odd number, got {}",
                             windowSize);
    }

    const i32 half = windowSize / 2;
    const f64 count = static_cast<f64>(windowSize) * windowSize;
    std::vector<f64> variance(plane.size(), 0.0);

    for (i32 y = half; y < height - half; ++y) {
        for (i32 x = half; x < width - half; ++x) {
            f64 sum = 0.0;
            for (i32 ky = -half; ky <= half; ++ky) {
                for (i32 kx = -half; kx <= half; ++kx) {
                    sum += plane[cellIndex(x + kx, y + ky, width)];
                }
            }
            const f64 mean = sum / count;
            f64 squares = 0.0;
            for (i32 ky = -half; ky <= half; ++ky) {
                for (i32 kx = -half; kx <= half; ++kx) {
                    const f64 d = plane[cellIndex(x + kx, y + ky, width)] - mean;
                    squares += d * d;
                }
            }
            const f64 value = squares / count;
            variance[cellIndex(x, y, width)] =
                value < VARIANCE_EPSILON ? 0.0 : value;
        }
    }
    return variance;
}

}  // namespace diffline::algorithm
