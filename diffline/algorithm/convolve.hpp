/*
 * convolve.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-18

Description: Small-kernel filters over single-channel planes

**************************************************/

#ifndef DIFFLINE_ALGORITHM_CONVOLVE_HPP
#define DIFFLINE_ALGORITHM_CONVOLVE_HPP

#include <array>
#include <span>
#include <vector>

#include "diffline/error/exception.hpp"
#include "diffline/type/numeric.hpp"

namespace diffline::algorithm {
class ConvolveError : public diffline::error::Exception {
public:
    using Exception::Exception;
};

#define THROW_CONVOLVE_ERROR(...)                                           \
    throw diffline::algorithm::ConvolveError(                               \
        DIFFLINE_FILE_NAME, DIFFLINE_FILE_LINE, DIFFLINE_FUNC_NAME, __VA_ARGS__)

/**
 * @brief 3x3 kernel, indexed [row][column].
 */
using Kernel3x3 = std::array<std::array<f64, 3>, 3>;

inline constexpr Kernel3x3 SOBEL_X{{{-1, 0, 1}, {-2, 0, 2}, {-1, 0, 1}}};
inline constexpr Kernel3x3 SOBEL_Y{{{-1, -2, -1}, {0, 0, 0}, {1, 2, 1}}};

/**
 * @brief Correlate a row-major plane with a 3x3 kernel.
 *
 * Only cells whose full neighborhood lies inside the plane are computed;
 * the one-pixel border is left at 0.
 *
 * @throws ConvolveError if plane.size() != width * height.
 */
[[nodiscard]] auto convolve3x3(std::span<const f64> plane, i32 width,
                               i32 height, const Kernel3x3& kernel)
    -> std::vector<f64>;

/**
 * @brief Sobel gradient magnitude, rounded and clamped to [0, 255].
 * Border cells are 0.
 */
[[nodiscard]] auto gradientMagnitude(std::span<const f64> plane, i32 width,
                                     i32 height) -> std::vector<u8>;

/**
 * @brief Population variance over a windowSize x windowSize window centred
 * on each cell.
 *
 * Cells whose window would leave the plane are 0, as are variances below
 * floating-point noise, so a flat plane yields an all-zero field.
 *
 * @throws ConvolveError if windowSize is not a positive odd number or the
 * plane size is inconsistent.
 */
[[nodiscard]] auto localVariance(std::span<const f64> plane, i32 width,
                                 i32 height, i32 windowSize)
    -> std::vector<f64>;

}  // namespace diffline::algorithm

#endif  // DIFFLINE_ALGORITHM_CONVOLVE_HPP
