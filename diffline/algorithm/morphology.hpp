/*
 * morphology.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-18

Description: Square-element erosion and dilation on binary masks

**************************************************/

#ifndef DIFFLINE_ALGORITHM_MORPHOLOGY_HPP
#define DIFFLINE_ALGORITHM_MORPHOLOGY_HPP

#include "diffline/algorithm/binary_mask.hpp"

namespace diffline::algorithm {

/**
 * @brief Keep a foreground pixel only if its whole (2r+1)x(2r+1)
 * neighborhood is foreground.
 *
 * Cells outside the mask count as background, so pixels closer than radius
 * to the border never survive. Radius 0 returns the input unchanged.
 *
 * @throws error::InvalidArgument if radius is negative.
 */
[[nodiscard]] auto erode(const BinaryMask& mask, i32 radius) -> BinaryMask;

/**
 * @brief Spread every foreground pixel over its (2r+1)x(2r+1)
 * neighborhood, clipped to the mask. Radius 0 returns the input unchanged.
 *
 * @throws error::InvalidArgument if radius is negative.
 */
[[nodiscard]] auto dilate(const BinaryMask& mask, i32 radius) -> BinaryMask;

}  // namespace diffline::algorithm

#endif  // DIFFLINE_ALGORITHM_MORPHOLOGY_HPP
