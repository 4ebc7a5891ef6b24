/*
 * line_overlay.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-23

Description: Outline each detected line on top of the compared image

**************************************************/

#ifndef DIFFLINE_DIFF_LINE_OVERLAY_HPP
#define DIFFLINE_DIFF_LINE_OVERLAY_HPP

#include <array>
#include <vector>

#include "diffline/diff/region.hpp"
#include "diffline/image/raster.hpp"

namespace diffline::diff {

inline constexpr i32 DEFAULT_OVERLAY_PADDING = 5;
inline constexpr i32 DEFAULT_OVERLAY_LINE_WIDTH = 3;

/// Outline colors, picked by a line's position in the list.
inline constexpr std::array<image::Rgba, 8> LINE_PALETTE{{
    {255, 59, 48, 255},
    {52, 199, 89, 255},
    {0, 122, 255, 255},
    {255, 149, 0, 255},
    {175, 82, 222, 255},
    {90, 200, 250, 255},
    {255, 45, 85, 255},
    {88, 86, 214, 255},
}};

[[nodiscard]] constexpr auto lineColor(usize position) noexcept -> image::Rgba {
    return LINE_PALETTE[position % LINE_PALETTE.size()];
}

/**
 * @brief The box padded by padding on every side, with its origin clamped
 * to the image and its size clamped to what is left of it.
 */
[[nodiscard]] auto overlayBox(const image::BoundingBox& box, i32 imageWidth,
                              i32 imageHeight, i32 padding)
    -> image::BoundingBox;

/**
 * @brief Copy of source with a lineWidth-thick outline drawn just inside
 * the overlayBox of every line.
 *
 * @throws error::InvalidArgument on negative padding or lineWidth < 1.
 */
[[nodiscard]] auto renderLineOverlay(const image::RasterBuffer& source,
                                     const std::vector<LineGroup>& lines,
                                     i32 padding = DEFAULT_OVERLAY_PADDING,
                                     i32 lineWidth = DEFAULT_OVERLAY_LINE_WIDTH)
    -> image::RasterBuffer;

}  // namespace diffline::diff

#endif  // DIFFLINE_DIFF_LINE_OVERLAY_HPP
