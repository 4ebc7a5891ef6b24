/*
 * line_preview.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-21

Description: Render the changed pixels of one line onto a clean canvas

**************************************************/

#ifndef DIFFLINE_DIFF_LINE_PREVIEW_HPP
#define DIFFLINE_DIFF_LINE_PREVIEW_HPP

#include "diffline/image/raster.hpp"

namespace diffline::diff {

inline constexpr i32 DEFAULT_PREVIEW_PADDING = 5;
inline constexpr image::Rgba DEFAULT_CONTENT_COLOR{128, 128, 128, 255};

struct LinePreview {
    image::RasterBuffer image;
    image::Rgba contentColor = DEFAULT_CONTENT_COLOR;
    usize contentPixels = 0;
};

/**
 * @brief Build the image that is sent for recognition of one line.
 *
 * The canvas is white and (box.width + 2 * padding) x (box.height + 2 *
 * padding). Pixels that are set in diffMask inside box are copied from
 * source, so only the new text survives. contentColor is the most common
 * color among those pixels after quantizing each channel down to a
 * multiple of 16; ties go to the color met first in row-major order.
 *
 * @throws DimensionMismatch if source and diffMask differ in size.
 * @throws error::InvalidArgument on negative padding or an empty box.
 */
[[nodiscard]] auto renderLinePreview(const image::RasterBuffer& source,
                                     const image::RasterBuffer& diffMask,
                                     const image::BoundingBox& box,
                                     i32 padding = DEFAULT_PREVIEW_PADDING)
    -> LinePreview;

}  // namespace diffline::diff

#endif  // DIFFLINE_DIFF_LINE_PREVIEW_HPP
