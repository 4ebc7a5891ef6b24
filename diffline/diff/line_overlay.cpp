/*
 * line_overlay.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "line_overlay.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

#include "diffline/error/exception.hpp"

namespace diffline::diff {

auto overlayBox(const image::BoundingBox& box, i32 imageWidth,
                i32 imageHeight, i32 padding) -> image::BoundingBox {
    const i32 x = std::max(0, box.x - padding);
    const i32 y = std::max(0, box.y - padding);
    return {x, y, std::min(imageWidth - x, box.width + padding * 2),
            std::min(imageHeight - y, box.height + padding * 2)};
}

auto renderLineOverlay(const image::RasterBuffer& source,
                       const std::vector<LineGroup>& lines, i32 padding,
                       i32 lineWidth) -> image::RasterBuffer {
    if (padding < 0) {
        THROW_INVALID_ARGUMENT("Overlay padding must be >= 0, got {}", padding);
    }
    if (lineWidth < 1) {
        THROW_INVALID_ARGUMENT("Overlay line width must be >= 1, got {}",
                               lineWidth);
    }

    spdlog::debug("Outlining {} lines", lines.size());
    image::RasterBuffer overlay = source;
    for (usize i = 0; i < lines.size(); ++i) {
        const auto box = overlayBox(lines[i].boundingBox, source.width(),
                                    source.height(), padding);
        if (box.empty()) {
            continue;
        }

        const auto color = lineColor(i);
        for (i32 y = box.y; y < box.bottom(); ++y) {
            const bool edgeRow =
                y - box.y < lineWidth || box.bottom() - 1 - y < lineWidth;
            for (i32 x = box.x; x < box.right(); ++x) {
                if (edgeRow || x - box.x < lineWidth ||
                    box.right() - 1 - x < lineWidth) {
                    overlay.setPixel(x, y, color);
                }
            }
        }
    }
    return overlay;
}

}  // namespace diffline::diff
