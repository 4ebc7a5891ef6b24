/*
 * region.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-19

Description: Clustered difference regions and the lines they form

**************************************************/

#ifndef DIFFLINE_DIFF_REGION_HPP
#define DIFFLINE_DIFF_REGION_HPP

#include <optional>
#include <string>
#include <vector>

#include "diffline/image/geometry.hpp"
#include "diffline/type/numeric.hpp"

namespace diffline::diff {

/**
 * @brief One connected blob of changed pixels.
 *
 * pixelCount and center describe the changed pixels themselves, not the
 * dilated component that grouped them, so center is the centroid of the
 * mask pixels rather than the middle of boundingBox.
 */
struct DiffRegion {
    i32 id = 0;
    image::BoundingBox boundingBox;
    usize pixelCount = 0;
    image::Point center;

    auto operator==(const DiffRegion&) const -> bool = default;
};

/**
 * @brief Regions sharing one horizontal text line, left to right.
 */
struct LineGroup {
    i32 lineIndex = 0;
    std::vector<DiffRegion> regions;
    image::BoundingBox boundingBox;
    std::optional<std::string> recognizedText;

    /**
     * @brief Mean of the member regions' center.y; 0 for an empty line.
     */
    [[nodiscard]] auto meanCenterY() const -> f64 {
        if (regions.empty()) {
            return 0.0;
        }
        f64 sum = 0.0;
        for (const auto& region : regions) {
            sum += region.center.y;
        }
        return sum / static_cast<f64>(regions.size());
    }

    auto operator==(const LineGroup&) const -> bool = default;
};

}  // namespace diffline::diff

#endif  // DIFFLINE_DIFF_REGION_HPP
