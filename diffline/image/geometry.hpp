/*
 * geometry.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-18

Description: Pixel-space points and bounding boxes

**************************************************/

#ifndef DIFFLINE_IMAGE_GEOMETRY_HPP
#define DIFFLINE_IMAGE_GEOMETRY_HPP

#include <algorithm>

#include "diffline/type/numeric.hpp"

namespace diffline::image {

/**
 * @brief Integer pixel coordinate, top-left origin.
 */
struct Point {
    i32 x = 0;
    i32 y = 0;

    constexpr auto operator==(const Point&) const -> bool = default;
};

/**
 * @brief Axis-aligned box in pixel space.
 *
 * right() and bottom() are exclusive, so a box at x=10 with width 20 spans
 * columns 10..29 and right() == 30.
 */
struct BoundingBox {
    i32 x = 0;
    i32 y = 0;
    i32 width = 0;
    i32 height = 0;

    [[nodiscard]] constexpr auto right() const noexcept -> i32 {
        return x + width;
    }
    [[nodiscard]] constexpr auto bottom() const noexcept -> i32 {
        return y + height;
    }
    [[nodiscard]] constexpr auto area() const noexcept -> i64 {
        return static_cast<i64>(width) * height;
    }
    [[nodiscard]] constexpr auto centerY() const noexcept -> f64 {
        return y + height / 2.0;
    }
    [[nodiscard]] constexpr auto empty() const noexcept -> bool {
        return width <= 0 || height <= 0;
    }

    /**
     * @brief Smallest box covering both boxes. An empty operand is ignored.
     */
    [[nodiscard]] constexpr auto unite(const BoundingBox& other) const noexcept
        -> BoundingBox {
        if (empty()) {
            return other;
        }
        if (other.empty()) {
            return *this;
        }
        const i32 left = std::min(x, other.x);
        const i32 top = std::min(y, other.y);
        return {left, top, std::max(right(), other.right()) - left,
                std::max(bottom(), other.bottom()) - top};
    }

    constexpr auto operator==(const BoundingBox&) const -> bool = default;
};

/**
 * @brief Horizontal gap between two boxes; 0 when their x-ranges overlap.
 */
[[nodiscard]] constexpr auto horizontalGap(const BoundingBox& a,
                                           const BoundingBox& b) noexcept
    -> i32 {
    return std::max(0, std::max(a.x - b.right(), b.x - a.right()));
}

/**
 * @brief Height of the shared part of the two boxes' y-ranges.
 */
[[nodiscard]] constexpr auto verticalOverlap(const BoundingBox& a,
                                             const BoundingBox& b) noexcept
    -> i32 {
    return std::max(0, std::min(a.bottom(), b.bottom()) - std::max(a.y, b.y));
}

/**
 * @brief True if one box's y-range fully contains the other's.
 */
[[nodiscard]] constexpr auto verticallyNested(const BoundingBox& a,
                                              const BoundingBox& b) noexcept
    -> bool {
    const bool aContainsB = a.y <= b.y && a.bottom() >= b.bottom();
    const bool bContainsA = b.y <= a.y && b.bottom() >= a.bottom();
    return aContainsB || bContainsA;
}

template <typename Range, typename Proj>
[[nodiscard]] auto unionOf(const Range& items, Proj proj) -> BoundingBox {
    BoundingBox result;
    for (const auto& item : items) {
        result = result.unite(proj(item));
    }
    return result;
}

}  // namespace diffline::image

#endif  // DIFFLINE_IMAGE_GEOMETRY_HPP
