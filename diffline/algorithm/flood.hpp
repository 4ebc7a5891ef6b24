/*
 * flood.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-18

Description: Flood fill and connected-component labeling over binary masks

**************************************************/

#ifndef DIFFLINE_ALGORITHM_FLOOD_HPP
#define DIFFLINE_ALGORITHM_FLOOD_HPP

#include <vector>

#include "diffline/algorithm/binary_mask.hpp"
#include "diffline/type/numeric.hpp"

namespace diffline::algorithm {

/**
 * @brief Per-pixel component labels of a mask.
 *
 * Label 0 is background; components are numbered 1..count in the order
 * their first pixel is met in a row-major scan. The numbering is an
 * implementation detail: callers should compare components by the pixels
 * they cover, never by label value.
 */
struct ComponentLabels {
    i32 width = 0;
    i32 height = 0;
    i32 count = 0;
    std::vector<i32> labels;
    std::vector<usize> sizes;  ///< sizes[label - 1] = pixels in component

    [[nodiscard]] auto at(i32 x, i32 y) const noexcept -> i32 {
        return labels[static_cast<usize>(y) * static_cast<usize>(width) +
                      static_cast<usize>(x)];
    }
};

/**
 * @class FloodFill
 * @brief Stack-based 4-connected flood fill (up, down, left, right); no
 * recursion, so component size is bounded only by memory.
 */
class FloodFill {
public:
    /**
     * @brief Assign label to every unlabeled foreground pixel reachable from
     * (startX, startY).
     *
     * @param mask Foreground mask.
     * @param labels Flat label array of mask.size() entries; 0 = unlabeled.
     * @param startX Start column.
     * @param startY Start row.
     * @param label Non-zero label to write.
     * @return Number of pixels labeled; 0 if the start pixel is background or
     * already labeled.
     * @throws error::InvalidArgument If the label array does not match the
     * mask, the start is out of bounds, or label is 0.
     */
    [[nodiscard]] static auto fillDFS(const BinaryMask& mask,
                                      std::vector<i32>& labels, i32 startX,
                                      i32 startY, i32 label) -> usize;

    /**
     * @brief Label every connected component of the mask.
     */
    [[nodiscard]] static auto labelComponents(const BinaryMask& mask)
        -> ComponentLabels;
};

}  // namespace diffline::algorithm

#endif  // DIFFLINE_ALGORITHM_FLOOD_HPP
