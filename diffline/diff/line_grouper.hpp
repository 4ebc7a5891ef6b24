/*
 * line_grouper.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-20

Description: Group diff regions into horizontal text lines

**************************************************/

#ifndef DIFFLINE_DIFF_LINE_GROUPER_HPP
#define DIFFLINE_DIFF_LINE_GROUPER_HPP

#include <optional>
#include <vector>

#include "diffline/diff/region.hpp"

namespace diffline::diff {

struct LineGroupOptions {
    f64 overlapThreshold = 0.4;
    i32 maxXGap = 55;
    /// Unset means max(30, 0.6 * mean region height).
    std::optional<f64> maxCenterYDiff;
    bool enableLineMerge = true;
    f64 lineMergeCenterYThreshold = 30.0;
    f64 lineMergeOverlapThreshold = 0.3;

    void validate() const;
};

/**
 * @brief Same-line test used to build the union-find classes.
 */
[[nodiscard]] auto isSameLine(const DiffRegion& a, const DiffRegion& b,
                              const LineGroupOptions& options,
                              f64 maxCenterYDiff) -> bool;

/**
 * @brief Whether two whole lines should be fused by the merge pass.
 */
[[nodiscard]] auto shouldMergeLines(const LineGroup& a, const LineGroup& b,
                                    const LineGroupOptions& options) -> bool;

[[nodiscard]] auto defaultMaxCenterYDiff(const std::vector<DiffRegion>& regions)
    -> f64;

class LineGrouper {
public:
    explicit LineGrouper(LineGroupOptions options = {});

    /**
     * @brief Group regions into lines, ordered top to bottom.
     *
     * Pairs accepted by isSameLine are closed transitively, then adjacent
     * lines are merged (if enabled) and lines with wide horizontal holes
     * are split. Regions in each line run left to right and lineIndex
     * follows mean member center.y.
     */
    [[nodiscard]] auto group(const std::vector<DiffRegion>& regions) const
        -> std::vector<LineGroup>;

    /**
     * @brief The union-find classes alone, before merge and split.
     */
    [[nodiscard]] auto initialGroups(const std::vector<DiffRegion>& regions)
        const -> std::vector<LineGroup>;

    [[nodiscard]] auto mergeLines(std::vector<LineGroup> lines) const
        -> std::vector<LineGroup>;

    [[nodiscard]] auto splitLines(const std::vector<LineGroup>& lines) const
        -> std::vector<LineGroup>;

    [[nodiscard]] auto options() const noexcept -> const LineGroupOptions& {
        return options_;
    }

private:
    LineGroupOptions options_;
};

[[nodiscard]] auto groupByLine(const std::vector<DiffRegion>& regions,
                               const LineGroupOptions& options = {})
    -> std::vector<LineGroup>;

}  // namespace diffline::diff

#endif  // DIFFLINE_DIFF_LINE_GROUPER_HPP
