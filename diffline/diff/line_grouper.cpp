/*
 * line_grouper.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-20

Description: Group diff regions into horizontal text lines

**************************************************/

#include "line_grouper.hpp"

#include <algorithm>
#include <cmath>

#include <spdlog/spdlog.h>

#include "diffline/algorithm/union_find.hpp"
#include "diffline/error/exception.hpp"

namespace diffline::diff {

namespace {

constexpr f64 MIN_CENTER_Y_DIFF = 30.0;
constexpr f64 CENTER_Y_HEIGHT_FACTOR = 0.6;
constexpr f64 NESTED_CENTER_FACTOR = 0.8;
constexpr f64 LOOSE_CENTER_FACTOR = 0.5;
constexpr f64 STRICT_OVERLAP_FACTOR = 1.5;

auto makeLine(std::vector<DiffRegion> regions) -> LineGroup {
    std::stable_sort(regions.begin(), regions.end(),
                     [](const DiffRegion& lhs, const DiffRegion& rhs) {
                         return lhs.boundingBox.x < rhs.boundingBox.x;
                     });
    LineGroup line;
    line.boundingBox = image::unionOf(
        regions, [](const DiffRegion& r) { return r.boundingBox; });
    line.regions = std::move(regions);
    return line;
}

void sortAndIndex(std::vector<LineGroup>& lines) {
    std::stable_sort(lines.begin(), lines.end(),
                     [](const LineGroup& lhs, const LineGroup& rhs) {
                         return lhs.meanCenterY() < rhs.meanCenterY();
                     });
    for (usize i = 0; i < lines.size(); ++i) {
        lines[i].lineIndex = static_cast<i32>(i);
    }
}

auto smallerHeight(const image::BoundingBox& a, const image::BoundingBox& b)
    -> f64 {
    return static_cast<f64>(std::min(a.height, b.height));
}

}  // namespace

void LineGroupOptions::validate() const {
    if (overlapThreshold < 0.0 || overlapThreshold > 1.0) {
        THROW_INVALID_ARGUMENT("Overlap threshold must be in [0, 1], got {}",
                               overlapThreshold);
    }
    if (maxXGap < 0) {
        THROW_INVALID_ARGUMENT("maxXGap must be >= 0, got {}", maxXGap);
    }
    if (maxCenterYDiff && *maxCenterYDiff < 0.0) {
        THROW_INVALID_ARGUMENT("maxCenterYDiff must be >= 0, got {}",
                               *maxCenterYDiff);
    }
    if (lineMergeCenterYThreshold < 0.0 || lineMergeOverlapThreshold < 0.0) {
        THROW_INVALID_ARGUMENT("Line merge thresholds must be >= 0");
    }
}

auto defaultMaxCenterYDiff(const std::vector<DiffRegion>& regions) -> f64 {
    if (regions.empty()) {
        return MIN_CENTER_Y_DIFF;
    }
    f64 heightSum = 0.0;
    for (const auto& region : regions) {
        heightSum += region.boundingBox.height;
    }
    const f64 meanHeight = heightSum / static_cast<f64>(regions.size());
    return std::max(MIN_CENTER_Y_DIFF, meanHeight * CENTER_Y_HEIGHT_FACTOR);
}

auto isSameLine(const DiffRegion& a, const DiffRegion& b,
                const LineGroupOptions& options, f64 maxCenterYDiff) -> bool {
    const auto& boxA = a.boundingBox;
    const auto& boxB = b.boundingBox;

    // Far apart blobs must not bridge two lines.
    if (image::horizontalGap(boxA, boxB) > options.maxXGap) {
        return false;
    }

    const f64 centerYDiff = std::abs(static_cast<f64>(a.center.y - b.center.y));
    if (centerYDiff > maxCenterYDiff) {
        return false;
    }

    const f64 minHeight = smallerHeight(boxA, boxB);
    if (image::verticallyNested(boxA, boxB)) {
        return centerYDiff <= minHeight * NESTED_CENTER_FACTOR;
    }

    if (minHeight <= 0.0) {
        return false;
    }
    const f64 overlapRatio =
        static_cast<f64>(image::verticalOverlap(boxA, boxB)) / minHeight;
    if (overlapRatio < options.overlapThreshold) {
        return false;
    }
    if (centerYDiff > minHeight * LOOSE_CENTER_FACTOR) {
        return overlapRatio >= options.overlapThreshold * STRICT_OVERLAP_FACTOR;
    }
    return true;
}

auto shouldMergeLines(const LineGroup& a, const LineGroup& b,
                      const LineGroupOptions& options) -> bool {
    const auto& boxA = a.boundingBox;
    const auto& boxB = b.boundingBox;

    if (image::horizontalGap(boxA, boxB) > options.maxXGap) {
        return false;
    }

    const f64 centerYDiff = std::abs(boxA.centerY() - boxB.centerY());
    if (centerYDiff <= options.lineMergeCenterYThreshold) {
        return true;
    }

    const f64 minHeight = smallerHeight(boxA, boxB);
    const i32 overlap = image::verticalOverlap(boxA, boxB);
    if (overlap > 0 && minHeight > 0.0 &&
        static_cast<f64>(overlap) / minHeight >=
            options.lineMergeOverlapThreshold) {
        return true;
    }

    if (image::verticallyNested(boxA, boxB)) {
        return centerYDiff <=
               std::max(options.lineMergeCenterYThreshold,
                        minHeight * LOOSE_CENTER_FACTOR);
    }
    return false;
}

LineGrouper::LineGrouper(LineGroupOptions options)
    : options_(std::move(options)) {
    options_.validate();
}

auto LineGrouper::initialGroups(const std::vector<DiffRegion>& regions) const
    -> std::vector<LineGroup> {
    if (regions.empty()) {
        return {};
    }

    const f64 maxCenterYDiff =
        options_.maxCenterYDiff.value_or(defaultMaxCenterYDiff(regions));
    spdlog::debug("Grouping {} regions, center-y limit {:.1f}px",
                  regions.size(), maxCenterYDiff);

    algorithm::UnionFind classes(regions.size());
    for (usize i = 0; i < regions.size(); ++i) {
        for (usize j = i + 1; j < regions.size(); ++j) {
            if (isSameLine(regions[i], regions[j], options_, maxCenterYDiff)) {
                classes.unite(i, j);
            }
        }
    }

    std::vector<LineGroup> lines;
    for (const auto& members : classes.groups()) {
        std::vector<DiffRegion> lineRegions;
        lineRegions.reserve(members.size());
        for (usize member : members) {
            lineRegions.push_back(regions[member]);
        }
        lines.push_back(makeLine(std::move(lineRegions)));
    }
    sortAndIndex(lines);
    return lines;
}

auto LineGrouper::mergeLines(std::vector<LineGroup> lines) const
    -> std::vector<LineGroup> {
    if (lines.size() < 2) {
        return lines;
    }

    std::stable_sort(lines.begin(), lines.end(),
                     [](const LineGroup& lhs, const LineGroup& rhs) {
                         return lhs.boundingBox.y < rhs.boundingBox.y;
                     });

    std::vector<LineGroup> merged;
    LineGroup current = std::move(lines.front());
    for (usize i = 1; i < lines.size(); ++i) {
        if (shouldMergeLines(current, lines[i], options_)) {
            spdlog::debug("Merging line at y={} into line at y={}",
                          lines[i].boundingBox.y, current.boundingBox.y);
            auto regions = std::move(current.regions);
            regions.insert(regions.end(), lines[i].regions.begin(),
                           lines[i].regions.end());
            current = makeLine(std::move(regions));
        } else {
            merged.push_back(std::move(current));
            current = std::move(lines[i]);
        }
    }
    merged.push_back(std::move(current));

    sortAndIndex(merged);
    return merged;
}

auto LineGrouper::splitLines(const std::vector<LineGroup>& lines) const
    -> std::vector<LineGroup> {
    std::vector<LineGroup> result;
    usize splitCount = 0;
    for (const auto& line : lines) {
        auto sorted = line.regions;
        std::stable_sort(sorted.begin(), sorted.end(),
                         [](const DiffRegion& lhs, const DiffRegion& rhs) {
                             return lhs.boundingBox.x < rhs.boundingBox.x;
                         });

        std::vector<DiffRegion> run;
        for (usize i = 0; i < sorted.size(); ++i) {
            if (!run.empty() &&
                sorted[i].boundingBox.x - run.back().boundingBox.right() >
                    options_.maxXGap) {
                result.push_back(makeLine(std::move(run)));
                run.clear();
                ++splitCount;
            }
            run.push_back(sorted[i]);
        }
        if (!run.empty()) {
            result.push_back(makeLine(std::move(run)));
        }
    }
    if (splitCount > 0) {
        spdlog::debug("Split {} wide gaps", splitCount);
    }
    sortAndIndex(result);
    return result;
}

auto LineGrouper::group(const std::vector<DiffRegion>& regions) const
    -> std::vector<LineGroup> {
    spdlog::info("Grouping {} regions into lines", regions.size());
    auto lines = initialGroups(regions);
    if (options_.enableLineMerge && lines.size() > 1) {
        lines = mergeLines(std::move(lines));
    }
    lines = splitLines(lines);
    spdlog::info("Found {} lines", lines.size());
    for (const auto& line : lines) {
        spdlog::debug("Line {}: {} regions, mean center y {:.0f}, box y {}..{}",
                      line.lineIndex + 1, line.regions.size(),
                      line.meanCenterY(), line.boundingBox.y,
                      line.boundingBox.bottom());
    }
    return lines;
}

auto groupByLine(const std::vector<DiffRegion>& regions,
                 const LineGroupOptions& options) -> std::vector<LineGroup> {
    return LineGrouper(options).group(regions);
}

}  // namespace diffline::diff
