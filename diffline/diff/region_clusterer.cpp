/*
 * region_clusterer.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-19

Description: Turn a diff mask into text-like regions

**************************************************/

#include "region_clusterer.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

#include <spdlog/spdlog.h>

#include "diffline/algorithm/flood.hpp"
#include "diffline/algorithm/morphology.hpp"
#include "diffline/error/exception.hpp"

namespace diffline::diff {

void ClusterOptions::validate() const {
    if (dilateRadius < 0) {
        THROW_INVALID_ARGUMENT("Dilate radius must be >= 0, got {}",
                               dilateRadius);
    }
    if (background.minFeatures <= 0) {
        THROW_INVALID_ARGUMENT(
            "Background filter needs at least one feature, got {}",
            background.minFeatures);
    }
}

auto classifyBackground(const DiffRegion& region, i32 imageWidth,
                        i32 imageHeight,
                        const BackgroundFilterOptions& options)
    -> BackgroundFeatures {
    BackgroundFeatures features;
    const auto& box = region.boundingBox;
    if (imageWidth <= 0 || imageHeight <= 0 || box.empty()) {
        return features;
    }

    const f64 boxArea = static_cast<f64>(box.area());
    const f64 imageArea =
        static_cast<f64>(imageWidth) * static_cast<f64>(imageHeight);
    const f64 areaRatio = boxArea / imageArea;
    const f64 heightRatio =
        static_cast<f64>(box.height) / static_cast<f64>(imageHeight);
    const f64 density = static_cast<f64>(region.pixelCount) / boxArea;
    const f64 aspect =
        static_cast<f64>(box.width) / static_cast<f64>(box.height);

    features.largeArea = areaRatio > options.largeAreaRatio;
    features.tooTall = heightRatio > options.tallHeightRatio;
    features.sparse = density < options.sparseDensity;
    features.largeSquare = aspect > options.squareAspectMin &&
                           aspect < options.squareAspectMax &&
                           areaRatio > options.largeSquareAreaRatio;
    return features;
}

auto isBackgroundRegion(const DiffRegion& region, i32 imageWidth,
                        i32 imageHeight,
                        const BackgroundFilterOptions& options) -> bool {
    if (!options.enabled) {
        return false;
    }
    return classifyBackground(region, imageWidth, imageHeight, options)
               .count() >= options.minFeatures;
}

RegionClusterer::RegionClusterer(ClusterOptions options)
    : options_(options) {
    options_.validate();
}

auto RegionClusterer::cluster(const image::RasterBuffer& diffMask) const
    -> ClusterResult {
    return cluster(algorithm::BinaryMask::fromRaster(diffMask));
}

namespace {

struct ComponentStats {
    i32 minX = std::numeric_limits<i32>::max();
    i32 minY = std::numeric_limits<i32>::max();
    i32 maxX = -1;
    i32 maxY = -1;
    i64 sumX = 0;
    i64 sumY = 0;
    usize pixels = 0;

    void add(i32 x, i32 y) {
        minX = std::min(minX, x);
        minY = std::min(minY, y);
        maxX = std::max(maxX, x);
        maxY = std::max(maxY, y);
        sumX += x;
        sumY += y;
        ++pixels;
    }
};

auto roundedMean(i64 sum, usize count) -> i32 {
    return static_cast<i32>(
        std::floor(static_cast<f64>(sum) / static_cast<f64>(count) + 0.5));
}

}  // namespace

auto RegionClusterer::cluster(const algorithm::BinaryMask& diffMask) const
    -> ClusterResult {
    ClusterResult result;
    result.labeledMask = image::RasterBuffer(diffMask.width(), diffMask.height());
    if (diffMask.size() == 0) {
        return result;
    }

    algorithm::BinaryMask grown = diffMask;
    if (options_.enableErode) {
        grown = algorithm::erode(grown, std::max(1, options_.dilateRadius / 2));
    }
    grown = algorithm::dilate(grown, options_.dilateRadius);

    const auto components = algorithm::FloodFill::labelComponents(grown);
    result.componentCount = static_cast<usize>(components.count);

    // Statistics come from the changed pixels, not from the grown area.
    std::vector<ComponentStats> stats(result.componentCount);
    for (i32 y = 0; y < diffMask.height(); ++y) {
        for (i32 x = 0; x < diffMask.width(); ++x) {
            if (!diffMask.test(x, y)) {
                continue;
            }
            const i32 label = components.at(x, y);
            if (label > 0) {
                stats[static_cast<usize>(label - 1)].add(x, y);
            }
        }
    }

    const auto& bg = options_.background;
    std::vector<i32> regionOfLabel(result.componentCount, 0);
    for (usize label = 0; label < stats.size(); ++label) {
        const auto& component = stats[label];
        if (component.pixels == 0 || component.pixels < options_.minAreaSize) {
            ++result.discardedSmall;
            continue;
        }

        DiffRegion region;
        region.boundingBox = {component.minX, component.minY,
                              component.maxX - component.minX + 1,
                              component.maxY - component.minY + 1};
        region.pixelCount = component.pixels;
        region.center = {roundedMean(component.sumX, component.pixels),
                         roundedMean(component.sumY, component.pixels)};

        if (isBackgroundRegion(region, diffMask.width(), diffMask.height(),
                               bg)) {
            spdlog::debug("Dropping background region at ({}, {}) {}x{}",
                          region.boundingBox.x, region.boundingBox.y,
                          region.boundingBox.width,
                          region.boundingBox.height);
            ++result.discardedBackground;
            continue;
        }

        region.id = static_cast<i32>(result.regions.size()) + 1;
        regionOfLabel[label] = region.id;
        result.regions.push_back(region);
    }

    // Paint the changed pixels of each surviving region.
    for (i32 y = 0; y < diffMask.height(); ++y) {
        for (i32 x = 0; x < diffMask.width(); ++x) {
            const i32 label = components.at(x, y);
            if (label == 0 || !diffMask.test(x, y)) {
                continue;
            }
            const i32 id = regionOfLabel[static_cast<usize>(label - 1)];
            if (id == 0) {
                continue;
            }
            result.labeledMask.setPixel(
                x, y,
                REGION_PALETTE[static_cast<usize>(id - 1) %
                               REGION_PALETTE.size()]);
        }
    }

    spdlog::info(
        "Clustered {} components into {} regions ({} small, {} background)",
        result.componentCount, result.regions.size(), result.discardedSmall,
        result.discardedBackground);
    return result;
}

}  // namespace diffline::diff
