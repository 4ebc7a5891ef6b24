/*
 * region_clusterer.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-19

Description: Turn a diff mask into text-like regions

**************************************************/

#ifndef DIFFLINE_DIFF_REGION_CLUSTERER_HPP
#define DIFFLINE_DIFF_REGION_CLUSTERER_HPP

#include <array>
#include <vector>

#include "diffline/algorithm/binary_mask.hpp"
#include "diffline/diff/region.hpp"
#include "diffline/image/raster.hpp"

namespace diffline::diff {

/**
 * @brief Cutoffs of the background heuristic.
 *
 * These were tuned on real screenshots, not derived; treat them as knobs.
 */
struct BackgroundFilterOptions {
    bool enabled = true;
    f64 largeAreaRatio = 0.08;        ///< box area / image area
    f64 tallHeightRatio = 0.15;       ///< box height / image height
    f64 sparseDensity = 0.20;         ///< pixelCount / box area
    f64 squareAspectMin = 0.7;        ///< exclusive
    f64 squareAspectMax = 1.5;        ///< exclusive
    f64 largeSquareAreaRatio = 0.05;  ///< box area / image area
    i32 minFeatures = 2;              ///< features needed to call it background
};

struct ClusterOptions {
    i32 dilateRadius = 3;
    usize minAreaSize = 100;
    bool enableErode = true;
    BackgroundFilterOptions background;

    /**
     * @throws error::InvalidArgument on a negative radius or a
     * non-positive minimum feature count.
     */
    void validate() const;
};

/**
 * @brief Which background features a region shows.
 */
struct BackgroundFeatures {
    bool largeArea = false;
    bool tooTall = false;
    bool sparse = false;
    bool largeSquare = false;

    [[nodiscard]] auto count() const noexcept -> i32 {
        return static_cast<i32>(largeArea) + static_cast<i32>(tooTall) +
               static_cast<i32>(sparse) + static_cast<i32>(largeSquare);
    }
};

[[nodiscard]] auto classifyBackground(const DiffRegion& region,
                                      i32 imageWidth, i32 imageHeight,
                                      const BackgroundFilterOptions& options)
    -> BackgroundFeatures;

[[nodiscard]] auto isBackgroundRegion(const DiffRegion& region,
                                      i32 imageWidth, i32 imageHeight,
                                      const BackgroundFilterOptions& options)
    -> bool;

struct ClusterResult {
    std::vector<DiffRegion> regions;
    image::RasterBuffer labeledMask;  ///< Visualization only
    usize componentCount = 0;         ///< Components before any filtering
    usize discardedSmall = 0;
    usize discardedBackground = 0;
};

/**
 * @brief Colors used for labeledMask, cycled by region id.
 */
inline constexpr std::array<image::Rgba, 8> REGION_PALETTE{{
    {255, 0, 0, 180},
    {0, 255, 0, 180},
    {0, 0, 255, 180},
    {255, 255, 0, 180},
    {255, 0, 255, 180},
    {0, 255, 255, 180},
    {255, 128, 0, 180},
    {128, 0, 255, 180},
}};

class RegionClusterer {
public:
    explicit RegionClusterer(ClusterOptions options = {});

    /**
     * @brief Cluster the white pixels of a diff mask.
     *
     * Steps: optional erosion by max(1, dilateRadius / 2) to cut thin
     * bridges, dilation by dilateRadius to rejoin strokes, 4-connected
     * labeling, removal of components with fewer than minAreaSize changed
     * pixels, then the background filter. Survivors are numbered 1..N.
     */
    [[nodiscard]] auto cluster(const image::RasterBuffer& diffMask) const
        -> ClusterResult;

    [[nodiscard]] auto cluster(const algorithm::BinaryMask& diffMask) const
        -> ClusterResult;

    [[nodiscard]] auto options() const noexcept -> const ClusterOptions& {
        return options_;
    }

private:
    ClusterOptions options_;
};

}  // namespace diffline::diff

#endif  // DIFFLINE_DIFF_REGION_CLUSTERER_HPP
