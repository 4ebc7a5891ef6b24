/*
 * diff_engine.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-19

Description: Pixel-wise comparison of two equally sized rasters

**************************************************/

#ifndef DIFFLINE_DIFF_DIFF_ENGINE_HPP
#define DIFFLINE_DIFF_DIFF_ENGINE_HPP

#include "diffline/error/exception.hpp"
#include "diffline/image/raster.hpp"
#include "diffline/type/numeric.hpp"

namespace diffline::diff {

class DimensionMismatch : public error::Exception {
public:
    using Exception::Exception;
};

#define THROW_DIMENSION_MISMATCH(...)                                       \
    throw diffline::diff::DimensionMismatch(DIFFLINE_FILE_NAME,             \
                                            DIFFLINE_FILE_LINE,             \
                                            DIFFLINE_FUNC_NAME, __VA_ARGS__)

inline constexpr f64 DEFAULT_DIFF_THRESHOLD = 30.0;

enum class DiffMode {
    Baseline,  ///< One global threshold on channel distance
    Adaptive   ///< Lower threshold on edges and texture, higher elsewhere
};

struct DiffOptions {
    f64 threshold = DEFAULT_DIFF_THRESHOLD;
    DiffMode mode = DiffMode::Adaptive;
    i32 edgeStrengthFloor = 30;   ///< Sobel magnitude above which a pixel is an edge
    f64 varianceRatio = 0.1;      ///< Fraction of the max local variance marking texture
    i32 varianceWindow = 7;       ///< Odd side length of the variance window
    f64 textLikeMultiplier = 0.8; ///< Threshold scale on edge/texture pixels
    f64 smoothMultiplier = 2.0;   ///< Threshold scale on smooth pixels

    /**
     * @throws error::InvalidArgument on a negative threshold, a non-odd
     * window, or non-positive multipliers.
     */
    void validate() const;
};

/**
 * @brief Binary change mask plus counters.
 *
 * mask is RGBA: white opaque where the pixels differ, black opaque where
 * they match. textLikeDiffCount and smoothDiffCount split diffPixelCount by
 * the threshold that was applied; in baseline mode every difference is
 * counted as smooth.
 */
struct DiffResult {
    image::RasterBuffer mask;
    usize diffPixelCount = 0;
    i32 width = 0;
    i32 height = 0;
    usize textLikeDiffCount = 0;
    usize smoothDiffCount = 0;
};

class DiffEngine {
public:
    explicit DiffEngine(DiffOptions options = {});

    /**
     * @brief Compare a and b pixel by pixel.
     *
     * Channel distance is |dR| + |dG| + |dB|; alpha is ignored. A pixel is
     * different when the distance exceeds the threshold in effect for it.
     *
     * @throws DimensionMismatch if the rasters differ in width or height.
     */
    [[nodiscard]] auto computeDiff(const image::RasterBuffer& a,
                                   const image::RasterBuffer& b) const
        -> DiffResult;

    [[nodiscard]] auto options() const noexcept -> const DiffOptions& {
        return options_;
    }

private:
    DiffOptions options_;
};

/**
 * @brief One-shot comparison with the given threshold and mode.
 */
[[nodiscard]] auto computeDiff(const image::RasterBuffer& a,
                               const image::RasterBuffer& b,
                               f64 threshold = DEFAULT_DIFF_THRESHOLD,
                               DiffMode mode = DiffMode::Adaptive)
    -> DiffResult;

}  // namespace diffline::diff

#endif  // DIFFLINE_DIFF_DIFF_ENGINE_HPP
