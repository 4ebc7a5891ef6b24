/*
 * diff_engine.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-19

Description: Edge and texture adaptive pixel diff

**************************************************/

#include "diff_engine.hpp"

#include <algorithm>
#include <cstdlib>
#include <vector>

#include <spdlog/spdlog.h>

#include "diffline/algorithm/convolve.hpp"

namespace diffline::diff {

void DiffOptions::validate() const {
    if (threshold < 0.0) {
        THROW_INVALID_ARGUMENT("Diff threshold must be >= 0, got {}",
                               threshold);
    }
    if (varianceWindow <= 0 || varianceWindow % 2 == 0) {
        THROW_INVALID_ARGUMENT("Variance window must be a positive odd number, "
                               "got {}",
                               varianceWindow);
    }
    if (textLikeMultiplier <= 0.0 || smoothMultiplier <= 0.0) {
        THROW_INVALID_ARGUMENT("Threshold multipliers must be > 0, got {} / {}",
                               textLikeMultiplier, smoothMultiplier);
    }
    if (varianceRatio < 0.0) {
        THROW_INVALID_ARGUMENT("Variance ratio must be >= 0, got {}",
                               varianceRatio);
    }
}

DiffEngine::DiffEngine(DiffOptions options) : options_(options) {
    options_.validate();
}

namespace {

inline auto channelDistance(std::span<const u8> a, std::span<const u8> b,
                            usize idx) -> i32 {
    return std::abs(static_cast<i32>(a[idx]) - static_cast<i32>(b[idx])) +
           std::abs(static_cast<i32>(a[idx + 1]) -
                    static_cast<i32>(b[idx + 1])) +
           std::abs(static_cast<i32>(a[idx + 2]) -
                    static_cast<i32>(b[idx + 2]));
}

inline void markPixel(std::span<u8> mask, usize idx, bool different) {
    const u8 value = different ? 255 : 0;
    mask[idx] = value;
    mask[idx + 1] = value;
    mask[idx + 2] = value;
    mask[idx + 3] = 255;
}

}  // namespace

auto DiffEngine::computeDiff(const image::RasterBuffer& a,
                             const image::RasterBuffer& b) const
    -> DiffResult {
    if (!a.sameSize(b)) {
        spdlog::error("Cannot diff {}x{} against {}x{}", a.width(), a.height(),
                      b.width(), b.height());
        THROW_DIMENSION_MISMATCH("Image dimensions differ: {}x{} vs {}x{}",
                                 a.width(), a.height(), b.width(),
                                 b.height());
    }

    const bool adaptive = options_.mode == DiffMode::Adaptive;
    spdlog::info("Computing {} pixel diff of {}x{} images, threshold {}",
                 adaptive ? "adaptive" : "baseline", a.width(), a.height(),
                 options_.threshold);

    DiffResult result;
    result.width = a.width();
    result.height = a.height();
    result.mask = image::RasterBuffer(a.width(), a.height());

    const auto dataA = a.data();
    const auto dataB = b.data();
    auto maskData = result.mask.data();
    const usize pixels = a.pixelCount();

    if (!adaptive) {
        for (usize i = 0; i < pixels; ++i) {
            const usize idx = i * image::RasterBuffer::CHANNELS;
            const bool different =
                channelDistance(dataA, dataB, idx) > options_.threshold;
            markPixel(maskData, idx, different);
            if (different) {
                result.diffPixelCount++;
                result.smoothDiffCount++;
            }
        }
        spdlog::info("Diff pixels: {} / {}", result.diffPixelCount, pixels);
        return result;
    }

    const auto lumaA = image::luminancePlane(a);
    const auto lumaB = image::luminancePlane(b);
    const auto edgesA =
        algorithm::gradientMagnitude(lumaA, a.width(), a.height());
    const auto edgesB =
        algorithm::gradientMagnitude(lumaB, b.width(), b.height());
    const auto variance = algorithm::localVariance(
        lumaB, b.width(), b.height(), options_.varianceWindow);

    const f64 maxVariance =
        variance.empty() ? 0.0
                         : *std::max_element(variance.begin(), variance.end());
    const f64 textureThreshold = maxVariance * options_.varianceRatio;
    const f64 textLikeThreshold =
        options_.threshold * options_.textLikeMultiplier;
    const f64 smoothThreshold = options_.threshold * options_.smoothMultiplier;
    spdlog::debug("Max local variance {:.2f}; edge threshold {:.1f}, smooth "
                  "threshold {:.1f}",
                  maxVariance, textLikeThreshold, smoothThreshold);

    for (usize i = 0; i < pixels; ++i) {
        const usize idx = i * image::RasterBuffer::CHANNELS;
        const i32 edgeStrength = std::max(edgesA[i], edgesB[i]);
        const bool textLike = edgeStrength > options_.edgeStrengthFloor ||
                              variance[i] > textureThreshold;
        const f64 threshold = textLike ? textLikeThreshold : smoothThreshold;
        const bool different = channelDistance(dataA, dataB, idx) > threshold;
        markPixel(maskData, idx, different);
        if (different) {
            result.diffPixelCount++;
            if (textLike) {
                result.textLikeDiffCount++;
            } else {
                result.smoothDiffCount++;
            }
        }
    }

    spdlog::info("Diff pixels: {} / {} (edge/texture {}, smooth {})",
                 result.diffPixelCount, pixels, result.textLikeDiffCount,
                 result.smoothDiffCount);
    return result;
}

auto computeDiff(const image::RasterBuffer& a, const image::RasterBuffer& b,
                 f64 threshold, DiffMode mode) -> DiffResult {
    DiffOptions options;
    options.threshold = threshold;
    options.mode = mode;
    return DiffEngine(options).computeDiff(a, b);
}

}  // namespace diffline::diff
