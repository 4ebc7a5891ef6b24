/*
 * line_preview.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "line_preview.hpp"

#include <unordered_map>
#include <vector>

#include <spdlog/spdlog.h>

#include "diffline/diff/diff_engine.hpp"
#include "diffline/error/exception.hpp"

namespace diffline::diff {

namespace {

constexpr u8 QUANT_STEP = 16;

constexpr auto quantize(u8 value) -> u8 {
    return static_cast<u8>(value / QUANT_STEP * QUANT_STEP);
}

struct ColorBucket {
    image::Rgba color;
    usize count = 0;
};

}  // namespace

auto renderLinePreview(const image::RasterBuffer& source,
                       const image::RasterBuffer& diffMask,
                       const image::BoundingBox& box, i32 padding)
    -> LinePreview {
    if (!source.sameSize(diffMask)) {
        THROW_DIMENSION_MISMATCH(
            "Preview source is {}x{} but diff mask is {}x{}", source.width(),
            source.height(), diffMask.width(), diffMask.height());
    }
    if (padding < 0) {
        THROW_INVALID_ARGUMENT("Preview padding must be >= 0, got {}",
                               padding);
    }
    if (box.empty()) {
        THROW_INVALID_ARGUMENT("Cannot preview an empty box ({}x{})",
                               box.width, box.height);
    }

    LinePreview preview;
    preview.image = image::RasterBuffer::filled(
        box.width + padding * 2, box.height + padding * 2, image::colors::WHITE);

    const auto src = source.data();
    const auto mask = diffMask.data();
    auto dst = preview.image.data();

    std::vector<ColorBucket> buckets;
    std::unordered_map<u32, usize> bucketOf;

    const auto visible = image::clipToRaster(box, source);
    for (i32 y = visible.y; y < visible.bottom(); ++y) {
        for (i32 x = visible.x; x < visible.right(); ++x) {
            const usize idx = source.offset(x, y);
            if (mask[idx] == 0) {
                continue;
            }
            const usize out =
                preview.image.offset(x - box.x + padding, y - box.y + padding);
            dst[out] = src[idx];
            dst[out + 1] = src[idx + 1];
            dst[out + 2] = src[idx + 2];
            dst[out + 3] = 255;
            ++preview.contentPixels;

            const image::Rgba quantized{quantize(src[idx]),
                                        quantize(src[idx + 1]),
                                        quantize(src[idx + 2]), 255};
            const u32 key = (static_cast<u32>(quantized.r) << 16) |
                            (static_cast<u32>(quantized.g) << 8) |
                            static_cast<u32>(quantized.b);
            auto [it, inserted] = bucketOf.try_emplace(key, buckets.size());
            if (inserted) {
                buckets.push_back({quantized, 0});
            }
            ++buckets[it->second].count;
        }
    }

    usize best = 0;
    for (const auto& bucket : buckets) {
        if (bucket.count > best) {
            best = bucket.count;
            preview.contentColor = bucket.color;
        }
    }

    spdlog::debug("Line preview {}x{}: {} content pixels, color ({}, {}, {})",
                  preview.image.width(), preview.image.height(),
                  preview.contentPixels, preview.contentColor.r,
                  preview.contentColor.g, preview.contentColor.b);
    return preview;
}

}  // namespace diffline::diff
