/*
 * raster.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "raster.hpp"

#include <algorithm>

namespace diffline::image {

RasterBuffer::RasterBuffer(i32 width, i32 height)
    : width_(width), height_(height) {
    if (width < 0 || height < 0) {
        THROW_INVALID_RASTER("Negative raster dimensions: {}x{}", width,
                             height);
    }
    data_.assign(pixelCount() * CHANNELS, 0);
}

RasterBuffer::RasterBuffer(i32 width, i32 height, std::vector<u8> data)
    : width_(width), height_(height), data_(std::move(data)) {
    if (width < 0 || height < 0) {
        THROW_INVALID_RASTER("Negative raster dimensions: {}x{}", width,
                             height);
    }
    if (data_.size() != pixelCount() * CHANNELS) {
        THROW_INVALID_RASTER(
            "Raster data size {} does not match {}x{}x{} = {} bytes",
            data_.size(), width, height, CHANNELS, pixelCount() * CHANNELS);
    }
}

auto RasterBuffer::filled(i32 width, i32 height, Rgba color) -> RasterBuffer {
    RasterBuffer raster(width, height);
    for (usize i = 0; i < raster.data_.size(); i += CHANNELS) {
        raster.data_[i] = color.r;
        raster.data_[i + 1] = color.g;
        raster.data_[i + 2] = color.b;
        raster.data_[i + 3] = color.a;
    }
    return raster;
}

void RasterBuffer::checkBounds(i32 x, i32 y) const {
    if (!contains(x, y)) {
        THROW_INVALID_ARGUMENT("Pixel ({}, {}) outside {}x{} raster", x, y,
                               width_, height_);
    }
}

auto RasterBuffer::pixel(i32 x, i32 y) const -> Rgba {
    checkBounds(x, y);
    const usize idx = offset(x, y);
    return {data_[idx], data_[idx + 1], data_[idx + 2], data_[idx + 3]};
}

void RasterBuffer::setPixel(i32 x, i32 y, Rgba color) {
    checkBounds(x, y);
    const usize idx = offset(x, y);
    data_[idx] = color.r;
    data_[idx + 1] = color.g;
    data_[idx + 2] = color.b;
    data_[idx + 3] = color.a;
}

void RasterBuffer::fillRect(const BoundingBox& box, Rgba color) {
    const BoundingBox clipped = clipToRaster(box, *this);
    for (i32 y = clipped.y; y < clipped.bottom(); ++y) {
        for (i32 x = clipped.x; x < clipped.right(); ++x) {
            const usize idx = offset(x, y);
            data_[idx] = color.r;
            data_[idx + 1] = color.g;
            data_[idx + 2] = color.b;
            data_[idx + 3] = color.a;
        }
    }
}

auto RasterBuffer::crop(const BoundingBox& box) const -> RasterBuffer {
    const BoundingBox clipped = clipToRaster(box, *this);
    RasterBuffer result(clipped.width, clipped.height);
    for (i32 y = 0; y < clipped.height; ++y) {
        const auto src = data_.begin() +
                         static_cast<isize>(offset(clipped.x, clipped.y + y));
        std::copy_n(src, static_cast<usize>(clipped.width) * CHANNELS,
                    result.data_.begin() +
                        static_cast<isize>(result.offset(0, y)));
    }
    return result;
}

auto luminancePlane(const RasterBuffer& raster) -> std::vector<f64> {
    std::vector<f64> plane(raster.pixelCount());
    const auto bytes = raster.data();
    for (usize i = 0; i < plane.size(); ++i) {
        const usize idx = i * RasterBuffer::CHANNELS;
        plane[i] = luminance(bytes[idx], bytes[idx + 1], bytes[idx + 2]);
    }
    return plane;
}

auto clipToRaster(const BoundingBox& box, const RasterBuffer& raster)
    -> BoundingBox {
    const i32 left = std::clamp(box.x, 0, raster.width());
    const i32 top = std::clamp(box.y, 0, raster.height());
    const i32 right = std::clamp(box.right(), left, raster.width());
    const i32 bottom = std::clamp(box.bottom(), top, raster.height());
    return {left, top, right - left, bottom - top};
}

}  // namespace diffline::image
