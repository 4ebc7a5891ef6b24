/*
 * binary_mask.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "binary_mask.hpp"

#include <algorithm>

namespace diffline::algorithm {

BinaryMask::BinaryMask(i32 width, i32 height)
    : width_(width), height_(height) {
    if (width < 0 || height < 0) {
        THROW_INVALID_ARGUMENT("Negative mask dimensions: {}x{}", width,
                               height);
    }
    cells_.assign(static_cast<usize>(width) * static_cast<usize>(height), 0);
}

auto BinaryMask::fromRaster(const image::RasterBuffer& raster) -> BinaryMask {
    BinaryMask mask(raster.width(), raster.height());
    const auto bytes = raster.data();
    for (usize i = 0; i < mask.cells_.size(); ++i) {
        mask.cells_[i] = bytes[i * image::RasterBuffer::CHANNELS] > 0 ? 1 : 0;
    }
    return mask;
}

auto BinaryMask::toRaster() const -> image::RasterBuffer {
    auto raster =
        image::RasterBuffer::filled(width_, height_, image::colors::BLACK);
    auto bytes = raster.data();
    for (usize i = 0; i < cells_.size(); ++i) {
        if (cells_[i] != 0) {
            const usize idx = i * image::RasterBuffer::CHANNELS;
            bytes[idx] = 255;
            bytes[idx + 1] = 255;
            bytes[idx + 2] = 255;
        }
    }
    return raster;
}

auto BinaryMask::count() const noexcept -> usize {
    return static_cast<usize>(
        std::count_if(cells_.begin(), cells_.end(), [](u8 v) { return v != 0; }));
}

}  // namespace diffline::algorithm
