/*
 * binary_mask.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-18

Description: One byte per pixel foreground/background mask

**************************************************/

#ifndef DIFFLINE_ALGORITHM_BINARY_MASK_HPP
#define DIFFLINE_ALGORITHM_BINARY_MASK_HPP

#include <vector>

#include "diffline/image/raster.hpp"
#include "diffline/type/numeric.hpp"

namespace diffline::algorithm {

/**
 * @brief Row-major mask; a cell is foreground when non-zero.
 */
class BinaryMask {
public:
    BinaryMask() = default;
    BinaryMask(i32 width, i32 height);

    /**
     * @brief Foreground wherever the raster's red channel is non-zero.
     *
     * Diff masks are pure black/white, so any channel would do; red is the
     * one the diff engine writes first.
     */
    [[nodiscard]] static auto fromRaster(const image::RasterBuffer& raster)
        -> BinaryMask;

    /**
     * @brief White opaque for foreground, black opaque for background.
     */
    [[nodiscard]] auto toRaster() const -> image::RasterBuffer;

    [[nodiscard]] auto width() const noexcept -> i32 { return width_; }
    [[nodiscard]] auto height() const noexcept -> i32 { return height_; }
    [[nodiscard]] auto size() const noexcept -> usize { return cells_.size(); }

    [[nodiscard]] auto inBounds(i32 x, i32 y) const noexcept -> bool {
        return x >= 0 && x < width_ && y >= 0 && y < height_;
    }
    [[nodiscard]] auto index(i32 x, i32 y) const noexcept -> usize {
        return static_cast<usize>(y) * static_cast<usize>(width_) +
               static_cast<usize>(x);
    }
    [[nodiscard]] auto test(i32 x, i32 y) const noexcept -> bool {
        return cells_[index(x, y)] != 0;
    }
    void set(i32 x, i32 y, bool value = true) noexcept {
        cells_[index(x, y)] = value ? 1 : 0;
    }

    [[nodiscard]] auto count() const noexcept -> usize;

    [[nodiscard]] auto cells() const noexcept -> const std::vector<u8>& {
        return cells_;
    }

    auto operator==(const BinaryMask&) const -> bool = default;

private:
    i32 width_ = 0;
    i32 height_ = 0;
    std::vector<u8> cells_;
};

}  // namespace diffline::algorithm

#endif  // DIFFLINE_ALGORITHM_BINARY_MASK_HPP
