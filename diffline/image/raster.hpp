/*
 * raster.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-18

Description: Interleaved RGBA raster buffer

**************************************************/

#ifndef DIFFLINE_IMAGE_RASTER_HPP
#define DIFFLINE_IMAGE_RASTER_HPP

#include <span>
#include <string>
#include <vector>

#include "diffline/error/exception.hpp"
#include "diffline/image/geometry.hpp"
#include "diffline/type/numeric.hpp"

namespace diffline::image {

class InvalidRaster : public error::Exception {
public:
    using Exception::Exception;
};

#define THROW_INVALID_RASTER(...)                                          \
    throw diffline::image::InvalidRaster(DIFFLINE_FILE_NAME,               \
                                         DIFFLINE_FILE_LINE,               \
                                         DIFFLINE_FUNC_NAME, __VA_ARGS__)

struct Rgba {
    u8 r = 0;
    u8 g = 0;
    u8 b = 0;
    u8 a = 0;

    constexpr auto operator==(const Rgba&) const -> bool = default;
};

namespace colors {
inline constexpr Rgba WHITE{255, 255, 255, 255};
inline constexpr Rgba BLACK{0, 0, 0, 255};
inline constexpr Rgba TRANSPARENT{0, 0, 0, 0};
}  // namespace colors

/**
 * @brief width x height pixels, 4 bytes per pixel (R, G, B, A), row-major,
 * top-left origin.
 *
 * This is the exchange format with the image-loading layer; the library
 * never decodes or encodes image files itself.
 */
class RasterBuffer {
public:
    static constexpr i32 CHANNELS = 4;

    RasterBuffer() = default;

    /**
     * @brief Allocate a zeroed (transparent black) buffer.
     * @throws InvalidRaster if a dimension is negative.
     */
    RasterBuffer(i32 width, i32 height);

    /**
     * @brief Adopt existing RGBA bytes.
     * @throws InvalidRaster if data.size() != width * height * 4.
     */
    RasterBuffer(i32 width, i32 height, std::vector<u8> data);

    [[nodiscard]] static auto filled(i32 width, i32 height, Rgba color)
        -> RasterBuffer;

    [[nodiscard]] auto width() const noexcept -> i32 { return width_; }
    [[nodiscard]] auto height() const noexcept -> i32 { return height_; }
    [[nodiscard]] auto pixelCount() const noexcept -> usize {
        return static_cast<usize>(width_) * static_cast<usize>(height_);
    }
    [[nodiscard]] auto empty() const noexcept -> bool {
        return pixelCount() == 0;
    }
    [[nodiscard]] auto sameSize(const RasterBuffer& other) const noexcept
        -> bool {
        return width_ == other.width_ && height_ == other.height_;
    }
    [[nodiscard]] auto contains(i32 x, i32 y) const noexcept -> bool {
        return x >= 0 && x < width_ && y >= 0 && y < height_;
    }

    [[nodiscard]] auto data() const noexcept -> std::span<const u8> {
        return data_;
    }
    [[nodiscard]] auto data() noexcept -> std::span<u8> { return data_; }

    /**
     * @brief Byte offset of the red channel of pixel (x, y). Unchecked.
     */
    [[nodiscard]] auto offset(i32 x, i32 y) const noexcept -> usize {
        return (static_cast<usize>(y) * static_cast<usize>(width_) +
                static_cast<usize>(x)) *
               CHANNELS;
    }

    [[nodiscard]] auto pixel(i32 x, i32 y) const -> Rgba;
    void setPixel(i32 x, i32 y, Rgba color);

    /**
     * @brief Paint every pixel of box (clipped to the buffer).
     */
    void fillRect(const BoundingBox& box, Rgba color);

    /**
     * @brief Copy of the pixels inside box, clipped to the buffer.
     */
    [[nodiscard]] auto crop(const BoundingBox& box) const -> RasterBuffer;

    auto operator==(const RasterBuffer&) const -> bool = default;

private:
    void checkBounds(i32 x, i32 y) const;

    i32 width_ = 0;
    i32 height_ = 0;
    std::vector<u8> data_;
};

/**
 * @brief ITU-R BT.601 luma of an RGB triple.
 */
[[nodiscard]] constexpr auto luminance(u8 r, u8 g, u8 b) noexcept -> f64 {
    return r * 0.299 + g * 0.587 + b * 0.114;
}

/**
 * @brief Luma plane of a raster, one value per pixel in row-major order.
 */
[[nodiscard]] auto luminancePlane(const RasterBuffer& raster)
    -> std::vector<f64>;

/**
 * @brief Intersection of box with the raster's extent.
 */
[[nodiscard]] auto clipToRaster(const BoundingBox& box,
                                const RasterBuffer& raster) -> BoundingBox;

}  // namespace diffline::image

#endif  // DIFFLINE_IMAGE_RASTER_HPP
