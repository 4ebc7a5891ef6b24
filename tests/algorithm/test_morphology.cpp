#include <gtest/gtest.h>
#include <spdlog/spdlog.h>

#include "diffline/algorithm/binary_mask.hpp"
#include "diffline/algorithm/morphology.hpp"

using namespace diffline;
using namespace diffline::algorithm;

namespace {

auto rectMask(i32 width, i32 height, i32 x0, i32 y0, i32 w, i32 h)
    -> BinaryMask {
    BinaryMask mask(width, height);
    for (i32 y = y0; y < y0 + h; ++y) {
        for (i32 x = x0; x < x0 + w; ++x) {
            mask.set(x, y);
        }
    }
    return mask;
}

}  // namespace

class MorphologyTest : public ::testing::Test {
protected:
    void SetUp() override { spdlog::set_level(spdlog::level::off); }
};

TEST_F(MorphologyTest, RadiusZeroIsIdentity) {
    auto mask = rectMask(10, 10, 2, 2, 3, 4);
    EXPECT_EQ(erode(mask, 0), mask);
    EXPECT_EQ(dilate(mask, 0), mask);
}

TEST_F(MorphologyTest, NegativeRadiusThrows) {
    BinaryMask mask(4, 4);
    EXPECT_THROW(static_cast<void>(erode(mask, -1)), error::InvalidArgument);
    EXPECT_THROW(static_cast<void>(dilate(mask, -2)), error::InvalidArgument);
}

TEST_F(MorphologyTest, ErodeShrinksRectangleByRadius) {
    auto eroded = erode(rectMask(40, 20, 10, 10, 20, 5), 1);
    EXPECT_EQ(eroded, rectMask(40, 20, 11, 11, 18, 3));
}

TEST_F(MorphologyTest, ErodeRemovesThinLines) {
    auto eroded = erode(rectMask(20, 20, 2, 5, 15, 2), 1);
    EXPECT_EQ(eroded.count(), 0u);
}

TEST_F(MorphologyTest, ErodeTreatsOutsideAsBackground) {
    BinaryMask full(5, 5);
    for (i32 y = 0; y < 5; ++y) {
        for (i32 x = 0; x < 5; ++x) {
            full.set(x, y);
        }
    }
    auto eroded = erode(full, 1);
    EXPECT_EQ(eroded, rectMask(5, 5, 1, 1, 3, 3));
}

TEST_F(MorphologyTest, DilateGrowsAndClips) {
    BinaryMask mask(6, 6);
    mask.set(0, 0);
    auto dilated = dilate(mask, 2);
    EXPECT_EQ(dilated, rectMask(6, 6, 0, 0, 3, 3));

    BinaryMask center(7, 7);
    center.set(3, 3);
    EXPECT_EQ(dilate(center, 1), rectMask(7, 7, 2, 2, 3, 3));
}

TEST_F(MorphologyTest, MaskRoundTripsThroughRaster) {
    auto mask = rectMask(8, 4, 1, 1, 2, 2);
    auto raster = mask.toRaster();
    EXPECT_EQ(raster.pixel(1, 1), image::colors::WHITE);
    EXPECT_EQ(raster.pixel(0, 0), image::colors::BLACK);
    EXPECT_EQ(BinaryMask::fromRaster(raster), mask);
}
