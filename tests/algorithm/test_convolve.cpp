#include <gtest/gtest.h>

#include <vector>

#include "diffline/algorithm/convolve.hpp"

using namespace diffline;
using namespace diffline::algorithm;

namespace {
// 5x5 plane: columns 0-1 are 0, columns 2-4 are 100.
auto verticalStep() -> std::vector<f64> {
    std::vector<f64> plane(25, 0.0);
    for (i32 y = 0; y < 5; ++y) {
        for (i32 x = 2; x < 5; ++x) {
            plane[static_cast<usize>(y * 5 + x)] = 100.0;
        }
    }
    return plane;
}
}  // namespace

TEST(ConvolveTest, SobelRespondsToVerticalEdge) {
    const auto plane = verticalStep();
    const auto gx = convolve3x3(plane, 5, 5, SOBEL_X);
    const auto gy = convolve3x3(plane, 5, 5, SOBEL_Y);

    EXPECT_DOUBLE_EQ(gx[1 * 5 + 1], 400.0);
    EXPECT_DOUBLE_EQ(gx[2 * 5 + 2], 400.0);
    EXPECT_DOUBLE_EQ(gx[2 * 5 + 3], 0.0);
    EXPECT_DOUBLE_EQ(gy[2 * 5 + 2], 0.0);
}

TEST(ConvolveTest, BorderCellsStayZero) {
    const auto plane = verticalStep();
    const auto gx = convolve3x3(plane, 5, 5, SOBEL_X);
    for (i32 i = 0; i < 5; ++i) {
        EXPECT_DOUBLE_EQ(gx[static_cast<usize>(i)], 0.0);
        EXPECT_DOUBLE_EQ(gx[static_cast<usize>(20 + i)], 0.0);
        EXPECT_DOUBLE_EQ(gx[static_cast<usize>(i * 5)], 0.0);
        EXPECT_DOUBLE_EQ(gx[static_cast<usize>(i * 5 + 4)], 0.0);
    }
}

TEST(ConvolveTest, GradientMagnitudeSaturates) {
    const auto plane = verticalStep();
    const auto magnitude = gradientMagnitude(plane, 5, 5);
    EXPECT_EQ(magnitude[2 * 5 + 1], 255);
    EXPECT_EQ(magnitude[2 * 5 + 3], 0);
    EXPECT_EQ(magnitude[0], 0);
}

TEST(ConvolveTest, FlatPlaneHasNoVariance) {
    const std::vector<f64> plane(49, 42.0);
    const auto variance = localVariance(plane, 7, 7, 3);
    for (f64 v : variance) {
        EXPECT_DOUBLE_EQ(v, 0.0);
    }
}

TEST(ConvolveTest, VarianceOfSinglePeak) {
    std::vector<f64> plane(9, 0.0);
    plane[4] = 9.0;
    const auto variance = localVariance(plane, 3, 3, 3);
    // mean = 1, squares = 8 * 1 + 64 = 72, variance = 8
    EXPECT_DOUBLE_EQ(variance[4], 8.0);
    EXPECT_DOUBLE_EQ(variance[0], 0.0);
}

TEST(ConvolveTest, RejectsBadInput) {
    const std::vector<f64> plane(9, 0.0);
    EXPECT_THROW((void)localVariance(plane, 3, 3, 2), ConvolveError);
    EXPECT_THROW((void)localVariance(plane, 3, 3, 0), ConvolveError);
    EXPECT_THROW((void)convolve3x3(plane, 4, 3, SOBEL_X), ConvolveError);
    EXPECT_THROW((void)gradientMagnitude(plane, -1, 3), ConvolveError);
}
