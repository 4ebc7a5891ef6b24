#include <gtest/gtest.h>

#include <spdlog/spdlog.h>

#include "diffline/diff/line_overlay.hpp"

using namespace diffline;
using namespace diffline::diff;
using image::BoundingBox;
using image::RasterBuffer;

class LineOverlayTest : public ::testing::Test {
protected:
    void SetUp() override {
        spdlog::set_level(spdlog::level::off);
        source_ = RasterBuffer::filled(100, 60, image::colors::WHITE);
    }

    static auto line(i32 index, const BoundingBox& box) -> LineGroup {
        LineGroup group;
        group.lineIndex = index;
        group.boundingBox = box;
        return group;
    }

    RasterBuffer source_;
};

TEST_F(LineOverlayTest, OutlineSitsInsideThePaddedBox) {
    // Padded box covers x 15..54, y 15..34.
    const auto overlay =
        renderLineOverlay(source_, {line(0, {20, 20, 30, 10})});
    const auto red = LINE_PALETTE[0];

    EXPECT_EQ(overlay.pixel(15, 15), red);
    EXPECT_EQ(overlay.pixel(17, 25), red);
    EXPECT_EQ(overlay.pixel(18, 25), image::colors::WHITE);
    EXPECT_EQ(overlay.pixel(52, 25), red);
    EXPECT_EQ(overlay.pixel(51, 25), image::colors::WHITE);
    EXPECT_EQ(overlay.pixel(30, 32), red);
    EXPECT_EQ(overlay.pixel(30, 31), image::colors::WHITE);
    EXPECT_EQ(overlay.pixel(54, 34), red);

    EXPECT_EQ(overlay.pixel(14, 15), image::colors::WHITE);
    EXPECT_EQ(overlay.pixel(55, 25), image::colors::WHITE);
    EXPECT_EQ(overlay.pixel(30, 35), image::colors::WHITE);

    // The input is left untouched.
    EXPECT_EQ(source_, RasterBuffer::filled(100, 60, image::colors::WHITE));
}

TEST_F(LineOverlayTest, EachLineGetsTheNextPaletteColor) {
    const auto overlay = renderLineOverlay(
        source_, {line(0, {10, 10, 10, 5}), line(1, {60, 10, 10, 5})}, 0, 1);

    EXPECT_EQ(overlay.pixel(10, 10), LINE_PALETTE[0]);
    EXPECT_EQ(overlay.pixel(60, 10), LINE_PALETTE[1]);
    EXPECT_EQ(overlay.pixel(11, 11), image::colors::WHITE);
    EXPECT_EQ(lineColor(8), LINE_PALETTE[0]);
    EXPECT_EQ(lineColor(10), LINE_PALETTE[2]);
}

TEST_F(LineOverlayTest, BoxesAreClippedToTheImage) {
    EXPECT_EQ(overlayBox({2, 50, 20, 8}, 100, 60, 5),
              (BoundingBox{0, 45, 30, 15}));
    EXPECT_TRUE(overlayBox({200, 10, 5, 5}, 100, 60, 5).empty());

    const auto overlay = renderLineOverlay(
        source_, {line(0, {2, 50, 20, 8}), line(1, {200, 10, 5, 5})});
    EXPECT_EQ(overlay.pixel(0, 59), LINE_PALETTE[0]);
    EXPECT_EQ(overlay.pixel(29, 50), LINE_PALETTE[0]);
    EXPECT_EQ(overlay.pixel(30, 50), image::colors::WHITE);
    EXPECT_EQ(overlay.pixel(10, 50), image::colors::WHITE);
}

TEST_F(LineOverlayTest, NoLinesGivesAPlainCopy) {
    EXPECT_EQ(renderLineOverlay(source_, {}), source_);
}

TEST_F(LineOverlayTest, RejectsInvalidStroke) {
    EXPECT_THROW((void)renderLineOverlay(source_, {}, -1),
                 error::InvalidArgument);
    EXPECT_THROW((void)renderLineOverlay(source_, {}, 5, 0),
                 error::InvalidArgument);
}
