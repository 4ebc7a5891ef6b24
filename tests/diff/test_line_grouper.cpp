#include <gtest/gtest.h>

#include <spdlog/spdlog.h>

#include "diffline/diff/line_grouper.hpp"
#include "diffline/error/exception.hpp"

using namespace diffline;
using namespace diffline::diff;
using image::BoundingBox;

class LineGrouperTest : public ::testing::Test {
protected:
    void SetUp() override { spdlog::set_level(spdlog::level::off); }

    static auto region(i32 id, i32 x, i32 y, i32 w, i32 h) -> DiffRegion {
        DiffRegion r;
        r.id = id;
        r.boundingBox = {x, y, w, h};
        r.pixelCount = static_cast<usize>(w * h);
        r.center = {x + w / 2, y + h / 2};
        return r;
    }

    static auto ids(const LineGroup& line) -> std::vector<i32> {
        std::vector<i32> out;
        for (const auto& r : line.regions) {
            out.push_back(r.id);
        }
        return out;
    }
};

TEST_F(LineGrouperTest, EmptyInputYieldsNoLines) {
    EXPECT_TRUE(groupByLine({}).empty());
}

TEST_F(LineGrouperTest, OverlappingRegionsShareALine) {
    const auto lines =
        groupByLine({region(1, 0, 10, 10, 10), region(2, 30, 12, 10, 10)});

    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0].lineIndex, 0);
    EXPECT_EQ(ids(lines[0]), (std::vector<i32>{1, 2}));
    EXPECT_EQ(lines[0].boundingBox, (BoundingBox{0, 10, 40, 12}));
    EXPECT_FALSE(lines[0].recognizedText.has_value());
}

TEST_F(LineGrouperTest, RegionsInALineRunLeftToRight) {
    const auto lines = groupByLine({region(1, 80, 10, 10, 10),
                                    region(2, 0, 10, 10, 10),
                                    region(3, 40, 10, 10, 10)});

    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(ids(lines[0]), (std::vector<i32>{2, 3, 1}));
}

TEST_F(LineGrouperTest, LinesAreIndexedTopToBottom) {
    const auto lines = groupByLine({region(1, 0, 200, 40, 10),
                                    region(2, 0, 10, 40, 10),
                                    region(3, 0, 100, 40, 10)});

    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(ids(lines[0]), (std::vector<i32>{2}));
    EXPECT_EQ(ids(lines[1]), (std::vector<i32>{3}));
    EXPECT_EQ(ids(lines[2]), (std::vector<i32>{1}));
    for (usize i = 0; i < lines.size(); ++i) {
        EXPECT_EQ(lines[i].lineIndex, static_cast<i32>(i));
        if (i > 0) {
            EXPECT_LE(lines[i - 1].meanCenterY(), lines[i].meanCenterY());
        }
    }
}

TEST_F(LineGrouperTest, SameLineIsClosedTransitively) {
    // a and c overlap too little on their own, b links them.
    LineGrouper grouper;
    const auto lines = grouper.initialGroups({region(1, 0, 10, 10, 10),
                                              region(2, 30, 14, 10, 10),
                                              region(3, 60, 18, 10, 10)});

    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(ids(lines[0]), (std::vector<i32>{1, 2, 3}));

    const LineGroupOptions options;
    EXPECT_FALSE(isSameLine(region(1, 0, 10, 10, 10),
                            region(3, 60, 18, 10, 10), options, 30.0));
}

TEST_F(LineGrouperTest, NestedRegionJoinsTallNeighbour) {
    const LineGroupOptions options;
    EXPECT_TRUE(isSameLine(region(1, 0, 0, 30, 40), region(2, 40, 15, 10, 10),
                           options, 30.0));
}

TEST_F(LineGrouperTest, NestedRegionFarFromCenterStaysApart) {
    // y 2..12 sits inside y 0..40 but its center is 13px off (limit 8px).
    const LineGroupOptions options;
    EXPECT_FALSE(isSameLine(region(1, 0, 0, 30, 40), region(2, 40, 2, 10, 10),
                            options, 30.0));
    EXPECT_TRUE(isSameLine(region(1, 0, 0, 30, 40), region(2, 40, 8, 10, 10),
                           options, 30.0));
}

TEST_F(LineGrouperTest, OffsetCentersNeedStrongerOverlap) {
    const LineGroupOptions options;
    // Overlap 4/10 meets 0.4, but a 6px center gap needs 0.6.
    EXPECT_FALSE(isSameLine(region(1, 0, 0, 10, 10), region(2, 20, 6, 10, 10),
                            options, 30.0));
    // A 5px center gap is still loose enough for plain 0.5 overlap.
    EXPECT_TRUE(isSameLine(region(1, 0, 0, 10, 10), region(2, 20, 5, 10, 10),
                           options, 30.0));
    // 7px gap with 8/10 overlap clears the stricter ratio.
    EXPECT_TRUE(isSameLine(region(1, 0, 0, 10, 20), region(2, 20, 12, 10, 10),
                           options, 30.0));

    LineGroupOptions noMerge;
    noMerge.enableLineMerge = false;
    const auto lines = groupByLine(
        {region(1, 0, 0, 10, 10), region(2, 20, 6, 10, 10)}, noMerge);
    EXPECT_EQ(lines.size(), 2u);
}

TEST_F(LineGrouperTest, NestedLinesMergeWithinHalfTheirHeight) {
    LineGroup outer;
    outer.boundingBox = {0, 0, 40, 200};
    LineGroup inner;
    inner.boundingBox = {0, 20, 40, 80};

    // Full containment already satisfies the default overlap ratio.
    EXPECT_TRUE(shouldMergeLines(outer, inner, LineGroupOptions{}));

    LineGroupOptions options;
    options.lineMergeOverlapThreshold = 1.5;
    // Centers 100 and 60: 40px apart, limit max(30, 80 / 2) = 40.
    EXPECT_TRUE(shouldMergeLines(outer, inner, options));
    EXPECT_TRUE(shouldMergeLines(inner, outer, options));

    // Centers 100 and 50: 50px apart is over the limit.
    inner.boundingBox = {0, 10, 40, 80};
    EXPECT_FALSE(shouldMergeLines(outer, inner, options));

    // Boxes that neither overlap enough nor nest stay separate.
    LineGroup below;
    below.boundingBox = {0, 150, 40, 10};
    LineGroup above;
    above.boundingBox = {0, 0, 40, 10};
    EXPECT_FALSE(shouldMergeLines(above, below, options));
}

TEST_F(LineGrouperTest, DistantRegionsNeverJoin) {
    const LineGroupOptions options;
    EXPECT_FALSE(isSameLine(region(1, 0, 10, 10, 10),
                            region(2, 100, 10, 10, 10), options, 30.0));
}

TEST_F(LineGrouperTest, AdjacentLinesAreMerged) {
    const std::vector<DiffRegion> regions{region(1, 0, 10, 40, 10),
                                          region(2, 0, 34, 40, 10)};

    LineGrouper grouper;
    EXPECT_EQ(grouper.initialGroups(regions).size(), 2u);

    const auto merged = grouper.group(regions);
    ASSERT_EQ(merged.size(), 1u);
    EXPECT_EQ(merged[0].boundingBox, (BoundingBox{0, 10, 40, 34}));

    LineGroupOptions noMerge;
    noMerge.enableLineMerge = false;
    EXPECT_EQ(groupByLine(regions, noMerge).size(), 2u);
}

TEST_F(LineGrouperTest, WideHolesSplitALine) {
    LineGroup line;
    line.regions = {region(3, 200, 10, 10, 10), region(1, 0, 10, 10, 10),
                    region(2, 20, 10, 10, 10)};
    line.boundingBox = {0, 10, 210, 10};

    LineGrouper grouper;
    const auto split = grouper.splitLines({line});

    ASSERT_EQ(split.size(), 2u);
    EXPECT_EQ(ids(split[0]), (std::vector<i32>{1, 2}));
    EXPECT_EQ(split[0].boundingBox, (BoundingBox{0, 10, 30, 10}));
    EXPECT_EQ(ids(split[1]), (std::vector<i32>{3}));
    EXPECT_EQ(split[1].lineIndex, 1);
}

TEST_F(LineGrouperTest, ExplicitCenterLimitIsHonoured) {
    LineGroupOptions options;
    options.maxCenterYDiff = 1.0;
    options.enableLineMerge = false;

    const auto lines =
        groupByLine({region(1, 0, 10, 10, 10), region(2, 30, 12, 10, 10)},
                    options);
    EXPECT_EQ(lines.size(), 2u);
}

TEST_F(LineGrouperTest, DefaultCenterLimitScalesWithHeight) {
    EXPECT_DOUBLE_EQ(defaultMaxCenterYDiff({}), 30.0);
    EXPECT_DOUBLE_EQ(defaultMaxCenterYDiff({region(1, 0, 0, 10, 10)}), 30.0);
    EXPECT_DOUBLE_EQ(defaultMaxCenterYDiff({region(1, 0, 0, 10, 100)}), 60.0);
}

TEST_F(LineGrouperTest, InvalidOptionsAreRejected) {
    LineGroupOptions options;
    options.overlapThreshold = 1.5;
    EXPECT_THROW(LineGrouper{options}, error::InvalidArgument);

    options = {};
    options.maxXGap = -1;
    EXPECT_THROW(LineGrouper{options}, error::InvalidArgument);
}
