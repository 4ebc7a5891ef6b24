#include <gtest/gtest.h>

#include <spdlog/spdlog.h>

#include "diffline/pipeline/diff_pipeline.hpp"
#include "recognition/fake_recognition_service.hpp"

using namespace diffline;
using namespace diffline::pipeline;
using image::BoundingBox;
using image::RasterBuffer;
using recognition::test::FakeRecognitionService;
using recognition::test::ManualClock;

namespace {

// Emits padded, numbered text so the pipeline has whitespace to strip.
class CountingEncoder : public ImageEncoder {
public:
    auto encode(const RasterBuffer& raster) -> std::string override {
        ++calls;
        lastWidth = raster.width();
        return " line\u3000" + std::to_string(calls) + "\n";
    }

    int calls = 0;
    i32 lastWidth = 0;
};

}  // namespace

class DiffPipelineTest : public ::testing::Test {
protected:
    void SetUp() override {
        spdlog::set_level(spdlog::level::off);
        before_ = RasterBuffer::filled(200, 100, image::colors::WHITE);
        after_ = before_;
        clock_ = std::make_shared<ManualClock>();
        service_ = std::make_shared<FakeRecognitionService>(clock_);
        encoder_ = std::make_shared<CountingEncoder>();
    }

    void addTwoLines() {
        after_.fillRect({10, 10, 40, 8}, image::colors::BLACK);
        after_.fillRect({10, 50, 40, 8}, image::colors::BLACK);
    }

    auto withRecognizer(PipelineOptions options = {}) -> DiffPipeline {
        DiffPipeline pipeline(options);
        pipeline.setRecognizer(
            std::make_shared<recognition::TaskOrchestrator>(service_, clock_),
            encoder_);
        return pipeline;
    }

    RasterBuffer before_;
    RasterBuffer after_;
    std::shared_ptr<ManualClock> clock_;
    std::shared_ptr<FakeRecognitionService> service_;
    std::shared_ptr<CountingEncoder> encoder_;
};

TEST_F(DiffPipelineTest, IdenticalImagesFindNothing) {
    DiffPipeline pipeline;
    const auto result = pipeline.run(before_, after_);

    EXPECT_EQ(result.width, 200);
    EXPECT_EQ(result.height, 100);
    EXPECT_EQ(result.totalDiffPixels, 0u);
    EXPECT_TRUE(result.regions.empty());
    EXPECT_TRUE(result.lines.empty());
    EXPECT_TRUE(result.previews.empty());
    EXPECT_FALSE(result.recognition.has_value());
    EXPECT_TRUE(result.fullText.empty());
    EXPECT_EQ(result.lineOverlay, after_);
}

TEST_F(DiffPipelineTest, FindsRegionsLinesAndPreviews) {
    addTwoLines();
    DiffPipeline pipeline;
    const auto result = pipeline.run(before_, after_);

    EXPECT_EQ(result.totalDiffPixels, 640u);
    ASSERT_EQ(result.regions.size(), 2u);
    ASSERT_EQ(result.lines.size(), 2u);
    EXPECT_EQ(result.lines[0].boundingBox, (BoundingBox{10, 10, 40, 8}));
    EXPECT_EQ(result.lines[1].boundingBox, (BoundingBox{10, 50, 40, 8}));

    ASSERT_EQ(result.previews.size(), 2u);
    EXPECT_EQ(result.previews[0].image.width(), 50);
    EXPECT_EQ(result.previews[0].image.height(), 18);
    EXPECT_EQ(result.previews[0].contentPixels, 320u);
    EXPECT_EQ(result.previews[0].contentColor, image::colors::BLACK);

    EXPECT_EQ(result.diffMask.pixel(10, 10), image::colors::WHITE);
    EXPECT_EQ(result.labeledMask.pixel(10, 50), diff::REGION_PALETTE[1]);
    EXPECT_EQ(result.lineOverlay.pixel(5, 5), diff::LINE_PALETTE[0]);
    EXPECT_EQ(result.lineOverlay.pixel(5, 45), diff::LINE_PALETTE[1]);
    EXPECT_EQ(result.lineOverlay.pixel(30, 14), after_.pixel(30, 14));
    EXPECT_FALSE(result.recognition.has_value());
}

TEST_F(DiffPipelineTest, RunIsRepeatable) {
    addTwoLines();
    DiffPipeline pipeline;
    const auto first = pipeline.run(before_, after_);
    const auto second = pipeline.run(before_, after_);

    EXPECT_EQ(first.regions, second.regions);
    EXPECT_EQ(first.lines, second.lines);
    EXPECT_EQ(first.diffMask, second.diffMask);
}

TEST_F(DiffPipelineTest, LineGroupingCanBeDisabled) {
    addTwoLines();
    PipelineOptions options;
    options.enableLineGrouping = false;
    const auto result = DiffPipeline(options).run(before_, after_);

    EXPECT_EQ(result.regions.size(), 2u);
    EXPECT_TRUE(result.lines.empty());
    EXPECT_TRUE(result.previews.empty());
}

TEST_F(DiffPipelineTest, RecognizedTextIsStrippedAndJoined) {
    addTwoLines();
    auto pipeline = withRecognizer();
    const auto result =
        pipeline.run(before_, after_, RecognitionInput{"hello", {"conv-7"}});

    ASSERT_EQ(result.lines.size(), 2u);
    EXPECT_EQ(result.lines[0].recognizedText, "line1");
    EXPECT_EQ(result.lines[1].recognizedText, "line2");
    EXPECT_EQ(result.fullText, "line1\nline2");
    ASSERT_TRUE(result.recognition.has_value());
    EXPECT_EQ(result.recognition->succeeded, 2u);
    EXPECT_EQ(result.recognition->failed, 0u);

    EXPECT_EQ(encoder_->lastWidth, 50);
    EXPECT_EQ(service_->lastConversationId(), "conv-7");
    const auto sent = service_->submissions();
    ASSERT_EQ(sent.size(), 2u);
    EXPECT_EQ(sent[0].wording, "hello");
}

TEST_F(DiffPipelineTest, BlankWordingSkipsRecognition) {
    addTwoLines();
    auto pipeline = withRecognizer();
    const auto result =
        pipeline.run(before_, after_, RecognitionInput{" \t\u3000", {}});

    EXPECT_EQ(result.lines.size(), 2u);
    EXPECT_FALSE(result.recognition.has_value());
    EXPECT_EQ(service_->submissionCount(), 0u);
    EXPECT_EQ(encoder_->calls, 0);
}

TEST_F(DiffPipelineTest, FailedRecognitionKeepsGeometry) {
    addTwoLines();
    service_->submitHook = [](const recognition::SubmitRequest&)
        -> std::optional<recognition::SubmitResponse> {
        return recognition::SubmitResponse{false, "", "unavailable"};
    };
    auto pipeline = withRecognizer();
    const auto result =
        pipeline.run(before_, after_, RecognitionInput{"hello", {}});

    EXPECT_EQ(result.lines.size(), 2u);
    for (const auto& line : result.lines) {
        EXPECT_FALSE(line.recognizedText.has_value());
    }
    EXPECT_TRUE(result.fullText.empty());
    ASSERT_TRUE(result.recognition.has_value());
    EXPECT_EQ(result.recognition->failed, 2u);
}

TEST_F(DiffPipelineTest, DimensionMismatchPropagates) {
    DiffPipeline pipeline;
    const auto other = RasterBuffer::filled(200, 99, image::colors::WHITE);
    EXPECT_THROW((void)pipeline.run(before_, other), diff::DimensionMismatch);
}

TEST_F(DiffPipelineTest, SetRecognizerNeedsBothParts) {
    DiffPipeline pipeline;
    EXPECT_THROW(pipeline.setRecognizer(nullptr, encoder_),
                 error::InvalidArgument);
}

TEST(StripWhitespaceTest, RemovesAsciiAndUnicodeSpaces) {
    EXPECT_EQ(stripWhitespace(" a b\tc\r\n"), "abc");
    EXPECT_EQ(stripWhitespace("\u4f60\u3000\u597d"), "\u4f60\u597d");
    EXPECT_EQ(stripWhitespace("\u00a0x\ufeff\u2003y"), "xy");
    EXPECT_EQ(stripWhitespace(""), "");
    EXPECT_EQ(stripWhitespace("caf\u00e9"), "caf\u00e9");
}

TEST(JoinRecognizedTextTest, SkipsEmptyLines) {
    std::vector<diff::LineGroup> lines(3);
    lines[0].recognizedText = "first";
    lines[2].recognizedText = "third";
    EXPECT_EQ(joinRecognizedText(lines), "first\nthird");

    lines[1].recognizedText = "";
    EXPECT_EQ(joinRecognizedText(lines), "first\nthird");
}

TEST(ToLineRequestsTest, NamesImagesByLineNumber) {
    std::vector<diff::LineGroup> lines(2);
    lines[0].lineIndex = 0;
    lines[1].lineIndex = 1;
    std::vector<diff::LinePreview> previews(2);
    CountingEncoder encoder;

    const auto requests = toLineRequests(lines, previews, "w", encoder);

    ASSERT_EQ(requests.size(), 2u);
    EXPECT_EQ(requests[1].lineIndex, 1);
    EXPECT_EQ(requests[1].imageName, "line-2.png");
    EXPECT_EQ(requests[1].wording, "w");
    EXPECT_EQ(encoder.calls, 2);

    previews.pop_back();
    EXPECT_THROW((void)toLineRequests(lines, previews, "w", encoder),
                 error::InvalidArgument);
}
