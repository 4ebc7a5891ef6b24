/*
 * diff_pipeline.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-23

Description: End-to-end image diff: mask, regions, lines and their text

**************************************************/

#ifndef DIFFLINE_PIPELINE_DIFF_PIPELINE_HPP
#define DIFFLINE_PIPELINE_DIFF_PIPELINE_HPP

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "diffline/diff/diff_engine.hpp"
#include "diffline/diff/line_grouper.hpp"
#include "diffline/diff/line_overlay.hpp"
#include "diffline/diff/line_preview.hpp"
#include "diffline/diff/region_clusterer.hpp"
#include "diffline/recognition/task_orchestrator.hpp"

namespace diffline::pipeline {

/**
 * @brief Turns a raster into the string sent as imageData, typically a
 * PNG data URL. Supplied by the embedding application.
 */
class ImageEncoder {
public:
    virtual ~ImageEncoder() = default;

    [[nodiscard]] virtual auto encode(const image::RasterBuffer& raster)
        -> std::string = 0;
};

struct PipelineOptions {
    diff::DiffOptions diff;
    diff::ClusterOptions cluster;
    diff::LineGroupOptions lines;
    bool enableLineGrouping = true;
    i32 previewPadding = diff::DEFAULT_PREVIEW_PADDING;
    i32 overlayPadding = diff::DEFAULT_OVERLAY_PADDING;
    i32 overlayLineWidth = diff::DEFAULT_OVERLAY_LINE_WIDTH;

    void validate() const;
};

/**
 * @brief What the recognition stage needs; a blank wording skips it.
 */
struct RecognitionInput {
    std::string wording;
    recognition::RecognitionContext context;
};

struct DiffPipelineResult {
    i32 width = 0;
    i32 height = 0;
    usize totalDiffPixels = 0;
    image::RasterBuffer diffMask;
    image::RasterBuffer labeledMask;
    image::RasterBuffer lineOverlay;  ///< after, with every line outlined
    std::vector<diff::DiffRegion> regions;
    std::vector<diff::LineGroup> lines;
    std::vector<diff::LinePreview> previews;  ///< previews[i] is lines[i]
    std::optional<recognition::RecognitionSummary> recognition;
    std::string fullText;
    std::chrono::milliseconds elapsed{0};
};

/**
 * @brief Remove every whitespace character, ASCII or Unicode (e.g. the
 * ideographic space U+3000), from UTF-8 text.
 */
[[nodiscard]] auto stripWhitespace(std::string_view text) -> std::string;

/**
 * @brief Non-empty recognized texts, top to bottom, one per line.
 */
[[nodiscard]] auto joinRecognizedText(const std::vector<diff::LineGroup>& lines)
    -> std::string;

/**
 * @brief Build one recognition request per line from its preview.
 *
 * Image names are "line-<lineIndex + 1>.png".
 */
[[nodiscard]] auto toLineRequests(const std::vector<diff::LineGroup>& lines,
                                  const std::vector<diff::LinePreview>& previews,
                                  std::string_view wording,
                                  ImageEncoder& encoder)
    -> std::vector<recognition::LineRequest>;

class DiffPipeline {
public:
    explicit DiffPipeline(PipelineOptions options = {});

    /**
     * @brief Enable the recognition stage.
     */
    void setRecognizer(std::shared_ptr<recognition::TaskOrchestrator> orchestrator,
                       std::shared_ptr<ImageEncoder> encoder);

    /**
     * @brief Diff before against after and describe what changed.
     *
     * Previews and recognition use the pixels of after. Recognition runs
     * only when input.wording is not blank and a recognizer is set; its
     * failures are logged and leave the lines without text.
     *
     * @throws diff::DimensionMismatch if the rasters differ in size.
     */
    [[nodiscard]] auto run(const image::RasterBuffer& before,
                           const image::RasterBuffer& after,
                           const RecognitionInput& input = {}) const
        -> DiffPipelineResult;

    [[nodiscard]] auto options() const noexcept -> const PipelineOptions& {
        return options_;
    }

private:
    void recognizeLines(DiffPipelineResult& result,
                        const RecognitionInput& input) const;

    PipelineOptions options_;
    diff::DiffEngine engine_;
    diff::RegionClusterer clusterer_;
    diff::LineGrouper grouper_;
    std::shared_ptr<recognition::TaskOrchestrator> orchestrator_;
    std::shared_ptr<ImageEncoder> encoder_;
};

}  // namespace diffline::pipeline

#endif  // DIFFLINE_PIPELINE_DIFF_PIPELINE_HPP
