/*
 * diff_pipeline.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-23

Description: End-to-end image diff: mask, regions, lines and their text

**************************************************/

#include "diff_pipeline.hpp"

#include <algorithm>
#include <map>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace diffline::pipeline {

namespace {

auto isUnicodeSpace(u32 codePoint) -> bool {
    switch (codePoint) {
        case 0x0009:
        case 0x000A:
        case 0x000B:
        case 0x000C:
        case 0x000D:
        case 0x0020:
        case 0x00A0:
        case 0x1680:
        case 0x2028:
        case 0x2029:
        case 0x202F:
        case 0x205F:
        case 0x3000:
        case 0xFEFF:
            return true;
        default:
            return codePoint >= 0x2000 && codePoint <= 0x200A;
    }
}

// Length of the UTF-8 sequence starting at text[pos] and its code point;
// invalid bytes decode as themselves with length 1.
auto decodeUtf8(std::string_view text, usize pos) -> std::pair<u32, usize> {
    const auto lead = static_cast<u8>(text[pos]);
    usize length = 1;
    u32 codePoint = lead;
    if ((lead & 0xE0U) == 0xC0U) {
        length = 2;
        codePoint = lead & 0x1FU;
    } else if ((lead & 0xF0U) == 0xE0U) {
        length = 3;
        codePoint = lead & 0x0FU;
    } else if ((lead & 0xF8U) == 0xF0U) {
        length = 4;
        codePoint = lead & 0x07U;
    } else {
        return {lead, 1};
    }
    if (pos + length > text.size()) {
        return {lead, 1};
    }
    for (usize i = 1; i < length; ++i) {
        const auto next = static_cast<u8>(text[pos + i]);
        if ((next & 0xC0U) != 0x80U) {
            return {lead, 1};
        }
        codePoint = (codePoint << 6) | (next & 0x3FU);
    }
    return {codePoint, length};
}

auto isBlank(std::string_view text) -> bool {
    return stripWhitespace(text).empty();
}

auto millisecondsSince(std::chrono::steady_clock::time_point start)
    -> std::chrono::milliseconds {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
}

}  // namespace

void PipelineOptions::validate() const {
    diff.validate();
    cluster.validate();
    lines.validate();
    if (previewPadding < 0) {
        THROW_INVALID_ARGUMENT("Preview padding must be >= 0, got {}",
                               previewPadding);
    }
    if (overlayPadding < 0 || overlayLineWidth < 1) {
        THROW_INVALID_ARGUMENT(
            "Overlay needs padding >= 0 and line width >= 1, got {} and {}",
            overlayPadding, overlayLineWidth);
    }
}

auto stripWhitespace(std::string_view text) -> std::string {
    std::string result;
    result.reserve(text.size());
    usize pos = 0;
    while (pos < text.size()) {
        const auto [codePoint, length] = decodeUtf8(text, pos);
        if (!isUnicodeSpace(codePoint)) {
            result.append(text.substr(pos, length));
        }
        pos += length;
    }
    return result;
}

auto joinRecognizedText(const std::vector<diff::LineGroup>& lines)
    -> std::string {
    std::string fullText;
    for (const auto& line : lines) {
        if (!line.recognizedText || line.recognizedText->empty()) {
            continue;
        }
        if (!fullText.empty()) {
            fullText += '\n';
        }
        fullText += *line.recognizedText;
    }
    return fullText;
}

auto toLineRequests(const std::vector<diff::LineGroup>& lines,
                    const std::vector<diff::LinePreview>& previews,
                    std::string_view wording, ImageEncoder& encoder)
    -> std::vector<recognition::LineRequest> {
    if (lines.size() != previews.size()) {
        THROW_INVALID_ARGUMENT("Got {} previews for {} lines", previews.size(),
                               lines.size());
    }
    std::vector<recognition::LineRequest> requests;
    requests.reserve(lines.size());
    for (usize i = 0; i < lines.size(); ++i) {
        recognition::LineRequest request;
        request.lineIndex = lines[i].lineIndex;
        request.wording = std::string(wording);
        request.imageData = encoder.encode(previews[i].image);
        request.imageName = fmt::format("line-{}.png", lines[i].lineIndex + 1);
        requests.push_back(std::move(request));
    }
    return requests;
}

DiffPipeline::DiffPipeline(PipelineOptions options)
    : options_(std::move(options)),
      engine_(options_.diff),
      clusterer_(options_.cluster),
      grouper_(options_.lines) {
    options_.validate();
}

void DiffPipeline::setRecognizer(
    std::shared_ptr<recognition::TaskOrchestrator> orchestrator,
    std::shared_ptr<ImageEncoder> encoder) {
    if (!orchestrator || !encoder) {
        THROW_INVALID_ARGUMENT("Recognizer needs an orchestrator and an encoder");
    }
    orchestrator_ = std::move(orchestrator);
    encoder_ = std::move(encoder);
}

auto DiffPipeline::run(const image::RasterBuffer& before,
                       const image::RasterBuffer& after,
                       const RecognitionInput& input) const
    -> DiffPipelineResult {
    const auto start = std::chrono::steady_clock::now();
    spdlog::info("Diffing {}x{} images", after.width(), after.height());

    DiffPipelineResult result;
    auto diffResult = engine_.computeDiff(before, after);
    result.width = diffResult.width;
    result.height = diffResult.height;
    result.totalDiffPixels = diffResult.diffPixelCount;

    auto clusters = clusterer_.cluster(diffResult.mask);
    result.regions = std::move(clusters.regions);
    result.labeledMask = std::move(clusters.labeledMask);
    result.diffMask = std::move(diffResult.mask);

    if (options_.enableLineGrouping && !result.regions.empty()) {
        result.lines = grouper_.group(result.regions);
        result.previews.reserve(result.lines.size());
        for (const auto& line : result.lines) {
            result.previews.push_back(diff::renderLinePreview(
                after, result.diffMask, line.boundingBox,
                options_.previewPadding));
        }
        recognizeLines(result, input);
    }
    result.lineOverlay = diff::renderLineOverlay(
        after, result.lines, options_.overlayPadding, options_.overlayLineWidth);

    result.fullText = joinRecognizedText(result.lines);
    result.elapsed = millisecondsSince(start);
    spdlog::info("Found {} regions in {} lines in {}ms", result.regions.size(),
                 result.lines.size(), result.elapsed.count());
    return result;
}

void DiffPipeline::recognizeLines(DiffPipelineResult& result,
                                  const RecognitionInput& input) const {
    if (isBlank(input.wording)) {
        return;
    }
    if (!orchestrator_ || !encoder_) {
        spdlog::warn("Wording given but no recognizer configured; skipping "
                     "recognition");
        return;
    }

    const auto start = std::chrono::steady_clock::now();
    try {
        auto requests =
            toLineRequests(result.lines, result.previews, input.wording,
                           *encoder_);
        auto outcomes = orchestrator_->recognize(requests, input.context);

        std::map<i32, diff::LineGroup*> lineOf;
        for (auto& line : result.lines) {
            lineOf.emplace(line.lineIndex, &line);
        }
        for (const auto& outcome : outcomes) {
            auto it = lineOf.find(outcome.lineIndex);
            if (it == lineOf.end() || !outcome.ok()) {
                continue;
            }
            it->second->recognizedText = stripWhitespace(outcome.text);
        }
        result.recognition = recognition::summarize(outcomes,
                                                    millisecondsSince(start));
        spdlog::info("Recognized {} of {} lines",
                     result.recognition->succeeded, result.recognition->total);
    } catch (const std::exception& e) {
        spdlog::error("Text recognition failed: {}", error::messageOf(e));
    }
}

}  // namespace diffline::pipeline
