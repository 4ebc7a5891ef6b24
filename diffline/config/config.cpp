/*
 * config.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-23

Description: JSON configuration for the diff pipeline and recognition

**************************************************/

#include "config.hpp"

#include <fstream>
#include <type_traits>

#include <spdlog/spdlog.h>

namespace diffline::config {

namespace {

using std::chrono::milliseconds;

auto section(const json& document, const char* name) -> const json* {
    auto it = document.find(name);
    if (it == document.end() || it->is_null()) {
        return nullptr;
    }
    if (!it->is_object()) {
        THROW_CONFIG_ERROR("Config section '{}' must be an object", name);
    }
    return &*it;
}

template <typename T>
void read(const json& object, const char* sectionName, const char* key,
          T& target) {
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return;
    }
    if constexpr (std::is_unsigned_v<T> && !std::is_same_v<T, bool>) {
        if (it->is_number() && it->get<f64>() < 0.0) {
            THROW_CONFIG_ERROR("{}.{} must not be negative", sectionName, key);
        }
    }
    try {
        target = it->get<T>();
    } catch (const json::exception& e) {
        THROW_CONFIG_ERROR("{}.{} has the wrong type: {}", sectionName, key,
                           e.what());
    }
}

void readMillis(const json& object, const char* sectionName, const char* key,
                milliseconds& target) {
    auto count = target.count();
    read(object, sectionName, key, count);
    target = milliseconds(count);
}

auto modeName(diff::DiffMode mode) -> const char* {
    return mode == diff::DiffMode::Baseline ? "baseline" : "adaptive";
}

void readDiff(const json& object, diff::DiffOptions& options) {
    read(object, "diff", "threshold", options.threshold);
    std::string mode = modeName(options.mode);
    read(object, "diff", "mode", mode);
    if (mode == "adaptive") {
        options.mode = diff::DiffMode::Adaptive;
    } else if (mode == "baseline") {
        options.mode = diff::DiffMode::Baseline;
    } else {
        THROW_CONFIG_ERROR("diff.mode must be 'adaptive' or 'baseline', got "
                           "'{}'",
                           mode);
    }
    read(object, "diff", "edgeStrengthFloor", options.edgeStrengthFloor);
    read(object, "diff", "varianceRatio", options.varianceRatio);
    read(object, "diff", "varianceWindow", options.varianceWindow);
    read(object, "diff", "textLikeMultiplier", options.textLikeMultiplier);
    read(object, "diff", "smoothMultiplier", options.smoothMultiplier);
}

void readCluster(const json& object, diff::ClusterOptions& options) {
    read(object, "cluster", "dilateRadius", options.dilateRadius);
    read(object, "cluster", "minAreaSize", options.minAreaSize);
    read(object, "cluster", "enableErode", options.enableErode);
    if (const json* bg = section(object, "background")) {
        auto& filter = options.background;
        read(*bg, "cluster.background", "enabled", filter.enabled);
        read(*bg, "cluster.background", "largeAreaRatio", filter.largeAreaRatio);
        read(*bg, "cluster.background", "tallHeightRatio",
             filter.tallHeightRatio);
        read(*bg, "cluster.background", "sparseDensity", filter.sparseDensity);
        read(*bg, "cluster.background", "squareAspectMin",
             filter.squareAspectMin);
        read(*bg, "cluster.background", "squareAspectMax",
             filter.squareAspectMax);
        read(*bg, "cluster.background", "largeSquareAreaRatio",
             filter.largeSquareAreaRatio);
        read(*bg, "cluster.background", "minFeatures", filter.minFeatures);
    }
}

void readLines(const json& object, diff::LineGroupOptions& options) {
    read(object, "lines", "overlapThreshold", options.overlapThreshold);
    read(object, "lines", "maxXGap", options.maxXGap);
    if (auto it = object.find("maxCenterYDiff"); it != object.end()) {
        if (it->is_null()) {
            options.maxCenterYDiff.reset();
        } else {
            f64 value = 0.0;
            read(object, "lines", "maxCenterYDiff", value);
            options.maxCenterYDiff = value;
        }
    }
    read(object, "lines", "enableLineMerge", options.enableLineMerge);
    read(object, "lines", "lineMergeCenterYThreshold",
         options.lineMergeCenterYThreshold);
    read(object, "lines", "lineMergeOverlapThreshold",
         options.lineMergeOverlapThreshold);
}

void readRecognition(const json& object, RecognitionConfig& config) {
    auto& service = config.service;
    read(object, "recognition", "baseUrl", service.baseUrl);
    read(object, "recognition", "apiKey", service.apiKey);
    read(object, "recognition", "requestTimeoutSeconds",
         service.requestTimeoutSeconds);
    read(object, "recognition", "verifySsl", service.verifySsl);

    auto& orchestrator = config.orchestrator;
    read(object, "recognition", "batchSize", orchestrator.batchSize);
    read(object, "recognition", "maxSubmitRetries",
         orchestrator.maxSubmitRetries);
    readMillis(object, "recognition", "submitBackoffMs",
               orchestrator.submitBackoff);
    readMillis(object, "recognition", "pollIntervalMs",
               orchestrator.pollInterval);
    readMillis(object, "recognition", "gracePeriodMs", orchestrator.gracePeriod);
    readMillis(object, "recognition", "stuckThresholdMs",
               orchestrator.stuckThreshold);
    read(object, "recognition", "maxResubmits", orchestrator.maxResubmits);
    readMillis(object, "recognition", "batchTimeoutMs",
               orchestrator.batchTimeout);
    if (service.requestTimeoutSeconds <= 0) {
        THROW_CONFIG_ERROR("recognition.requestTimeoutSeconds must be > 0, "
                           "got {}",
                           service.requestTimeoutSeconds);
    }
}

}  // namespace

auto parseConfig(const json& document) -> DiffLineConfig {
    if (!document.is_object()) {
        THROW_CONFIG_ERROR("Config root must be a JSON object");
    }

    DiffLineConfig config;
    auto& pipeline = config.pipeline;
    if (const json* diff = section(document, "diff")) {
        readDiff(*diff, pipeline.diff);
    }
    if (const json* cluster = section(document, "cluster")) {
        readCluster(*cluster, pipeline.cluster);
    }
    if (const json* lines = section(document, "lines")) {
        read(*lines, "lines", "enabled", pipeline.enableLineGrouping);
        readLines(*lines, pipeline.lines);
    }
    if (const json* preview = section(document, "preview")) {
        read(*preview, "preview", "padding", pipeline.previewPadding);
    }
    if (const json* overlay = section(document, "overlay")) {
        read(*overlay, "overlay", "padding", pipeline.overlayPadding);
        read(*overlay, "overlay", "lineWidth", pipeline.overlayLineWidth);
    }
    if (const json* recognition = section(document, "recognition")) {
        readRecognition(*recognition, config.recognition);
    }
    if (const json* logging = section(document, "logging")) {
        read(*logging, "logging", "level", config.logging.level);
        read(*logging, "logging", "pattern", config.logging.pattern);
    }

    try {
        pipeline.validate();
        config.recognition.orchestrator.validate();
        static_cast<void>(log::parseLogLevel(config.logging.level));
    } catch (const error::InvalidArgument& e) {
        THROW_CONFIG_ERROR("Invalid configuration: {}", e.getMessage());
    }
    return config;
}

auto loadConfig(const std::filesystem::path& path) -> DiffLineConfig {
    std::ifstream file(path);
    if (!file.is_open()) {
        THROW_FILE_NOT_READABLE("Cannot open config file {}", path.string());
    }

    json document;
    try {
        file >> document;
    } catch (const json::parse_error& e) {
        THROW_CONFIG_ERROR("Config file {} is not valid JSON: {}",
                           path.string(), e.what());
    }
    spdlog::info("Loaded config from {}", path.string());
    return parseConfig(document);
}

auto toJson(const DiffLineConfig& config) -> json {
    const auto& pipeline = config.pipeline;
    const auto& diff = pipeline.diff;
    const auto& cluster = pipeline.cluster;
    const auto& bg = cluster.background;
    const auto& lines = pipeline.lines;
    const auto& service = config.recognition.service;
    const auto& orchestrator = config.recognition.orchestrator;

    json document;
    document["diff"] = {
        {"threshold", diff.threshold},
        {"mode", modeName(diff.mode)},
        {"edgeStrengthFloor", diff.edgeStrengthFloor},
        {"varianceRatio", diff.varianceRatio},
        {"varianceWindow", diff.varianceWindow},
        {"textLikeMultiplier", diff.textLikeMultiplier},
        {"smoothMultiplier", diff.smoothMultiplier},
    };
    document["cluster"] = {
        {"dilateRadius", cluster.dilateRadius},
        {"minAreaSize", cluster.minAreaSize},
        {"enableErode", cluster.enableErode},
        {"background",
         {
             {"enabled", bg.enabled},
             {"largeAreaRatio", bg.largeAreaRatio},
             {"tallHeightRatio", bg.tallHeightRatio},
             {"sparseDensity", bg.sparseDensity},
             {"squareAspectMin", bg.squareAspectMin},
             {"squareAspectMax", bg.squareAspectMax},
             {"largeSquareAreaRatio", bg.largeSquareAreaRatio},
             {"minFeatures", bg.minFeatures},
         }},
    };
    document["lines"] = {
        {"enabled", pipeline.enableLineGrouping},
        {"overlapThreshold", lines.overlapThreshold},
        {"maxXGap", lines.maxXGap},
        {"maxCenterYDiff", lines.maxCenterYDiff
                               ? json(*lines.maxCenterYDiff)
                               : json(nullptr)},
        {"enableLineMerge", lines.enableLineMerge},
        {"lineMergeCenterYThreshold", lines.lineMergeCenterYThreshold},
        {"lineMergeOverlapThreshold", lines.lineMergeOverlapThreshold},
    };
    document["preview"] = {{"padding", pipeline.previewPadding}};
    document["overlay"] = {{"padding", pipeline.overlayPadding},
                           {"lineWidth", pipeline.overlayLineWidth}};
    document["recognition"] = {
        {"baseUrl", service.baseUrl},
        {"apiKey", service.apiKey},
        {"requestTimeoutSeconds", service.requestTimeoutSeconds},
        {"verifySsl", service.verifySsl},
        {"batchSize", orchestrator.batchSize},
        {"maxSubmitRetries", orchestrator.maxSubmitRetries},
        {"submitBackoffMs", orchestrator.submitBackoff.count()},
        {"pollIntervalMs", orchestrator.pollInterval.count()},
        {"gracePeriodMs", orchestrator.gracePeriod.count()},
        {"stuckThresholdMs", orchestrator.stuckThreshold.count()},
        {"maxResubmits", orchestrator.maxResubmits},
        {"batchTimeoutMs", orchestrator.batchTimeout.count()},
    };
    document["logging"] = {
        {"level", config.logging.level},
        {"pattern", config.logging.pattern},
    };
    return document;
}

}  // namespace diffline::config
