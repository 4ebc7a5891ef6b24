/*
 * config.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-23

Description: JSON configuration for the diff pipeline and recognition

**************************************************/

#ifndef DIFFLINE_CONFIG_CONFIG_HPP
#define DIFFLINE_CONFIG_CONFIG_HPP

#include <filesystem>

#include <nlohmann/json.hpp>

#include "diffline/error/exception.hpp"
#include "diffline/log/logging.hpp"
#include "diffline/pipeline/diff_pipeline.hpp"
#include "diffline/recognition/http_recognition_service.hpp"
#include "diffline/recognition/task_orchestrator.hpp"

namespace diffline::config {

using json = nlohmann::json;

class ConfigError : public error::Exception {
public:
    using error::Exception::Exception;
};

#define THROW_CONFIG_ERROR(...)                                              \
    throw diffline::config::ConfigError(DIFFLINE_FILE_NAME, DIFFLINE_FILE_LINE, \
                                        DIFFLINE_FUNC_NAME, __VA_ARGS__)

struct RecognitionConfig {
    recognition::HttpServiceOptions service;
    recognition::OrchestratorOptions orchestrator;
};

/**
 * @brief Everything the library can be configured with.
 *
 * JSON layout: {"diff": {...}, "cluster": {..., "background": {...}},
 * "lines": {...}, "preview": {"padding"},
 * "overlay": {"padding", "lineWidth"}, "recognition": {...},
 * "logging": {"level", "pattern"}}. Durations are in milliseconds.
 */
struct DiffLineConfig {
    pipeline::PipelineOptions pipeline;
    RecognitionConfig recognition;
    log::LoggingConfig logging;
};

/**
 * @brief Read a config object. Missing sections and keys keep defaults.
 * @throws ConfigError on wrong types, unknown enum values or values the
 * options reject.
 */
[[nodiscard]] auto parseConfig(const json& document) -> DiffLineConfig;

/**
 * @throws FileNotReadable if the file cannot be opened.
 * @throws ConfigError if it is not valid JSON or fails parseConfig.
 */
[[nodiscard]] auto loadConfig(const std::filesystem::path& path)
    -> DiffLineConfig;

[[nodiscard]] auto toJson(const DiffLineConfig& config) -> json;

}  // namespace diffline::config

#endif  // DIFFLINE_CONFIG_CONFIG_HPP
