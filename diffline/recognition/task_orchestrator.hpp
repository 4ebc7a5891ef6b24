/*
 * task_orchestrator.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-22

Description: Batched submit / poll driver for remote line recognition

**************************************************/

#ifndef DIFFLINE_RECOGNITION_TASK_ORCHESTRATOR_HPP
#define DIFFLINE_RECOGNITION_TASK_ORCHESTRATOR_HPP

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <span>
#include <string>
#include <vector>

#include "diffline/error/exception.hpp"
#include "diffline/recognition/clock.hpp"
#include "diffline/recognition/recognition_service.hpp"

namespace diffline::recognition {

class RecognitionError : public error::RuntimeError {
public:
    using error::RuntimeError::RuntimeError;
};

#define THROW_RECOGNITION_ERROR(...)                                \
    throw diffline::recognition::RecognitionError(                  \
        DIFFLINE_FILE_NAME, DIFFLINE_FILE_LINE, DIFFLINE_FUNC_NAME, \
        __VA_ARGS__)

struct OrchestratorOptions {
    usize batchSize = 10;
    i32 maxSubmitRetries = 3;
    std::chrono::milliseconds submitBackoff{1000};  ///< times the attempt number
    std::chrono::milliseconds pollInterval{3000};
    std::chrono::milliseconds gracePeriod{10000};
    std::chrono::milliseconds stuckThreshold{40000};
    i32 maxResubmits = 3;  ///< per line, across all causes
    std::chrono::milliseconds batchTimeout{std::chrono::minutes(10)};

    /**
     * @throws error::InvalidArgument on a zero batch size or poll interval,
     * fewer than one submit attempt, or negative durations.
     */
    void validate() const;
};

/// Called after every batch with (lines resolved so far, lines requested).
using ProgressCallback = std::function<void(usize, usize)>;

/**
 * @brief Drives remote recognition of many lines with recovery.
 *
 * Lines are processed in batches, one batch at a time. A batch submits
 * all of its lines concurrently, then polls their remote tasks until each
 * line has a result or the batch times out. Tasks that disappear or fail
 * are resubmitted, and a task without progress for stuckThreshold gets a
 * racing duplicate while it keeps running. The first finished task of a
 * line wins; later ones are ignored. Every requested line ends up with
 * exactly one LineResult, either text or a LineError.
 */
class TaskOrchestrator {
public:
    TaskOrchestrator(std::shared_ptr<RecognitionService> service,
                     std::shared_ptr<Clock> clock,
                     OrchestratorOptions options = {});

    explicit TaskOrchestrator(std::shared_ptr<RecognitionService> service,
                              OrchestratorOptions options = {});

    void onProgress(ProgressCallback callback);

    /**
     * @brief Recognize every request; results are sorted by lineIndex.
     *
     * Requests repeating an earlier lineIndex are ignored.
     */
    [[nodiscard]] auto recognize(const std::vector<LineRequest>& requests,
                                 const RecognitionContext& context)
        -> std::vector<LineResult>;

    /**
     * @brief Recognize a single line.
     * @throws RecognitionError carrying the line's error message.
     */
    [[nodiscard]] auto recognizeOne(const LineRequest& request,
                                    const RecognitionContext& context)
        -> std::string;

    [[nodiscard]] auto options() const noexcept -> const OrchestratorOptions& {
        return options_;
    }

private:
    struct SubmitOutcome {
        std::string taskId;  ///< Empty on failure
        std::string error;
    };

    class BatchRun;

    auto submitWithRetry(const LineRequest& request,
                         const RecognitionContext& context) -> SubmitOutcome;

    auto processBatch(std::span<const LineRequest> batch,
                      const RecognitionContext& context)
        -> std::map<i32, LineResult>;

    std::shared_ptr<RecognitionService> service_;
    std::shared_ptr<Clock> clock_;
    OrchestratorOptions options_;
    ProgressCallback progress_;
};

}  // namespace diffline::recognition

#endif  // DIFFLINE_RECOGNITION_TASK_ORCHESTRATOR_HPP
