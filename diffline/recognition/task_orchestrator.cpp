/*
 * task_orchestrator.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-22

Description: Batched submit / poll driver for remote line recognition

**************************************************/

#include "task_orchestrator.hpp"

#include <algorithm>
#include <future>
#include <optional>
#include <set>
#include <unordered_map>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "diffline/utils/time.hpp"

namespace diffline::recognition {

namespace {

auto seconds(std::chrono::milliseconds duration) -> long long {
    return std::chrono::duration_cast<std::chrono::seconds>(duration).count();
}

auto toSubmitRequest(const LineRequest& request) -> SubmitRequest {
    SubmitRequest submit;
    submit.wording = request.wording;
    submit.imageData = request.imageData;
    if (!request.imageName.empty()) {
        submit.imageName = request.imageName;
    }
    return submit;
}

auto failedResult(i32 lineIndex, LineErrorKind kind, std::string message)
    -> LineResult {
    LineResult result;
    result.lineIndex = lineIndex;
    result.error = LineError{kind, std::move(message)};
    return result;
}

}  // namespace

void OrchestratorOptions::validate() const {
    using std::chrono::milliseconds;
    if (batchSize == 0) {
        THROW_INVALID_ARGUMENT("Batch size must be positive");
    }
    if (maxSubmitRetries < 1) {
        THROW_INVALID_ARGUMENT("Need at least one submit attempt, got {}",
                               maxSubmitRetries);
    }
    if (maxResubmits < 0) {
        THROW_INVALID_ARGUMENT("maxResubmits must be >= 0, got {}",
                               maxResubmits);
    }
    if (pollInterval <= milliseconds::zero()) {
        THROW_INVALID_ARGUMENT("Poll interval must be positive, got {}ms",
                               pollInterval.count());
    }
    if (submitBackoff < milliseconds::zero() ||
        gracePeriod < milliseconds::zero() ||
        stuckThreshold < milliseconds::zero() ||
        batchTimeout < milliseconds::zero()) {
        THROW_INVALID_ARGUMENT("Recognition durations must not be negative");
    }
}

/**
 * State of one batch between its first submission and its last poll.
 */
class TaskOrchestrator::BatchRun {
public:
    BatchRun(TaskOrchestrator& owner, std::span<const LineRequest> batch,
             const RecognitionContext& context)
        : owner_(owner), context_(context) {
        for (const auto& request : batch) {
            requests_.emplace(request.lineIndex, &request);
        }
    }

    auto run() -> std::map<i32, LineResult> {
        submitAll();
        if (tasks_.empty()) {
            return std::move(results_);
        }

        auto& clock = *owner_.clock_;
        const auto& options = owner_.options_;
        const auto start = clock.now();
        while (!allResolved() && clock.now() - start < options.batchTimeout) {
            clock.sleepFor(options.pollInterval);
            pollOnce();
        }

        for (const auto& [lineIndex, request] : requests_) {
            if (!results_.contains(lineIndex)) {
                spdlog::error("Line {} timed out after {}s", lineIndex,
                              seconds(options.batchTimeout));
                results_.emplace(
                    lineIndex,
                    failedResult(lineIndex, LineErrorKind::BatchTimeout,
                                 fmt::format("Recognition timed out after {}s",
                                             seconds(options.batchTimeout))));
            }
        }
        return std::move(results_);
    }

private:
    struct Resubmission {
        i32 lineIndex = 0;
        std::optional<LineError> failure;  ///< Empty for a stuck task
    };

    void submitAll() {
        spdlog::info("Submitting {} lines concurrently", requests_.size());
        std::vector<std::pair<i32, std::future<SubmitOutcome>>> pending;
        pending.reserve(requests_.size());
        for (const auto& [lineIndex, request] : requests_) {
            pending.emplace_back(
                lineIndex,
                std::async(std::launch::async, [this, request = request] {
                    return owner_.submitWithRetry(*request, context_);
                }));
        }

        for (auto& [lineIndex, future] : pending) {
            auto outcome = future.get();
            if (outcome.taskId.empty()) {
                spdlog::error("Line {} could not be submitted: {}", lineIndex,
                              outcome.error);
                results_.emplace(
                    lineIndex,
                    failedResult(lineIndex, LineErrorKind::SubmissionFailure,
                                 std::move(outcome.error)));
                continue;
            }
            spdlog::info("Line {} submitted as {}", lineIndex,
                         shortTaskId(outcome.taskId));
            track(lineIndex, std::move(outcome.taskId), 0);
        }
    }

    void track(i32 lineIndex, std::string taskId, i32 resubmitCount) {
        RecognitionTask task;
        task.lineIndex = lineIndex;
        task.remoteTaskId = std::move(taskId);
        task.submittedAt = owner_.clock_->now();
        task.resubmitCount = resubmitCount;
        task.isFresh = true;
        tasks_.push_back(std::move(task));
    }

    [[nodiscard]] auto allResolved() const -> bool {
        return std::all_of(requests_.begin(), requests_.end(),
                           [this](const auto& entry) {
                               return results_.contains(entry.first);
                           });
    }

    void pollOnce() {
        std::vector<std::string> taskIds;
        taskIds.reserve(tasks_.size());
        for (const auto& task : tasks_) {
            taskIds.push_back(task.remoteTaskId);
        }
        spdlog::debug("Polling {} tasks", taskIds.size());

        CheckResponse response;
        try {
            response = owner_.service_->check(taskIds);
        } catch (const std::exception& e) {
            spdlog::warn("Status check failed, retrying next tick: {}",
                         error::messageOf(e));
            return;
        }
        if (!response.success) {
            spdlog::warn("Status check rejected, retrying next tick: {}",
                         response.error);
            return;
        }

        std::unordered_map<std::string, const RemoteTask*> reported;
        for (const auto& remote : response.tasks) {
            reported.emplace(remote.taskId, &remote);
        }

        const auto now = owner_.clock_->now();
        const auto& options = owner_.options_;
        std::vector<RecognitionTask> kept;
        kept.reserve(tasks_.size());

        for (auto& task : tasks_) {
            if (results_.contains(task.lineIndex)) {
                continue;
            }

            auto it = reported.find(task.remoteTaskId);
            if (it == reported.end()) {
                if (now - task.submittedAt < options.gracePeriod) {
                    kept.push_back(std::move(task));
                    continue;
                }
                spdlog::warn("Task {} of line {} is gone",
                             shortTaskId(task.remoteTaskId), task.lineIndex);
                requestResubmit(
                    task.lineIndex,
                    LineError{LineErrorKind::RemoteTaskLost,
                              fmt::format("Remote task {} no longer exists",
                                          task.remoteTaskId)});
                continue;
            }

            const RemoteTask& remote = *it->second;
            task.isFresh = false;
            switch (remote.status) {
                case TaskStatus::Done: {
                    LineResult result;
                    result.lineIndex = task.lineIndex;
                    result.text = remote.text.value_or("");
                    result.duration = remote.duration;
                    results_.emplace(task.lineIndex, std::move(result));
                    spdlog::info("Line {} recognized by {}", task.lineIndex,
                                 shortTaskId(task.remoteTaskId));
                    break;
                }
                case TaskStatus::Failed: {
                    const auto message =
                        remote.errorMessage.value_or("Remote task failed");
                    spdlog::warn("Task {} of line {} failed: {}",
                                 shortTaskId(task.remoteTaskId), task.lineIndex,
                                 message);
                    requestResubmit(
                        task.lineIndex,
                        LineError{LineErrorKind::RemoteTaskFailure, message});
                    break;
                }
                case TaskStatus::Pending:
                case TaskStatus::Processing: {
                    const auto lastProgress =
                        remote.updatedAt.value_or(task.submittedAt);
                    const auto idle =
                        std::chrono::duration_cast<std::chrono::milliseconds>(
                            now - lastProgress);
                    if (idle > options.stuckThreshold &&
                        resubmitCounts_[task.lineIndex] < options.maxResubmits) {
                        spdlog::warn(
                            "Line {} stuck for {}s (last progress {}), adding "
                            "a racing task",
                            task.lineIndex, seconds(idle),
                            utils::toIsoTimestamp(lastProgress));
                        requestResubmit(task.lineIndex, std::nullopt);
                    }
                    kept.push_back(std::move(task));
                    break;
                }
            }
        }
        tasks_ = std::move(kept);

        resubmitRequested();
        resubmissions_.clear();
    }

    void requestResubmit(i32 lineIndex, std::optional<LineError> failure) {
        auto it = std::find_if(resubmissions_.begin(), resubmissions_.end(),
                               [lineIndex](const Resubmission& entry) {
                                   return entry.lineIndex == lineIndex;
                               });
        if (it == resubmissions_.end()) {
            resubmissions_.push_back({lineIndex, std::move(failure)});
        } else if (failure) {
            it->failure = std::move(failure);
        }
    }

    void resubmitRequested() {
        const auto& options = owner_.options_;
        for (auto& entry : resubmissions_) {
            const i32 lineIndex = entry.lineIndex;
            if (results_.contains(lineIndex)) {
                continue;
            }

            i32& count = resubmitCounts_[lineIndex];
            if (count < options.maxResubmits) {
                ++count;
                spdlog::info("Resubmitting line {} ({}/{})", lineIndex, count,
                             options.maxResubmits);
                auto outcome =
                    owner_.submitWithRetry(*requests_.at(lineIndex), context_);
                if (!outcome.taskId.empty()) {
                    track(lineIndex, std::move(outcome.taskId), count);
                    continue;
                }
                spdlog::error("Resubmission of line {} failed: {}", lineIndex,
                              outcome.error);
                results_.emplace(
                    lineIndex,
                    failedResult(lineIndex, LineErrorKind::SubmissionFailure,
                                 std::move(outcome.error)));
                continue;
            }

            // Out of resubmissions; any racing sibling is dropped next poll.
            if (entry.failure) {
                spdlog::error("Line {} gave up after {} resubmissions: {}",
                              lineIndex, options.maxResubmits,
                              entry.failure->message);
                LineResult result;
                result.lineIndex = lineIndex;
                result.error = std::move(entry.failure);
                results_.emplace(lineIndex, std::move(result));
            }
        }
    }

    TaskOrchestrator& owner_;
    const RecognitionContext& context_;
    std::map<i32, const LineRequest*> requests_;
    std::map<i32, LineResult> results_;
    std::map<i32, i32> resubmitCounts_;
    std::vector<RecognitionTask> tasks_;
    std::vector<Resubmission> resubmissions_;
};

TaskOrchestrator::TaskOrchestrator(std::shared_ptr<RecognitionService> service,
                                   std::shared_ptr<Clock> clock,
                                   OrchestratorOptions options)
    : service_(std::move(service)),
      clock_(std::move(clock)),
      options_(options) {
    if (!service_) {
        THROW_INVALID_ARGUMENT("TaskOrchestrator needs a recognition service");
    }
    if (!clock_) {
        THROW_INVALID_ARGUMENT("TaskOrchestrator needs a clock");
    }
    options_.validate();
}

TaskOrchestrator::TaskOrchestrator(std::shared_ptr<RecognitionService> service,
                                   OrchestratorOptions options)
    : TaskOrchestrator(std::move(service), std::make_shared<SystemClock>(),
                       options) {}

void TaskOrchestrator::onProgress(ProgressCallback callback) {
    progress_ = std::move(callback);
}

auto TaskOrchestrator::submitWithRetry(const LineRequest& request,
                                       const RecognitionContext& context)
    -> SubmitOutcome {
    const auto submit = toSubmitRequest(request);
    SubmitOutcome outcome;
    for (i32 attempt = 1; attempt <= options_.maxSubmitRetries; ++attempt) {
        try {
            auto response = service_->submit(submit, context);
            if (response.success && !response.taskId.empty()) {
                outcome.taskId = std::move(response.taskId);
                outcome.error.clear();
                return outcome;
            }
            outcome.error = response.error.empty() ? "Submission rejected"
                                                   : std::move(response.error);
        } catch (const std::exception& e) {
            outcome.error = error::messageOf(e);
        }

        spdlog::warn("Submit attempt {}/{} for line {} failed: {}", attempt,
                     options_.maxSubmitRetries, request.lineIndex,
                     outcome.error);
        if (attempt < options_.maxSubmitRetries) {
            clock_->sleepFor(options_.submitBackoff * attempt);
        }
    }
    return outcome;
}

auto TaskOrchestrator::processBatch(std::span<const LineRequest> batch,
                                    const RecognitionContext& context)
    -> std::map<i32, LineResult> {
    return BatchRun(*this, batch, context).run();
}

auto TaskOrchestrator::recognize(const std::vector<LineRequest>& requests,
                                 const RecognitionContext& context)
    -> std::vector<LineResult> {
    std::vector<LineRequest> unique;
    std::set<i32> seen;
    for (const auto& request : requests) {
        if (!seen.insert(request.lineIndex).second) {
            spdlog::warn("Ignoring duplicate request for line {}",
                         request.lineIndex);
            continue;
        }
        unique.push_back(request);
    }
    if (unique.empty()) {
        return {};
    }

    const usize total = unique.size();
    const usize batchCount = (total + options_.batchSize - 1) / options_.batchSize;
    spdlog::info("Recognizing {} lines in {} batches of up to {}", total,
                 batchCount, options_.batchSize);

    const auto started = clock_->now();
    std::map<i32, LineResult> merged;
    for (usize begin = 0; begin < total; begin += options_.batchSize) {
        const usize size = std::min(options_.batchSize, total - begin);
        spdlog::info("Batch {}/{} ({} lines)",
                     begin / options_.batchSize + 1, batchCount, size);

        auto results = processBatch(
            std::span<const LineRequest>(unique).subspan(begin, size), context);
        for (auto& [lineIndex, result] : results) {
            merged.try_emplace(lineIndex, std::move(result));
        }

        spdlog::info("Resolved {}/{} lines", merged.size(), total);
        if (progress_) {
            progress_(merged.size(), total);
        }
    }

    std::vector<LineResult> ordered;
    ordered.reserve(merged.size());
    for (auto& [lineIndex, result] : merged) {
        ordered.push_back(std::move(result));
    }

    const auto summary = summarize(
        ordered, std::chrono::duration_cast<std::chrono::milliseconds>(
                     clock_->now() - started));
    spdlog::info("Recognition finished: {} succeeded, {} failed in {}ms",
                 summary.succeeded, summary.failed, summary.elapsed.count());
    return ordered;
}

auto TaskOrchestrator::recognizeOne(const LineRequest& request,
                                    const RecognitionContext& context)
    -> std::string {
    auto results = recognize({request}, context);
    if (results.empty()) {
        THROW_RECOGNITION_ERROR("No result for line {}", request.lineIndex);
    }
    auto& result = results.front();
    if (result.error) {
        THROW_RECOGNITION_ERROR("Line {} failed ({}): {}", result.lineIndex,
                                toString(result.error->kind),
                                result.error->message);
    }
    return std::move(result.text);
}

}  // namespace diffline::recognition
