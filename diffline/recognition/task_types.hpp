/*
 * task_types.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-21

Description: Value types exchanged with the recognition service

**************************************************/

#ifndef DIFFLINE_RECOGNITION_TASK_TYPES_HPP
#define DIFFLINE_RECOGNITION_TASK_TYPES_HPP

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "diffline/type/numeric.hpp"

namespace diffline::recognition {

using TimePoint = std::chrono::system_clock::time_point;

inline constexpr std::string_view OCR_TASK_TYPE = "dify-ocr";
inline constexpr std::string_view DEFAULT_IMAGE_NAME = "line-preview.png";

/// Last eight characters of a task id, enough to tell tasks apart in logs.
[[nodiscard]] inline auto shortTaskId(std::string_view taskId) -> std::string {
    constexpr usize SHORT_ID_LENGTH = 8;
    if (taskId.size() > SHORT_ID_LENGTH) {
        taskId.remove_prefix(taskId.size() - SHORT_ID_LENGTH);
    }
    return std::string(taskId);
}

/**
 * @brief Per-call state the remote service needs; passed explicitly.
 */
struct RecognitionContext {
    std::string conversationId;
};

/**
 * @brief One line to be recognized.
 */
struct LineRequest {
    i32 lineIndex = 0;
    std::string wording;    ///< Hint text sent along with the image
    std::string imageData;  ///< Encoded crop, e.g. a PNG data URL
    std::string imageName;  ///< Empty means DEFAULT_IMAGE_NAME
};

enum class LineErrorKind {
    SubmissionFailure,
    RemoteTaskFailure,
    RemoteTaskLost,
    BatchTimeout,
};

[[nodiscard]] constexpr auto toString(LineErrorKind kind) -> std::string_view {
    switch (kind) {
        case LineErrorKind::SubmissionFailure:
            return "SubmissionFailure";
        case LineErrorKind::RemoteTaskFailure:
            return "RemoteTaskFailure";
        case LineErrorKind::RemoteTaskLost:
            return "RemoteTaskLost";
        case LineErrorKind::BatchTimeout:
            return "BatchTimeout";
    }
    return "Unknown";
}

struct LineError {
    LineErrorKind kind = LineErrorKind::SubmissionFailure;
    std::string message;

    auto operator==(const LineError&) const -> bool = default;
};

struct LineResult {
    i32 lineIndex = 0;
    std::string text;
    std::optional<LineError> error;
    std::optional<f64> duration;  ///< As reported by the remote task

    [[nodiscard]] auto ok() const noexcept -> bool { return !error; }
};

struct RecognitionSummary {
    usize total = 0;
    usize succeeded = 0;
    usize failed = 0;
    std::chrono::milliseconds elapsed{0};
};

[[nodiscard]] inline auto summarize(const std::vector<LineResult>& results,
                                    std::chrono::milliseconds elapsed = {})
    -> RecognitionSummary {
    RecognitionSummary summary;
    summary.total = results.size();
    for (const auto& result : results) {
        if (result.ok()) {
            ++summary.succeeded;
        } else {
            ++summary.failed;
        }
    }
    summary.elapsed = elapsed;
    return summary;
}

// Wire level ----------------------------------------------------------------

struct SubmitRequest {
    std::string taskType{OCR_TASK_TYPE};
    std::string wording;
    std::string imageData;
    std::string imageName{DEFAULT_IMAGE_NAME};
};

struct SubmitResponse {
    bool success = false;
    std::string taskId;
    std::string error;
};

enum class TaskStatus {
    Pending,
    Processing,
    Done,
    Failed,
};

/**
 * @brief Map a remote status word; anything unknown counts as Pending.
 */
[[nodiscard]] inline auto parseTaskStatus(std::string_view status)
    -> TaskStatus {
    if (status == "done") {
        return TaskStatus::Done;
    }
    if (status == "failed") {
        return TaskStatus::Failed;
    }
    if (status == "processing") {
        return TaskStatus::Processing;
    }
    return TaskStatus::Pending;
}

/**
 * @brief State of one remote task as reported by a status check.
 */
struct RemoteTask {
    std::string taskId;
    TaskStatus status = TaskStatus::Pending;
    std::optional<std::string> text;
    std::optional<f64> duration;
    std::optional<std::string> errorMessage;
    std::optional<std::string> triggerId;
    std::optional<TimePoint> createdAt;
    std::optional<TimePoint> updatedAt;
};

struct CheckResponse {
    bool success = false;
    std::vector<RemoteTask> tasks;
    std::string error;
};

/**
 * @brief A remote job the orchestrator is tracking for one line.
 */
struct RecognitionTask {
    i32 lineIndex = 0;
    std::string remoteTaskId;
    TimePoint submittedAt;
    i32 resubmitCount = 0;
    bool isFresh = true;  ///< Not yet seen in any status check
};

}  // namespace diffline::recognition

#endif  // DIFFLINE_RECOGNITION_TASK_TYPES_HPP
