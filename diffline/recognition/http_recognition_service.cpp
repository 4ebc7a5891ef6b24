/*
 * http_recognition_service.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-22

Description: RecognitionService over the submit-task / check-task HTTP API

**************************************************/

#include "http_recognition_service.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "diffline/utils/time.hpp"
#include "diffline/web/curl.hpp"

namespace diffline::recognition {

namespace {

constexpr long HTTP_OK_MIN = 200;
constexpr long HTTP_OK_MAX = 299;

auto optionalString(const json& object, const char* key)
    -> std::optional<std::string> {
    auto it = object.find(key);
    if (it == object.end() || !it->is_string()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

auto flag(const json& object, const char* key) -> bool {
    auto it = object.find(key);
    return it != object.end() && it->is_boolean() && it->get<bool>();
}

auto optionalTime(const json& object, const char* key)
    -> std::optional<TimePoint> {
    auto text = optionalString(object, key);
    if (!text) {
        return std::nullopt;
    }
    auto parsed = utils::parseIsoTimestamp(*text);
    if (!parsed) {
        spdlog::debug("Ignoring unparseable {} '{}'", key, *text);
    }
    return parsed;
}

}  // namespace

auto toSubmitJson(const SubmitRequest& request,
                  const RecognitionContext& context) -> json {
    return {
        {"taskType", request.taskType},
        {"conversationId", context.conversationId},
        {"inputData",
         {{"wording", request.wording},
          {"imageData", request.imageData},
          {"imageName", request.imageName.empty()
                            ? std::string(DEFAULT_IMAGE_NAME)
                            : request.imageName}}},
    };
}

auto submitResponseFromJson(const json& body) -> SubmitResponse {
    SubmitResponse response;
    if (!body.is_object()) {
        response.error = "Malformed submit response";
        return response;
    }
    const bool success = flag(body, "success");
    auto taskId = optionalString(body, "taskId");
    if (success && taskId && !taskId->empty()) {
        response.success = true;
        response.taskId = std::move(*taskId);
        return response;
    }
    response.error = optionalString(body, "error").value_or("Submission rejected");
    return response;
}

auto toCheckJson(const std::vector<std::string>& taskIds) -> json {
    return {{"taskIds", taskIds}};
}

auto checkResponseFromJson(const json& body) -> CheckResponse {
    CheckResponse response;
    if (!body.is_object()) {
        response.error = "Malformed check response";
        return response;
    }
    response.success = flag(body, "success");
    response.error = optionalString(body, "error").value_or("");

    auto tasks = body.find("tasks");
    if (tasks == body.end() || !tasks->is_array()) {
        return response;
    }
    for (const auto& item : *tasks) {
        if (!item.is_object()) {
            continue;
        }
        auto taskId = optionalString(item, "taskId");
        if (!taskId) {
            continue;
        }
        RemoteTask task;
        task.taskId = std::move(*taskId);
        task.status = parseTaskStatus(optionalString(item, "status").value_or(""));
        if (auto output = item.find("outputData");
            output != item.end() && output->is_object()) {
            task.text = optionalString(*output, "text");
            if (auto duration = output->find("duration");
                duration != output->end() && duration->is_number()) {
                task.duration = duration->get<f64>();
            }
        }
        task.errorMessage = optionalString(item, "errorMessage");
        task.triggerId = optionalString(item, "triggerId");
        task.createdAt = optionalTime(item, "createdAt");
        task.updatedAt = optionalTime(item, "updatedAt");
        response.tasks.push_back(std::move(task));
    }
    return response;
}

HttpRecognitionService::HttpRecognitionService(HttpServiceOptions options)
    : options_(std::move(options)) {
    if (options_.baseUrl.empty()) {
        THROW_INVALID_ARGUMENT("Recognition service needs a base URL");
    }
    while (!options_.baseUrl.empty() && options_.baseUrl.back() == '/') {
        options_.baseUrl.pop_back();
    }
}

auto HttpRecognitionService::post(const std::string& path,
                                  const json& body) const -> Reply {
    web::CurlWrapper curl;
    curl.setUrl(options_.baseUrl + path)
        .setRequestMethod("POST")
        .addHeader("Content-Type", "application/json")
        .setTimeout(options_.requestTimeoutSeconds)
        .setFollowLocation(true)
        .setSSLOptions(options_.verifySsl, options_.verifySsl)
        .setRequestBody(body.dump());
    if (!options_.apiKey.empty()) {
        curl.addHeader("apikey", options_.apiKey)
            .addHeader("Authorization", "Bearer " + options_.apiKey);
    }

    auto response = curl.perform();
    Reply reply;
    reply.status = response.status;
    if (response.status < HTTP_OK_MIN || response.status > HTTP_OK_MAX) {
        return reply;
    }
    try {
        reply.body = json::parse(response.body);
    } catch (const json::parse_error& e) {
        THROW_TRANSPORT_ERROR("Invalid JSON from {}{}: {}", options_.baseUrl,
                              path, e.what());
    }
    return reply;
}

auto HttpRecognitionService::submit(const SubmitRequest& request,
                                    const RecognitionContext& context)
    -> SubmitResponse {
    auto reply = post("/submit-task", toSubmitJson(request, context));
    if (reply.body.is_null()) {
        spdlog::warn("submit-task answered HTTP {}", reply.status);
        SubmitResponse response;
        response.error = fmt::format("HTTP {}", reply.status);
        return response;
    }
    auto response = submitResponseFromJson(reply.body);
    if (response.success) {
        spdlog::debug("Submitted task {}", shortTaskId(response.taskId));
    }
    return response;
}

auto HttpRecognitionService::check(const std::vector<std::string>& taskIds)
    -> CheckResponse {
    auto reply = post("/check-task", toCheckJson(taskIds));
    if (reply.body.is_null()) {
        spdlog::warn("check-task answered HTTP {}", reply.status);
        CheckResponse response;
        response.error = fmt::format("HTTP {}", reply.status);
        return response;
    }
    return checkResponseFromJson(reply.body);
}

}  // namespace diffline::recognition
