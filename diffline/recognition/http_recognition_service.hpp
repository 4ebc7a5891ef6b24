/*
 * http_recognition_service.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-22

Description: RecognitionService over the submit-task / check-task HTTP API

**************************************************/

#ifndef DIFFLINE_RECOGNITION_HTTP_RECOGNITION_SERVICE_HPP
#define DIFFLINE_RECOGNITION_HTTP_RECOGNITION_SERVICE_HPP

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "diffline/recognition/recognition_service.hpp"

namespace diffline::recognition {

using json = nlohmann::json;

struct HttpServiceOptions {
    std::string baseUrl;  ///< e.g. https://host/functions/v1
    std::string apiKey;   ///< Sent as apikey and Bearer token when not empty
    long requestTimeoutSeconds = 30;
    bool verifySsl = true;
};

[[nodiscard]] auto toSubmitJson(const SubmitRequest& request,
                                const RecognitionContext& context) -> json;

/**
 * @brief Read a submit reply. A reply without taskId is a failure.
 */
[[nodiscard]] auto submitResponseFromJson(const json& body) -> SubmitResponse;

[[nodiscard]] auto toCheckJson(const std::vector<std::string>& taskIds)
    -> json;

/**
 * @brief Read a check reply. Unknown fields are ignored and timestamps
 * that fail to parse are left empty.
 */
[[nodiscard]] auto checkResponseFromJson(const json& body) -> CheckResponse;

class HttpRecognitionService final : public RecognitionService {
public:
    /**
     * @throws error::InvalidArgument if baseUrl is empty.
     */
    explicit HttpRecognitionService(HttpServiceOptions options);

    /**
     * @throws web::TransportError on network failure or an unreadable body.
     */
    [[nodiscard]] auto submit(const SubmitRequest& request,
                              const RecognitionContext& context)
        -> SubmitResponse override;

    /**
     * @throws web::TransportError on network failure or an unreadable body.
     */
    [[nodiscard]] auto check(const std::vector<std::string>& taskIds)
        -> CheckResponse override;

    [[nodiscard]] auto options() const noexcept -> const HttpServiceOptions& {
        return options_;
    }

private:
    struct Reply {
        long status = 0;
        json body;
    };

    auto post(const std::string& path, const json& body) const -> Reply;

    HttpServiceOptions options_;
};

}  // namespace diffline::recognition

#endif  // DIFFLINE_RECOGNITION_HTTP_RECOGNITION_SERVICE_HPP
