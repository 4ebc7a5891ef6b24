/*
 * recognition_service.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-21

Description: Remote text recognition contract

**************************************************/

#ifndef DIFFLINE_RECOGNITION_RECOGNITION_SERVICE_HPP
#define DIFFLINE_RECOGNITION_RECOGNITION_SERVICE_HPP

#include <string>
#include <vector>

#include "diffline/recognition/task_types.hpp"

namespace diffline::recognition {

/**
 * @brief Asynchronous per-line recognition backend.
 *
 * submit() may be called from several threads at once. Implementations
 * report transport problems by throwing (see web::TransportError) and
 * business failures through success = false.
 */
class RecognitionService {
public:
    virtual ~RecognitionService() = default;

    [[nodiscard]] virtual auto submit(const SubmitRequest& request,
                                      const RecognitionContext& context)
        -> SubmitResponse = 0;

    [[nodiscard]] virtual auto check(const std::vector<std::string>& taskIds)
        -> CheckResponse = 0;
};

}  // namespace diffline::recognition

#endif  // DIFFLINE_RECOGNITION_RECOGNITION_SERVICE_HPP
