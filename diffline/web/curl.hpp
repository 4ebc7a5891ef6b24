/*
 * curl.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-21

Description: Simple HTTP client using libcurl.

**************************************************/

#ifndef DIFFLINE_WEB_CURL_HPP
#define DIFFLINE_WEB_CURL_HPP

#include <memory>
#include <string>

#include "diffline/error/exception.hpp"

namespace diffline::web {

/**
 * @brief Raised when a request cannot be carried out at all.
 */
class TransportError : public error::RuntimeError {
public:
    using error::RuntimeError::RuntimeError;
};

#define THROW_TRANSPORT_ERROR(...)                                            \
    throw diffline::web::TransportError(DIFFLINE_FILE_NAME, DIFFLINE_FILE_LINE, \
                                        DIFFLINE_FUNC_NAME, __VA_ARGS__)

struct HttpResponse {
    long status = 0;
    std::string body;
};

/**
 * @brief A wrapper class for performing one HTTP request at a time using
 * libcurl. Not thread-safe; use one instance per thread.
 */
class CurlWrapper {
public:
    CurlWrapper();
    ~CurlWrapper();

    CurlWrapper(const CurlWrapper &other) = delete;
    auto operator=(const CurlWrapper &other) -> CurlWrapper & = delete;
    CurlWrapper(CurlWrapper &&other) noexcept = delete;
    auto operator=(CurlWrapper &&other) noexcept -> CurlWrapper & = delete;

    auto setUrl(const std::string &url) -> CurlWrapper &;

    /**
     * @brief Sets the HTTP request method (e.g., GET, POST).
     */
    auto setRequestMethod(const std::string &method) -> CurlWrapper &;

    auto addHeader(const std::string &key,
                   const std::string &value) -> CurlWrapper &;

    /**
     * @brief Sets the timeout for the whole request in seconds.
     */
    auto setTimeout(long timeout) -> CurlWrapper &;

    auto setFollowLocation(bool follow) -> CurlWrapper &;

    /**
     * @brief Sets the request body for POST requests. The data is copied.
     */
    auto setRequestBody(const std::string &data) -> CurlWrapper &;

    auto setSSLOptions(bool verifyPeer, bool verifyHost) -> CurlWrapper &;

    /**
     * @brief Performs the request synchronously.
     * @throws TransportError if libcurl reports a failure.
     */
    auto perform() -> HttpResponse;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};

}  // namespace diffline::web

#endif  // DIFFLINE_WEB_CURL_HPP
