/*
 * curl.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "curl.hpp"

#include <curl/curl.h>

#include <mutex>

#include <spdlog/spdlog.h>

namespace diffline::web {

namespace {

constexpr size_t RESPONSE_RESERVE = 4096;

std::once_flag globalInitFlag;

void ensureGlobalInit() {
    std::call_once(globalInitFlag, [] {
        if (curl_global_init(CURL_GLOBAL_ALL) != CURLE_OK) {
            spdlog::error("curl_global_init failed");
        }
    });
}

}  // namespace

class CurlWrapper::Impl {
public:
    Impl();
    ~Impl();

    Impl(const Impl &) = delete;
    auto operator=(const Impl &) -> Impl & = delete;

    void setUrl(const std::string &url);
    void setRequestMethod(const std::string &method);
    void addHeader(const std::string &key, const std::string &value);
    void setTimeout(long timeout);
    void setFollowLocation(bool follow);
    void setRequestBody(const std::string &data);
    void setSSLOptions(bool verifyPeer, bool verifyHost);
    auto perform() -> HttpResponse;

private:
    CURL *handle_;
    curl_slist *headersList_;
    std::string url_;
    std::string requestBody_;
    std::string responseData_;

    static auto writeCallback(void *contents, size_t size, size_t nmemb,
                              void *userp) -> size_t;
};

CurlWrapper::CurlWrapper() : pImpl_(std::make_unique<Impl>()) {}

CurlWrapper::~CurlWrapper() = default;

auto CurlWrapper::setUrl(const std::string &url) -> CurlWrapper & {
    pImpl_->setUrl(url);
    return *this;
}

auto CurlWrapper::setRequestMethod(const std::string &method) -> CurlWrapper & {
    pImpl_->setRequestMethod(method);
    return *this;
}

auto CurlWrapper::addHeader(const std::string &key, const std::string &value)
    -> CurlWrapper & {
    pImpl_->addHeader(key, value);
    return *this;
}

auto CurlWrapper::setTimeout(long timeout) -> CurlWrapper & {
    pImpl_->setTimeout(timeout);
    return *this;
}

auto CurlWrapper::setFollowLocation(bool follow) -> CurlWrapper & {
    pImpl_->setFollowLocation(follow);
    return *this;
}

auto CurlWrapper::setRequestBody(const std::string &data) -> CurlWrapper & {
    pImpl_->setRequestBody(data);
    return *this;
}

auto CurlWrapper::setSSLOptions(bool verifyPeer, bool verifyHost)
    -> CurlWrapper & {
    pImpl_->setSSLOptions(verifyPeer, verifyHost);
    return *this;
}

auto CurlWrapper::perform() -> HttpResponse { return pImpl_->perform(); }

CurlWrapper::Impl::Impl() : handle_(nullptr), headersList_(nullptr) {
    ensureGlobalInit();
    handle_ = curl_easy_init();
    if (handle_ == nullptr) {
        spdlog::error("Failed to initialize CURL");
        THROW_TRANSPORT_ERROR("Failed to initialize CURL.");
    }
    curl_easy_setopt(handle_, CURLOPT_NOSIGNAL, 1L);
}

CurlWrapper::Impl::~Impl() {
    if (headersList_ != nullptr) {
        curl_slist_free_all(headersList_);
    }
    curl_easy_cleanup(handle_);
}

void CurlWrapper::Impl::setUrl(const std::string &url) {
    spdlog::debug("Setting URL: {}", url);
    url_ = url;
    curl_easy_setopt(handle_, CURLOPT_URL, url_.c_str());
}

void CurlWrapper::Impl::setRequestMethod(const std::string &method) {
    if (method == "GET") {
        curl_easy_setopt(handle_, CURLOPT_HTTPGET, 1L);
    } else if (method == "POST") {
        curl_easy_setopt(handle_, CURLOPT_POST, 1L);
    } else {
        curl_easy_setopt(handle_, CURLOPT_CUSTOMREQUEST, method.c_str());
    }
}

void CurlWrapper::Impl::addHeader(const std::string &key,
                                  const std::string &value) {
    std::string header = key + ": " + value;
    headersList_ = curl_slist_append(headersList_, header.c_str());
    curl_easy_setopt(handle_, CURLOPT_HTTPHEADER, headersList_);
}

void CurlWrapper::Impl::setTimeout(long timeout) {
    curl_easy_setopt(handle_, CURLOPT_TIMEOUT, timeout);
}

void CurlWrapper::Impl::setFollowLocation(bool follow) {
    curl_easy_setopt(handle_, CURLOPT_FOLLOWLOCATION, follow ? 1L : 0L);
}

void CurlWrapper::Impl::setRequestBody(const std::string &data) {
    spdlog::debug("Setting request body (size: {} bytes)", data.size());
    requestBody_ = data;
    curl_easy_setopt(handle_, CURLOPT_POSTFIELDS, requestBody_.c_str());
    curl_easy_setopt(handle_, CURLOPT_POSTFIELDSIZE,
                     static_cast<long>(requestBody_.size()));
}

void CurlWrapper::Impl::setSSLOptions(bool verifyPeer, bool verifyHost) {
    curl_easy_setopt(handle_, CURLOPT_SSL_VERIFYPEER, verifyPeer ? 1L : 0L);
    curl_easy_setopt(handle_, CURLOPT_SSL_VERIFYHOST, verifyHost ? 2L : 0L);
}

auto CurlWrapper::Impl::perform() -> HttpResponse {
    responseData_.clear();
    responseData_.reserve(RESPONSE_RESERVE);

    curl_easy_setopt(handle_, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(handle_, CURLOPT_WRITEDATA, &responseData_);

    CURLcode res = curl_easy_perform(handle_);
    if (res != CURLE_OK) {
        spdlog::error("CURL request to {} failed: {}", url_,
                      curl_easy_strerror(res));
        THROW_TRANSPORT_ERROR("CURL perform failed for {}: {}", url_,
                              curl_easy_strerror(res));
    }

    HttpResponse response;
    curl_easy_getinfo(handle_, CURLINFO_RESPONSE_CODE, &response.status);
    response.body = responseData_;
    return response;
}

auto CurlWrapper::Impl::writeCallback(void *contents, size_t size, size_t nmemb,
                                      void *userp) -> size_t {
    size_t totalSize = size * nmemb;
    auto *str = static_cast<std::string *>(userp);
    str->append(static_cast<char *>(contents), totalSize);
    return totalSize;
}

}  // namespace diffline::web
