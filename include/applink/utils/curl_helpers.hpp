#pragma once

#include "applink/utils/result.hpp"
#include <curl/curl.h>
#include <cstddef>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace applink {
namespace utils {

using CurlString = std::unique_ptr<char, decltype(&curl_free)>;

/**
 * @brief Owns a CURL easy handle. Throws std::runtime_error if libcurl
 * cannot allocate one.
 */
class CurlHandle {
public:
    CurlHandle();
    ~CurlHandle() = default;

    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;

    CURL* get() const noexcept { return curl_.get(); }

private:
    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl_;
};

/**
 * @brief Owns a curl_slist used for request headers.
 */
class CurlSlistHandle {
public:
    CurlSlistHandle() = default;
    ~CurlSlistHandle();

    CurlSlistHandle(const CurlSlistHandle&) = delete;
    CurlSlistHandle& operator=(const CurlSlistHandle&) = delete;

    bool append(const std::string& line);
    curl_slist* get() const noexcept { return slist_; }

private:
    curl_slist* slist_ = nullptr;
};

/**
 * @brief Owns a CURLU URL handle used to parse URLs and append queries.
 */
class CurlUrlHandle {
public:
    CurlUrlHandle();
    ~CurlUrlHandle();

    CurlUrlHandle(const CurlUrlHandle&) = delete;
    CurlUrlHandle& operator=(const CurlUrlHandle&) = delete;

    Result<void> setUrl(const std::string& url);
    Result<void> appendQuery(const std::string& query);
    Result<std::string> url() const;
    // Raw (still percent-encoded) query, empty if the URL has none.
    std::string query() const;

private:
    CURLU* handle_;
};

/**
 * @brief Ordered list of name/value pairs serialized as
 * application/x-www-form-urlencoded text.
 */
class UrlSearchParams {
public:
    UrlSearchParams() = default;

    void append(const std::string& name, const std::string& value);
    const std::vector<std::pair<std::string, std::string>>& entries() const { return params_; }

    Result<std::string> toString() const;

private:
    std::vector<std::pair<std::string, std::string>> params_;
};

// Write callback appending the received bytes to a std::string.
std::size_t curlStringWriter(void* contents, std::size_t size, std::size_t nmemb, void* userp) noexcept;

// One-time libcurl global initialization.
void ensureCurlInitialized();

} // namespace utils
} // namespace applink
