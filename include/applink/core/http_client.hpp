#pragma once

#include "applink/utils/logging.hpp"
#include "applink/utils/result.hpp"
#include <chrono>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace applink {
namespace core {

struct HttpRequest {
    std::string method{"POST"};
    std::string url;
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;
    std::chrono::milliseconds timeout{std::chrono::seconds(30)};

    // Value of the first header named @p name (case-insensitive), empty if absent.
    std::string header(const std::string& name) const;
};

struct HttpResponse {
    long status{0};
    std::string body;
};

/**
 * @brief Abstract HTTP client used for the token exchange.
 */
class HttpClient {
public:
    virtual ~HttpClient() = default;

    /**
     * @brief Perform a request.
     *
     * @return The response for any HTTP status, or an error when no response
     * could be obtained (DNS, connect, TLS, timeout)
     */
    virtual Result<HttpResponse> send(const HttpRequest& request) = 0;
};

/**
 * @brief HttpClient backed by a libcurl easy handle per request.
 */
class CurlHttpClient : public HttpClient {
public:
    explicit CurlHttpClient(std::shared_ptr<utils::Logger> logger = utils::defaultLogger());

    Result<HttpResponse> send(const HttpRequest& request) override;

private:
    std::shared_ptr<utils::Logger> logger_;
};

} // namespace core
} // namespace applink
