#include "applink/core/http_client.hpp"
#include "applink/utils/curl_helpers.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace applink {
namespace core {

namespace {

bool equalsIgnoreCase(const std::string& a, const std::string& b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
               return std::tolower(x) == std::tolower(y);
           });
}

} // namespace

std::string HttpRequest::header(const std::string& name) const {
    for (const auto& h : headers) {
        if (equalsIgnoreCase(h.first, name)) {
            return h.second;
        }
    }
    return std::string();
}

CurlHttpClient::CurlHttpClient(std::shared_ptr<utils::Logger> logger)
    : logger_(std::move(logger)) {
    utils::ensureCurlInitialized();
}

Result<HttpResponse> CurlHttpClient::send(const HttpRequest& request) {
    std::unique_ptr<utils::CurlHandle> handle;
    try {
        handle = std::make_unique<utils::CurlHandle>();
    } catch (const std::runtime_error& e) {
        return utils::fail(std::string(e.what()));
    }
    CURL* curl = handle->get();

    utils::CurlSlistHandle headers;
    for (const auto& h : request.headers) {
        if (!headers.append(h.first + ": " + h.second)) {
            return utils::fail("failed to build request header " + h.first);
        }
    }

    std::string responseBody;
    char errorBuffer[CURL_ERROR_SIZE] = {0};

    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, request.method.c_str());
    if (request.method == "POST") {
        curl_easy_setopt(curl, CURLOPT_POST, 1L);
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
    }
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, utils::curlStringWriter);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &responseBody);
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errorBuffer);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout.count()));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(request.timeout.count()));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 0L);

    APPLINK_LOG_DEBUG(logger_, request.method << " " << request.url);

    CURLcode rc = curl_easy_perform(curl);
    if (rc != CURLE_OK) {
        std::string reason = errorBuffer[0] ? std::string(errorBuffer) : std::string(curl_easy_strerror(rc));
        APPLINK_LOG_WARN(logger_, "HTTP request to " << request.url << " failed: " << reason);
        return utils::fail(reason);
    }

    HttpResponse response;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
    response.body = std::move(responseBody);
    APPLINK_LOG_DEBUG(logger_, "HTTP " << response.status << " from " << request.url);
    return response;
}

} // namespace core
} // namespace applink
