#include "applink/utils/curl_helpers.hpp"
#include <limits>
#include <mutex>
#include <sstream>
#include <stdexcept>

namespace applink {
namespace utils {

namespace {

CURL* createCurlHandle() {
    ensureCurlInitialized();
    CURL* curl = curl_easy_init();
    if (!curl) {
        throw std::runtime_error("Failed to initialize curl easy handle");
    }
    return curl;
}

} // namespace

void ensureCurlInitialized() {
    static std::once_flag curlInitFlag;
    std::call_once(curlInitFlag, []() {
        curl_global_init(CURL_GLOBAL_DEFAULT);
    });
}

CurlHandle::CurlHandle() : curl_(createCurlHandle(), &curl_easy_cleanup) {}

CurlSlistHandle::~CurlSlistHandle() {
    curl_slist_free_all(slist_);
}

bool CurlSlistHandle::append(const std::string& line) {
    curl_slist* updated = curl_slist_append(slist_, line.c_str());
    if (!updated) {
        return false;
    }
    slist_ = updated;
    return true;
}

CurlUrlHandle::CurlUrlHandle() : handle_(curl_url()) {
    if (!handle_) {
        throw std::runtime_error("Failed to initialize curl URL handle");
    }
}

CurlUrlHandle::~CurlUrlHandle() {
    curl_url_cleanup(handle_);
}

Result<void> CurlUrlHandle::setUrl(const std::string& url) {
    CURLUcode uc = curl_url_set(handle_, CURLUPART_URL, url.c_str(), 0);
    if (uc != CURLUE_OK) {
        return Result<void>("invalid URL '" + url + "': " + curl_url_strerror(uc));
    }
    return Result<void>();
}

Result<void> CurlUrlHandle::appendQuery(const std::string& query) {
    CURLUcode uc = curl_url_set(handle_, CURLUPART_QUERY, query.c_str(), CURLU_APPENDQUERY);
    if (uc != CURLUE_OK) {
        return Result<void>(std::string("failed to append query: ") + curl_url_strerror(uc));
    }
    return Result<void>();
}

Result<std::string> CurlUrlHandle::url() const {
    char* raw = nullptr;
    CURLUcode uc = curl_url_get(handle_, CURLUPART_URL, &raw, 0);
    if (uc != CURLUE_OK || !raw) {
        return fail(std::string("failed to render URL: ") + curl_url_strerror(uc));
    }
    CurlString owned(raw, curl_free);
    return std::string(owned.get());
}

std::string CurlUrlHandle::query() const {
    char* raw = nullptr;
    if (curl_url_get(handle_, CURLUPART_QUERY, &raw, 0) != CURLUE_OK || !raw) {
        return std::string();
    }
    CurlString owned(raw, curl_free);
    return std::string(owned.get());
}

void UrlSearchParams::append(const std::string& name, const std::string& value) {
    params_.emplace_back(name, value);
}

Result<std::string> UrlSearchParams::toString() const {
    CurlHandle curl;
    std::ostringstream oss;
    for (std::size_t i = 0; i < params_.size(); ++i) {
        if (i > 0) {
            oss << "&";
        }
        const std::string& key = params_[i].first;
        const std::string& value = params_[i].second;
        CurlString escapedKey(
            curl_easy_escape(curl.get(), key.c_str(), static_cast<int>(key.length())), curl_free);
        CurlString escapedValue(
            curl_easy_escape(curl.get(), value.c_str(), static_cast<int>(value.length())), curl_free);
        if (!escapedKey || !escapedValue) {
            return fail("failed to percent-encode parameter '" + key + "'");
        }
        oss << escapedKey.get() << "=" << escapedValue.get();
    }
    return oss.str();
}

std::size_t curlStringWriter(void* contents, std::size_t size, std::size_t nmemb, void* userp) noexcept {
    if (size != 0 && nmemb > (std::numeric_limits<std::size_t>::max() / size)) {
        return 0;
    }
    std::size_t totalSize = size * nmemb;
    try {
        static_cast<std::string*>(userp)->append(static_cast<char*>(contents), totalSize);
    } catch (const std::bad_alloc&) {
        return 0;
    }
    return totalSize;
}

} // namespace utils
} // namespace applink
