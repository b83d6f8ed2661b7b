#include "applink/utils/encoding.hpp"
#include "applink/utils/curl_helpers.hpp"
#include <openssl/evp.h>
#include <algorithm>

namespace applink {
namespace utils {

std::string base64Encode(const std::vector<uint8_t>& data) {
    if (data.empty()) {
        return std::string();
    }
    // EVP_EncodeBlock writes 4 bytes per 3 input bytes plus a terminator.
    std::vector<unsigned char> out(4 * ((data.size() + 2) / 3) + 1);
    int written = EVP_EncodeBlock(out.data(), data.data(), static_cast<int>(data.size()));
    return std::string(reinterpret_cast<const char*>(out.data()), static_cast<size_t>(written));
}

std::string base64Encode(const std::string& data) {
    return base64Encode(std::vector<uint8_t>(data.begin(), data.end()));
}

std::string base64UrlEncode(const std::vector<uint8_t>& data) {
    std::string encoded = base64Encode(data);
    std::replace(encoded.begin(), encoded.end(), '+', '-');
    std::replace(encoded.begin(), encoded.end(), '/', '_');
    return encoded;
}

std::string htmlEscape(const std::string& text) {
    std::string escaped;
    escaped.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&':  escaped += "&amp;"; break;
            case '<':  escaped += "&lt;"; break;
            case '>':  escaped += "&gt;"; break;
            case '"':  escaped += "&#34;"; break;
            case '\'': escaped += "&#39;"; break;
            default:   escaped += c; break;
        }
    }
    return escaped;
}

Result<QueryParameters> parseQueryString(const std::string& query) {
    QueryParameters params;
    if (query.empty()) {
        return params;
    }

    CurlHandle curl;
    auto decode = [&curl](std::string component, std::string& out) {
        std::replace(component.begin(), component.end(), '+', ' ');
        int length = 0;
        CurlString decoded(
            curl_easy_unescape(curl.get(), component.c_str(), static_cast<int>(component.length()), &length),
            curl_free);
        if (!decoded) {
            return false;
        }
        out.assign(decoded.get(), static_cast<size_t>(length));
        return true;
    };

    size_t start = 0;
    while (start <= query.size()) {
        size_t end = query.find('&', start);
        if (end == std::string::npos) {
            end = query.size();
        }
        std::string pair = query.substr(start, end - start);
        if (!pair.empty()) {
            size_t eq = pair.find('=');
            std::string name;
            std::string value;
            if (!decode(pair.substr(0, eq), name) ||
                (eq != std::string::npos && !decode(pair.substr(eq + 1), value))) {
                return fail("malformed query component: " + pair);
            }
            params.emplace(std::move(name), std::move(value));
        }
        start = end + 1;
    }
    return params;
}

} // namespace utils
} // namespace applink
