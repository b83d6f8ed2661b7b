#ifndef APPLINK_UTILS_ENCODING_HPP
#define APPLINK_UTILS_ENCODING_HPP

#include "applink/utils/result.hpp"
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace applink {
namespace utils {

using QueryParameters = std::map<std::string, std::string>;

// Standard base64 with padding.
std::string base64Encode(const std::vector<uint8_t>& data);
std::string base64Encode(const std::string& data);

// URL-safe base64 ('-' and '_' alphabet) with padding.
std::string base64UrlEncode(const std::vector<uint8_t>& data);

// Escapes &, <, >, " and ' for inclusion in HTML text or attributes.
std::string htmlEscape(const std::string& text);

/**
 * @brief Parses an application/x-www-form-urlencoded query string.
 *
 * '+' decodes to a space and percent escapes are decoded. When a name
 * repeats, the first value wins.
 */
Result<QueryParameters> parseQueryString(const std::string& query);

} // namespace utils
} // namespace applink

#endif // APPLINK_UTILS_ENCODING_HPP
