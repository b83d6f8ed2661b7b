#include "applink/core/flow_types.hpp"
#include <nlohmann/json.hpp>
#include <cctype>
#include <cstdio>
#include <ctime>

namespace applink {
namespace core {

using json = nlohmann::json;

namespace {

constexpr std::chrono::minutes kRefreshWindow(5);

// Days since 1970-01-01 for a proleptic Gregorian date.
int64_t daysFromCivil(int64_t y, unsigned m, unsigned d) {
    y -= m <= 2;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

} // namespace

const char* toString(RedirectScheme scheme) {
    return scheme == RedirectScheme::Https ? "https" : "http";
}

const char* toString(FlowState state) {
    switch (state) {
        case FlowState::Idle:             return "Idle";
        case FlowState::AwaitingCallback: return "AwaitingCallback";
        case FlowState::Succeeded:        return "Succeeded";
        case FlowState::Failed:           return "Failed";
        case FlowState::TimedOut:         return "TimedOut";
    }
    return "Unknown";
}

const char* toString(FlowErrorKind kind) {
    switch (kind) {
        case FlowErrorKind::BindError:                  return "BindError";
        case FlowErrorKind::CSRFMismatch:               return "CSRFMismatch";
        case FlowErrorKind::ProviderDenied:             return "ProviderDenied";
        case FlowErrorKind::MissingCode:                return "MissingCode";
        case FlowErrorKind::Timeout:                    return "Timeout";
        case FlowErrorKind::Cancelled:                  return "Cancelled";
        case FlowErrorKind::ExchangeFailure:            return "ExchangeFailure";
        case FlowErrorKind::CertificateError:           return "CertificateError";
        case FlowErrorKind::TrustInstallError:          return "TrustInstallError";
        case FlowErrorKind::ConfigurationError:         return "ConfigurationError";
        case FlowErrorKind::CredentialStoreUnavailable: return "CredentialStoreUnavailable";
    }
    return "Unknown";
}

std::string FlowError::describe() const {
    if (detail.empty()) {
        return message;
    }
    return message + ": " + detail;
}

AuthorizationRequest::AuthorizationRequest(std::string state, std::string authorizationUrl,
                                           std::string redirectUri, RedirectScheme scheme)
    : state_(std::move(state)),
      authorizationUrl_(std::move(authorizationUrl)),
      redirectUri_(std::move(redirectUri)),
      scheme_(scheme) {}

CallbackOutcome CallbackOutcome::Code(std::string authorizationCode) {
    CallbackOutcome outcome(Kind::Code);
    outcome.authorizationCode_ = std::move(authorizationCode);
    return outcome;
}

CallbackOutcome CallbackOutcome::ProviderError(std::string errorCode, std::string errorDescription) {
    CallbackOutcome outcome(Kind::ProviderError);
    outcome.errorCode_ = std::move(errorCode);
    outcome.errorDescription_ = std::move(errorDescription);
    return outcome;
}

CallbackOutcome CallbackOutcome::StateMismatch() {
    return CallbackOutcome(Kind::StateMismatch);
}

CallbackOutcome CallbackOutcome::MissingCode() {
    return CallbackOutcome(Kind::MissingCode);
}

bool Token::isExpired(Clock::time_point now) const {
    return hasExpiry() && now > expiresAt;
}

bool Token::needsRefresh(Clock::time_point now) const {
    return hasExpiry() && now + kRefreshWindow > expiresAt;
}

std::string Token::toJson() const {
    json j;
    j["access_token"] = accessToken;
    if (!refreshToken.empty()) j["refresh_token"] = refreshToken;
    if (!tokenType.empty()) j["token_type"] = tokenType;
    if (hasExpiry()) j["expires_at"] = formatTimestamp(expiresAt);
    if (!scope.empty()) j["scope"] = scope;
    for (const auto& ext : extensions) {
        j[ext.first] = ext.second;
    }
    return j.dump();
}

Result<Token> Token::fromJson(const std::string& text) {
    json j = json::parse(text, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return utils::fail(std::string("stored token is not a JSON object"));
    }

    Token token;
    for (auto it = j.begin(); it != j.end(); ++it) {
        if (!it.value().is_string()) {
            continue;
        }
        const std::string& key = it.key();
        std::string value = it.value().get<std::string>();
        if (key == "access_token") {
            token.accessToken = value;
        } else if (key == "refresh_token") {
            token.refreshToken = value;
        } else if (key == "token_type") {
            token.tokenType = value;
        } else if (key == "scope") {
            token.scope = value;
        } else if (key == "expires_at") {
            auto parsed = parseTimestamp(value);
            if (parsed.has_error()) {
                return utils::fail(parsed.error());
            }
            token.expiresAt = parsed.value();
        } else {
            token.extensions[key] = value;
        }
    }
    if (token.accessToken.empty()) {
        return utils::fail(std::string("stored token has no access_token"));
    }
    return token;
}

std::string formatTimestamp(Token::Clock::time_point time) {
    std::time_t seconds = Token::Clock::to_time_t(time);
    std::tm utc{};
#ifdef _WIN32
    gmtime_s(&utc, &seconds);
#else
    gmtime_r(&seconds, &utc);
#endif
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &utc);
    return buffer;
}

Result<Token::Clock::time_point> parseTimestamp(const std::string& text) {
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    int consumed = 0;
    if (std::sscanf(text.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n",
                    &year, &month, &day, &hour, &minute, &second, &consumed) != 6 ||
        month < 1 || month > 12 || day < 1 || day > 31) {
        return Result<Token::Clock::time_point>(std::string("invalid timestamp: ") + text);
    }

    size_t pos = static_cast<size_t>(consumed);
    // Fractional seconds are accepted and truncated.
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            ++pos;
        }
    }

    int64_t offsetSeconds = 0;
    if (pos < text.size() && (text[pos] == 'Z' || text[pos] == 'z')) {
        ++pos;
    } else if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
        int offHours = 0, offMinutes = 0;
        if (std::sscanf(text.c_str() + pos + 1, "%2d:%2d", &offHours, &offMinutes) != 2) {
            return Result<Token::Clock::time_point>(std::string("invalid timestamp offset: ") + text);
        }
        offsetSeconds = (offHours * 3600 + offMinutes * 60) * (text[pos] == '-' ? -1 : 1);
        pos += 6;
    } else {
        return Result<Token::Clock::time_point>(std::string("timestamp lacks a zone: ") + text);
    }
    if (pos != text.size()) {
        return Result<Token::Clock::time_point>(std::string("trailing characters in timestamp: ") + text);
    }

    int64_t epochSeconds = daysFromCivil(year, static_cast<unsigned>(month), static_cast<unsigned>(day)) * 86400 +
                           hour * 3600 + minute * 60 + second - offsetSeconds;
    return Token::Clock::time_point(std::chrono::seconds(epochSeconds));
}

} // namespace core
} // namespace applink
