#ifndef APPLINK_CORE_FLOW_TYPES_HPP
#define APPLINK_CORE_FLOW_TYPES_HPP

#include "applink/utils/result.hpp"
#include <chrono>
#include <map>
#include <string>

namespace applink {
namespace core {

/**
 * @brief Scheme used by the loopback redirect URI.
 */
enum class RedirectScheme {
    Http,
    Https
};

const char* toString(RedirectScheme scheme);

/**
 * @brief Lifecycle of a single authorization flow.
 */
enum class FlowState {
    Idle,
    AwaitingCallback,
    Succeeded,
    Failed,
    TimedOut
};

const char* toString(FlowState state);

enum class FlowErrorKind {
    BindError,
    CSRFMismatch,
    ProviderDenied,
    MissingCode,
    Timeout,
    Cancelled,
    ExchangeFailure,
    CertificateError,
    TrustInstallError,
    ConfigurationError,
    CredentialStoreUnavailable
};

const char* toString(FlowErrorKind kind);

/**
 * @brief Error reported by the authorization engine.
 *
 * @c message is safe to show to the user. @c detail carries supporting text
 * such as the provider's error description or a response body.
 */
struct FlowError {
    FlowErrorKind kind = FlowErrorKind::ConfigurationError;
    std::string message;
    std::string detail;

    FlowError() = default;
    FlowError(FlowErrorKind k, std::string msg, std::string det = std::string())
        : kind(k), message(std::move(msg)), detail(std::move(det)) {}

    // "message" or "message: detail" when a detail is present.
    std::string describe() const;
};

/**
 * @brief Client registration used for a provider.
 */
struct ClientCredentials {
    std::string clientId;
    std::string clientSecret;
};

/**
 * @brief Immutable description of one authorization attempt.
 */
class AuthorizationRequest {
public:
    AuthorizationRequest(std::string state, std::string authorizationUrl,
                         std::string redirectUri, RedirectScheme scheme);

    const std::string& state() const { return state_; }
    const std::string& authorizationUrl() const { return authorizationUrl_; }
    const std::string& redirectUri() const { return redirectUri_; }
    RedirectScheme scheme() const { return scheme_; }

private:
    std::string state_;
    std::string authorizationUrl_;
    std::string redirectUri_;
    RedirectScheme scheme_;
};

/**
 * @brief Classification of the first request that reached the callback path.
 */
class CallbackOutcome {
public:
    enum class Kind {
        Code,
        ProviderError,
        StateMismatch,
        MissingCode
    };

    static CallbackOutcome Code(std::string authorizationCode);
    static CallbackOutcome ProviderError(std::string errorCode, std::string errorDescription);
    static CallbackOutcome StateMismatch();
    static CallbackOutcome MissingCode();

    Kind kind() const { return kind_; }
    bool isSuccess() const { return kind_ == Kind::Code; }
    const std::string& authorizationCode() const { return authorizationCode_; }
    const std::string& errorCode() const { return errorCode_; }
    const std::string& errorDescription() const { return errorDescription_; }

private:
    explicit CallbackOutcome(Kind kind) : kind_(kind) {}

    Kind kind_;
    std::string authorizationCode_;
    std::string errorCode_;
    std::string errorDescription_;
};

/**
 * @brief Access credential returned by a token exchange.
 *
 * An empty refreshToken, tokenType or scope means the provider did not
 * return one. A default-constructed expiresAt means the token never expires.
 * Provider-specific values (team_id, user) live in @c extensions.
 */
struct Token {
    using Clock = std::chrono::system_clock;

    std::string accessToken;
    std::string refreshToken;
    std::string tokenType;
    std::string scope;
    Clock::time_point expiresAt{};
    std::map<std::string, std::string> extensions;

    bool hasExpiry() const { return expiresAt != Clock::time_point{}; }

    // True when the token carries an expiry earlier than @p now.
    bool isExpired(Clock::time_point now = Clock::now()) const;

    // True when the token expires within five minutes of @p now.
    bool needsRefresh(Clock::time_point now = Clock::now()) const;

    // Serializes using the persisted field names (access_token, expires_at, ...).
    std::string toJson() const;
    static Result<Token> fromJson(const std::string& json);
};

// RFC 3339 UTC rendering, e.g. "2024-05-01T12:00:00Z".
std::string formatTimestamp(Token::Clock::time_point time);
Result<Token::Clock::time_point> parseTimestamp(const std::string& text);

} // namespace core
} // namespace applink

#endif // APPLINK_CORE_FLOW_TYPES_HPP
