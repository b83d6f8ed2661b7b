#pragma once

#include "applink/core/flow_types.hpp"
#include "applink/core/http_client.hpp"
#include "applink/core/provider_registry.hpp"
#include "applink/utils/result.hpp"
#include <chrono>
#include <string>
#include <utility>
#include <vector>

namespace applink {
namespace core {

/**
 * @brief How client credentials are presented to the token endpoint.
 */
enum class ClientAuthMethod {
    HttpBasic,      ///< Authorization: Basic base64(id:secret)
    RequestBody     ///< client_id / client_secret form fields
};

/**
 * @brief Where the token fields live in a successful exchange response.
 */
enum class TokenResponseShape {
    Flat,           ///< Standard top-level access_token, refresh_token, ...
    Nested          ///< Token fields under ProviderStrategy::nestedTokenKey
};

/**
 * @brief Per-provider variations of the authorization code flow.
 *
 * Behaviour that differs between providers is expressed as data here so the
 * orchestrator never branches on provider ids.
 */
struct ProviderStrategy {
    std::string providerId;

    // Providers that only accept https loopback redirects.
    bool requiresHttps{false};

    // Authorization URL scope parameter and the separator between scopes.
    std::string scopeParameter{"scope"};
    std::string scopeSeparator{" "};

    ClientAuthMethod clientAuth{ClientAuthMethod::RequestBody};

    TokenResponseShape responseShape{TokenResponseShape::Flat};
    std::string nestedTokenKey;

    // Boolean success flag in the response; empty when the provider has none.
    std::string successFlagKey;
    std::string errorKey{"error"};

    // Token extension name -> JSON pointer into the response (e.g. "/team/id").
    std::vector<std::pair<std::string, std::string>> extensionFields;
};

/**
 * @brief Maps provider descriptors to the request and response conventions of
 * their token endpoints.
 */
class ProviderAdapter {
public:
    // Built-in strategies: slack (https, user_scope, nested) and notion (basic auth).
    ProviderAdapter();
    ProviderAdapter(std::vector<ProviderStrategy> strategies, ProviderStrategy fallback);

    // Strategy for @p providerId, or the standard OAuth2 strategy.
    const ProviderStrategy& strategyFor(const std::string& providerId) const;

    RedirectScheme redirectScheme(const ProviderDescriptor& provider) const;

    // Authorization URL query parameters, in the order they are appended.
    std::vector<std::pair<std::string, std::string>> authorizationParameters(
        const ProviderDescriptor& provider, const std::string& clientId,
        const std::string& redirectUri, const std::string& state) const;

    /**
     * @brief Build the form-encoded authorization_code grant request.
     */
    Result<HttpRequest, FlowError> buildTokenRequest(const ProviderDescriptor& provider,
                                                     const ClientCredentials& credentials,
                                                     const std::string& code,
                                                     const std::string& redirectUri,
                                                     std::chrono::milliseconds timeout) const;

    /**
     * @brief Parse a 200 response body into a Token.
     *
     * expires_in is interpreted relative to @p issuedAt.
     */
    Result<Token, FlowError> parseTokenResponse(const ProviderDescriptor& provider,
                                                const std::string& body,
                                                Token::Clock::time_point issuedAt) const;

private:
    std::vector<ProviderStrategy> strategies_;
    ProviderStrategy fallback_;
};

} // namespace core
} // namespace applink
