#include "applink/core/provider_adapter.hpp"
#include "applink/utils/curl_helpers.hpp"
#include "applink/utils/encoding.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>

namespace applink {
namespace core {

using json = nlohmann::json;

namespace {

// Ten years.
constexpr int64_t kMaxTokenLifetimeSeconds = 10LL * 365 * 24 * 60 * 60;

ProviderStrategy standardStrategy() {
    return ProviderStrategy{};
}

std::vector<ProviderStrategy> builtinStrategies() {
    ProviderStrategy slack;
    slack.providerId = "slack";
    slack.requiresHttps = true;
    // Slack issues user tokens for user_scope, comma separated.
    slack.scopeParameter = "user_scope";
    slack.scopeSeparator = ",";
    slack.clientAuth = ClientAuthMethod::RequestBody;
    slack.responseShape = TokenResponseShape::Nested;
    slack.nestedTokenKey = "authed_user";
    slack.successFlagKey = "ok";
    slack.extensionFields = {{"team_id", "/team/id"}};

    ProviderStrategy notion;
    notion.providerId = "notion";
    notion.clientAuth = ClientAuthMethod::HttpBasic;

    return {slack, notion};
}

std::string joinScopes(const std::vector<std::string>& scopes, const std::string& separator) {
    std::string joined;
    for (size_t i = 0; i < scopes.size(); ++i) {
        if (i > 0) {
            joined += separator;
        }
        joined += scopes[i];
    }
    return joined;
}

std::string stringField(const json& object, const char* key) {
    auto it = object.find(key);
    if (it == object.end() || !it->is_string()) {
        return std::string();
    }
    return it->get<std::string>();
}

} // namespace

ProviderAdapter::ProviderAdapter()
    : strategies_(builtinStrategies()), fallback_(standardStrategy()) {}

ProviderAdapter::ProviderAdapter(std::vector<ProviderStrategy> strategies, ProviderStrategy fallback)
    : strategies_(std::move(strategies)), fallback_(std::move(fallback)) {}

const ProviderStrategy& ProviderAdapter::strategyFor(const std::string& providerId) const {
    for (const auto& strategy : strategies_) {
        if (strategy.providerId == providerId) {
            return strategy;
        }
    }
    return fallback_;
}

RedirectScheme ProviderAdapter::redirectScheme(const ProviderDescriptor& provider) const {
    return strategyFor(provider.id).requiresHttps ? RedirectScheme::Https : RedirectScheme::Http;
}

std::vector<std::pair<std::string, std::string>> ProviderAdapter::authorizationParameters(
    const ProviderDescriptor& provider, const std::string& clientId,
    const std::string& redirectUri, const std::string& state) const {
    const ProviderStrategy& strategy = strategyFor(provider.id);

    std::vector<std::pair<std::string, std::string>> params = {
        {"client_id", clientId},
        {"redirect_uri", redirectUri},
        {"response_type", "code"},
        {"state", state},
    };
    if (!provider.scopes.empty()) {
        params.emplace_back(strategy.scopeParameter, joinScopes(provider.scopes, strategy.scopeSeparator));
    }
    return params;
}

Result<HttpRequest, FlowError> ProviderAdapter::buildTokenRequest(const ProviderDescriptor& provider,
                                                                  const ClientCredentials& credentials,
                                                                  const std::string& code,
                                                                  const std::string& redirectUri,
                                                                  std::chrono::milliseconds timeout) const {
    const ProviderStrategy& strategy = strategyFor(provider.id);

    utils::UrlSearchParams form;
    form.append("grant_type", "authorization_code");
    form.append("code", code);
    form.append("redirect_uri", redirectUri);

    HttpRequest request;
    request.method = "POST";
    request.url = provider.tokenUrl;
    request.timeout = timeout;
    request.headers.emplace_back("Content-Type", "application/x-www-form-urlencoded");
    request.headers.emplace_back("Accept", "application/json");

    if (strategy.clientAuth == ClientAuthMethod::HttpBasic) {
        request.headers.emplace_back(
            "Authorization", "Basic " + utils::base64Encode(credentials.clientId + ":" + credentials.clientSecret));
    } else {
        form.append("client_id", credentials.clientId);
        form.append("client_secret", credentials.clientSecret);
    }

    auto body = form.toString();
    if (body.has_error()) {
        return FlowError(FlowErrorKind::ExchangeFailure, "failed to encode token request", body.error());
    }
    request.body = body.value();
    return request;
}

Result<Token, FlowError> ProviderAdapter::parseTokenResponse(const ProviderDescriptor& provider,
                                                             const std::string& body,
                                                             Token::Clock::time_point issuedAt) const {
    const ProviderStrategy& strategy = strategyFor(provider.id);

    json response = json::parse(body, nullptr, false);
    if (response.is_discarded() || !response.is_object()) {
        return FlowError(FlowErrorKind::ExchangeFailure, "failed to parse token response", body);
    }

    if (!strategy.successFlagKey.empty()) {
        auto flag = response.find(strategy.successFlagKey);
        if (flag != response.end() && flag->is_boolean() && !flag->get<bool>()) {
            return FlowError(FlowErrorKind::ExchangeFailure,
                             provider.id + " auth failed: " + stringField(response, strategy.errorKey.c_str()),
                             body);
        }
    }

    const json* source = &response;
    json empty = json::object();
    if (strategy.responseShape == TokenResponseShape::Nested) {
        auto nested = response.find(strategy.nestedTokenKey);
        source = (nested != response.end() && nested->is_object()) ? &(*nested) : &empty;
    }

    Token token;
    token.accessToken = stringField(*source, "access_token");
    token.refreshToken = stringField(*source, "refresh_token");
    token.tokenType = stringField(*source, "token_type");
    token.scope = stringField(*source, "scope");

    auto expiresIn = source->find("expires_in");
    if (expiresIn != source->end() && expiresIn->is_number()) {
        // Lifetimes beyond the limit are treated as non-expiring.
        double seconds = expiresIn->get<double>();
        if (seconds > 0 && seconds <= static_cast<double>(kMaxTokenLifetimeSeconds)) {
            token.expiresAt = issuedAt + std::chrono::seconds(static_cast<int64_t>(seconds));
        }
    }

    for (const auto& field : strategy.extensionFields) {
        json::json_pointer pointer(field.second);
        if (response.contains(pointer) && response.at(pointer).is_string()) {
            token.extensions[field.first] = response.at(pointer).get<std::string>();
        }
    }

    if (token.accessToken.empty()) {
        return FlowError(FlowErrorKind::ExchangeFailure, "no access token in response", body);
    }
    return token;
}

} // namespace core
} // namespace applink
