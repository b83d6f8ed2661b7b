#include "applink/core/oauth_flow.hpp"
#include "applink/core/callback_listener.hpp"
#include "applink/core/openssl_support.hpp"
#include "applink/utils/curl_helpers.hpp"
#include "applink/utils/encoding.hpp"
#include <openssl/rand.h>
#include <chrono>
#include <optional>
#include <vector>

namespace applink {
namespace core {

namespace {

constexpr size_t kStateBytes = 32;

std::shared_ptr<CertificateAuthorityManager> defaultAuthority(const EngineConfig& config) {
    CertificateAuthorityConfig caConfig;
    caConfig.directory = config.certsDirectory;
    return std::make_shared<CertificateAuthorityManager>(caConfig, config.logger);
}

FlowError errorForOutcome(const CallbackOutcome& outcome) {
    switch (outcome.kind()) {
        case CallbackOutcome::Kind::ProviderError:
            return FlowError(FlowErrorKind::ProviderDenied, outcome.errorCode(), outcome.errorDescription());
        case CallbackOutcome::Kind::StateMismatch:
            return FlowError(FlowErrorKind::CSRFMismatch, "state mismatch: possible CSRF attack");
        case CallbackOutcome::Kind::MissingCode:
            return FlowError(FlowErrorKind::MissingCode, "no authorization code in callback");
        case CallbackOutcome::Kind::Code:
            break;
    }
    return FlowError(FlowErrorKind::ConfigurationError, "unexpected callback outcome");
}

} // namespace

OAuthFlow::OAuthFlow(EngineConfig config,
                     std::shared_ptr<HttpClient> httpClient,
                     std::shared_ptr<BrowserLauncher> browser,
                     std::shared_ptr<CertificateAuthorityManager> authority,
                     ProviderAdapter adapter,
                     std::ostream& out)
    : config_(std::move(config)),
      httpClient_(std::move(httpClient)),
      browser_(std::move(browser)),
      authority_(std::move(authority)),
      adapter_(std::move(adapter)),
      out_(out) {
    if (!authority_) {
        authority_ = defaultAuthority(config_);
    }
}

Result<std::string> OAuthFlow::generateState() {
    ensureSSLInitialized();
    std::vector<uint8_t> bytes(kStateBytes);
    if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
        return utils::fail("failed to generate state: " + getOpenSSLError());
    }
    return utils::base64UrlEncode(bytes);
}

Result<std::string, FlowError> OAuthFlow::buildAuthorizationUrl(const ProviderDescriptor& provider,
                                                                const std::string& clientId,
                                                                const std::string& redirectUri,
                                                                const std::string& state) const {
    utils::CurlUrlHandle url;
    auto parsed = url.setUrl(provider.authorizationUrl);
    if (parsed.has_error()) {
        return FlowError(FlowErrorKind::ConfigurationError, "failed to build auth URL", parsed.error());
    }

    utils::UrlSearchParams params;
    for (const auto& param : adapter_.authorizationParameters(provider, clientId, redirectUri, state)) {
        params.append(param.first, param.second);
    }
    auto query = params.toString();
    if (query.has_error()) {
        return FlowError(FlowErrorKind::ConfigurationError, "failed to build auth URL", query.error());
    }
    auto appended = url.appendQuery(query.value());
    if (appended.has_error()) {
        return FlowError(FlowErrorKind::ConfigurationError, "failed to build auth URL", appended.error());
    }

    auto rendered = url.url();
    if (rendered.has_error()) {
        return FlowError(FlowErrorKind::ConfigurationError, "failed to build auth URL", rendered.error());
    }
    return rendered.value();
}

std::string OAuthFlow::redirectUri(const ProviderDescriptor& provider, uint16_t port) const {
    return std::string(toString(adapter_.redirectScheme(provider))) + "://" + config_.callbackHost + ":" +
           std::to_string(port) + config_.callbackPath;
}

Result<AuthorizationRequest, FlowError> OAuthFlow::createRequest(const ProviderDescriptor& provider,
                                                                const std::string& clientId,
                                                                const std::string& state,
                                                                uint16_t port) const {
    std::string redirect = redirectUri(provider, port);
    auto authorizationUrl = buildAuthorizationUrl(provider, clientId, redirect, state);
    if (authorizationUrl.has_error()) {
        return authorizationUrl.error();
    }
    return AuthorizationRequest(state, authorizationUrl.value(), redirect, adapter_.redirectScheme(provider));
}

Result<Token, FlowError> OAuthFlow::run(const ProviderDescriptor& provider, const ClientCredentials& credentials) {
    if (state_.load() != FlowState::Idle) {
        setState(FlowState::Idle);
    }
    if (!provider.usesOAuth()) {
        return FlowError(FlowErrorKind::ConfigurationError,
                         provider.id + " does not use OAuth; store an API key instead");
    }

    auto state = generateState();
    if (state.has_error()) {
        setState(FlowState::Failed);
        return FlowError(FlowErrorKind::ConfigurationError, "failed to generate state", state.error());
    }

    ListenerOptions options;
    options.port = config_.callbackPort;
    options.path = config_.callbackPath;
    options.expectedState = state.value();
    options.scheme = adapter_.redirectScheme(provider);
    options.connectionTimeout = config_.connectionTimeout;
    if (options.scheme == RedirectScheme::Https) {
        auto certificate = serverCertificate();
        if (certificate.has_error()) {
            setState(FlowState::Failed);
            return certificate.error();
        }
        options.certificate = certificate.value();
    }

    auto channel = std::make_shared<CallbackChannel>();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        activeChannel_ = channel;
    }

    auto listener = CallbackListener::start(options, channel, config_.logger);

    std::optional<AuthorizationRequest> request;
    if (listener->isRunning()) {
        auto created = createRequest(provider, credentials.clientId, state.value(), listener->port());
        if (created.has_error()) {
            channel->post(created.error());
        } else {
            request.emplace(created.value());
            setState(FlowState::AwaitingCallback);
            printInstructions(request->authorizationUrl());
            openBrowser(request->authorizationUrl());
        }
    }

    auto deadline = std::chrono::steady_clock::now() + config_.callbackTimeout;
    auto event = channel->waitUntil(deadline);

    listener->shutdown(config_.shutdownTimeout);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        activeChannel_.reset();
    }

    if (!event) {
        APPLINK_LOG_WARN(config_.logger, "No callback received within "
                                             << std::chrono::duration_cast<std::chrono::seconds>(
                                                    config_.callbackTimeout).count()
                                             << "s");
        setState(FlowState::TimedOut);
        return FlowError(FlowErrorKind::Timeout, "authentication timed out");
    }
    if (!request) {
        // Listener or URL setup failed before the browser was opened.
        setState(FlowState::Failed);
        if (const FlowError* error = std::get_if<FlowError>(&*event)) {
            return *error;
        }
        return FlowError(FlowErrorKind::ConfigurationError, "callback received without an authorization request");
    }
    return finish(provider, credentials, *request, *event);
}

Result<Token, FlowError> OAuthFlow::finish(const ProviderDescriptor& provider,
                                           const ClientCredentials& credentials,
                                           const AuthorizationRequest& request,
                                           const ListenerEvent& event) {
    if (const FlowError* error = std::get_if<FlowError>(&event)) {
        setState(FlowState::Failed);
        return *error;
    }

    const CallbackOutcome& outcome = std::get<CallbackOutcome>(event);
    if (!outcome.isSuccess()) {
        FlowError error = errorForOutcome(outcome);
        APPLINK_LOG_INFO(config_.logger, "Authorization failed: " << error.describe());
        setState(FlowState::Failed);
        return error;
    }

    setState(FlowState::Succeeded);
    auto token = exchangeCode(provider, credentials, outcome.authorizationCode(), request.redirectUri());
    if (token.has_error()) {
        setState(FlowState::Failed);
    }
    return token;
}

Result<Token, FlowError> OAuthFlow::exchangeCode(const ProviderDescriptor& provider,
                                                 const ClientCredentials& credentials,
                                                 const std::string& code,
                                                 const std::string& redirectUri) const {
    auto request = adapter_.buildTokenRequest(provider, credentials, code, redirectUri, config_.exchangeTimeout);
    if (request.has_error()) {
        return request.error();
    }

    APPLINK_LOG_DEBUG(config_.logger, "Exchanging authorization code at " << provider.tokenUrl);
    auto response = httpClient_->send(request.value());
    if (response.has_error()) {
        return FlowError(FlowErrorKind::ExchangeFailure, "token exchange request failed", response.error());
    }
    if (response.value().status != 200) {
        APPLINK_LOG_DEBUG(config_.logger, "Token endpoint returned status " << response.value().status);
        return FlowError(FlowErrorKind::ExchangeFailure, "token exchange failed", response.value().body);
    }
    return adapter_.parseTokenResponse(provider, response.value().body, Token::Clock::now());
}

bool OAuthFlow::cancel() {
    std::shared_ptr<CallbackChannel> channel;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        channel = activeChannel_;
    }
    if (!channel) {
        return false;
    }
    return channel->post(FlowError(FlowErrorKind::Cancelled, "authentication cancelled"));
}

void OAuthFlow::setStateCallback(StateCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    stateCallback_ = std::move(callback);
}

void OAuthFlow::printInstructions(const std::string& authorizationUrl) const {
    out_ << "Opening browser for authentication...\n"
         << "If the browser doesn't open, visit:\n"
         << authorizationUrl << "\n\n";
    out_.flush();
}

Result<std::shared_ptr<const LeafCertificate>, FlowError> OAuthFlow::serverCertificate() const {
    if (authority_->authorityExists()) {
        auto leaf = authority_->issueLeafCertificate();
        if (leaf.has_error()) {
            return FlowError(FlowErrorKind::CertificateError, "failed to generate TLS certificate", leaf.error());
        }
        return std::shared_ptr<const LeafCertificate>(std::make_shared<LeafCertificate>(std::move(leaf.value())));
    }

    out_ << "Note: no local CA found; your browser will show a certificate warning.\n"
         << "Run the trust setup to avoid this in future.\n\n";
    auto leaf = authority_->issueSelfSignedLeaf();
    if (leaf.has_error()) {
        return FlowError(FlowErrorKind::CertificateError, "failed to generate TLS certificate", leaf.error());
    }
    return std::shared_ptr<const LeafCertificate>(std::make_shared<LeafCertificate>(std::move(leaf.value())));
}

void OAuthFlow::setState(FlowState state) {
    state_.store(state);
    StateCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        callback = stateCallback_;
    }
    APPLINK_LOG_DEBUG(config_.logger, "Flow state: " << toString(state));
    if (callback) {
        callback(state);
    }
}

void OAuthFlow::openBrowser(const std::string& authorizationUrl) const {
    if (!browser_) {
        return;
    }
    auto opened = browser_->open(authorizationUrl);
    if (opened.has_error()) {
        APPLINK_LOG_WARN(config_.logger, "Failed to open browser: " << opened.error());
        out_ << "Failed to open browser: " << opened.error() << "\n"
             << "Please open the URL above manually.\n\n";
    }
}

} // namespace core
} // namespace applink
