#ifndef APPLINK_CORE_OAUTH_FLOW_HPP
#define APPLINK_CORE_OAUTH_FLOW_HPP

#include "applink/core/browser_launcher.hpp"
#include "applink/core/callback_channel.hpp"
#include "applink/core/certificate_authority.hpp"
#include "applink/core/engine_config.hpp"
#include "applink/core/flow_types.hpp"
#include "applink/core/http_client.hpp"
#include "applink/core/provider_adapter.hpp"
#include "applink/core/provider_registry.hpp"
#include "applink/utils/result.hpp"
#include <atomic>
#include <cstdint>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>

namespace applink {
namespace core {

/**
 * @brief Drives one OAuth2 authorization-code flow through a loopback redirect.
 *
 * run() moves the flow Idle -> AwaitingCallback -> {Succeeded, Failed, TimedOut}.
 * The callback listener is always shut down before run() returns, whichever
 * of callback, listener failure, cancellation or timeout came first.
 */
class OAuthFlow {
public:
    using StateCallback = std::function<void(FlowState)>;

    /**
     * @brief Construct a flow.
     *
     * @param config Engine settings (port, timeouts, logger)
     * @param httpClient Client used for the token exchange
     * @param browser Launcher for the authorization URL
     * @param authority Source of the TLS certificate for https redirects;
     *        when null one is created for config.certsDirectory
     * @param adapter Provider conventions
     * @param out Stream for user-facing instructions
     */
    OAuthFlow(EngineConfig config,
              std::shared_ptr<HttpClient> httpClient,
              std::shared_ptr<BrowserLauncher> browser,
              std::shared_ptr<CertificateAuthorityManager> authority = nullptr,
              ProviderAdapter adapter = ProviderAdapter(),
              std::ostream& out = std::cout);

    OAuthFlow(const OAuthFlow&) = delete;
    OAuthFlow& operator=(const OAuthFlow&) = delete;

    /**
     * @brief 32 random bytes, URL-safe base64. A fresh value on every call.
     */
    static Result<std::string> generateState();

    /**
     * @brief Authorization URL carrying client_id, redirect_uri,
     * response_type=code, state and the provider's scope parameter.
     */
    Result<std::string, FlowError> buildAuthorizationUrl(const ProviderDescriptor& provider,
                                                         const std::string& clientId,
                                                         const std::string& redirectUri,
                                                         const std::string& state) const;

    // scheme://host:port/path using the scheme the provider requires.
    std::string redirectUri(const ProviderDescriptor& provider, uint16_t port) const;

    /**
     * @brief The authorization attempt for a listener bound to @p port: the
     * state it must echo, the redirect URI and the URL to open.
     */
    Result<AuthorizationRequest, FlowError> createRequest(const ProviderDescriptor& provider,
                                                          const std::string& clientId,
                                                          const std::string& state,
                                                          uint16_t port) const;

    /**
     * @brief Run the full flow and return the exchanged token.
     *
     * A flow may be run again after it finishes; each run starts from Idle.
     */
    Result<Token, FlowError> run(const ProviderDescriptor& provider, const ClientCredentials& credentials);

    /**
     * @brief Exchange an authorization code at the provider's token endpoint.
     */
    Result<Token, FlowError> exchangeCode(const ProviderDescriptor& provider,
                                          const ClientCredentials& credentials,
                                          const std::string& code,
                                          const std::string& redirectUri) const;

    /**
     * @brief Abort a flow waiting for its callback; run() returns Cancelled.
     *
     * @return true if a waiting flow was cancelled
     */
    bool cancel();

    FlowState state() const { return state_.load(); }
    void setStateCallback(StateCallback callback);

    // Prints the URL so the user can navigate manually.
    void printInstructions(const std::string& authorizationUrl) const;

private:
    Result<std::shared_ptr<const LeafCertificate>, FlowError> serverCertificate() const;
    Result<Token, FlowError> finish(const ProviderDescriptor& provider,
                                    const ClientCredentials& credentials,
                                    const AuthorizationRequest& request,
                                    const ListenerEvent& event);
    void setState(FlowState state);
    void openBrowser(const std::string& authorizationUrl) const;

    EngineConfig config_;
    std::shared_ptr<HttpClient> httpClient_;
    std::shared_ptr<BrowserLauncher> browser_;
    std::shared_ptr<CertificateAuthorityManager> authority_;
    ProviderAdapter adapter_;
    std::ostream& out_;

    std::atomic<FlowState> state_{FlowState::Idle};
    std::mutex mutex_;
    StateCallback stateCallback_;
    std::shared_ptr<CallbackChannel> activeChannel_;
};

} // namespace core
} // namespace applink

#endif // APPLINK_CORE_OAUTH_FLOW_HPP
