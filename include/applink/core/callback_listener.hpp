#ifndef APPLINK_CORE_CALLBACK_LISTENER_HPP
#define APPLINK_CORE_CALLBACK_LISTENER_HPP

#include "applink/core/callback_channel.hpp"
#include "applink/core/certificate_authority.hpp"
#include "applink/core/flow_types.hpp"
#include "applink/utils/encoding.hpp"
#include "applink/utils/logging.hpp"
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace applink {
namespace core {

struct ListenerOptions {
    // 0 binds an ephemeral port; see CallbackListener::port().
    uint16_t port{8888};
    std::string path{"/callback"};
    std::string expectedState;
    RedirectScheme scheme{RedirectScheme::Http};
    // Required when scheme is Https.
    std::shared_ptr<const LeafCertificate> certificate;
    // Read/write timeout for a single browser connection.
    std::chrono::milliseconds connectionTimeout{std::chrono::seconds(5)};
};

/**
 * @brief Classify a callback query.
 *
 * Precedence: provider error, then state mismatch, then missing code.
 * Empty parameters count as absent.
 */
CallbackOutcome evaluateCallback(const utils::QueryParameters& query, const std::string& expectedState);

// HTTP status sent for @p outcome: 200 for a code, 400 otherwise.
int callbackStatusCode(const CallbackOutcome& outcome);

// HTML page shown in the browser for @p outcome. Provider text is escaped.
std::string renderCallbackPage(const CallbackOutcome& outcome);

/**
 * @brief Loopback HTTP(S) server that accepts the authorization redirect.
 *
 * The first request to the callback path is classified, answered with a
 * result page and posted to the shared CallbackChannel. Requests that arrive
 * after the channel resolved still get a page but change nothing. Listener
 * failures (bind, TLS setup, accept loop) are posted to the same channel as
 * FlowErrors.
 */
class CallbackListener {
public:
    /**
     * @brief Bind the loopback socket and start serving on a background thread.
     *
     * Never returns null. When binding fails a BindError has already been
     * posted to @p channel and the returned listener is not running.
     */
    static std::unique_ptr<CallbackListener> start(ListenerOptions options,
                                                   std::shared_ptr<CallbackChannel> channel,
                                                   std::shared_ptr<utils::Logger> logger = utils::defaultLogger());

    ~CallbackListener();

    CallbackListener(const CallbackListener&) = delete;
    CallbackListener& operator=(const CallbackListener&) = delete;

    // Bound port, useful when 0 was requested.
    uint16_t port() const;
    bool isRunning() const;

    /**
     * @brief Stop accepting, release the port and join the serving thread.
     *
     * Waits at most @p timeout for an in-flight connection before logging a
     * warning; the port is released before returning. Safe to call repeatedly.
     *
     * @return true if the server stopped within @p timeout
     */
    bool shutdown(std::chrono::milliseconds timeout);

private:
    class Impl;
    explicit CallbackListener(std::unique_ptr<Impl> impl);

    std::unique_ptr<Impl> impl_;
};

} // namespace core
} // namespace applink

#endif // APPLINK_CORE_CALLBACK_LISTENER_HPP
