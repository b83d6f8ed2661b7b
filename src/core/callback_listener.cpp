#include "applink/core/callback_listener.hpp"
#include "applink/core/socket_defs.hpp"
#include "applink/core/tls_server_context.hpp"
#include <openssl/err.h>
#include <openssl/ssl.h>
#include <atomic>
#include <cerrno>
#include <condition_variable>
#include <cstring>
#include <list>
#include <mutex>
#include <set>
#include <sstream>
#include <thread>

#ifndef _WIN32
#include <csignal>
#include <pthread.h>
#include <sys/time.h>
#endif

namespace applink {
namespace core {

namespace {

constexpr int kPollIntervalMs = 100;
constexpr size_t kMaxRequestHeadBytes = 16 * 1024;
// Browsers open a few speculative connections; anything beyond this is refused.
constexpr size_t kMaxConcurrentConnections = 16;

const char* kPageStyle = R"(<style>
        body {
            font-family: -apple-system, BlinkMacSystemFont, "Segoe UI", Roboto, sans-serif;
            display: flex;
            justify-content: center;
            align-items: center;
            height: 100vh;
            margin: 0;
            background: %BACKGROUND%;
        }
        .card {
            background: white;
            padding: 3rem;
            border-radius: 1rem;
            box-shadow: 0 20px 40px rgba(0,0,0,0.2);
            text-align: center;
            max-width: 400px;
        }
        .icon { font-size: 4rem; margin-bottom: 1rem; }
        h1 { color: #1a1a2e; margin: 0 0 0.5rem 0; }
        p { color: #666; margin: 0; }
        .error-details {
            background: #f5f5f5;
            padding: 1rem;
            border-radius: 0.5rem;
            margin-top: 1rem;
            font-family: monospace;
            font-size: 0.9rem;
            color: #c0392b;
        }
    </style>)";

std::string pageStyle(const std::string& background) {
    std::string style(kPageStyle);
    const std::string marker = "%BACKGROUND%";
    style.replace(style.find(marker), marker.size(), background);
    return style;
}

std::string lastSocketError() {
#ifdef _WIN32
    return "WSA error " + std::to_string(WSAGetLastError());
#else
    return std::strerror(errno);
#endif
}

const char* reasonPhrase(int status) {
    switch (status) {
        case 200: return "OK";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        default:  return "Error";
    }
}

std::string buildResponse(int status, const std::string& contentType, const std::string& body,
                          const std::string& extraHeaders = std::string()) {
    std::ostringstream oss;
    oss << "HTTP/1.1 " << status << " " << reasonPhrase(status) << "\r\n"
        << "Content-Type: " << contentType << "\r\n"
        << "Content-Length: " << body.size() << "\r\n"
        << "Cache-Control: no-store\r\n"
        << "Connection: close\r\n"
        << extraHeaders
        << "\r\n"
        << body;
    return oss.str();
}

/**
 * Byte stream over an accepted connection, plain or TLS.
 */
class ClientStream {
public:
    virtual ~ClientStream() = default;
    virtual long read(char* buffer, size_t size) = 0;
    virtual bool writeAll(const std::string& data) = 0;
};

class PlainStream : public ClientStream {
public:
    explicit PlainStream(socket_t fd) : fd_(fd) {}

    long read(char* buffer, size_t size) override {
        for (;;) {
            long n = static_cast<long>(::recv(fd_, buffer, static_cast<int>(size), 0));
            if (n < 0 && errno == EINTR) {
                continue;
            }
            return n;
        }
    }

    bool writeAll(const std::string& data) override {
#ifdef MSG_NOSIGNAL
        const int flags = MSG_NOSIGNAL;
#else
        const int flags = 0;
#endif
        size_t sent = 0;
        while (sent < data.size()) {
            long n = static_cast<long>(::send(fd_, data.data() + sent, static_cast<int>(data.size() - sent), flags));
            if (n < 0 && errno == EINTR) {
                continue;
            }
            if (n <= 0) {
                return false;
            }
            sent += static_cast<size_t>(n);
        }
        return true;
    }

private:
    socket_t fd_;
};

class TlsStream : public ClientStream {
public:
    explicit TlsStream(SslPtr ssl) : ssl_(std::move(ssl)) {}

    ~TlsStream() override {
        if (handshakeDone_) {
            SSL_shutdown(ssl_.get());
        }
    }

    bool handshake() {
        int rc = SSL_accept(ssl_.get());
        handshakeDone_ = rc == 1;
        return handshakeDone_;
    }

    long read(char* buffer, size_t size) override {
        int n = SSL_read(ssl_.get(), buffer, static_cast<int>(size));
        return n > 0 ? n : -1;
    }

    bool writeAll(const std::string& data) override {
        size_t sent = 0;
        while (sent < data.size()) {
            int n = SSL_write(ssl_.get(), data.data() + sent, static_cast<int>(data.size() - sent));
            if (n <= 0) {
                return false;
            }
            sent += static_cast<size_t>(n);
        }
        return true;
    }

private:
    SslPtr ssl_;
    bool handshakeDone_ = false;
};

void setSocketTimeouts(socket_t fd, std::chrono::milliseconds timeout) {
#ifdef _WIN32
    DWORD ms = static_cast<DWORD>(timeout.count());
    setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, reinterpret_cast<const char*>(&ms), sizeof(ms));
    setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, reinterpret_cast<const char*>(&ms), sizeof(ms));
#else
    timeval tv{};
    tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
    setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
#endif
}

} // namespace

CallbackOutcome evaluateCallback(const utils::QueryParameters& query, const std::string& expectedState) {
    auto param = [&query](const char* name) {
        auto it = query.find(name);
        return it == query.end() ? std::string() : it->second;
    };

    std::string error = param("error");
    if (!error.empty()) {
        return CallbackOutcome::ProviderError(error, param("error_description"));
    }
    if (param("state") != expectedState) {
        return CallbackOutcome::StateMismatch();
    }
    std::string code = param("code");
    if (code.empty()) {
        return CallbackOutcome::MissingCode();
    }
    return CallbackOutcome::Code(code);
}

int callbackStatusCode(const CallbackOutcome& outcome) {
    return outcome.isSuccess() ? 200 : 400;
}

std::string renderCallbackPage(const CallbackOutcome& outcome) {
    std::ostringstream html;
    if (outcome.isSuccess()) {
        html << "<!DOCTYPE html>\n<html>\n<head>\n    <meta charset=\"utf-8\">\n"
             << "    <title>Authentication Successful</title>\n    "
             << pageStyle("linear-gradient(135deg, #667eea 0%, #764ba2 100%)") << "\n</head>\n<body>\n"
             << "    <div class=\"card\">\n"
             << "        <div class=\"icon\">&#10003;</div>\n"
             << "        <h1>Authentication Successful</h1>\n"
             << "        <p>You can close this window and return to the terminal.</p>\n"
             << "    </div>\n</body>\n</html>";
        return html.str();
    }

    std::string title;
    std::string detail;
    switch (outcome.kind()) {
        case CallbackOutcome::Kind::ProviderError:
            title = outcome.errorCode();
            detail = outcome.errorDescription();
            break;
        case CallbackOutcome::Kind::StateMismatch:
            title = "Invalid state";
            detail = "State parameter mismatch";
            break;
        case CallbackOutcome::Kind::MissingCode:
        default:
            title = "Missing code";
            detail = "No authorization code received";
            break;
    }

    html << "<!DOCTYPE html>\n<html>\n<head>\n    <meta charset=\"utf-8\">\n"
         << "    <title>Authentication Failed</title>\n    "
         << pageStyle("linear-gradient(135deg, #f093fb 0%, #f5576c 100%)") << "\n</head>\n<body>\n"
         << "    <div class=\"card\">\n"
         << "        <div class=\"icon\">&#10007;</div>\n"
         << "        <h1>Authentication Failed</h1>\n"
         << "        <p>Something went wrong during authentication.</p>\n"
         << "        <div class=\"error-details\">" << utils::htmlEscape(title) << ": "
         << utils::htmlEscape(detail) << "</div>\n"
         << "    </div>\n</body>\n</html>";
    return html.str();
}

class CallbackListener::Impl {
public:
    Impl(ListenerOptions options, std::shared_ptr<CallbackChannel> channel,
         std::shared_ptr<utils::Logger> logger)
        : options_(std::move(options)),
          channel_(std::move(channel)),
          logger_(std::move(logger)) {}

    ~Impl() {
        stop(std::chrono::milliseconds(0));
    }

    // On failure the error is posted to the channel and the listener stays stopped.
    void open() {
        if (options_.scheme == RedirectScheme::Https) {
            if (!options_.certificate) {
                failSetup(FlowError(FlowErrorKind::CertificateError,
                                    "HTTPS callback requires a server certificate"));
                return;
            }
            auto tls = TlsServerContext::create(*options_.certificate);
            if (tls.has_error()) {
                failSetup(FlowError(FlowErrorKind::CertificateError,
                                    "failed to configure TLS for callback server", tls.error()));
                return;
            }
            tls_ = std::move(tls.value());
        }

        listenFd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        if (listenFd_ == INVALID_SOCKET_VALUE) {
            failBind("failed to create socket: " + lastSocketError());
            return;
        }

        int on = 1;
#ifdef _WIN32
        // SO_REUSEADDR on Windows would let the bind steal a port another process listens on.
        setsockopt(listenFd_, SOL_SOCKET, SO_EXCLUSIVEADDRUSE, reinterpret_cast<const char*>(&on), sizeof(on));
#else
        setsockopt(listenFd_, SOL_SOCKET, SO_REUSEADDR, reinterpret_cast<const char*>(&on), sizeof(on));
#endif

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = htons(options_.port);
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        if (::bind(listenFd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0 ||
            ::listen(listenFd_, SOMAXCONN) != 0) {
            failBind(lastSocketError());
            return;
        }

        sockaddr_in bound{};
        socklen_t len = sizeof(bound);
        if (::getsockname(listenFd_, reinterpret_cast<sockaddr*>(&bound), &len) == 0) {
            port_ = ntohs(bound.sin_port);
        } else {
            port_ = options_.port;
        }

        running_ = true;
        thread_ = std::thread(&Impl::serve, this);

        APPLINK_LOG_INFO(logger_, "Callback server listening on " << toString(options_.scheme)
                         << "://localhost:" << port_ << options_.path);
    }

    uint16_t port() const { return port_; }
    bool isRunning() const { return running_; }

    /**
     * Stops accepting, then gives in-flight connections until @p timeout to
     * finish. Connections still open after that are shut down.
     *
     * @return false if any connection had to be cut off
     */
    bool stop(std::chrono::milliseconds timeout) {
        std::lock_guard<std::mutex> stopLock(stopMutex_);
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        stopping_ = true;
        if (thread_.joinable()) {
            thread_.join();
        }

        bool graceful = true;
        std::list<Worker> workers;
        {
            std::unique_lock<std::mutex> lock(clientMutex_);
            if (!clientsIdle_.wait_until(lock, deadline, [this] { return activeClients_.empty(); })) {
                graceful = false;
                APPLINK_LOG_WARN(logger_, "Callback server did not stop within " << timeout.count()
                                 << "ms; closing " << activeClients_.size() << " active connection(s)");
                for (socket_t client : activeClients_) {
                    shutdownSocket(client);
                }
            }
            workers.swap(workers_);
        }
        for (auto& worker : workers) {
            worker.thread.join();
        }

        if (listenFd_ != INVALID_SOCKET_VALUE) {
            closeSocket(listenFd_);
            listenFd_ = INVALID_SOCKET_VALUE;
            APPLINK_LOG_DEBUG(logger_, "Callback server on port " << port_ << " stopped");
        }
        running_ = false;
        return graceful;
    }

private:
    void failSetup(const FlowError& error) {
        APPLINK_LOG_ERROR(logger_, error.describe());
        channel_->post(error);
    }

    void failBind(const std::string& reason) {
        if (listenFd_ != INVALID_SOCKET_VALUE) {
            closeSocket(listenFd_);
            listenFd_ = INVALID_SOCKET_VALUE;
        }
        failSetup(FlowError(FlowErrorKind::BindError,
                            "failed to start callback server on port " + std::to_string(options_.port),
                            reason));
    }

    void respond(ClientStream& stream, const std::string& response) {
        if (!stream.writeAll(response)) {
            APPLINK_LOG_DEBUG(logger_, "Failed to write response to the browser");
        }
    }

    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> finished;
    };

    static void shutdownSocket(socket_t fd) {
#ifdef _WIN32
        ::shutdown(fd, SD_BOTH);
#else
        ::shutdown(fd, SHUT_RDWR);
#endif
    }

    void serve() {
#ifndef _WIN32
        // Writes to a connection the browser already closed must not kill the
        // process. Connection threads inherit this mask.
        sigset_t set;
        sigemptyset(&set);
        sigaddset(&set, SIGPIPE);
        pthread_sigmask(SIG_BLOCK, &set, nullptr);
#endif
        while (!stopping_) {
            reapFinishedWorkers();

            pollfd_t pfd{};
            pfd.fd = listenFd_;
            pfd.events = POLLIN;
            int rc = pollSockets(&pfd, 1, kPollIntervalMs);
            if (rc < 0) {
                if (errno == EINTR) {
                    continue;
                }
                channel_->post(FlowError(FlowErrorKind::BindError, "callback server error", lastSocketError()));
                break;
            }
            if (rc == 0 || stopping_) {
                continue;
            }

            socket_t client = ::accept(listenFd_, nullptr, nullptr);
            if (client == INVALID_SOCKET_VALUE) {
                continue;
            }

            std::lock_guard<std::mutex> lock(clientMutex_);
            if (activeClients_.size() >= kMaxConcurrentConnections) {
                APPLINK_LOG_WARN(logger_, "Too many open connections; refusing a new one");
                closeSocket(client);
                continue;
            }
            activeClients_.insert(client);
            Worker worker;
            worker.finished = std::make_shared<std::atomic<bool>>(false);
            worker.thread = std::thread(&Impl::serveClient, this, client, worker.finished);
            workers_.push_back(std::move(worker));
        }
    }

    // One thread per accepted connection.
    void serveClient(socket_t client, std::shared_ptr<std::atomic<bool>> finished) {
        setSocketTimeouts(client, options_.connectionTimeout);
        handleConnection(client);
        {
            std::lock_guard<std::mutex> lock(clientMutex_);
            closeSocket(client);
            activeClients_.erase(client);
        }
        clientsIdle_.notify_all();
        finished->store(true);
    }

    void reapFinishedWorkers() {
        std::list<Worker> done;
        {
            std::lock_guard<std::mutex> lock(clientMutex_);
            for (auto it = workers_.begin(); it != workers_.end();) {
                if (it->finished->load()) {
                    done.push_back(std::move(*it));
                    it = workers_.erase(it);
                } else {
                    ++it;
                }
            }
        }
        for (auto& worker : done) {
            worker.thread.join();
        }
    }

    void handleConnection(socket_t client) {
        std::unique_ptr<ClientStream> stream;
        if (tls_) {
            SslPtr ssl(SSL_new(tls_->get()), SSL_free);
            if (!ssl || SSL_set_fd(ssl.get(), static_cast<int>(client)) != 1) {
                APPLINK_LOG_WARN(logger_, "Failed to create TLS session: " << getOpenSSLError());
                return;
            }
            auto tlsStream = std::make_unique<TlsStream>(std::move(ssl));
            if (!tlsStream->handshake()) {
                // Typical when the browser rejects an untrusted certificate.
                APPLINK_LOG_DEBUG(logger_, "TLS handshake failed: " << getOpenSSLError());
                ERR_clear_error();
                return;
            }
            stream = std::move(tlsStream);
        } else {
            stream = std::make_unique<PlainStream>(client);
        }

        std::string request;
        if (!readRequestHead(*stream, request)) {
            APPLINK_LOG_DEBUG(logger_, "Discarding incomplete request");
            return;
        }

        std::string requestLine = request.substr(0, request.find("\r\n"));
        std::istringstream lineStream(requestLine);
        std::string method;
        std::string target;
        lineStream >> method >> target;

        size_t queryStart = target.find('?');
        std::string path = target.substr(0, queryStart);
        std::string query = queryStart == std::string::npos ? std::string() : target.substr(queryStart + 1);
        size_t fragment = query.find('#');
        if (fragment != std::string::npos) {
            query.erase(fragment);
        }

        if (path != options_.path) {
            APPLINK_LOG_DEBUG(logger_, "Ignoring request for " << path);
            respond(*stream, buildResponse(404, "text/plain; charset=utf-8", "404 page not found\n"));
            return;
        }
        if (method != "GET") {
            respond(*stream, buildResponse(405, "text/plain; charset=utf-8", "Method Not Allowed\n",
                                           "Allow: GET\r\n"));
            return;
        }

        auto params = utils::parseQueryString(query);
        if (params.has_error()) {
            respond(*stream, buildResponse(400, "text/plain; charset=utf-8", params.error() + "\n"));
            return;
        }

        CallbackOutcome outcome = evaluateCallback(params.value(), options_.expectedState);
        respond(*stream, buildResponse(callbackStatusCode(outcome), "text/html; charset=utf-8",
                                       renderCallbackPage(outcome)));

        if (channel_->post(outcome)) {
            APPLINK_LOG_DEBUG(logger_, "Callback received on " << options_.path);
        } else {
            APPLINK_LOG_DEBUG(logger_, "Ignoring callback received after the flow resolved");
        }
    }

    bool readRequestHead(ClientStream& stream, std::string& request) {
        const auto deadline = std::chrono::steady_clock::now() + options_.connectionTimeout;
        char buffer[2048];
        while (request.find("\r\n\r\n") == std::string::npos) {
            if (request.size() > kMaxRequestHeadBytes || stopping_ ||
                std::chrono::steady_clock::now() > deadline) {
                return false;
            }
            long n = stream.read(buffer, sizeof(buffer));
            if (n <= 0) {
                return false;
            }
            request.append(buffer, static_cast<size_t>(n));
        }
        return true;
    }

    ListenerOptions options_;
    std::shared_ptr<CallbackChannel> channel_;
    std::shared_ptr<utils::Logger> logger_;
    std::unique_ptr<TlsServerContext> tls_;

    socket_t listenFd_ = INVALID_SOCKET_VALUE;
    uint16_t port_ = 0;

    std::thread thread_;
    std::atomic<bool> stopping_{false};
    std::atomic<bool> running_{false};
    std::mutex stopMutex_;

    std::mutex clientMutex_;
    std::condition_variable clientsIdle_;
    std::set<socket_t> activeClients_;
    std::list<Worker> workers_;
};

CallbackListener::CallbackListener(std::unique_ptr<Impl> impl) : impl_(std::move(impl)) {}

CallbackListener::~CallbackListener() = default;

std::unique_ptr<CallbackListener> CallbackListener::start(ListenerOptions options,
                                                          std::shared_ptr<CallbackChannel> channel,
                                                          std::shared_ptr<utils::Logger> logger) {
    auto impl = std::make_unique<Impl>(std::move(options), std::move(channel), std::move(logger));
    impl->open();
    return std::unique_ptr<CallbackListener>(new CallbackListener(std::move(impl)));
}

uint16_t CallbackListener::port() const {
    return impl_->port();
}

bool CallbackListener::isRunning() const {
    return impl_->isRunning();
}

bool CallbackListener::shutdown(std::chrono::milliseconds timeout) {
    return impl_->stop(timeout);
}

} // namespace core
} // namespace applink
