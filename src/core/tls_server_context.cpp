#include "applink/core/tls_server_context.hpp"

namespace applink {
namespace core {

TlsServerContext::TlsServerContext(SslCtxPtr ctx) : ctx_(std::move(ctx)) {}

Result<std::unique_ptr<TlsServerContext>> TlsServerContext::create(const LeafCertificate& leaf) {
    ensureSSLInitialized();

    SslCtxPtr ctx(SSL_CTX_new(TLS_server_method()), SSL_CTX_free);
    if (!ctx) {
        return utils::fail("Failed to create SSL context: " + getOpenSSLError());
    }
    if (SSL_CTX_set_min_proto_version(ctx.get(), TLS1_2_VERSION) != 1) {
        return utils::fail("Failed to set minimum TLS version: " + getOpenSSLError());
    }
    if (SSL_CTX_use_certificate(ctx.get(), leaf.certificate()) != 1) {
        return utils::fail("Failed to load server certificate: " + getOpenSSLError());
    }
    if (SSL_CTX_use_PrivateKey(ctx.get(), leaf.privateKey()) != 1) {
        return utils::fail("Failed to load server private key: " + getOpenSSLError());
    }
    if (SSL_CTX_check_private_key(ctx.get()) != 1) {
        return utils::fail("Server private key does not match certificate: " + getOpenSSLError());
    }
    SSL_CTX_set_mode(ctx.get(), SSL_MODE_AUTO_RETRY);

    return std::unique_ptr<TlsServerContext>(new TlsServerContext(std::move(ctx)));
}

} // namespace core
} // namespace applink
