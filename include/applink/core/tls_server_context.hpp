#pragma once

#include "applink/core/certificate_authority.hpp"
#include "applink/core/openssl_support.hpp"
#include "applink/utils/result.hpp"
#include <memory>

namespace applink {
namespace core {

/**
 * @brief Server-side SSL_CTX loaded with a loopback leaf certificate.
 *
 * Accepts TLS 1.2 and newer.
 */
class TlsServerContext {
public:
    static Result<std::unique_ptr<TlsServerContext>> create(const LeafCertificate& leaf);

    SSL_CTX* get() const { return ctx_.get(); }

private:
    explicit TlsServerContext(SslCtxPtr ctx);

    SslCtxPtr ctx_;
};

} // namespace core
} // namespace applink
