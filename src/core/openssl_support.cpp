#include "applink/core/openssl_support.hpp"
#include <openssl/err.h>
#include <mutex>
#include <sstream>

namespace applink {
namespace core {

void ensureSSLInitialized() {
    static std::once_flag sslInitFlag;
    std::call_once(sslInitFlag, []() {
        OPENSSL_init_ssl(OPENSSL_INIT_LOAD_SSL_STRINGS | OPENSSL_INIT_LOAD_CRYPTO_STRINGS, nullptr);
    });
}

std::string getOpenSSLError() {
    std::stringstream ss;
    unsigned long err;
    bool first = true;
    while ((err = ERR_get_error()) != 0) {
        char buf[256];
        ERR_error_string_n(err, buf, sizeof(buf));
        if (!first) {
            ss << "; ";
        }
        ss << buf;
        first = false;
    }
    return ss.str();
}

} // namespace core
} // namespace applink
