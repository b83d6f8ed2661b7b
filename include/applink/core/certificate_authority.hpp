#ifndef APPLINK_CORE_CERTIFICATE_AUTHORITY_HPP
#define APPLINK_CORE_CERTIFICATE_AUTHORITY_HPP

#include "applink/core/openssl_support.hpp"
#include "applink/utils/logging.hpp"
#include "applink/utils/result.hpp"
#include <filesystem>
#include <memory>
#include <string>

namespace applink {
namespace core {

/**
 * @brief Settings for the local development certificate authority.
 */
struct CertificateAuthorityConfig {
    std::filesystem::path directory;
    std::string keyFileName{"applink-ca-key.pem"};
    std::string certFileName{"applink-ca.pem"};

    std::string commonName{"applink Local CA"};
    std::string organization{"applink"};
    std::string organizationalUnit{"Development CA"};

    int authorityValidityDays{3650};
    int leafValidityDays{365};
    // Validity of the throwaway certificate used when no authority exists.
    int selfSignedValidityHours{24};

    std::string leafHostname{"localhost"};
};

/**
 * @brief A server certificate and its private key, owned together.
 */
class LeafCertificate {
public:
    LeafCertificate(X509Ptr certificate, EvpPkeyPtr privateKey, bool selfSigned);

    LeafCertificate(LeafCertificate&&) = default;
    LeafCertificate& operator=(LeafCertificate&&) = default;

    X509* certificate() const { return certificate_.get(); }
    EVP_PKEY* privateKey() const { return privateKey_.get(); }
    bool isSelfSigned() const { return selfSigned_; }

    std::string certificatePem() const;
    std::string subjectCommonName() const;

private:
    X509Ptr certificate_;
    EvpPkeyPtr privateKey_;
    bool selfSigned_;
};

/**
 * @brief Creates, persists and uses the local certificate authority that
 * signs loopback TLS certificates.
 *
 * The CA private key is written with owner-only permissions next to the
 * world-readable CA certificate. Leaf certificates are kept in memory only.
 */
class CertificateAuthorityManager {
public:
    explicit CertificateAuthorityManager(CertificateAuthorityConfig config,
                                         std::shared_ptr<utils::Logger> logger = utils::defaultLogger());

    const std::filesystem::path& directory() const { return config_.directory; }
    std::filesystem::path certificatePath() const;
    std::filesystem::path keyPath() const;

    /**
     * @brief True when both CA files exist, parse, and the key matches the certificate.
     */
    bool authorityExists() const;

    /**
     * @brief Generate a new P-256 CA and persist it, replacing any existing one.
     */
    Result<void> generateAuthority();

    /**
     * @brief Issue a loopback server certificate signed by the persisted CA.
     */
    Result<LeafCertificate> issueLeafCertificate() const;

    /**
     * @brief Issue a short-lived self-signed loopback certificate. Used when
     * no CA has been generated; browsers will show a warning.
     */
    Result<LeafCertificate> issueSelfSignedLeaf() const;

    /**
     * @brief Verify that @p leaf chains to the persisted CA for TLS server use.
     */
    Result<void> verifyLeaf(const LeafCertificate& leaf) const;

    /**
     * @brief Verify that @p leaf chains to the CA certificate in @p caPem.
     */
    static Result<void> verifyIssuedBy(const LeafCertificate& leaf, const std::string& caPem);

private:
    struct Authority {
        X509Ptr certificate{nullptr, X509_free};
        EvpPkeyPtr privateKey{nullptr, EVP_PKEY_free};
    };

    Result<Authority> loadAuthority() const;

    CertificateAuthorityConfig config_;
    std::shared_ptr<utils::Logger> logger_;
};

} // namespace core
} // namespace applink

#endif // APPLINK_CORE_CERTIFICATE_AUTHORITY_HPP
