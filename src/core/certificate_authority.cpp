#include "applink/core/certificate_authority.hpp"
#include "applink/utils/file_io.hpp"
#include <openssl/bn.h>
#include <openssl/ec.h>
#include <openssl/err.h>
#include <openssl/obj_mac.h>
#include <openssl/pem.h>
#include <openssl/x509v3.h>

namespace applink {
namespace core {

namespace {

namespace fs = std::filesystem;

Result<EvpPkeyPtr> generateP256Key() {
    std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)> ctx(
        EVP_PKEY_CTX_new_id(EVP_PKEY_EC, nullptr), EVP_PKEY_CTX_free);
    if (!ctx) {
        return utils::fail("Failed to create key context: " + getOpenSSLError());
    }
    if (EVP_PKEY_keygen_init(ctx.get()) <= 0 ||
        EVP_PKEY_CTX_set_ec_paramgen_curve_nid(ctx.get(), NID_X9_62_prime256v1) <= 0) {
        return utils::fail("Failed to initialize P-256 key generation: " + getOpenSSLError());
    }
    EVP_PKEY* raw = nullptr;
    if (EVP_PKEY_keygen(ctx.get(), &raw) <= 0) {
        return utils::fail("Failed to generate P-256 key: " + getOpenSSLError());
    }
    return EvpPkeyPtr(raw, EVP_PKEY_free);
}

// Random 128-bit positive serial number.
bool assignRandomSerial(X509* cert) {
    std::unique_ptr<BIGNUM, decltype(&BN_free)> serial(BN_new(), BN_free);
    if (!serial || !BN_rand(serial.get(), 128, BN_RAND_TOP_ANY, BN_RAND_BOTTOM_ANY)) {
        return false;
    }
    return BN_to_ASN1_INTEGER(serial.get(), X509_get_serialNumber(cert)) != nullptr;
}

bool addNameEntry(X509_NAME* name, const char* field, const std::string& value) {
    if (value.empty()) {
        return true;
    }
    return X509_NAME_add_entry_by_txt(name, field, MBSTRING_UTF8,
        reinterpret_cast<const unsigned char*>(value.c_str()), -1, -1, 0) == 1;
}

bool addExtension(X509* cert, X509* issuer, int nid, const char* value) {
    X509V3_CTX ctx;
    X509V3_set_ctx_nodb(&ctx);
    X509V3_set_ctx(&ctx, issuer, cert, nullptr, nullptr, 0);
    X509_EXTENSION* ext = X509V3_EXT_conf_nid(nullptr, &ctx, nid, value);
    if (!ext) {
        return false;
    }
    int rc = X509_add_ext(cert, ext, -1);
    X509_EXTENSION_free(ext);
    return rc == 1;
}

// Creates an unsigned v3 certificate with a random serial and the given validity.
Result<X509Ptr> newCertificate(EVP_PKEY* publicKey, int validDays, long extraSeconds) {
    X509Ptr cert(X509_new(), X509_free);
    if (!cert) {
        return utils::fail("Failed to create X509 structure: " + getOpenSSLError());
    }
    if (X509_set_version(cert.get(), 2) != 1 || !assignRandomSerial(cert.get())) {
        return utils::fail("Failed to initialize certificate serial: " + getOpenSSLError());
    }
    if (!X509_gmtime_adj(X509_getm_notBefore(cert.get()), 0) ||
        !X509_time_adj_ex(X509_getm_notAfter(cert.get()), validDays, extraSeconds, nullptr)) {
        return utils::fail("Failed to set certificate validity: " + getOpenSSLError());
    }
    if (X509_set_pubkey(cert.get(), publicKey) != 1) {
        return utils::fail("Failed to set certificate public key: " + getOpenSSLError());
    }
    return cert;
}

Result<void> addLeafExtensions(X509* cert, X509* issuer, const std::string& hostname, bool withAuthorityKeyId) {
    const std::string san = "DNS:" + hostname + ",IP:127.0.0.1";
    if (!addExtension(cert, issuer, NID_basic_constraints, "critical,CA:FALSE") ||
        !addExtension(cert, issuer, NID_key_usage, "critical,digitalSignature,keyEncipherment") ||
        !addExtension(cert, issuer, NID_ext_key_usage, "serverAuth") ||
        !addExtension(cert, issuer, NID_subject_alt_name, san.c_str()) ||
        !addExtension(cert, issuer, NID_subject_key_identifier, "hash")) {
        return Result<void>("Failed to add leaf certificate extensions: " + getOpenSSLError());
    }
    if (withAuthorityKeyId &&
        !addExtension(cert, issuer, NID_authority_key_identifier, "keyid:always")) {
        return Result<void>("Failed to add authority key identifier: " + getOpenSSLError());
    }
    return Result<void>();
}

Result<std::string> toPem(X509* cert) {
    BioPtr bio(BIO_new(BIO_s_mem()), BIO_free_all);
    if (!bio || PEM_write_bio_X509(bio.get(), cert) != 1) {
        return utils::fail("Failed to encode certificate: " + getOpenSSLError());
    }
    char* data = nullptr;
    long len = BIO_get_mem_data(bio.get(), &data);
    return std::string(data, static_cast<size_t>(len));
}

Result<std::string> toPem(EVP_PKEY* key) {
    BioPtr bio(BIO_new(BIO_s_mem()), BIO_free_all);
    if (!bio || PEM_write_bio_PrivateKey(bio.get(), key, nullptr, nullptr, 0, nullptr, nullptr) != 1) {
        return utils::fail("Failed to encode private key: " + getOpenSSLError());
    }
    char* data = nullptr;
    long len = BIO_get_mem_data(bio.get(), &data);
    return std::string(data, static_cast<size_t>(len));
}

Result<X509Ptr> parseCertificatePem(const std::string& pem) {
    BioPtr bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())), BIO_free_all);
    if (!bio) {
        return utils::fail("Failed to create BIO: " + getOpenSSLError());
    }
    X509* cert = PEM_read_bio_X509(bio.get(), nullptr, nullptr, nullptr);
    if (!cert) {
        return utils::fail("Failed to parse certificate: " + getOpenSSLError());
    }
    return X509Ptr(cert, X509_free);
}

} // namespace

LeafCertificate::LeafCertificate(X509Ptr certificate, EvpPkeyPtr privateKey, bool selfSigned)
    : certificate_(std::move(certificate)),
      privateKey_(std::move(privateKey)),
      selfSigned_(selfSigned) {}

std::string LeafCertificate::certificatePem() const {
    auto pem = toPem(certificate_.get());
    return pem.has_value() ? pem.value() : std::string();
}

std::string LeafCertificate::subjectCommonName() const {
    X509_NAME* subject = X509_get_subject_name(certificate_.get());
    char buf[256] = {0};
    if (X509_NAME_get_text_by_NID(subject, NID_commonName, buf, sizeof(buf)) < 0) {
        return std::string();
    }
    return buf;
}

CertificateAuthorityManager::CertificateAuthorityManager(CertificateAuthorityConfig config,
                                                         std::shared_ptr<utils::Logger> logger)
    : config_(std::move(config)), logger_(std::move(logger)) {
    ensureSSLInitialized();
}

std::filesystem::path CertificateAuthorityManager::certificatePath() const {
    return config_.directory / config_.certFileName;
}

std::filesystem::path CertificateAuthorityManager::keyPath() const {
    return config_.directory / config_.keyFileName;
}

bool CertificateAuthorityManager::authorityExists() const {
    auto authority = loadAuthority();
    if (authority.has_error()) {
        APPLINK_LOG_DEBUG(logger_, "No usable CA in " << config_.directory.string() << ": " << authority.error());
        return false;
    }
    return true;
}

Result<void> CertificateAuthorityManager::generateAuthority() {
    auto directory = utils::ensurePrivateDirectory(config_.directory);
    if (directory.has_error()) {
        return directory;
    }

    auto key = generateP256Key();
    if (key.has_error()) {
        return Result<void>(key.error());
    }

    auto cert = newCertificate(key.value().get(), config_.authorityValidityDays, 0);
    if (cert.has_error()) {
        return Result<void>(cert.error());
    }
    X509* ca = cert.value().get();

    X509_NAME* name = X509_get_subject_name(ca);
    if (!addNameEntry(name, "O", config_.organization) ||
        !addNameEntry(name, "OU", config_.organizationalUnit) ||
        !addNameEntry(name, "CN", config_.commonName) ||
        X509_set_issuer_name(ca, name) != 1) {
        return Result<void>("Failed to set CA subject: " + getOpenSSLError());
    }

    if (!addExtension(ca, ca, NID_basic_constraints, "critical,CA:TRUE,pathlen:0") ||
        !addExtension(ca, ca, NID_key_usage, "critical,keyCertSign,cRLSign") ||
        !addExtension(ca, ca, NID_subject_key_identifier, "hash")) {
        return Result<void>("Failed to add CA extensions: " + getOpenSSLError());
    }

    if (X509_sign(ca, key.value().get(), EVP_sha256()) <= 0) {
        return Result<void>("Failed to sign CA certificate: " + getOpenSSLError());
    }

    auto keyPem = toPem(key.value().get());
    if (keyPem.has_error()) {
        return Result<void>(keyPem.error());
    }
    auto certPem = toPem(ca);
    if (certPem.has_error()) {
        return Result<void>(certPem.error());
    }

    auto written = utils::writeFile(keyPath(), keyPem.value(), fs::perms::owner_read | fs::perms::owner_write);
    if (written.has_error()) {
        return written;
    }
    written = utils::writeFile(certificatePath(), certPem.value(),
                               fs::perms::owner_read | fs::perms::owner_write |
                               fs::perms::group_read | fs::perms::others_read);
    if (written.has_error()) {
        return written;
    }

    APPLINK_LOG_INFO(logger_, "Generated local CA at " << certificatePath().string());
    return Result<void>();
}

Result<CertificateAuthorityManager::Authority> CertificateAuthorityManager::loadAuthority() const {
    auto certPem = utils::readFile(certificatePath());
    if (certPem.has_error()) {
        return utils::fail(certPem.error());
    }
    auto keyPem = utils::readFile(keyPath());
    if (keyPem.has_error()) {
        return utils::fail(keyPem.error());
    }

    Authority authority;
    auto cert = parseCertificatePem(certPem.value());
    if (cert.has_error()) {
        return utils::fail("Failed to parse CA certificate: " + cert.error());
    }
    authority.certificate = std::move(cert.value());

    BioPtr keyBio(BIO_new_mem_buf(keyPem.value().data(), static_cast<int>(keyPem.value().size())), BIO_free_all);
    EVP_PKEY* key = keyBio ? PEM_read_bio_PrivateKey(keyBio.get(), nullptr, nullptr, nullptr) : nullptr;
    if (!key) {
        return utils::fail("Failed to parse CA private key: " + getOpenSSLError());
    }
    authority.privateKey.reset(key);

    if (X509_check_private_key(authority.certificate.get(), authority.privateKey.get()) != 1) {
        ERR_clear_error();
        return utils::fail(std::string("CA private key does not match certificate"));
    }
    return authority;
}

Result<LeafCertificate> CertificateAuthorityManager::issueLeafCertificate() const {
    auto authority = loadAuthority();
    if (authority.has_error()) {
        return utils::fail("Failed to load CA: " + authority.error());
    }
    X509* ca = authority.value().certificate.get();

    auto key = generateP256Key();
    if (key.has_error()) {
        return utils::fail(key.error());
    }
    auto cert = newCertificate(key.value().get(), config_.leafValidityDays, 0);
    if (cert.has_error()) {
        return utils::fail(cert.error());
    }
    X509* leaf = cert.value().get();

    X509_NAME* name = X509_get_subject_name(leaf);
    if (!addNameEntry(name, "O", config_.organization) ||
        !addNameEntry(name, "CN", config_.leafHostname) ||
        X509_set_issuer_name(leaf, X509_get_subject_name(ca)) != 1) {
        return utils::fail("Failed to set leaf subject: " + getOpenSSLError());
    }

    auto ext = addLeafExtensions(leaf, ca, config_.leafHostname, true);
    if (ext.has_error()) {
        return utils::fail(ext.error());
    }
    if (X509_sign(leaf, authority.value().privateKey.get(), EVP_sha256()) <= 0) {
        return utils::fail("Failed to sign leaf certificate: " + getOpenSSLError());
    }

    APPLINK_LOG_DEBUG(logger_, "Issued CA-signed certificate for " << config_.leafHostname);
    return LeafCertificate(std::move(cert.value()), std::move(key.value()), false);
}

Result<LeafCertificate> CertificateAuthorityManager::issueSelfSignedLeaf() const {
    auto key = generateP256Key();
    if (key.has_error()) {
        return utils::fail(key.error());
    }
    auto cert = newCertificate(key.value().get(), 0, 3600L * config_.selfSignedValidityHours);
    if (cert.has_error()) {
        return utils::fail(cert.error());
    }
    X509* leaf = cert.value().get();

    X509_NAME* name = X509_get_subject_name(leaf);
    if (!addNameEntry(name, "O", config_.organization) ||
        !addNameEntry(name, "CN", config_.leafHostname) ||
        X509_set_issuer_name(leaf, name) != 1) {
        return utils::fail("Failed to set certificate subject: " + getOpenSSLError());
    }

    auto ext = addLeafExtensions(leaf, leaf, config_.leafHostname, false);
    if (ext.has_error()) {
        return utils::fail(ext.error());
    }
    if (X509_sign(leaf, key.value().get(), EVP_sha256()) <= 0) {
        return utils::fail("Failed to sign certificate: " + getOpenSSLError());
    }

    APPLINK_LOG_WARN(logger_, "Using a self-signed certificate; the browser will show a security warning");
    return LeafCertificate(std::move(cert.value()), std::move(key.value()), true);
}

Result<void> CertificateAuthorityManager::verifyLeaf(const LeafCertificate& leaf) const {
    auto caPem = utils::readFile(certificatePath());
    if (caPem.has_error()) {
        return Result<void>(caPem.error());
    }
    return verifyIssuedBy(leaf, caPem.value());
}

Result<void> CertificateAuthorityManager::verifyIssuedBy(const LeafCertificate& leaf, const std::string& caPem) {
    ensureSSLInitialized();
    auto ca = parseCertificatePem(caPem);
    if (ca.has_error()) {
        return Result<void>(ca.error());
    }

    std::unique_ptr<X509_STORE, decltype(&X509_STORE_free)> store(X509_STORE_new(), X509_STORE_free);
    if (!store || X509_STORE_add_cert(store.get(), ca.value().get()) != 1) {
        return Result<void>("Failed to build trust store: " + getOpenSSLError());
    }

    std::unique_ptr<X509_STORE_CTX, decltype(&X509_STORE_CTX_free)> ctx(X509_STORE_CTX_new(), X509_STORE_CTX_free);
    if (!ctx || X509_STORE_CTX_init(ctx.get(), store.get(), leaf.certificate(), nullptr) != 1) {
        return Result<void>("Failed to initialize X509_STORE_CTX: " + getOpenSSLError());
    }
    X509_STORE_CTX_set_purpose(ctx.get(), X509_PURPOSE_SSL_SERVER);

    if (X509_verify_cert(ctx.get()) != 1) {
        int err = X509_STORE_CTX_get_error(ctx.get());
        ERR_clear_error();
        return Result<void>(std::string("Certificate verification failed: ") +
                            X509_verify_cert_error_string(err));
    }
    return Result<void>();
}

} // namespace core
} // namespace applink
