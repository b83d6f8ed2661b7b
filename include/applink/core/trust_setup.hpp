#pragma once

#include "applink/core/certificate_authority.hpp"
#include "applink/core/flow_types.hpp"
#include "applink/core/trust_store.hpp"
#include "applink/utils/logging.hpp"
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

namespace applink {
namespace core {

enum class TrustStatus {
    AlreadyTrusted,
    Installed,
    // Installation failed; manual instructions were printed.
    InstalledManually,
    Declined
};

const char* toString(TrustStatus status);

struct TrustReport {
    TrustStatus status = TrustStatus::AlreadyTrusted;
    // Set with kind TrustInstallError when status is InstalledManually.
    std::optional<FlowError> installError;
};

// Asks the user a yes/no question; returns true for yes.
using Confirmer = std::function<bool(const std::string& prompt)>;

// Reads a "[Y/n]" answer from @p in; an empty answer means yes.
Confirmer makeStreamConfirmer(std::istream& in = std::cin, std::ostream& out = std::cout);

struct TrustSetupOptions {
    // Regenerate and reinstall even when a trusted CA exists.
    bool force{false};
    // Shown before the prompt, e.g. "Slack requires HTTPS for OAuth callbacks."
    std::string reason;
};

/**
 * @brief Idempotent "make the local CA exist and be trusted" operation shared
 * by explicit initialization and by login for HTTPS-only providers.
 */
class TrustSetup {
public:
    TrustSetup(std::shared_ptr<CertificateAuthorityManager> authority,
               std::shared_ptr<TrustStore> trustStore,
               Confirmer confirmer,
               std::ostream& out = std::cout,
               std::shared_ptr<utils::Logger> logger = utils::defaultLogger());

    /**
     * @brief Ensure the CA exists and is installed in the OS trust store.
     *
     * Only certificate generation failures are errors. A failed install
     * degrades to printed manual instructions and is reported in
     * TrustReport::installError.
     */
    Result<TrustReport, FlowError> ensureTrusted(const TrustSetupOptions& options = TrustSetupOptions());

private:
    std::shared_ptr<CertificateAuthorityManager> authority_;
    std::shared_ptr<TrustStore> trustStore_;
    Confirmer confirmer_;
    std::ostream& out_;
    std::shared_ptr<utils::Logger> logger_;
};

} // namespace core
} // namespace applink
