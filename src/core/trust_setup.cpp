#include "applink/core/trust_setup.hpp"
#include <algorithm>
#include <cctype>

namespace applink {
namespace core {

namespace {

TrustReport report(TrustStatus status) {
    TrustReport result;
    result.status = status;
    return result;
}

} // namespace

const char* toString(TrustStatus status) {
    switch (status) {
        case TrustStatus::AlreadyTrusted:    return "AlreadyTrusted";
        case TrustStatus::Installed:         return "Installed";
        case TrustStatus::InstalledManually: return "InstalledManually";
        case TrustStatus::Declined:          return "Declined";
    }
    return "Unknown";
}

Confirmer makeStreamConfirmer(std::istream& in, std::ostream& out) {
    return [&in, &out](const std::string& prompt) {
        out << prompt << " [Y/n]: " << std::flush;
        std::string answer;
        if (!std::getline(in, answer)) {
            return false;
        }
        answer.erase(std::remove_if(answer.begin(), answer.end(),
                                    [](unsigned char c) { return std::isspace(c) != 0; }),
                     answer.end());
        std::transform(answer.begin(), answer.end(), answer.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return answer.empty() || answer == "y" || answer == "yes";
    };
}

TrustSetup::TrustSetup(std::shared_ptr<CertificateAuthorityManager> authority,
                       std::shared_ptr<TrustStore> trustStore,
                       Confirmer confirmer,
                       std::ostream& out,
                       std::shared_ptr<utils::Logger> logger)
    : authority_(std::move(authority)),
      trustStore_(std::move(trustStore)),
      confirmer_(std::move(confirmer)),
      out_(out),
      logger_(std::move(logger)) {}

Result<TrustReport, FlowError> TrustSetup::ensureTrusted(const TrustSetupOptions& options) {
    const bool exists = authority_->authorityExists();
    if (exists && !options.force && trustStore_->isAuthorityTrusted()) {
        APPLINK_LOG_DEBUG(logger_, "Local CA already exists and is trusted");
        return report(TrustStatus::AlreadyTrusted);
    }

    if (!options.reason.empty()) {
        out_ << options.reason << "\n";
    }
    out_ << "applink needs to create a local certificate authority (CA) and add it to your\n"
         << "system trust store. This may prompt for your password.\n\n";

    if (!confirmer_ || !confirmer_("Install the applink CA now?")) {
        out_ << "Certificate setup skipped. The browser will show a security warning.\n";
        if (exists) {
            out_ << "\n" << manualInstallInstructions(trustStore_->platform(), authority_->certificatePath());
        }
        return report(TrustStatus::Declined);
    }

    if (!exists || options.force) {
        auto generated = authority_->generateAuthority();
        if (generated.has_error()) {
            return FlowError(FlowErrorKind::CertificateError, "failed to generate CA", generated.error());
        }
        out_ << "Generated CA certificate: " << authority_->certificatePath().string() << "\n";
    }

    auto installed = trustStore_->installAuthority(authority_->certificatePath());
    if (installed.has_error()) {
        APPLINK_LOG_WARN(logger_, "CA installation failed: " << installed.error());
        out_ << "\nWarning: failed to install CA automatically: " << installed.error() << "\n\n"
             << manualInstallInstructions(trustStore_->platform(), authority_->certificatePath());
        TrustReport manual = report(TrustStatus::InstalledManually);
        manual.installError = FlowError(FlowErrorKind::TrustInstallError,
                                        "failed to install CA automatically", installed.error());
        return manual;
    }

    out_ << "CA installed in the system trust store.\n";
    return report(TrustStatus::Installed);
}

} // namespace core
} // namespace applink
