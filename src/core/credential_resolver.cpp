#include "applink/core/credential_resolver.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <sstream>

namespace applink {
namespace core {

using json = nlohmann::json;

namespace {

std::string environmentHelp(const std::string& service) {
    const std::string prefix = CredentialResolver::environmentPrefix(service);
    std::ostringstream oss;
    oss << "Use environment variables instead:\n"
        << "  export " << prefix << "CLIENT_ID=\"your-client-id\"\n"
        << "  export " << prefix << "CLIENT_SECRET=\"your-client-secret\"";
    return oss.str();
}

FlowError storeUnavailable(const std::string& service, const SecretStoreError& error) {
    return FlowError(FlowErrorKind::CredentialStoreUnavailable,
                     "secret store error: " + error.message,
                     "Secret store is not available.\n\n" + environmentHelp(service));
}

} // namespace

CredentialResolver::CredentialResolver(std::shared_ptr<SecretStore> store, EnvironmentLookup env)
    : store_(std::move(store)), env_(std::move(env)) {}

std::string CredentialResolver::environmentPrefix(const std::string& service) {
    std::string upper = service;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return "APPLINK_" + upper + "_";
}

std::string CredentialResolver::storeKey(const std::string& service) {
    return "applink_creds/" + service;
}

Result<ClientCredentials, FlowError> CredentialResolver::resolve(const ProviderDescriptor& provider) const {
    const std::string prefix = environmentPrefix(provider.id);
    auto clientId = env_(prefix + "CLIENT_ID");
    auto clientSecret = env_(prefix + "CLIENT_SECRET");
    if (clientId && clientSecret) {
        return ClientCredentials{*clientId, *clientSecret};
    }

    auto stored = store_->get(storeKey(provider.id));
    if (stored.has_error()) {
        return storeUnavailable(provider.id, stored.error());
    }

    if (!stored.value()) {
        std::ostringstream detail;
        detail << "Option 1: Run setup (stores in the secret store)\n"
               << "  applink setup " << provider.id << "\n\n"
               << "Option 2: " << environmentHelp(provider.id);
        if (!provider.setupUrl.empty()) {
            detail << "\n\nTo create an OAuth app, visit: " << provider.setupUrl;
        }
        return FlowError(FlowErrorKind::ConfigurationError,
                         "No OAuth credentials found for " + provider.displayName, detail.str());
    }

    try {
        json document = json::parse(*stored.value());
        ClientCredentials credentials{document.at("client_id").get<std::string>(),
                                      document.at("client_secret").get<std::string>()};
        if (credentials.clientId.empty()) {
            return FlowError(FlowErrorKind::ConfigurationError,
                             "stored credentials for " + provider.id + " have an empty client_id");
        }
        return credentials;
    } catch (const json::exception& e) {
        return FlowError(FlowErrorKind::ConfigurationError, "failed to get credentials", e.what());
    }
}

Result<void, FlowError> CredentialResolver::store(const std::string& service, const ClientCredentials& credentials) {
    json document = {{"client_id", credentials.clientId}, {"client_secret", credentials.clientSecret}};
    auto written = store_->set(storeKey(service), document.dump());
    if (written.has_error()) {
        return storeUnavailable(service, written.error());
    }
    return Result<void, FlowError>();
}

Result<void, FlowError> CredentialResolver::remove(const std::string& service) {
    auto removed = store_->remove(storeKey(service));
    if (removed.has_error()) {
        return storeUnavailable(service, removed.error());
    }
    return Result<void, FlowError>();
}

bool CredentialResolver::hasCredentials(const ProviderDescriptor& provider) const {
    return resolve(provider).has_value();
}

} // namespace core
} // namespace applink
