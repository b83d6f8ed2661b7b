#include "applink/core/credential_resolver.hpp"
#include "applink/core/engine_config.hpp"
#include "applink/core/oauth_flow.hpp"
#include "applink/core/provider_adapter.hpp"
#include "applink/core/provider_registry.hpp"
#include "applink/core/secret_store.hpp"
#include "applink/core/token_repository.hpp"
#include "applink/core/trust_setup.hpp"
#include <iostream>
#include <memory>

using namespace applink::core;

namespace {

int fail(const FlowError& error) {
    std::cerr << "Error: authentication failed: " << error.message << "\n";
    if (!error.detail.empty()) {
        std::cerr << "\n" << error.detail << "\n";
    }
    return 1;
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc != 2) {
        std::cerr << "Usage: applink_login <service>\n";
        return 2;
    }
    const std::string service = argv[1];

    auto config = EngineConfig::fromEnvironment();
    if (config.has_error()) {
        std::cerr << "Error: " << config.error() << "\n";
        return 1;
    }
    auto logger = config.value().logger;

    auto provider = ProviderRegistry::builtin().find(service);
    if (provider.has_error()) {
        std::cerr << "Error: " << provider.error() << "\n";
        return 1;
    }
    if (!provider.value().usesOAuth()) {
        std::cerr << provider.value().displayName << " uses an API key; see "
                  << provider.value().setupUrl << "\n";
        return 1;
    }

    std::cout << "Authenticating with " << provider.value().displayName << "...\n";

    auto secrets = std::make_shared<FileSecretStore>(FileSecretStore::defaultPath(), logger);
    CredentialResolver resolver(secrets);
    auto credentials = resolver.resolve(provider.value());
    if (credentials.has_error()) {
        return fail(credentials.error());
    }

    CertificateAuthorityConfig caConfig;
    caConfig.directory = config.value().certsDirectory;
    auto authority = std::make_shared<CertificateAuthorityManager>(caConfig, logger);

    ProviderAdapter adapter;
    if (adapter.redirectScheme(provider.value()) == RedirectScheme::Https) {
        auto trustStore = std::make_shared<TrustStore>(currentPlatform(), std::make_shared<ProcessCommandRunner>(),
                                                       TrustStoreConfig(), logger);
        TrustSetup trust(authority, trustStore, makeStreamConfirmer(), std::cout, logger);
        TrustSetupOptions options;
        options.reason = provider.value().displayName + " requires HTTPS for OAuth callbacks.";
        auto status = trust.ensureTrusted(options);
        if (status.has_error()) {
            return fail(status.error());
        }
        if (status.value().installError) {
            std::cout << "Continuing without a trusted CA ("
                      << status.value().installError->describe() << ").\n"
                      << "Your browser will show a certificate warning.\n\n";
        }
    }

    OAuthFlow flow(config.value(), std::make_shared<CurlHttpClient>(logger),
                   std::make_shared<SystemBrowserLauncher>(), authority, adapter);
    auto token = flow.run(provider.value(), credentials.value());
    if (token.has_error()) {
        return fail(token.error());
    }

    TokenRepository tokens(secrets);
    auto saved = tokens.save(service, token.value());
    if (saved.has_error()) {
        std::cerr << "Error: failed to store token: " << saved.error().message << "\n";
        return 1;
    }

    std::cout << "✓ Successfully authenticated with " << provider.value().displayName << "\n";
    return 0;
}
