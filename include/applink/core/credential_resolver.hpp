#pragma once

#include "applink/core/engine_config.hpp"
#include "applink/core/flow_types.hpp"
#include "applink/core/provider_registry.hpp"
#include "applink/core/secret_store.hpp"
#include "applink/utils/result.hpp"
#include <memory>
#include <string>

namespace applink {
namespace core {

/**
 * @brief Finds the OAuth client registration for a service.
 *
 * APPLINK_<SERVICE>_CLIENT_ID and APPLINK_<SERVICE>_CLIENT_SECRET take
 * precedence when both are set; otherwise the secret store entry
 * "applink_creds/<service>" is used.
 */
class CredentialResolver {
public:
    explicit CredentialResolver(std::shared_ptr<SecretStore> store,
                                EnvironmentLookup env = processEnvironment);

    // "APPLINK_<SERVICE>_" with the service id upper-cased.
    static std::string environmentPrefix(const std::string& service);
    static std::string storeKey(const std::string& service);

    /**
     * @brief Resolve credentials for @p provider.
     *
     * @return The credentials; CredentialStoreUnavailable when the store cannot
     * be read (the message explains the environment fallback);
     * ConfigurationError when no credentials exist anywhere
     */
    Result<ClientCredentials, FlowError> resolve(const ProviderDescriptor& provider) const;

    Result<void, FlowError> store(const std::string& service, const ClientCredentials& credentials);
    Result<void, FlowError> remove(const std::string& service);

    // True when resolve() would succeed.
    bool hasCredentials(const ProviderDescriptor& provider) const;

private:
    std::shared_ptr<SecretStore> store_;
    EnvironmentLookup env_;
};

} // namespace core
} // namespace applink
