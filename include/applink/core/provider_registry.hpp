#pragma once

#include "applink/utils/result.hpp"
#include <string>
#include <vector>

namespace applink {
namespace core {

enum class AuthType {
    OAuth,
    ApiKey
};

/**
 * @brief Static description of a provider the engine can authorize against.
 */
struct ProviderDescriptor {
    std::string id;
    std::string displayName;
    AuthType authType{AuthType::OAuth};

    // OAuth endpoints and requested scopes; unused for API key providers.
    std::string authorizationUrl;
    std::string tokenUrl;
    std::vector<std::string> scopes;

    std::string apiBaseUrl;
    std::string setupUrl;
    std::string setupInstructions;

    bool usesOAuth() const { return authType == AuthType::OAuth; }
};

/**
 * @brief Lookup table of known providers, ordered by registration.
 */
class ProviderRegistry {
public:
    // Registry holding slack, notion, linear and honeycomb.
    ProviderRegistry();
    explicit ProviderRegistry(std::vector<ProviderDescriptor> providers);

    static const ProviderRegistry& builtin();

    /**
     * @brief Find a provider by id.
     *
     * @return The descriptor, or an error naming the supported providers
     */
    Result<ProviderDescriptor> find(const std::string& id) const;

    const std::vector<ProviderDescriptor>& all() const { return providers_; }
    std::vector<std::string> names() const;

private:
    std::vector<ProviderDescriptor> providers_;
};

} // namespace core
} // namespace applink
