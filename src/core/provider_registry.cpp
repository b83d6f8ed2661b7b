#include "applink/core/provider_registry.hpp"
#include <sstream>

namespace applink {
namespace core {

namespace {

std::vector<ProviderDescriptor> builtinProviders() {
    std::vector<ProviderDescriptor> providers;

    ProviderDescriptor slack;
    slack.id = "slack";
    slack.displayName = "Slack";
    slack.authorizationUrl = "https://slack.com/oauth/v2/authorize";
    slack.tokenUrl = "https://slack.com/api/oauth.v2.access";
    slack.scopes = {"channels:read", "channels:history", "groups:read",
                    "groups:history", "chat:write", "users:read"};
    slack.apiBaseUrl = "https://slack.com";
    slack.setupUrl = "https://api.slack.com/apps";
    slack.setupInstructions =
        "1. Go to https://api.slack.com/apps\n"
        "2. Click \"Create New App\" and choose \"From scratch\"\n"
        "3. Name your app (e.g., \"applink\") and select your workspace\n"
        "4. Go to \"OAuth & Permissions\" in the sidebar\n"
        "5. Under \"Redirect URLs\", add: https://localhost:8888/callback\n"
        "6. Under \"User Token Scopes\", add these scopes:\n"
        "   - channels:read, channels:history\n"
        "   - groups:read, groups:history\n"
        "   - chat:write, users:read\n"
        "7. Go to \"Basic Information\" to find your Client ID and Client Secret";
    providers.push_back(slack);

    ProviderDescriptor notion;
    notion.id = "notion";
    notion.displayName = "Notion";
    notion.authorizationUrl = "https://api.notion.com/v1/oauth/authorize";
    notion.tokenUrl = "https://api.notion.com/v1/oauth/token";
    notion.apiBaseUrl = "https://api.notion.com";
    notion.setupUrl = "https://www.notion.so/my-integrations";
    notion.setupInstructions =
        "1. Go to https://www.notion.so/my-integrations\n"
        "2. Click \"New integration\"\n"
        "3. Name your integration (e.g., \"applink\")\n"
        "4. Select the workspace to install it in\n"
        "5. Under \"Capabilities\", ensure it has the access you need\n"
        "6. Set the redirect URI to: http://localhost:8888/callback\n"
        "7. Copy the \"OAuth client ID\" and \"OAuth client secret\"\n"
        "\n"
        "Note: After authenticating, you must share specific pages with the integration.";
    providers.push_back(notion);

    ProviderDescriptor linear;
    linear.id = "linear";
    linear.displayName = "Linear";
    linear.authorizationUrl = "https://linear.app/oauth/authorize";
    linear.tokenUrl = "https://api.linear.app/oauth/token";
    linear.scopes = {"read", "write", "issues:create", "comments:create"};
    linear.apiBaseUrl = "https://api.linear.app";
    linear.setupUrl = "https://linear.app/settings/api";
    linear.setupInstructions =
        "1. Go to https://linear.app/settings/api\n"
        "2. Under \"OAuth applications\", click \"Create new\"\n"
        "3. Name your application (e.g., \"applink\")\n"
        "4. Set the redirect URI to: http://localhost:8888/callback\n"
        "5. Select the scopes: read, write, issues:create, comments:create\n"
        "6. Copy the \"Client ID\" and \"Client Secret\"";
    providers.push_back(linear);

    ProviderDescriptor honeycomb;
    honeycomb.id = "honeycomb";
    honeycomb.displayName = "Honeycomb";
    honeycomb.authType = AuthType::ApiKey;
    honeycomb.apiBaseUrl = "https://api.honeycomb.io";
    honeycomb.setupUrl = "https://ui.honeycomb.io/account";
    honeycomb.setupInstructions =
        "1. Go to https://ui.honeycomb.io/account\n"
        "2. Navigate to \"Team settings\" and then \"API Keys\"\n"
        "3. Create a new API key with the permissions you need\n"
        "4. Copy the API key";
    providers.push_back(honeycomb);

    return providers;
}

} // namespace

ProviderRegistry::ProviderRegistry() : providers_(builtinProviders()) {}

ProviderRegistry::ProviderRegistry(std::vector<ProviderDescriptor> providers)
    : providers_(std::move(providers)) {}

const ProviderRegistry& ProviderRegistry::builtin() {
    static const ProviderRegistry registry;
    return registry;
}

Result<ProviderDescriptor> ProviderRegistry::find(const std::string& id) const {
    for (const auto& provider : providers_) {
        if (provider.id == id) {
            return provider;
        }
    }

    std::ostringstream oss;
    oss << "unknown service: " << id << "\n\nSupported services: ";
    for (size_t i = 0; i < providers_.size(); ++i) {
        if (i > 0) {
            oss << ", ";
        }
        oss << providers_[i].id;
    }
    return utils::fail(oss.str());
}

std::vector<std::string> ProviderRegistry::names() const {
    std::vector<std::string> names;
    names.reserve(providers_.size());
    for (const auto& provider : providers_) {
        names.push_back(provider.id);
    }
    return names;
}

} // namespace core
} // namespace applink
