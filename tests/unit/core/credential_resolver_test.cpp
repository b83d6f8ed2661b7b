#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "applink/core/credential_resolver.hpp"
#include "mock_collaborators.hpp"
#include <map>

namespace applink {
namespace core {
namespace {

using ::testing::_;
using ::testing::HasSubstr;
using ::testing::Return;

EnvironmentLookup fakeEnvironment(std::map<std::string, std::string> values) {
    return [values](const std::string& name) -> std::optional<std::string> {
        auto it = values.find(name);
        if (it == values.end()) {
            return std::nullopt;
        }
        return it->second;
    };
}

class CredentialResolverTest : public ::testing::Test {
protected:
    ProviderDescriptor provider(const std::string& id) {
        return ProviderRegistry::builtin().find(id).value();
    }

    std::shared_ptr<InMemorySecretStore> store_ = std::make_shared<InMemorySecretStore>();
};

TEST_F(CredentialResolverTest, NamingConventions) {
    EXPECT_EQ(CredentialResolver::environmentPrefix("linear"), "APPLINK_LINEAR_");
    EXPECT_EQ(CredentialResolver::storeKey("linear"), "applink_creds/linear");
}

TEST_F(CredentialResolverTest, EnvironmentTakesPrecedence) {
    CredentialResolver resolver(store_, fakeEnvironment({{"APPLINK_LINEAR_CLIENT_ID", "env-id"},
                                                         {"APPLINK_LINEAR_CLIENT_SECRET", "env-secret"}}));
    ASSERT_TRUE(resolver.store("linear", {"stored-id", "stored-secret"}).has_value());

    auto credentials = resolver.resolve(provider("linear"));
    ASSERT_TRUE(credentials.has_value()) << credentials.error().describe();
    EXPECT_EQ(credentials.value().clientId, "env-id");
    EXPECT_EQ(credentials.value().clientSecret, "env-secret");
}

TEST_F(CredentialResolverTest, PartialEnvironmentFallsBackToStore) {
    CredentialResolver resolver(store_, fakeEnvironment({{"APPLINK_LINEAR_CLIENT_ID", "env-id"}}));
    ASSERT_TRUE(resolver.store("linear", {"stored-id", "stored-secret"}).has_value());

    auto credentials = resolver.resolve(provider("linear"));
    ASSERT_TRUE(credentials.has_value());
    EXPECT_EQ(credentials.value().clientId, "stored-id");
    EXPECT_TRUE(resolver.hasCredentials(provider("linear")));
}

TEST_F(CredentialResolverTest, MissingCredentialsExplainSetup) {
    CredentialResolver resolver(store_, fakeEnvironment({}));
    auto linear = provider("linear");
    auto credentials = resolver.resolve(linear);
    ASSERT_TRUE(credentials.has_error());
    EXPECT_EQ(credentials.error().kind, FlowErrorKind::ConfigurationError);
    EXPECT_EQ(credentials.error().message, "No OAuth credentials found for Linear");
    EXPECT_THAT(credentials.error().detail, HasSubstr("applink setup linear"));
    EXPECT_THAT(credentials.error().detail, HasSubstr("export APPLINK_LINEAR_CLIENT_SECRET="));
    EXPECT_THAT(credentials.error().detail, HasSubstr(linear.setupUrl));
    EXPECT_FALSE(resolver.hasCredentials(linear));
}

TEST_F(CredentialResolverTest, UnavailableStoreSuggestsEnvironment) {
    auto broken = std::make_shared<MockSecretStore>();
    EXPECT_CALL(*broken, get("applink_creds/notion"))
        .WillOnce(Return(applink::Result<std::optional<std::string>, SecretStoreError>(
            SecretStoreError(SecretStoreError::Kind::Unavailable, "keychain locked"))));

    CredentialResolver resolver(broken, fakeEnvironment({}));
    auto credentials = resolver.resolve(provider("notion"));
    ASSERT_TRUE(credentials.has_error());
    EXPECT_EQ(credentials.error().kind, FlowErrorKind::CredentialStoreUnavailable);
    EXPECT_THAT(credentials.error().message, HasSubstr("keychain locked"));
    EXPECT_THAT(credentials.error().detail, HasSubstr("export APPLINK_NOTION_CLIENT_ID="));
}

TEST_F(CredentialResolverTest, EnvironmentWorksWithoutStore) {
    auto broken = std::make_shared<MockSecretStore>();
    EXPECT_CALL(*broken, get(_)).Times(0);
    CredentialResolver resolver(broken, fakeEnvironment({{"APPLINK_NOTION_CLIENT_ID", "id"},
                                                         {"APPLINK_NOTION_CLIENT_SECRET", "secret"}}));
    EXPECT_TRUE(resolver.resolve(provider("notion")).has_value());
}

TEST_F(CredentialResolverTest, MalformedStoredEntry) {
    ASSERT_TRUE(store_->set("applink_creds/slack", "{\"client_id\":42}").has_value());
    CredentialResolver resolver(store_, fakeEnvironment({}));
    auto credentials = resolver.resolve(provider("slack"));
    ASSERT_TRUE(credentials.has_error());
    EXPECT_EQ(credentials.error().kind, FlowErrorKind::ConfigurationError);
    EXPECT_EQ(credentials.error().message, "failed to get credentials");
}

TEST_F(CredentialResolverTest, StoreFailureIsReported) {
    auto broken = std::make_shared<MockSecretStore>();
    EXPECT_CALL(*broken, set("applink_creds/slack", _))
        .WillOnce(Return(applink::Result<void, SecretStoreError>(
            SecretStoreError(SecretStoreError::Kind::WriteFailed, "disk full"))));
    CredentialResolver resolver(broken, fakeEnvironment({}));

    auto stored = resolver.store("slack", {"id", "secret"});
    ASSERT_TRUE(stored.has_error());
    EXPECT_EQ(stored.error().kind, FlowErrorKind::CredentialStoreUnavailable);
}

TEST_F(CredentialResolverTest, RemoveForgetsStoredCredentials) {
    CredentialResolver resolver(store_, fakeEnvironment({}));
    ASSERT_TRUE(resolver.store("linear", {"id", "secret"}).has_value());
    EXPECT_TRUE(resolver.hasCredentials(provider("linear")));
    ASSERT_TRUE(resolver.remove("linear").has_value());
    EXPECT_FALSE(resolver.hasCredentials(provider("linear")));
}

} // namespace
} // namespace core
} // namespace applink
