#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "applink/core/provider_adapter.hpp"
#include "applink/utils/encoding.hpp"

namespace applink {
namespace core {
namespace {

using ::testing::HasSubstr;
using ::testing::Pair;
using ::testing::Contains;
using ::testing::Not;

class ProviderAdapterTest : public ::testing::Test {
protected:
    ProviderDescriptor provider(const std::string& id) {
        return ProviderRegistry::builtin().find(id).value();
    }

    ProviderAdapter adapter_;
    ClientCredentials credentials_{"client-id", "client-secret"};
    Token::Clock::time_point issuedAt_{std::chrono::seconds(1700000000)};
};

TEST_F(ProviderAdapterTest, SlackRequiresHttpsAndUserScope) {
    auto slack = provider("slack");
    EXPECT_EQ(adapter_.redirectScheme(slack), RedirectScheme::Https);
    EXPECT_EQ(adapter_.redirectScheme(provider("linear")), RedirectScheme::Http);

    auto params = adapter_.authorizationParameters(slack, "id", "https://localhost:8888/callback", "S");
    EXPECT_THAT(params, Contains(Pair("user_scope",
        "channels:read,channels:history,groups:read,groups:history,chat:write,users:read")));
    EXPECT_THAT(params, Contains(Pair("response_type", "code")));
}

TEST_F(ProviderAdapterTest, StandardScopesAreSpaceSeparated) {
    auto params = adapter_.authorizationParameters(provider("linear"), "id", "http://localhost:8888/callback", "S");
    EXPECT_THAT(params, Contains(Pair("scope", "read write issues:create comments:create")));

    auto notionParams = adapter_.authorizationParameters(provider("notion"), "id", "uri", "S");
    for (const auto& param : notionParams) {
        EXPECT_NE(param.first, "scope");
    }
}

TEST_F(ProviderAdapterTest, NotionUsesBasicAuth) {
    auto request = adapter_.buildTokenRequest(provider("notion"), credentials_, "abc",
                                              "http://localhost:8888/callback", std::chrono::seconds(30));
    ASSERT_TRUE(request.has_value());
    EXPECT_EQ(request.value().header("authorization"),
              "Basic " + utils::base64Encode(std::string("client-id:client-secret")));
    EXPECT_THAT(request.value().body, Not(HasSubstr("client_secret")));
    EXPECT_EQ(request.value().header("Content-Type"), "application/x-www-form-urlencoded");
}

TEST_F(ProviderAdapterTest, StandardCredentialsInBody) {
    auto request = adapter_.buildTokenRequest(provider("linear"), credentials_, "abc",
                                              "http://localhost:8888/callback", std::chrono::seconds(30));
    ASSERT_TRUE(request.has_value());
    auto form = utils::parseQueryString(request.value().body);
    ASSERT_TRUE(form.has_value());
    EXPECT_EQ(form.value().at("grant_type"), "authorization_code");
    EXPECT_EQ(form.value().at("code"), "abc");
    EXPECT_EQ(form.value().at("redirect_uri"), "http://localhost:8888/callback");
    EXPECT_EQ(form.value().at("client_id"), "client-id");
    EXPECT_EQ(form.value().at("client_secret"), "client-secret");
    EXPECT_TRUE(request.value().header("Authorization").empty());
    EXPECT_EQ(request.value().url, "https://api.linear.app/oauth/token");
    EXPECT_EQ(request.value().timeout, std::chrono::seconds(30));
}

TEST_F(ProviderAdapterTest, ParsesFlatResponseWithExpiry) {
    auto token = adapter_.parseTokenResponse(provider("linear"),
        R"({"access_token":"lin_1","refresh_token":"r","token_type":"Bearer","expires_in":3600,"scope":"read"})",
        issuedAt_);
    ASSERT_TRUE(token.has_value()) << token.error().describe();
    EXPECT_EQ(token.value().accessToken, "lin_1");
    EXPECT_EQ(token.value().refreshToken, "r");
    EXPECT_EQ(token.value().expiresAt, issuedAt_ + std::chrono::hours(1));
}

TEST_F(ProviderAdapterTest, NonPositiveLifetimeMeansNoExpiry) {
    auto token = adapter_.parseTokenResponse(provider("linear"),
        R"({"access_token":"lin_1","expires_in":0})", issuedAt_);
    ASSERT_TRUE(token.has_value());
    EXPECT_FALSE(token.value().hasExpiry());
}

TEST_F(ProviderAdapterTest, OutOfRangeLifetimeMeansNoExpiry) {
    for (const char* lifetime : {"1e300", "9300000000", "1.7976931348623157e308"}) {
        auto token = adapter_.parseTokenResponse(provider("linear"),
            std::string(R"({"access_token":"x","expires_in":)") + lifetime + "}", issuedAt_);
        ASSERT_TRUE(token.has_value()) << lifetime;
        EXPECT_FALSE(token.value().hasExpiry()) << lifetime;
    }

    auto yearLong = adapter_.parseTokenResponse(provider("linear"),
        R"({"access_token":"x","expires_in":31536000})", issuedAt_);
    ASSERT_TRUE(yearLong.has_value());
    EXPECT_EQ(yearLong.value().expiresAt, issuedAt_ + std::chrono::seconds(31536000));
}

TEST_F(ProviderAdapterTest, ParsesSlackNestedResponse) {
    auto token = adapter_.parseTokenResponse(provider("slack"),
        R"({"ok":true,"access_token":"xoxb-bot","authed_user":{"access_token":"xoxp-user","scope":"chat:write"},)"
        R"("team":{"id":"T0123"}})",
        issuedAt_);
    ASSERT_TRUE(token.has_value()) << token.error().describe();
    EXPECT_EQ(token.value().accessToken, "xoxp-user");
    EXPECT_EQ(token.value().scope, "chat:write");
    EXPECT_EQ(token.value().extensions.at("team_id"), "T0123");
}

TEST_F(ProviderAdapterTest, SlackFailureFlagWins) {
    auto token = adapter_.parseTokenResponse(provider("slack"),
        R"({"ok":false,"error":"invalid_code","authed_user":{"access_token":"xoxp-user"}})", issuedAt_);
    ASSERT_TRUE(token.has_error());
    EXPECT_EQ(token.error().kind, FlowErrorKind::ExchangeFailure);
    EXPECT_EQ(token.error().message, "slack auth failed: invalid_code");
    EXPECT_THAT(token.error().detail, HasSubstr(R"("error":"invalid_code")"));
}

TEST_F(ProviderAdapterTest, MissingAccessTokenIncludesBody) {
    const std::string body = R"({"token_type":"Bearer"})";
    auto token = adapter_.parseTokenResponse(provider("notion"), body, issuedAt_);
    ASSERT_TRUE(token.has_error());
    EXPECT_EQ(token.error().message, "no access token in response");
    EXPECT_EQ(token.error().detail, body);

    auto slack = adapter_.parseTokenResponse(provider("slack"), R"({"ok":true})", issuedAt_);
    ASSERT_TRUE(slack.has_error());
    EXPECT_EQ(slack.error().message, "no access token in response");
}

TEST_F(ProviderAdapterTest, MalformedResponse) {
    auto token = adapter_.parseTokenResponse(provider("linear"), "<html>oops</html>", issuedAt_);
    ASSERT_TRUE(token.has_error());
    EXPECT_EQ(token.error().message, "failed to parse token response");
    EXPECT_EQ(token.error().detail, "<html>oops</html>");
}

} // namespace
} // namespace core
} // namespace applink
