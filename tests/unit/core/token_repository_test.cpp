#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "applink/core/token_repository.hpp"
#include "mock_collaborators.hpp"

namespace applink {
namespace core {
namespace {

using ::testing::HasSubstr;
using ::testing::Return;

class TokenRepositoryTest : public ::testing::Test {
protected:
    std::shared_ptr<InMemorySecretStore> store_ = std::make_shared<InMemorySecretStore>();
    TokenRepository tokens_{store_};
};

TEST_F(TokenRepositoryTest, SaveAndLoad) {
    Token token;
    token.accessToken = "xoxp-user";
    token.refreshToken = "refresh";
    token.tokenType = "Bearer";
    token.expiresAt = Token::Clock::time_point(std::chrono::seconds(1900000000));
    token.extensions["team_id"] = "T0123";
    ASSERT_TRUE(tokens_.save("slack", token).has_value());

    EXPECT_TRUE(store_->get("applink/slack").value().has_value());

    auto loaded = tokens_.load("slack");
    ASSERT_TRUE(loaded.has_value());
    ASSERT_TRUE(loaded.value().has_value());
    EXPECT_EQ(loaded.value()->accessToken, "xoxp-user");
    EXPECT_EQ(loaded.value()->refreshToken, "refresh");
    EXPECT_EQ(loaded.value()->expiresAt, token.expiresAt);
    EXPECT_EQ(loaded.value()->extensions.at("team_id"), "T0123");
}

TEST_F(TokenRepositoryTest, MissingTokenIsEmpty) {
    auto loaded = tokens_.load("linear");
    ASSERT_TRUE(loaded.has_value());
    EXPECT_FALSE(loaded.value().has_value());
    EXPECT_TRUE(tokens_.remove("linear").has_value());
}

TEST_F(TokenRepositoryTest, RejectsTokenWithoutAccessToken) {
    auto saved = tokens_.save("linear", Token());
    ASSERT_TRUE(saved.has_error());
    EXPECT_EQ(saved.error().kind, SecretStoreError::Kind::InvalidData);
}

TEST_F(TokenRepositoryTest, UndecodableEntryIsInvalidData) {
    ASSERT_TRUE(store_->set(TokenRepository::storeKey("notion"), "not a token").has_value());
    auto loaded = tokens_.load("notion");
    ASSERT_TRUE(loaded.has_error());
    EXPECT_EQ(loaded.error().kind, SecretStoreError::Kind::InvalidData);
    EXPECT_THAT(loaded.error().message, HasSubstr("stored token for notion is invalid"));
}

TEST_F(TokenRepositoryTest, RemoveDeletesEntry) {
    Token token;
    token.accessToken = "lin_tok";
    ASSERT_TRUE(tokens_.save("linear", token).has_value());
    ASSERT_TRUE(tokens_.remove("linear").has_value());
    EXPECT_FALSE(tokens_.load("linear").value().has_value());
}

TEST(TokenRepositoryStoreErrorTest, PropagatesStoreErrors) {
    auto broken = std::make_shared<MockSecretStore>();
    EXPECT_CALL(*broken, get("applink/linear"))
        .WillOnce(Return(applink::Result<std::optional<std::string>, SecretStoreError>(
            SecretStoreError(SecretStoreError::Kind::Unavailable, "locked"))));

    TokenRepository tokens(broken);
    auto loaded = tokens.load("linear");
    ASSERT_TRUE(loaded.has_error());
    EXPECT_EQ(loaded.error().kind, SecretStoreError::Kind::Unavailable);
}

} // namespace
} // namespace core
} // namespace applink
