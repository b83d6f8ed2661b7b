#include "applink/core/token_repository.hpp"

namespace applink {
namespace core {

TokenRepository::TokenRepository(std::shared_ptr<SecretStore> store) : store_(std::move(store)) {}

std::string TokenRepository::storeKey(const std::string& service) {
    return "applink/" + service;
}

Result<void, SecretStoreError> TokenRepository::save(const std::string& service, const Token& token) {
    if (token.accessToken.empty()) {
        return SecretStoreError(SecretStoreError::Kind::InvalidData, "refusing to store a token without an access token");
    }
    return store_->set(storeKey(service), token.toJson());
}

Result<std::optional<Token>, SecretStoreError> TokenRepository::load(const std::string& service) const {
    auto stored = store_->get(storeKey(service));
    if (stored.has_error()) {
        return stored.error();
    }
    if (!stored.value()) {
        return std::optional<Token>();
    }

    auto token = Token::fromJson(*stored.value());
    if (token.has_error()) {
        return SecretStoreError(SecretStoreError::Kind::InvalidData,
                                "stored token for " + service + " is invalid: " + token.error());
    }
    return std::optional<Token>(token.value());
}

Result<void, SecretStoreError> TokenRepository::remove(const std::string& service) {
    return store_->remove(storeKey(service));
}

} // namespace core
} // namespace applink
