#pragma once

#include "applink/core/flow_types.hpp"
#include "applink/core/secret_store.hpp"
#include "applink/utils/result.hpp"
#include <memory>
#include <optional>
#include <string>

namespace applink {
namespace core {

/**
 * @brief Persists tokens in a SecretStore under "applink/<service>".
 */
class TokenRepository {
public:
    explicit TokenRepository(std::shared_ptr<SecretStore> store);

    static std::string storeKey(const std::string& service);

    Result<void, SecretStoreError> save(const std::string& service, const Token& token);

    // Empty when no token is stored; InvalidData when the entry does not decode.
    Result<std::optional<Token>, SecretStoreError> load(const std::string& service) const;

    // Removing a token that is not stored succeeds.
    Result<void, SecretStoreError> remove(const std::string& service);

private:
    std::shared_ptr<SecretStore> store_;
};

} // namespace core
} // namespace applink
