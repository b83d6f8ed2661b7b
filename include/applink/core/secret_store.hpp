#ifndef APPLINK_CORE_SECRET_STORE_HPP
#define APPLINK_CORE_SECRET_STORE_HPP

#include "applink/core/engine_config.hpp"
#include "applink/utils/logging.hpp"
#include "applink/utils/result.hpp"
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace applink {
namespace core {

struct SecretStoreError {
    enum class Kind {
        Unavailable,    ///< The backing store cannot be read at all
        WriteFailed,    ///< The store is readable but the update could not be saved
        InvalidData     ///< An entry exists but does not decode
    };

    Kind kind = Kind::Unavailable;
    std::string message;

    SecretStoreError() = default;
    SecretStoreError(Kind k, std::string msg) : kind(k), message(std::move(msg)) {}
};

/**
 * @brief Key/value store for credentials and tokens.
 *
 * A missing key is not an error: get() returns an empty optional and
 * remove() succeeds.
 */
class SecretStore {
public:
    virtual ~SecretStore() = default;

    virtual Result<std::optional<std::string>, SecretStoreError> get(const std::string& key) const = 0;
    virtual Result<void, SecretStoreError> set(const std::string& key, const std::string& value) = 0;
    virtual Result<void, SecretStoreError> remove(const std::string& key) = 0;
};

class InMemorySecretStore : public SecretStore {
public:
    Result<std::optional<std::string>, SecretStoreError> get(const std::string& key) const override;
    Result<void, SecretStoreError> set(const std::string& key, const std::string& value) override;
    Result<void, SecretStoreError> remove(const std::string& key) override;

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::string> entries_;
};

/**
 * @brief SecretStore persisted as a JSON object in an owner-only file.
 *
 * A missing file is an empty store. A file that cannot be read or parsed
 * makes the store Unavailable. Every update rewrites the whole file.
 */
class FileSecretStore : public SecretStore {
public:
    explicit FileSecretStore(std::filesystem::path path,
                             std::shared_ptr<utils::Logger> logger = utils::defaultLogger());

    // secrets.json under defaultDataDirectory()
    static std::filesystem::path defaultPath(const EnvironmentLookup& env = processEnvironment);

    const std::filesystem::path& path() const { return path_; }

    Result<std::optional<std::string>, SecretStoreError> get(const std::string& key) const override;
    Result<void, SecretStoreError> set(const std::string& key, const std::string& value) override;
    Result<void, SecretStoreError> remove(const std::string& key) override;

private:
    using Entries = std::map<std::string, std::string>;

    Result<Entries, SecretStoreError> load() const;
    Result<void, SecretStoreError> save(const Entries& entries) const;

    std::filesystem::path path_;
    std::shared_ptr<utils::Logger> logger_;
    mutable std::mutex mutex_;
};

} // namespace core
} // namespace applink

#endif // APPLINK_CORE_SECRET_STORE_HPP
