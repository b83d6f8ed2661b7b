#include "applink/core/secret_store.hpp"
#include "applink/utils/file_io.hpp"
#include <nlohmann/json.hpp>
#include <system_error>

namespace applink {
namespace core {

using json = nlohmann::json;
namespace fs = std::filesystem;

Result<std::optional<std::string>, SecretStoreError> InMemorySecretStore::get(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return std::optional<std::string>();
    }
    return std::optional<std::string>(it->second);
}

Result<void, SecretStoreError> InMemorySecretStore::set(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_[key] = value;
    return Result<void, SecretStoreError>();
}

Result<void, SecretStoreError> InMemorySecretStore::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.erase(key);
    return Result<void, SecretStoreError>();
}

FileSecretStore::FileSecretStore(fs::path path, std::shared_ptr<utils::Logger> logger)
    : path_(std::move(path)), logger_(std::move(logger)) {}

fs::path FileSecretStore::defaultPath(const EnvironmentLookup& env) {
    std::string dataDirectory = defaultDataDirectory(env);
    if (dataDirectory.empty()) {
        return fs::path();
    }
    return fs::path(dataDirectory) / "secrets.json";
}

Result<std::optional<std::string>, SecretStoreError> FileSecretStore::get(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto entries = load();
    if (entries.has_error()) {
        return entries.error();
    }
    auto it = entries.value().find(key);
    if (it == entries.value().end()) {
        return std::optional<std::string>();
    }
    return std::optional<std::string>(it->second);
}

Result<void, SecretStoreError> FileSecretStore::set(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto entries = load();
    if (entries.has_error()) {
        return entries.error();
    }
    entries.value()[key] = value;
    return save(entries.value());
}

Result<void, SecretStoreError> FileSecretStore::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto entries = load();
    if (entries.has_error()) {
        return entries.error();
    }
    if (entries.value().erase(key) == 0) {
        return Result<void, SecretStoreError>();
    }
    return save(entries.value());
}

Result<FileSecretStore::Entries, SecretStoreError> FileSecretStore::load() const {
    if (path_.empty()) {
        return SecretStoreError(SecretStoreError::Kind::Unavailable, "no secret store location (HOME is not set)");
    }

    std::error_code ec;
    if (!fs::exists(path_, ec)) {
        if (ec) {
            return SecretStoreError(SecretStoreError::Kind::Unavailable,
                                    "cannot access " + path_.string() + ": " + ec.message());
        }
        return Entries();
    }

    auto text = utils::readFile(path_);
    if (text.has_error()) {
        return SecretStoreError(SecretStoreError::Kind::Unavailable, text.error());
    }

    Entries entries;
    try {
        json document = json::parse(text.value());
        if (!document.is_object()) {
            return SecretStoreError(SecretStoreError::Kind::Unavailable,
                                    path_.string() + " does not contain a JSON object");
        }
        for (auto it = document.begin(); it != document.end(); ++it) {
            if (it->is_string()) {
                entries[it.key()] = it->get<std::string>();
            } else {
                APPLINK_LOG_WARN(logger_, "Ignoring non-string entry '" << it.key() << "' in " << path_.string());
            }
        }
    } catch (const json::exception& e) {
        return SecretStoreError(SecretStoreError::Kind::Unavailable,
                                "failed to parse " + path_.string() + ": " + e.what());
    }
    return entries;
}

Result<void, SecretStoreError> FileSecretStore::save(const Entries& entries) const {
    auto directory = utils::ensurePrivateDirectory(path_.parent_path());
    if (directory.has_error()) {
        return SecretStoreError(SecretStoreError::Kind::WriteFailed, directory.error());
    }

    json document = json::object();
    for (const auto& entry : entries) {
        document[entry.first] = entry.second;
    }

    auto written = utils::writeFile(path_, document.dump(2), fs::perms::owner_read | fs::perms::owner_write);
    if (written.has_error()) {
        return SecretStoreError(SecretStoreError::Kind::WriteFailed, written.error());
    }
    APPLINK_LOG_DEBUG(logger_, "Saved " << entries.size() << " secret(s) to " << path_.string());
    return Result<void, SecretStoreError>();
}

} // namespace core
} // namespace applink
