#include "applink/core/engine_config.hpp"
#include "applink/utils/file_io.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <utility>

namespace applink {
namespace core {

using json = nlohmann::json;

namespace {

bool parseBool(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value == "1" || value == "true" || value == "yes" || value == "on";
}

Result<uint16_t> parsePort(const std::string& text) {
    if (text.empty() || !std::all_of(text.begin(), text.end(),
                                     [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return Result<uint16_t>(std::string("invalid callback port: ") + text);
    }
    unsigned long port = std::strtoul(text.c_str(), nullptr, 10);
    if (text.size() > 5 || port > 65535) {
        return Result<uint16_t>(std::string("callback port out of range: ") + text);
    }
    return static_cast<uint16_t>(port);
}

// One day; longer waits are configuration mistakes.
constexpr double kMaxTimeoutSeconds = 24 * 60 * 60;

Result<std::chrono::milliseconds> secondsToMillis(const std::string& name, double seconds) {
    if (!(seconds >= 0 && seconds <= kMaxTimeoutSeconds)) {
        return Result<std::chrono::milliseconds>(name + " out of range: " + std::to_string(seconds));
    }
    return std::chrono::milliseconds(static_cast<int64_t>(seconds * 1000.0));
}

} // namespace

std::optional<std::string> processEnvironment(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (!value || !*value) {
        return std::nullopt;
    }
    return std::string(value);
}

std::string defaultDataDirectory(const EnvironmentLookup& env) {
#ifdef _WIN32
    auto home = env("USERPROFILE");
#else
    auto home = env("HOME");
#endif
    if (!home) {
        return std::string();
    }
    return (std::filesystem::path(*home) / ".applink").string();
}

std::string defaultCertsDirectory(const EnvironmentLookup& env) {
    std::string dataDirectory = defaultDataDirectory(env);
    if (dataDirectory.empty()) {
        return dataDirectory;
    }
    return (std::filesystem::path(dataDirectory) / "certs").string();
}

std::optional<std::string> EngineConfig::validate() const {
    if (callbackHost.empty()) {
        return "Callback host must not be empty";
    }
    if (callbackPath.empty() || callbackPath.front() != '/') {
        return "Callback path must start with '/'";
    }
    if (callbackTimeout.count() <= 0) {
        return "Callback timeout must be positive";
    }
    if (shutdownTimeout.count() <= 0) {
        return "Shutdown timeout must be positive";
    }
    if (connectionTimeout.count() <= 0) {
        return "Connection timeout must be positive";
    }
    if (exchangeTimeout.count() <= 0) {
        return "Exchange timeout must be positive";
    }
    if (certsDirectory.empty()) {
        return "Certificate directory is unknown; set APPLINK_CERTS_DIR";
    }
    if (!logger) {
        return "Logger must be set";
    }
    return std::nullopt;
}

void EngineConfig::applyDebug(bool enabled) {
    debug = enabled;
    if (logger) {
        logger->setLevel(enabled ? utils::LogLevel::DEBUG : utils::LogLevel::INFO);
    }
}

Result<EngineConfig> EngineConfig::fromEnvironment(const EnvironmentLookup& env) {
    EngineConfig config;
    config.certsDirectory = defaultCertsDirectory(env);

    if (auto port = env("APPLINK_CALLBACK_PORT")) {
        auto parsed = parsePort(*port);
        if (parsed.has_error()) {
            return utils::fail(parsed.error());
        }
        config.callbackPort = parsed.value();
    }
    if (auto dir = env("APPLINK_CERTS_DIR")) {
        config.certsDirectory = *dir;
    }
    if (auto debug = env("APPLINK_DEBUG")) {
        config.applyDebug(parseBool(*debug));
    }

    if (auto err = config.validate()) {
        return utils::fail(*err);
    }
    return config;
}

Result<EngineConfig> EngineConfig::fromJsonFile(const std::string& path) {
    auto text = utils::readFile(path);
    if (text.has_error()) {
        return utils::fail("failed to read config file: " + text.error());
    }
    return fromJson(text.value());
}

Result<EngineConfig> EngineConfig::fromJson(const std::string& text) {
    json j = json::parse(text, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return utils::fail(std::string("config is not a JSON object"));
    }

    EngineConfig config;
    try {
        if (j.contains("callback_port")) {
            int port = j.at("callback_port").get<int>();
            if (port < 0 || port > 65535) {
                return utils::fail("callback port out of range: " + std::to_string(port));
            }
            config.callbackPort = static_cast<uint16_t>(port);
        }
        if (j.contains("callback_host")) config.callbackHost = j.at("callback_host").get<std::string>();
        if (j.contains("callback_path")) config.callbackPath = j.at("callback_path").get<std::string>();
        const std::pair<const char*, std::chrono::milliseconds*> timeouts[] = {
            {"callback_timeout", &config.callbackTimeout},
            {"shutdown_timeout", &config.shutdownTimeout},
            {"connection_timeout", &config.connectionTimeout},
            {"exchange_timeout", &config.exchangeTimeout},
        };
        for (const auto& timeout : timeouts) {
            if (!j.contains(timeout.first)) {
                continue;
            }
            auto value = secondsToMillis(timeout.first, j.at(timeout.first).get<double>());
            if (value.has_error()) {
                return utils::fail(value.error());
            }
            *timeout.second = value.value();
        }
        if (j.contains("certs_dir")) config.certsDirectory = j.at("certs_dir").get<std::string>();
        if (j.contains("version")) config.version = j.at("version").get<std::string>();
        if (j.contains("commit")) config.commit = j.at("commit").get<std::string>();
        if (j.contains("debug")) config.applyDebug(j.at("debug").get<bool>());
    } catch (const json::exception& e) {
        return utils::fail(std::string("invalid config value: ") + e.what());
    }

    if (auto err = config.validate()) {
        return utils::fail(*err);
    }
    return config;
}

} // namespace core
} // namespace applink
