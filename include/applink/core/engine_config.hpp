#pragma once

#include "applink/utils/logging.hpp"
#include "applink/utils/result.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace applink {
namespace core {

// Looks up an environment variable; nullopt when unset or empty.
using EnvironmentLookup = std::function<std::optional<std::string>(const std::string&)>;

// EnvironmentLookup backed by std::getenv.
std::optional<std::string> processEnvironment(const std::string& name);

// $HOME/.applink (%USERPROFILE% on Windows), empty if no home is known.
std::string defaultDataDirectory(const EnvironmentLookup& env = processEnvironment);

// $HOME/.applink/certs (%USERPROFILE% on Windows), empty if no home is known.
std::string defaultCertsDirectory(const EnvironmentLookup& env = processEnvironment);

/**
 * @brief Settings shared by every component of the authorization engine.
 */
struct EngineConfig {
    // Callback listener settings. Port 0 lets the OS choose a free port.
    uint16_t callbackPort{8888};
    std::string callbackHost{"localhost"};
    std::string callbackPath{"/callback"};

    // Overall wait for the browser to come back.
    std::chrono::milliseconds callbackTimeout{std::chrono::minutes(5)};
    // Upper bound for stopping the listener once the flow ends.
    std::chrono::milliseconds shutdownTimeout{std::chrono::seconds(5)};
    // Per-connection read/write timeout inside the listener.
    std::chrono::milliseconds connectionTimeout{std::chrono::seconds(5)};
    // Timeout for the token exchange request.
    std::chrono::milliseconds exchangeTimeout{std::chrono::seconds(30)};

    // Where the local certificate authority is persisted.
    std::string certsDirectory{defaultCertsDirectory()};

    bool debug{false};
    std::string version{"dev"};
    std::string commit{"none"};

    std::shared_ptr<utils::Logger> logger{std::make_shared<utils::Logger>()};

    /**
     * @brief Validate the configuration
     *
     * @return std::optional<std::string> Error message if invalid, nullopt if valid
     */
    std::optional<std::string> validate() const;

    // Applies the debug flag to the logger level.
    void applyDebug(bool enabled);

    /**
     * @brief Build a configuration from APPLINK_CALLBACK_PORT, APPLINK_CERTS_DIR
     * and APPLINK_DEBUG on top of the defaults.
     */
    static Result<EngineConfig> fromEnvironment(const EnvironmentLookup& env = processEnvironment);

    /**
     * @brief Load overrides from a JSON document. Unknown keys are ignored;
     * durations are given in seconds.
     */
    static Result<EngineConfig> fromJsonFile(const std::string& path);
    static Result<EngineConfig> fromJson(const std::string& text);
};

} // namespace core
} // namespace applink
