#pragma once

#include "applink/utils/logging.hpp"
#include "applink/utils/result.hpp"
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace applink {
namespace core {

enum class TrustPlatform {
    MacOS,
    Linux,
    Windows,
    Unsupported
};

// Platform this binary was built for.
TrustPlatform currentPlatform();
const char* toString(TrustPlatform platform);

struct CommandResult {
    int exitCode{0};
    std::string output;     ///< Combined stdout and stderr

    bool succeeded() const { return exitCode == 0; }
};

/**
 * @brief Runs an external program without a shell.
 */
class CommandRunner {
public:
    virtual ~CommandRunner() = default;

    /**
     * @brief Run @p argv[0] with the remaining arguments and wait for it.
     *
     * @return The exit status and captured output, or an error when the
     * program could not be started
     */
    virtual Result<CommandResult> run(const std::vector<std::string>& argv) = 0;
};

/**
 * @brief CommandRunner that spawns a child process (fork/exec on POSIX).
 */
class ProcessCommandRunner : public CommandRunner {
public:
    Result<CommandResult> run(const std::vector<std::string>& argv) override;
};

struct TrustStoreConfig {
    std::string authorityCommonName{"applink Local CA"};
    std::string bundleFileName{"applink-ca.crt"};
    std::filesystem::path debianAnchorDirectory{"/usr/local/share/ca-certificates"};
    std::filesystem::path rhelAnchorDirectory{"/etc/pki/ca-trust/source/anchors"};
    std::string macKeychain{"login.keychain"};
    // Prefix privileged Linux commands with sudo.
    bool useSudo{true};
};

/**
 * @brief Installs, removes and queries the local CA in the OS trust store.
 *
 * All platform work goes through the injected CommandRunner. Failures carry
 * the command's output.
 */
class TrustStore {
public:
    TrustStore(TrustPlatform platform, std::shared_ptr<CommandRunner> runner,
               TrustStoreConfig config = TrustStoreConfig(),
               std::shared_ptr<utils::Logger> logger = utils::defaultLogger());

    TrustPlatform platform() const { return platform_; }

    bool isAuthorityTrusted();
    Result<void> installAuthority(const std::filesystem::path& caCertPath);
    Result<void> uninstallAuthority();

private:
    Result<void> installLinux(const std::filesystem::path& caCertPath);
    Result<void> uninstallLinux();

    // Runs @p argv and converts a non-zero exit into an error quoting the output.
    Result<void> runChecked(const std::vector<std::string>& argv, const std::string& what);
    std::vector<std::string> privileged(std::vector<std::string> argv) const;

    TrustPlatform platform_;
    std::shared_ptr<CommandRunner> runner_;
    TrustStoreConfig config_;
    std::shared_ptr<utils::Logger> logger_;
};

/**
 * @brief Human-readable commands for installing the CA by hand on @p platform.
 */
std::string manualInstallInstructions(TrustPlatform platform, const std::filesystem::path& caCertPath);

} // namespace core
} // namespace applink
