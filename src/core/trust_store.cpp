#include "applink/core/trust_store.hpp"
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <optional>
#include <sstream>

#ifdef _WIN32
#include <stdio.h>
#else
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>
#endif

namespace applink {
namespace core {

TrustPlatform currentPlatform() {
#if defined(__APPLE__)
    return TrustPlatform::MacOS;
#elif defined(_WIN32)
    return TrustPlatform::Windows;
#elif defined(__linux__)
    return TrustPlatform::Linux;
#else
    return TrustPlatform::Unsupported;
#endif
}

const char* toString(TrustPlatform platform) {
    switch (platform) {
        case TrustPlatform::MacOS:       return "macOS";
        case TrustPlatform::Linux:       return "Linux";
        case TrustPlatform::Windows:     return "Windows";
        case TrustPlatform::Unsupported: return "unsupported";
    }
    return "unknown";
}

#ifndef _WIN32

Result<CommandResult> ProcessCommandRunner::run(const std::vector<std::string>& argv) {
    if (argv.empty()) {
        return utils::fail(std::string("empty command"));
    }

    int outputPipe[2];
    int execStatusPipe[2];
    if (::pipe(outputPipe) != 0) {
        return utils::fail(std::string("failed to create pipe: ") + std::strerror(errno));
    }
    if (::pipe(execStatusPipe) != 0) {
        ::close(outputPipe[0]);
        ::close(outputPipe[1]);
        return utils::fail(std::string("failed to create pipe: ") + std::strerror(errno));
    }
    ::fcntl(execStatusPipe[1], F_SETFD, FD_CLOEXEC);

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        int err = errno;
        ::close(outputPipe[0]);
        ::close(outputPipe[1]);
        ::close(execStatusPipe[0]);
        ::close(execStatusPipe[1]);
        return utils::fail(std::string("failed to fork: ") + std::strerror(err));
    }

    if (pid == 0) {
        // Child process
        ::close(outputPipe[0]);
        ::close(execStatusPipe[0]);
        ::dup2(outputPipe[1], STDOUT_FILENO);
        ::dup2(outputPipe[1], STDERR_FILENO);
        ::close(outputPipe[1]);
        ::execvp(args[0], args.data());
        int err = errno;
        ssize_t ignored = ::write(execStatusPipe[1], &err, sizeof(err));
        (void)ignored;
        ::_exit(127);
    }

    ::close(outputPipe[1]);
    ::close(execStatusPipe[1]);

    // A successful exec closes the status pipe without writing to it.
    int execErrno = 0;
    ssize_t statusBytes;
    do {
        statusBytes = ::read(execStatusPipe[0], &execErrno, sizeof(execErrno));
    } while (statusBytes < 0 && errno == EINTR);
    ::close(execStatusPipe[0]);

    CommandResult result;
    char buffer[4096];
    for (;;) {
        ssize_t n = ::read(outputPipe[0], buffer, sizeof(buffer));
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n <= 0) {
            break;
        }
        result.output.append(buffer, static_cast<size_t>(n));
    }
    ::close(outputPipe[0]);

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }

    if (statusBytes == static_cast<ssize_t>(sizeof(execErrno))) {
        return utils::fail("failed to run " + argv[0] + ": " + std::strerror(execErrno));
    }

    if (WIFEXITED(status)) {
        result.exitCode = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exitCode = 128 + WTERMSIG(status);
    } else {
        result.exitCode = -1;
    }
    return result;
}

#else

Result<CommandResult> ProcessCommandRunner::run(const std::vector<std::string>& argv) {
    if (argv.empty()) {
        return utils::fail(std::string("empty command"));
    }
    std::ostringstream cmd;
    for (size_t i = 0; i < argv.size(); ++i) {
        if (i > 0) {
            cmd << ' ';
        }
        cmd << '"' << argv[i] << '"';
    }
    cmd << " 2>&1";

    FILE* pipe = _popen(cmd.str().c_str(), "r");
    if (!pipe) {
        return utils::fail("failed to run " + argv[0]);
    }
    CommandResult result;
    char buffer[4096];
    size_t n;
    while ((n = fread(buffer, 1, sizeof(buffer), pipe)) > 0) {
        result.output.append(buffer, n);
    }
    result.exitCode = _pclose(pipe);
    return result;
}

#endif

TrustStore::TrustStore(TrustPlatform platform, std::shared_ptr<CommandRunner> runner,
                       TrustStoreConfig config, std::shared_ptr<utils::Logger> logger)
    : platform_(platform),
      runner_(std::move(runner)),
      config_(std::move(config)),
      logger_(std::move(logger)) {}

std::vector<std::string> TrustStore::privileged(std::vector<std::string> argv) const {
    if (config_.useSudo) {
        argv.insert(argv.begin(), "sudo");
    }
    return argv;
}

Result<void> TrustStore::runChecked(const std::vector<std::string>& argv, const std::string& what) {
    APPLINK_LOG_DEBUG(logger_, "Running " << argv.front() << " (" << what << ")");
    auto result = runner_->run(argv);
    if (result.has_error()) {
        return Result<void>("failed to " + what + ": " + result.error());
    }
    if (!result.value().succeeded()) {
        std::ostringstream oss;
        oss << "failed to " << what << ": exit status " << result.value().exitCode
            << "\nOutput: " << result.value().output;
        return Result<void>(oss.str());
    }
    return Result<void>();
}

bool TrustStore::isAuthorityTrusted() {
    auto succeeds = [this](const std::vector<std::string>& argv) {
        auto result = runner_->run(argv);
        return result.has_value() && result.value().succeeded();
    };

    switch (platform_) {
        case TrustPlatform::MacOS:
            return succeeds({"security", "find-certificate", "-c", config_.authorityCommonName,
                             config_.macKeychain});
        case TrustPlatform::Linux:
            return succeeds({"test", "-f", (config_.debianAnchorDirectory / config_.bundleFileName).string()}) ||
                   succeeds({"test", "-f", (config_.rhelAnchorDirectory / config_.bundleFileName).string()});
        case TrustPlatform::Windows:
            return succeeds({"certutil", "-verifystore", "-user", "Root", config_.authorityCommonName});
        case TrustPlatform::Unsupported:
            return false;
    }
    return false;
}

Result<void> TrustStore::installAuthority(const std::filesystem::path& caCertPath) {
    APPLINK_LOG_INFO(logger_, "Installing CA into the " << toString(platform_) << " trust store");
    switch (platform_) {
        case TrustPlatform::MacOS:
            return runChecked({"security", "add-trusted-cert", "-r", "trustRoot", "-k",
                               config_.macKeychain, caCertPath.string()},
                              "install CA on macOS");
        case TrustPlatform::Linux:
            return installLinux(caCertPath);
        case TrustPlatform::Windows:
            return runChecked({"certutil", "-addstore", "-user", "Root", caCertPath.string()},
                              "install CA on Windows");
        case TrustPlatform::Unsupported:
            break;
    }
    return Result<void>(std::string("unsupported operating system"));
}

Result<void> TrustStore::uninstallAuthority() {
    switch (platform_) {
        case TrustPlatform::MacOS:
            return runChecked({"security", "delete-certificate", "-c", config_.authorityCommonName,
                               config_.macKeychain},
                              "uninstall CA on macOS");
        case TrustPlatform::Linux:
            return uninstallLinux();
        case TrustPlatform::Windows:
            return runChecked({"certutil", "-delstore", "-user", "Root", config_.authorityCommonName},
                              "uninstall CA on Windows");
        case TrustPlatform::Unsupported:
            break;
    }
    return Result<void>(std::string("unsupported operating system"));
}

Result<void> TrustStore::installLinux(const std::filesystem::path& caCertPath) {
    // Debian/Ubuntu layout first, then RHEL/Fedora.
    auto debianDest = (config_.debianAnchorDirectory / config_.bundleFileName).string();
    auto copied = runChecked(privileged({"cp", caCertPath.string(), debianDest}), "copy CA certificate");
    if (copied.has_value()) {
        return runChecked(privileged({"update-ca-certificates"}), "update CA certificates");
    }
    APPLINK_LOG_DEBUG(logger_, "Debian CA layout unavailable: " << copied.error());

    auto rhelDest = (config_.rhelAnchorDirectory / config_.bundleFileName).string();
    copied = runChecked(privileged({"cp", caCertPath.string(), rhelDest}), "copy CA certificate");
    if (copied.has_error()) {
        return copied;
    }
    return runChecked(privileged({"update-ca-trust"}), "update CA trust");
}

Result<void> TrustStore::uninstallLinux() {
    struct Layout {
        std::filesystem::path directory;
        std::vector<std::string> refresh;
        const char* what;
    };
    const std::vector<Layout> layouts = {
        {config_.debianAnchorDirectory, {"update-ca-certificates"}, "update CA certificates"},
        {config_.rhelAnchorDirectory, {"update-ca-trust"}, "update CA trust"},
    };

    std::optional<std::string> firstError;
    for (const auto& layout : layouts) {
        auto present = runner_->run({"test", "-d", layout.directory.string()});
        if (present.has_error() || !present.value().succeeded()) {
            continue;
        }
        auto removed = runChecked(privileged({"rm", "-f", (layout.directory / config_.bundleFileName).string()}),
                                  "remove CA certificate");
        if (removed.has_error()) {
            if (!firstError) firstError = removed.error();
            continue;
        }
        auto refreshed = runChecked(privileged(layout.refresh), layout.what);
        if (refreshed.has_error() && !firstError) {
            firstError = refreshed.error();
        }
    }

    if (firstError) {
        return Result<void>(*firstError);
    }
    return Result<void>();
}

std::string manualInstallInstructions(TrustPlatform platform, const std::filesystem::path& caCertPath) {
    const std::string cert = caCertPath.string();
    std::ostringstream oss;
    oss << "To install the CA manually:\n\n";
    switch (platform) {
        case TrustPlatform::MacOS:
            oss << "  security add-trusted-cert -r trustRoot -k login.keychain " << cert << "\n";
            break;
        case TrustPlatform::Linux:
            oss << "  # Debian/Ubuntu:\n"
                << "  sudo cp " << cert << " /usr/local/share/ca-certificates/applink-ca.crt\n"
                << "  sudo update-ca-certificates\n\n"
                << "  # RHEL/Fedora:\n"
                << "  sudo cp " << cert << " /etc/pki/ca-trust/source/anchors/applink-ca.crt\n"
                << "  sudo update-ca-trust\n";
            break;
        case TrustPlatform::Windows:
            oss << "  certutil -addstore -user Root " << cert << "\n";
            break;
        case TrustPlatform::Unsupported:
            oss << "  Import " << cert << " into your system or browser trust store.\n";
            break;
    }
    return oss.str();
}

} // namespace core
} // namespace applink
