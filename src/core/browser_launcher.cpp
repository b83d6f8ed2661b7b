#include "applink/core/browser_launcher.hpp"
#include <cerrno>
#include <cstring>

#ifdef _WIN32
#include <windows.h>
#else
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>
#endif

namespace applink {
namespace core {

#ifdef _WIN32

Result<void> SystemBrowserLauncher::open(const std::string& url) {
    std::string commandLine = "rundll32 url.dll,FileProtocolHandler " + url;
    STARTUPINFOA si{};
    si.cb = sizeof(si);
    PROCESS_INFORMATION pi{};
    if (!CreateProcessA(nullptr, &commandLine[0], nullptr, nullptr, FALSE, 0, nullptr, nullptr, &si, &pi)) {
        return Result<void>("failed to start rundll32: error " + std::to_string(GetLastError()));
    }
    CloseHandle(pi.hThread);
    CloseHandle(pi.hProcess);
    return Result<void>();
}

#else

Result<void> SystemBrowserLauncher::open(const std::string& url) {
#ifdef __APPLE__
    const char* opener = "open";
#else
    const char* opener = "xdg-open";
#endif

    // The grandchild reports a failed exec through this pipe; a successful
    // exec closes it without writing.
    int execStatusPipe[2];
    if (::pipe(execStatusPipe) != 0) {
        return Result<void>(std::string("failed to create pipe: ") + std::strerror(errno));
    }
    ::fcntl(execStatusPipe[1], F_SETFD, FD_CLOEXEC);

    // Double fork so the opener is reparented and never left as a zombie,
    // even when it blocks for the lifetime of the browser.
    pid_t pid = ::fork();
    if (pid < 0) {
        int err = errno;
        ::close(execStatusPipe[0]);
        ::close(execStatusPipe[1]);
        return Result<void>(std::string("failed to fork process for opening browser: ") + std::strerror(err));
    }
    if (pid == 0) {
        ::close(execStatusPipe[0]);
        pid_t grandchild = ::fork();
        if (grandchild == 0) {
            ::execlp(opener, opener, url.c_str(), static_cast<char*>(nullptr));
            int err = errno;
            ssize_t ignored = ::write(execStatusPipe[1], &err, sizeof(err));
            (void)ignored;
            ::_exit(127);
        }
        ::_exit(grandchild < 0 ? 1 : 0);
    }
    ::close(execStatusPipe[1]);

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            int err = errno;
            ::close(execStatusPipe[0]);
            return Result<void>(std::string("failed to wait for browser opener: ") + std::strerror(err));
        }
    }
    if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        ::close(execStatusPipe[0]);
        return Result<void>(std::string("failed to launch ") + opener);
    }

    int execErrno = 0;
    ssize_t statusBytes;
    do {
        statusBytes = ::read(execStatusPipe[0], &execErrno, sizeof(execErrno));
    } while (statusBytes < 0 && errno == EINTR);
    ::close(execStatusPipe[0]);

    if (statusBytes == static_cast<ssize_t>(sizeof(execErrno))) {
        return Result<void>(std::string("failed to run ") + opener + ": " + std::strerror(execErrno));
    }
    return Result<void>();
}

#endif

} // namespace core
} // namespace applink
