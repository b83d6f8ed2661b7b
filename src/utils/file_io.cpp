#include "applink/utils/file_io.hpp"
#include <cerrno>
#include <fstream>
#include <sstream>
#include <system_error>

#ifndef _WIN32
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#endif

namespace applink {
namespace utils {

namespace fs = std::filesystem;

Result<std::string> readFile(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return fail("Failed to open " + path.string());
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        return fail("Failed to read " + path.string());
    }
    return buffer.str();
}

Result<void> writeFile(const fs::path& path, const std::string& data, fs::perms mode) {
#ifndef _WIN32
    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, static_cast<mode_t>(mode));
    if (fd < 0) {
        return Result<void>("Failed to open " + path.string() + " for writing: " +
                            std::error_code(errno, std::generic_category()).message());
    }
    size_t written = 0;
    while (written < data.size()) {
        ssize_t n = ::write(fd, data.data() + written, data.size() - written);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            ::close(fd);
            return Result<void>("Failed to write " + path.string());
        }
        written += static_cast<size_t>(n);
    }
    if (::close(fd) != 0) {
        return Result<void>("Failed to write " + path.string());
    }
#else
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file || !(file << data)) {
        return Result<void>("Failed to write " + path.string());
    }
    file.close();
#endif
    std::error_code ec;
    // Re-apply in case the file already existed with other permissions.
    fs::permissions(path, mode, fs::perm_options::replace, ec);
    if (ec) {
        return Result<void>("Failed to set permissions on " + path.string() + ": " + ec.message());
    }
    return Result<void>();
}

Result<void> ensurePrivateDirectory(const fs::path& directory) {
    std::error_code ec;
    fs::create_directories(directory, ec);
    if (ec) {
        return Result<void>("Failed to create directory " + directory.string() + ": " + ec.message());
    }
    fs::permissions(directory, fs::perms::owner_all, fs::perm_options::replace, ec);
    if (ec) {
        return Result<void>("Failed to restrict directory " + directory.string() + ": " + ec.message());
    }
    return Result<void>();
}

} // namespace utils
} // namespace applink
