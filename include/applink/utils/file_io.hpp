#pragma once

#include "applink/utils/result.hpp"
#include <filesystem>
#include <string>

namespace applink {
namespace utils {

// Reads the whole file as bytes.
Result<std::string> readFile(const std::filesystem::path& path);

/**
 * @brief Write @p data to @p path, creating the file with @p mode.
 *
 * The file never exists with broader permissions than @p mode; an existing
 * file is truncated and has its permissions replaced.
 */
Result<void> writeFile(const std::filesystem::path& path, const std::string& data,
                       std::filesystem::perms mode);

// Creates @p directory (and parents) and restricts it to the owner.
Result<void> ensurePrivateDirectory(const std::filesystem::path& directory);

} // namespace utils
} // namespace applink
