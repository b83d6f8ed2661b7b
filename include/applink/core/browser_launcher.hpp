#pragma once

#include "applink/utils/result.hpp"
#include <string>

namespace applink {
namespace core {

/**
 * @brief Opens a URL in the user's browser.
 */
class BrowserLauncher {
public:
    virtual ~BrowserLauncher() = default;
    virtual Result<void> open(const std::string& url) = 0;
};

/**
 * @brief Uses the platform opener: open (macOS), xdg-open (Linux) or
 * rundll32 url.dll,FileProtocolHandler (Windows). The URL is passed as a
 * single argument, never through a shell.
 */
class SystemBrowserLauncher : public BrowserLauncher {
public:
    Result<void> open(const std::string& url) override;
};

} // namespace core
} // namespace applink
