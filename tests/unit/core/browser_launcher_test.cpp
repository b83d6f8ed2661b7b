#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "applink/core/browser_launcher.hpp"
#include <cstdlib>
#include <optional>
#include <string>

namespace applink {
namespace core {
namespace {

using ::testing::HasSubstr;

#ifndef _WIN32
class SystemBrowserLauncherTest : public ::testing::Test {
protected:
    void SetUp() override {
        if (const char* path = std::getenv("PATH")) {
            savedPath_ = std::string(path);
        }
        ::setenv("PATH", "/nonexistent", 1);
    }

    void TearDown() override {
        if (savedPath_) {
            ::setenv("PATH", savedPath_->c_str(), 1);
        } else {
            ::unsetenv("PATH");
        }
    }

    std::optional<std::string> savedPath_;
};

TEST_F(SystemBrowserLauncherTest, MissingOpenerIsReported) {
    SystemBrowserLauncher launcher;
    auto opened = launcher.open("http://127.0.0.1:1/authorize?state=S");
    ASSERT_TRUE(opened.has_error());
    EXPECT_THAT(opened.error(), HasSubstr("failed to run"));
    EXPECT_THAT(opened.error(), HasSubstr("No such file or directory"));
}
#endif

} // namespace
} // namespace core
} // namespace applink
