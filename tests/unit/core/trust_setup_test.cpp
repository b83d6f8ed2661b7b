#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "applink/core/trust_setup.hpp"
#include "applink/utils/file_io.hpp"
#include "mock_collaborators.hpp"
#include <filesystem>
#include <sstream>

using namespace applink::core;
using namespace testing;

namespace {

namespace fs = std::filesystem;

applink::Result<CommandResult> exited(int code, const std::string& output = std::string()) {
    return CommandResult{code, output};
}

class TrustSetupTest : public Test {
protected:
    void SetUp() override {
        dir_ = fs::temp_directory_path() /
               ("applink_trust_setup_" + std::string(UnitTest::GetInstance()->current_test_info()->name()));
        fs::remove_all(dir_);

        CertificateAuthorityConfig caConfig;
        caConfig.directory = dir_;
        authority_ = std::make_shared<CertificateAuthorityManager>(caConfig);
        runner_ = std::make_shared<StrictMock<MockCommandRunner>>();
        trustStore_ = std::make_shared<TrustStore>(TrustPlatform::Linux, runner_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    TrustSetup makeSetup(bool answer) {
        return TrustSetup(authority_, trustStore_,
                          [this, answer](const std::string& prompt) {
                              prompts_.push_back(prompt);
                              return answer;
                          },
                          out_);
    }

    fs::path dir_;
    std::shared_ptr<CertificateAuthorityManager> authority_;
    std::shared_ptr<StrictMock<MockCommandRunner>> runner_;
    std::shared_ptr<TrustStore> trustStore_;
    std::vector<std::string> prompts_;
    std::ostringstream out_;
};

TEST_F(TrustSetupTest, ExistingTrustedAuthorityIsLeftAlone) {
    ASSERT_TRUE(authority_->generateAuthority().has_value());
    EXPECT_CALL(*runner_, run(ElementsAre("test", "-f", _))).WillOnce(Return(exited(0)));

    auto status = makeSetup(true).ensureTrusted();
    ASSERT_TRUE(status.has_value());
    EXPECT_EQ(status.value().status, TrustStatus::AlreadyTrusted);
    EXPECT_TRUE(prompts_.empty());
}

TEST_F(TrustSetupTest, DeclineSkipsGeneration) {
    TrustSetupOptions options;
    options.reason = "Slack requires HTTPS for OAuth callbacks.";

    auto status = makeSetup(false).ensureTrusted(options);
    ASSERT_TRUE(status.has_value());
    EXPECT_EQ(status.value().status, TrustStatus::Declined);
    EXPECT_EQ(prompts_.size(), 1u);
    EXPECT_FALSE(authority_->authorityExists());
    EXPECT_THAT(out_.str(), HasSubstr("Slack requires HTTPS"));
    EXPECT_THAT(out_.str(), HasSubstr("Certificate setup skipped"));
}

TEST_F(TrustSetupTest, AcceptGeneratesAndInstalls) {
    InSequence seq;
    EXPECT_CALL(*runner_, run(ElementsAre("sudo", "cp", authority_->certificatePath().string(), _)))
        .WillOnce(Return(exited(0)));
    EXPECT_CALL(*runner_, run(ElementsAre("sudo", "update-ca-certificates")))
        .WillOnce(Return(exited(0)));

    auto status = makeSetup(true).ensureTrusted();
    ASSERT_TRUE(status.has_value());
    EXPECT_EQ(status.value().status, TrustStatus::Installed);
    EXPECT_TRUE(authority_->authorityExists());
    EXPECT_FALSE(status.value().installError.has_value());
}

TEST_F(TrustSetupTest, InstallFailureDegradesToManualInstructions) {
    EXPECT_CALL(*runner_, run(_)).WillRepeatedly(Return(exited(1, "permission denied")));

    auto status = makeSetup(true).ensureTrusted();
    ASSERT_TRUE(status.has_value());
    EXPECT_EQ(status.value().status, TrustStatus::InstalledManually);
    ASSERT_TRUE(status.value().installError.has_value());
    EXPECT_EQ(status.value().installError->kind, FlowErrorKind::TrustInstallError);
    EXPECT_THAT(status.value().installError->detail, HasSubstr("permission denied"));
    EXPECT_TRUE(authority_->authorityExists());
    EXPECT_THAT(out_.str(), HasSubstr("permission denied"));
    EXPECT_THAT(out_.str(), HasSubstr("To install the CA manually"));
}

TEST_F(TrustSetupTest, ForceRegeneratesTrustedAuthority) {
    ASSERT_TRUE(authority_->generateAuthority().has_value());
    auto before = applink::utils::readFile(authority_->certificatePath());
    EXPECT_CALL(*runner_, run(_)).WillRepeatedly(Return(exited(0)));

    TrustSetupOptions options;
    options.force = true;
    auto status = makeSetup(true).ensureTrusted(options);
    ASSERT_TRUE(status.has_value());
    EXPECT_EQ(status.value().status, TrustStatus::Installed);

    auto after = applink::utils::readFile(authority_->certificatePath());
    EXPECT_NE(before.value(), after.value());
}

TEST(StreamConfirmerTest, EmptyAnswerMeansYes) {
    std::ostringstream out;
    std::istringstream yes("\n");
    EXPECT_TRUE(makeStreamConfirmer(yes, out)("Install?"));
    EXPECT_THAT(out.str(), HasSubstr("Install? [Y/n]"));

    std::istringstream upper(" YES \n");
    EXPECT_TRUE(makeStreamConfirmer(upper, out)("Install?"));

    std::istringstream no("n\n");
    EXPECT_FALSE(makeStreamConfirmer(no, out)("Install?"));

    std::istringstream closed("");
    EXPECT_FALSE(makeStreamConfirmer(closed, out)("Install?"));
}

} // namespace
