#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "applink/core/secret_store.hpp"
#include "applink/utils/file_io.hpp"
#include <filesystem>

namespace applink {
namespace core {
namespace {

namespace fs = std::filesystem;
using ::testing::HasSubstr;

TEST(InMemorySecretStoreTest, SetGetRemove) {
    InMemorySecretStore store;
    auto missing = store.get("applink/linear");
    ASSERT_TRUE(missing.has_value());
    EXPECT_FALSE(missing.value().has_value());

    ASSERT_TRUE(store.set("applink/linear", "secret").has_value());
    auto found = store.get("applink/linear");
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found.value().value(), "secret");

    EXPECT_TRUE(store.remove("applink/linear").has_value());
    EXPECT_TRUE(store.remove("applink/linear").has_value());
    EXPECT_FALSE(store.get("applink/linear").value().has_value());
}

class FileSecretStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = fs::temp_directory_path() / "applink_secret_store_test";
        fs::remove_all(dir_);
        path_ = dir_ / "data" / "secrets.json";
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    fs::path dir_;
    fs::path path_;
};

TEST_F(FileSecretStoreTest, MissingFileIsEmpty) {
    FileSecretStore store(path_);
    auto value = store.get("anything");
    ASSERT_TRUE(value.has_value());
    EXPECT_FALSE(value.value().has_value());
    EXPECT_FALSE(fs::exists(path_));
}

TEST_F(FileSecretStoreTest, PersistsAcrossInstances) {
    {
        FileSecretStore store(path_);
        ASSERT_TRUE(store.set("applink/slack", "xoxp").has_value());
        ASSERT_TRUE(store.set("applink_creds/slack", "{\"client_id\":\"a\"}").has_value());
    }

    FileSecretStore reopened(path_);
    EXPECT_EQ(reopened.get("applink/slack").value().value(), "xoxp");
    EXPECT_EQ(reopened.get("applink_creds/slack").value().value(), "{\"client_id\":\"a\"}");

    ASSERT_TRUE(reopened.remove("applink/slack").has_value());
    EXPECT_FALSE(FileSecretStore(path_).get("applink/slack").value().has_value());
    EXPECT_TRUE(reopened.remove("never-stored").has_value());
}

#ifndef _WIN32
TEST_F(FileSecretStoreTest, FileIsOwnerOnly) {
    FileSecretStore store(path_);
    ASSERT_TRUE(store.set("k", "v").has_value());
    auto perms = fs::status(path_).permissions();
    EXPECT_EQ(perms & fs::perms::all, fs::perms::owner_read | fs::perms::owner_write);
    EXPECT_EQ(fs::status(path_.parent_path()).permissions() & fs::perms::all, fs::perms::owner_all);
}
#endif

TEST_F(FileSecretStoreTest, CorruptFileMakesStoreUnavailable) {
    ASSERT_TRUE(utils::ensurePrivateDirectory(path_.parent_path()).has_value());
    ASSERT_TRUE(utils::writeFile(path_, "{not json", fs::perms::owner_read | fs::perms::owner_write).has_value());

    FileSecretStore store(path_);
    auto value = store.get("k");
    ASSERT_TRUE(value.has_error());
    EXPECT_EQ(value.error().kind, SecretStoreError::Kind::Unavailable);
    EXPECT_THAT(value.error().message, HasSubstr("failed to parse"));

    auto written = store.set("k", "v");
    ASSERT_TRUE(written.has_error());
    EXPECT_EQ(written.error().kind, SecretStoreError::Kind::Unavailable);
    EXPECT_EQ(utils::readFile(path_).value(), "{not json");
}

TEST_F(FileSecretStoreTest, NonStringEntriesAreIgnored) {
    ASSERT_TRUE(utils::ensurePrivateDirectory(path_.parent_path()).has_value());
    ASSERT_TRUE(utils::writeFile(path_, R"({"good":"yes","bad":42})",
                                 fs::perms::owner_read | fs::perms::owner_write).has_value());

    FileSecretStore store(path_);
    EXPECT_EQ(store.get("good").value().value(), "yes");
    EXPECT_FALSE(store.get("bad").value().has_value());
}

TEST_F(FileSecretStoreTest, EmptyPathIsUnavailable) {
    FileSecretStore store{fs::path()};
    auto value = store.get("k");
    ASSERT_TRUE(value.has_error());
    EXPECT_EQ(value.error().kind, SecretStoreError::Kind::Unavailable);
}

TEST(FileSecretStoreDefaultsTest, DefaultPathFollowsHome) {
    auto env = [](const std::string& name) -> std::optional<std::string> {
        if (name == "HOME" || name == "USERPROFILE") {
            return std::string("/home/dev");
        }
        return std::nullopt;
    };
#ifndef _WIN32
    EXPECT_EQ(FileSecretStore::defaultPath(env), fs::path("/home/dev/.applink/secrets.json"));
#endif
    auto noHome = [](const std::string&) -> std::optional<std::string> { return std::nullopt; };
    EXPECT_TRUE(FileSecretStore::defaultPath(noHome).empty());
}

} // namespace
} // namespace core
} // namespace applink
