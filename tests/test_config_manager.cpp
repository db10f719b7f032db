#include <gtest/gtest.h>
#include "test_support.hpp"
#include "wbvm/config_manager.hpp"

#include <cstdlib>

using namespace wbvm;
using namespace wbvm::test;

class ConfigManagerTest : public TempRootTest {
protected:
    void SetUp() override {
        TempRootTest::SetUp();
        unsetenv("WBVM_RELEASES_URL");
        unsetenv("WBVM_PLATFORM");
    }

    void TearDown() override {
        unsetenv("WBVM_RELEASES_URL");
        unsetenv("WBVM_PLATFORM");
        TempRootTest::TearDown();
    }
};

TEST_F(ConfigManagerTest, DefaultsWithoutConfigFile) {
    Settings settings = ConfigManager(root).load();
    EXPECT_EQ(settings.root_dir, root);
    EXPECT_EQ(settings.product, "worterbuch");
    EXPECT_EQ(settings.release_index_url, "https://api.github.com/repos/babymotte/worterbuch/releases");
    EXPECT_FALSE(settings.platform_override.has_value());
}

TEST_F(ConfigManagerTest, ConfigFileOverridesDefaults) {
    write_file(root / "config.json", R"({
        "product": "wb",
        "release_index_url": "https://mirror.example/releases",
        "platform": "macos-x64",
        "unrelated": 42
    })");

    Settings settings = ConfigManager(root).load();
    EXPECT_EQ(settings.product, "wb");
    EXPECT_EQ(settings.release_index_url, "https://mirror.example/releases");
    EXPECT_EQ(settings.platform_override.value_or(""), "macos-x64");
}

TEST_F(ConfigManagerTest, EnvironmentOverridesConfigFile) {
    write_file(root / "config.json", R"({"release_index_url": "https://file", "platform": "macos-x64"})");
    setenv("WBVM_RELEASES_URL", "https://env", 1);
    setenv("WBVM_PLATFORM", "windows-x64", 1);

    Settings settings = ConfigManager(root).load();
    EXPECT_EQ(settings.release_index_url, "https://env");
    EXPECT_EQ(settings.platform_override.value_or(""), "windows-x64");
}

TEST_F(ConfigManagerTest, MalformedConfigIsRejected) {
    auto expect_invalid = [this](const std::string& content) {
        write_file(root / "config.json", content);
        try {
            (void)ConfigManager(root).load();
            ADD_FAILURE() << "expected CONFIG_INVALID for " << content;
        } catch (const WbvmError& e) {
            EXPECT_EQ(e.kind(), ErrorKind::CONFIG_INVALID);
        }
    };

    expect_invalid("{broken");
    expect_invalid("[1, 2]");
    expect_invalid(R"({"product": 7})");
    expect_invalid(R"({"product": ""})");
}

TEST_F(ConfigManagerTest, LoopingConfigSymlinkIsRejected) {
    fs::create_symlink("config.json", root / "config.json");
    try {
        (void)ConfigManager(root).load();
        FAIL() << "expected CONFIG_INVALID";
    } catch (const WbvmError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::CONFIG_INVALID);
    }
}
