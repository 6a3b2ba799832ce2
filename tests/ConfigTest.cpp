#include "mdview/common/Config.hpp"
#include "mdview/common/Paths.hpp"

#include "MdviewTestHelpers.hpp"

#include <gtest/gtest.h>

namespace mdview::common {
namespace {

TEST(ConfigTest, ParsesAllKeys) {
    auto config = parseConfig(R"({
        "style": true,
        "previewDelayMs": 250,
        "viewerCommand": "firefox",
        "stylesheet": "/tmp/custom.css",
        "unsafeHtml": true,
        "logFile": "/tmp/mdview.log"
    })",
                              "test");
    ASSERT_TRUE(config.has_value()) << config.error();
    EXPECT_EQ(config->style, true);
    EXPECT_EQ(config->previewDelayMs, 250);
    EXPECT_EQ(config->viewerCommand, "firefox");
    EXPECT_EQ(config->stylesheet.value_or("").string(), "/tmp/custom.css");
    EXPECT_EQ(config->unsafeHtml, true);
    EXPECT_EQ(config->logFile.value_or("").string(), "/tmp/mdview.log");
}

TEST(ConfigTest, EmptyObjectLeavesEverythingUnset) {
    auto config = parseConfig("{}", "test");
    ASSERT_TRUE(config.has_value());
    EXPECT_FALSE(config->style.has_value());
    EXPECT_FALSE(config->previewDelayMs.has_value());
    EXPECT_FALSE(config->viewerCommand.has_value());
    EXPECT_FALSE(config->stylesheet.has_value());
    EXPECT_FALSE(config->unsafeHtml.has_value());
    EXPECT_FALSE(config->logFile.has_value());
}

TEST(ConfigTest, MalformedJsonFails) {
    auto config = parseConfig("{ not valid json", "broken.json");
    ASSERT_FALSE(config.has_value());
    EXPECT_NE(config.error().find("broken.json"), std::string::npos);
}

TEST(ConfigTest, NonObjectRootFails) {
    EXPECT_FALSE(parseConfig("[true]", "test").has_value());
}

TEST(ConfigTest, WrongTypesFail) {
    EXPECT_FALSE(parseConfig(R"({"style": "yes"})", "test").has_value());
    EXPECT_FALSE(parseConfig(R"({"previewDelayMs": 1.5})", "test").has_value());
    EXPECT_FALSE(parseConfig(R"({"previewDelayMs": -1})", "test").has_value());
    EXPECT_FALSE(parseConfig(R"({"viewerCommand": ""})", "test").has_value());
    EXPECT_FALSE(parseConfig(R"({"logFile": 3})", "test").has_value());
}

TEST(ConfigTest, MissingUserConfigGivesDefaults) {
    test_helpers::ScopedTempDir dir("mdview-config-missing");
    test_helpers::ScopedEnvVar env("XDG_CONFIG_HOME", dir.path().string());

    EXPECT_EQ(userConfigPath().string(), (dir.path() / "mdview" / "config.json").string());
    auto config = loadConfig(std::nullopt);
    ASSERT_TRUE(config.has_value());
    EXPECT_FALSE(config->style.has_value());
}

TEST(ConfigTest, LoadsUserConfigFromXdgConfigHome) {
    test_helpers::ScopedTempDir dir("mdview-config-xdg");
    std::filesystem::create_directories(dir.path() / "mdview");
    test_helpers::writeFile(dir.path() / "mdview" / "config.json", R"({"style": true})");
    test_helpers::ScopedEnvVar env("XDG_CONFIG_HOME", dir.path().string());

    auto config = loadConfig(std::nullopt);
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->style, true);
}

TEST(ConfigTest, FallsBackToHomeConfigDir) {
    test_helpers::ScopedTempDir dir("mdview-config-home");
    test_helpers::ScopedEnvVar xdg("XDG_CONFIG_HOME", "");
    test_helpers::ScopedEnvVar home("HOME", dir.path().string());
    EXPECT_EQ(userConfigDir().string(), (dir.path() / ".config" / "mdview").string());
}

TEST(ConfigTest, ExplicitPathMustExist) {
    auto config = loadConfig(std::filesystem::path("/nonexistent/mdview/config.json"));
    ASSERT_FALSE(config.has_value());
}

TEST(ConfigTest, ExplicitPathIsUsed) {
    test_helpers::ScopedTempDir dir("mdview-config-explicit");
    const auto path = dir.path() / "custom.json";
    test_helpers::writeFile(path, R"({"previewDelayMs": 0})");

    auto config = loadConfig(path);
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->previewDelayMs, 0);
}

TEST(ConfigTest, DirectoryAsConfigPathFails) {
    test_helpers::ScopedTempDir dir("mdview-config-dir");
    auto config = loadConfig(dir.path());
    ASSERT_FALSE(config.has_value());
    EXPECT_NE(config.error().find("directory"), std::string::npos);
}

TEST(ConfigTest, DirectoryAtUserConfigLocationFails) {
    test_helpers::ScopedTempDir dir("mdview-config-userdir");
    std::filesystem::create_directories(dir.path() / "mdview" / "config.json");
    test_helpers::ScopedEnvVar env("XDG_CONFIG_HOME", dir.path().string());
    EXPECT_FALSE(loadConfig(std::nullopt).has_value());
}

}  // namespace
}  // namespace mdview::common
