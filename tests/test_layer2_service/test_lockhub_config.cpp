/**
 * @file test_lockhub_config.cpp
 * @brief Layer 2 tests for LockHubConfig layered loading.
 */
#include "lkh_service.hpp"
#include "shared_test_helpers.h"
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cstdlib>
#include <fstream>

using namespace lockhub::utils;
using namespace lockhub::tests::helper;
using ::testing::HasSubstr;

namespace
{
void write_file(const fs::path &path, const std::string &text)
{
    std::ofstream out(path);
    out << text;
}
} // namespace

class LockHubConfigTest : public ::testing::Test
{
  protected:
    void SetUp() override
    {
        ::unsetenv("LOCKHUB_CONFIG_FILE");
        ::unsetenv("LOCKHUB_DOMAIN");
        ::unsetenv("LOCKHUB_LOG_LEVEL");
    }
    void TearDown() override { SetUp(); }

    TempDir dir_{"config"};
};

TEST_F(LockHubConfigTest, DefaultsWithEmptyConfigDir)
{
    auto cfg = LockHubConfig::load(dir_.path());
    EXPECT_EQ(cfg.domain(), "local");
    EXPECT_EQ(cfg.log_level(), "info");
    EXPECT_TRUE(cfg.log_file().empty());
    EXPECT_TRUE(cfg.lock_managers().is_array());
    EXPECT_TRUE(cfg.lock_managers().empty());
    EXPECT_TRUE(cfg.loaded_files().empty());
}

TEST_F(LockHubConfigTest, UserFileOverridesDefaultFile)
{
    write_file(dir_.path() / "lockhub.default.json", R"({
        "domain": "wiki",
        "log_level": "info",
        "lock_managers": [ { "name": "fsLockManager", "class": "FSLockManager",
                             "lockDirectory": "/tmp/x" } ]
    })");
    write_file(dir_.path() / "lockhub.user.json", R"({ "log_level": "debug",
        "log_file": "logs/lockhub.log" })");

    auto cfg = LockHubConfig::load(dir_.path());
    EXPECT_EQ(cfg.domain(), "wiki");
    EXPECT_EQ(cfg.log_level(), "debug");
    EXPECT_EQ(cfg.log_file(), (dir_.path() / "logs" / "lockhub.log").lexically_normal());
    ASSERT_EQ(cfg.lock_managers().size(), 1u);
    EXPECT_EQ(cfg.lock_managers()[0]["name"], "fsLockManager");
    EXPECT_EQ(cfg.loaded_files().size(), 2u);
}

TEST_F(LockHubConfigTest, ArraysReplaceInsteadOfMerging)
{
    write_file(dir_.path() / "lockhub.default.json",
               R"({ "lock_managers": [ {"name": "a", "class": "NullLockManager"},
                                       {"name": "b", "class": "NullLockManager"} ] })");
    write_file(dir_.path() / "lockhub.user.json",
               R"({ "lock_managers": [ {"name": "c", "class": "NullLockManager"} ] })");

    auto cfg = LockHubConfig::load(dir_.path());
    ASSERT_EQ(cfg.lock_managers().size(), 1u);
    EXPECT_EQ(cfg.lock_managers()[0]["name"], "c");
}

TEST_F(LockHubConfigTest, OverrideFileReplacesLayeredFiles)
{
    write_file(dir_.path() / "lockhub.default.json", R"({ "domain": "from-default" })");
    const auto single = dir_.path() / "single.json";
    write_file(single, R"({ "domain": "from-single" })");

    auto cfg = LockHubConfig::load(dir_.path(), single);
    EXPECT_EQ(cfg.domain(), "from-single");
    ASSERT_EQ(cfg.loaded_files().size(), 1u);
    EXPECT_EQ(cfg.loaded_files()[0], single);
    EXPECT_EQ(cfg.config_dir(), dir_.path());
}

TEST_F(LockHubConfigTest, ConfigFileEnvironmentVariable)
{
    const auto single = dir_.path() / "env.json";
    write_file(single, R"({ "domain": "from-env-file" })");
    ::setenv("LOCKHUB_CONFIG_FILE", single.c_str(), 1);

    auto cfg = LockHubConfig::load(dir_.path());
    EXPECT_EQ(cfg.domain(), "from-env-file");
}

TEST_F(LockHubConfigTest, EnvironmentOverridesFiles)
{
    write_file(dir_.path() / "lockhub.default.json", R"({ "domain": "wiki", "log_level": "info" })");
    ::setenv("LOCKHUB_DOMAIN", "commons", 1);
    ::setenv("LOCKHUB_LOG_LEVEL", "warning", 1);

    auto cfg = LockHubConfig::load(dir_.path());
    EXPECT_EQ(cfg.domain(), "commons");
    EXPECT_EQ(cfg.log_level(), "warning");
    EXPECT_EQ(cfg.merged_json()["domain"], "commons");
}

TEST_F(LockHubConfigTest, ParseErrorNamesTheFile)
{
    write_file(dir_.path() / "lockhub.default.json", "{ not json");
    try
    {
        (void)LockHubConfig::load(dir_.path());
        FAIL() << "expected std::runtime_error";
    }
    catch (const std::runtime_error &e)
    {
        EXPECT_THAT(e.what(), HasSubstr("failed to parse"));
        EXPECT_THAT(e.what(), HasSubstr("lockhub.default.json"));
    }
}

TEST_F(LockHubConfigTest, ApplyJsonValidatesTypes)
{
    LockHubConfig cfg;
    EXPECT_THROW(cfg.apply_json(nlohmann::json::array()), std::runtime_error);
    EXPECT_THROW(cfg.apply_json({{"domain", 5}}), std::runtime_error);
    EXPECT_THROW(cfg.apply_json({{"domain", ""}}), std::runtime_error);
    EXPECT_THROW(cfg.apply_json({{"log_level", "loud"}}), std::runtime_error);
    EXPECT_THROW(cfg.apply_json({{"log_file", 3}}), std::runtime_error);
    EXPECT_THROW(cfg.apply_json({{"lock_managers", nlohmann::json::object()}}), std::runtime_error);

    cfg.apply_json({{"log_file", "/var/log/lockhub.log"}});
    EXPECT_EQ(cfg.log_file(), fs::path("/var/log/lockhub.log"));
    cfg.apply_json({{"log_file", nullptr}});
    EXPECT_TRUE(cfg.log_file().empty());
}

TEST(JsonMergeTest, MergesObjectsRecursively)
{
    nlohmann::json base = {{"a", {{"x", 1}, {"y", 2}}}, {"list", {1, 2, 3}}};
    json_merge(base, {{"a", {{"y", 20}, {"z", 30}}}, {"list", {9}}});
    EXPECT_EQ(base["a"]["x"], 1);
    EXPECT_EQ(base["a"]["y"], 20);
    EXPECT_EQ(base["a"]["z"], 30);
    EXPECT_EQ(base["list"], nlohmann::json({9}));
}

TEST(JsonMergeTest, ReadMissingFileIsNull)
{
    EXPECT_TRUE(read_json_file("/nonexistent/lockhub/none.json").is_null());
}
