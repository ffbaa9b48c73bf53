/**
 * @file test_lock_manager_registry_factory.cpp
 * @brief Layer 3 tests for LockManagerRegistryFactory.
 */
#include "lkh_lockmgr.hpp"
#include "lockmgr_test_helpers.h"
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <map>

using namespace lockhub::lockmgr;
using namespace lockhub::tests::helper;
using ::testing::ElementsAre;

class LockManagerRegistryFactoryTest : public ::testing::Test
{
  protected:
    ServiceDependencyProvider deps_;
    std::map<std::string, int> calls_;
    std::map<std::string, nlohmann::json> records_{
        {"wiki", nlohmann::json::array({{{"name", "default"}, {"class", "NullLockManager"}}})},
        {"commons", nlohmann::json::array({{{"name", "nullLockManager"}, {"class", "NullLockManager"}},
                                           {{"name", "default"}, {"class", "NullLockManager"}}})},
    };

    LockManagerRegistryFactory::RecordSource source()
    {
        return [this](const std::string &domain)
        {
            ++calls_[domain];
            auto it = records_.find(domain);
            return it == records_.end() ? nlohmann::json::array() : it->second;
        };
    }
};

TEST_F(LockManagerRegistryFactoryTest, EmptyNameMeansDefaultDomain)
{
    LockManagerRegistryFactory factory("wiki", source(), deps_);
    EXPECT_EQ(factory.default_domain(), "wiki");

    auto registry = factory.get();
    EXPECT_EQ(registry->domain(), "wiki");
    EXPECT_EQ(factory.get("wiki"), registry);
    EXPECT_EQ(calls_["wiki"], 1);
}

TEST_F(LockManagerRegistryFactoryTest, OneRegistryPerDomain)
{
    LockManagerRegistryFactory factory("wiki", source(), deps_);
    auto wiki = factory.get("wiki");
    auto commons = factory.get("commons");
    EXPECT_NE(wiki, commons);
    EXPECT_EQ(factory.get("commons"), commons);
    EXPECT_EQ(factory.size(), 2u);
    EXPECT_EQ(calls_["commons"], 1);

    EXPECT_THAT(commons->names(), ElementsAre("nullLockManager", "default"));
    EXPECT_EQ(commons->config("default").at("domain"), "commons");
    EXPECT_EQ(commons->get("default")->domain(), "commons");
}

TEST_F(LockManagerRegistryFactoryTest, InvalidRecordsAreNotCached)
{
    records_["broken"] = nlohmann::json::array({{{"name", "x"}}});
    LockManagerRegistryFactory factory("wiki", source(), deps_);

    EXPECT_THROW((void)factory.get("broken"), ConfigError);
    EXPECT_EQ(factory.size(), 0u);

    records_["broken"] = nlohmann::json::array({{{"name", "x"}, {"class", "NullLockManager"}}});
    auto fixed = factory.get("broken");
    EXPECT_TRUE(fixed->has("x"));
    EXPECT_EQ(calls_["broken"], 2);
}

TEST_F(LockManagerRegistryFactoryTest, ResetKeepsHandedOutRegistries)
{
    LockManagerRegistryFactory factory("wiki", source(), deps_);
    auto before = factory.get();
    auto manager = before->get("default");

    factory.reset_for_testing();
    EXPECT_EQ(factory.size(), 0u);

    auto after = factory.get();
    EXPECT_NE(after, before);
    EXPECT_EQ(calls_["wiki"], 2);
    EXPECT_EQ(before->get("default"), manager);
    EXPECT_TRUE(manager->lock({"p"}, LockType::Exclusive).ok());
}

TEST_F(LockManagerRegistryFactoryTest, RequiresRecordSource)
{
    EXPECT_THROW(LockManagerRegistryFactory("wiki", nullptr, deps_), ConfigError);
}

TEST_F(LockManagerRegistryFactoryTest, OptionsReachEveryRegistry)
{
    records_["dup"] = nlohmann::json::array({{{"name", "x"}, {"class", "NullLockManager"}},
                                             {{"name", "x"}, {"class", "NullLockManager"}}});
    LockManagerRegistryFactory strict("wiki", source(), deps_);
    EXPECT_THROW((void)strict.get("dup"), ConfigError);

    RegistryOptions options;
    options.duplicates = DuplicateNamePolicy::LastWins;
    LockManagerRegistryFactory lenient("wiki", source(), deps_, options);
    EXPECT_THAT(lenient.get("dup")->names(), ElementsAre("x"));
}
