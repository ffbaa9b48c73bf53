/**
 * @file test_lock_manager_registry.cpp
 * @brief Layer 3 tests for LockManagerRegistry: lazy construction, lookup errors,
 *        dependency injection, the default/any fallbacks and concurrent resolution.
 */
#include "lkh_lockmgr.hpp"
#include "lockmgr_test_helpers.h"
#include "shared_test_helpers.h"
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>

using namespace lockhub::lockmgr;
using namespace lockhub::tests::helper;
using namespace std::chrono_literals;
using ::testing::ElementsAre;
using ::testing::HasSubstr;

namespace
{

/// Factory table that builds a RecordingLockManager for every kind and counts calls.
RegistryOptions recording_options(std::atomic<int> *built = nullptr)
{
    RegistryOptions options;
    for (auto kind : {LockManagerKind::Database, LockManagerKind::Filesystem,
                      LockManagerKind::Cache, LockManagerKind::Null})
    {
        options.factories[kind] = [built](const LockManagerSettings &settings)
        {
            if (built != nullptr)
                built->fetch_add(1);
            return std::make_shared<RecordingLockManager>(settings);
        };
    }
    return options;
}

const RecordingLockManager &as_recording(const std::shared_ptr<LockManager> &manager)
{
    return dynamic_cast<const RecordingLockManager &>(*manager);
}

} // namespace

class LockManagerRegistryTest : public ::testing::Test
{
  protected:
    std::shared_ptr<FakeAdvisoryServer> server_ = std::make_shared<FakeAdvisoryServer>();
    int connections_opened_ = 0;
    ServiceDependencyProvider deps_{[this](const std::string &domain)
                                    {
                                        ++connections_opened_;
                                        return std::make_shared<FakeSession>(server_, domain);
                                    }};
    TempDir dir_{"registry"};

    std::string lock_dir() const { return (dir_.path() / "locks").string(); }
};

// ============================================================================
// Lookup and lazy construction
// ============================================================================

TEST_F(LockManagerRegistryTest, ConstructsLazilyAndOnce)
{
    std::atomic<int> built{0};
    LockManagerRegistry registry("wiki",
                                 nlohmann::json::array({{{"name", "a"}, {"class", "NullLockManager"}},
                                                        {{"name", "b"}, {"class", "NullLockManager"}}}),
                                 deps_, recording_options(&built));

    EXPECT_EQ(built.load(), 0);
    EXPECT_FALSE(registry.is_instantiated("a"));

    auto first = registry.get("a");
    auto second = registry.get("a");
    EXPECT_EQ(first, second);
    EXPECT_EQ(built.load(), 1);
    EXPECT_TRUE(registry.is_instantiated("a"));
    EXPECT_FALSE(registry.is_instantiated("b"));
    EXPECT_FALSE(registry.is_instantiated("missing"));
}

TEST_F(LockManagerRegistryTest, UnknownNameIsNotFound)
{
    LockManagerRegistry registry(
        "wiki", nlohmann::json::array({{{"name", "a"}, {"class", "NullLockManager"}}}), deps_);

    try
    {
        (void)registry.get("nope");
        FAIL() << "expected NotFoundError";
    }
    catch (const NotFoundError &e)
    {
        EXPECT_THAT(e.what(), HasSubstr("nope"));
        EXPECT_THAT(e.what(), HasSubstr("wiki"));
    }

    (void)registry.get("a");
    EXPECT_THROW((void)registry.get("nope"), NotFoundError);
    EXPECT_THROW((void)registry.config("nope"), NotFoundError);
}

TEST_F(LockManagerRegistryTest, ConfigDoesNotConstruct)
{
    std::atomic<int> built{0};
    LockManagerRegistry registry(
        "wiki",
        nlohmann::json::array({{{"name", "fsLockManager"},
                                {"class", "FSLockManager"},
                                {"lockDirectory", "/var/lock/lh"}}}),
        deps_, recording_options(&built));

    const auto cfg = registry.config("fsLockManager");
    EXPECT_EQ(cfg.at("class"), "FSLockManager");
    EXPECT_EQ(cfg.at("name"), "fsLockManager");
    EXPECT_EQ(cfg.at("lockDirectory"), "/var/lock/lh");
    EXPECT_EQ(cfg.at("domain"), "wiki");
    EXPECT_EQ(built.load(), 0);
    EXPECT_FALSE(registry.is_instantiated("fsLockManager"));
}

TEST_F(LockManagerRegistryTest, NamesKeepRegistrationOrder)
{
    LockManagerRegistry registry("wiki",
                                 nlohmann::json::array({{{"name", "zeta"}, {"class", "NullLockManager"}},
                                                        {{"name", "alpha"}, {"class", "NullLockManager"}},
                                                        {{"name", "mid"}, {"class", "NullLockManager"}}}),
                                 deps_);
    EXPECT_THAT(registry.names(), ElementsAre("zeta", "alpha", "mid"));
    EXPECT_TRUE(registry.has("alpha"));
    EXPECT_FALSE(registry.has("beta"));
    EXPECT_EQ(registry.domain(), "wiki");
}

// ============================================================================
// Validation
// ============================================================================

TEST_F(LockManagerRegistryTest, InvalidRecordsAreRejected)
{
    EXPECT_THROW(LockManagerRegistry("wiki", nlohmann::json::object(), deps_), ConfigError);
    EXPECT_THROW(LockManagerRegistry("wiki", nlohmann::json::array({{{"class", "NullLockManager"}}}),
                                     deps_),
                 ConfigError);
    EXPECT_THROW(LockManagerRegistry("wiki",
                                     nlohmann::json::array({{{"name", "x"}, {"class", "RedisLockManager"}}}),
                                     deps_),
                 ConfigError);
    EXPECT_THROW(LockManagerRegistry("wiki", nlohmann::json::array({42}), deps_), ConfigError);
}

TEST_F(LockManagerRegistryTest, DuplicateNamesRejectedByDefault)
{
    const auto records =
        nlohmann::json::array({{{"name", "x"}, {"class", "NullLockManager"}},
                               {{"name", "x"}, {"class", "FSLockManager"}, {"lockDirectory", "/tmp"}}});
    try
    {
        LockManagerRegistry registry("wiki", records, deps_);
        FAIL() << "expected ConfigError";
    }
    catch (const ConfigError &e)
    {
        EXPECT_THAT(e.what(), HasSubstr("duplicate"));
    }
}

TEST_F(LockManagerRegistryTest, DuplicateNamesLastWins)
{
    const auto records = nlohmann::json::array(
        {{{"name", "x"}, {"class", "NullLockManager"}},
         {{"name", "y"}, {"class", "NullLockManager"}},
         {{"name", "x"}, {"class", "FSLockManager"}, {"lockDirectory", "/tmp/lh"}}});
    RegistryOptions options;
    options.duplicates = DuplicateNamePolicy::LastWins;
    LockManagerRegistry registry("wiki", records, deps_, options);

    EXPECT_THAT(registry.names(), ElementsAre("x", "y"));
    EXPECT_EQ(registry.config("x").at("class"), "FSLockManager");
}

// ============================================================================
// Dependency injection
// ============================================================================

TEST_F(LockManagerRegistryTest, InjectsWhatEachKindNeeds)
{
    LockManagerRegistry registry(
        "wiki",
        nlohmann::json::array({{{"name", "db"}, {"class", "PostgreSqlLockManager"}},
                               {{"name", "memc"}, {"class", "MemcLockManager"}},
                               {{"name", "fs"}, {"class", "FSLockManager"}, {"lockDirectory", "/tmp"}},
                               {{"name", "null"}, {"class", "NullLockManager"}}}),
        deps_, recording_options());

    const auto db = registry.get("db");
    const auto &db_settings = as_recording(db).settings();
    ASSERT_NE(db_settings.local_db_master, nullptr);
    EXPECT_EQ(db_settings.local_db_master->domain(), "wiki");
    EXPECT_EQ(db_settings.srv_cache, deps_.get_local_cache());
    EXPECT_EQ(db_settings.selector, "PostgreSqlLockManager");
    EXPECT_EQ(db->kind_name(), "PostgreSqlLockManager");

    const auto memc = registry.get("memc");
    EXPECT_EQ(as_recording(memc).settings().local_db_master, nullptr);
    EXPECT_EQ(as_recording(memc).settings().srv_cache, deps_.get_local_cache());

    for (const char *name : {"fs", "null"})
    {
        const auto &s = as_recording(registry.get(name)).settings();
        EXPECT_EQ(s.local_db_master, nullptr) << name;
        EXPECT_EQ(s.srv_cache, nullptr) << name;
    }

    for (const auto &name : registry.names())
    {
        const auto &s = as_recording(registry.get(name)).settings();
        EXPECT_EQ(s.logger.channel(), "LockManager") << name;
        EXPECT_EQ(s.params.at("domain"), "wiki") << name;
        EXPECT_EQ(s.domain, "wiki") << name;
        EXPECT_FALSE(s.params.contains("class")) << name;
    }
    EXPECT_EQ(connections_opened_, 1);
}

TEST_F(LockManagerRegistryTest, FailedConstructionIsRetried)
{
    bool refuse = true;
    ServiceDependencyProvider flaky(
        [&](const std::string &domain) -> std::shared_ptr<TransactionalConnection>
        {
            if (refuse)
                return nullptr;
            return std::make_shared<FakeSession>(server_, domain);
        });
    LockManagerRegistry registry(
        "wiki", nlohmann::json::array({{{"name", "default"}, {"class", "DBLockManager"}}}), flaky);

    EXPECT_THROW((void)registry.get("default"), ConstructionError);
    EXPECT_FALSE(registry.is_instantiated("default"));

    refuse = false;
    auto manager = registry.get("default");
    ASSERT_NE(manager, nullptr);
    EXPECT_EQ(manager->kind_name(), "DBLockManager");
    EXPECT_EQ(registry.get("default"), manager);
}

TEST_F(LockManagerRegistryTest, ImplementationErrorsPassThrough)
{
    // No lockDirectory: FSLockManager refuses to build.
    LockManagerRegistry registry(
        "wiki", nlohmann::json::array({{{"name", "fsLockManager"}, {"class", "FSLockManager"}}}),
        deps_);
    try
    {
        (void)registry.get("fsLockManager");
        FAIL() << "expected ConstructionError";
    }
    catch (const ConstructionError &e)
    {
        EXPECT_THAT(e.what(), HasSubstr("lockDirectory"));
    }
}

// ============================================================================
// get_default / get_any
// ============================================================================

TEST_F(LockManagerRegistryTest, DefaultAndAnyPreferDefaultEntry)
{
    LockManagerRegistry registry(
        "wiki",
        nlohmann::json::array({{{"name", "default"}, {"class", "DBLockManager"}},
                               {{"name", "fsLockManager"},
                                {"class", "FSLockManager"},
                                {"lockDirectory", lock_dir()}}}),
        deps_);

    auto by_default = registry.get_default();
    auto by_any = registry.get_any();
    EXPECT_EQ(by_default, registry.get("default"));
    EXPECT_EQ(by_any, by_default);
    EXPECT_EQ(by_default->kind_name(), "DBLockManager");

    auto fs_manager = registry.get("fsLockManager");
    EXPECT_EQ(fs_manager->kind_name(), "FSLockManager");
    EXPECT_NE(fs_manager, by_default);
    EXPECT_THROW((void)registry.get("nope"), NotFoundError);

    EXPECT_TRUE(by_default->lock({"Main_Page"}, LockType::Exclusive).ok());
    EXPECT_EQ(server_->holders("wiki:Main_Page"), 1u);
    EXPECT_TRUE(by_default->unlock({"Main_Page"}, LockType::Exclusive).ok());
}

TEST_F(LockManagerRegistryTest, DefaultFallsBackToNullManager)
{
    LockManagerRegistry registry("wiki",
                                 nlohmann::json::array({{{"name", "fsLockManager"},
                                                         {"class", "FSLockManager"},
                                                         {"lockDirectory", lock_dir()}}}),
                                 deps_);

    auto fallback = registry.get_default();
    ASSERT_NE(fallback, nullptr);
    EXPECT_EQ(fallback->kind_name(), "NullLockManager");
    EXPECT_EQ(fallback->domain(), "wiki");
    EXPECT_TRUE(fallback->lock({"a", "b"}, LockType::Exclusive).ok());
    EXPECT_TRUE(fallback->unlock({"a", "b"}, LockType::Exclusive).ok());
    EXPECT_FALSE(registry.has("default"));

    auto any = registry.get_any();
    EXPECT_EQ(any, registry.get("fsLockManager"));
    EXPECT_EQ(any->kind_name(), "FSLockManager");
}

TEST_F(LockManagerRegistryTest, AnyWithoutCandidatesIsNotFound)
{
    LockManagerRegistry registry(
        "wiki", nlohmann::json::array({{{"name", "other"}, {"class", "NullLockManager"}}}), deps_);
    EXPECT_THROW((void)registry.get_any(), NotFoundError);
    EXPECT_NE(registry.get_default(), nullptr);
    EXPECT_FALSE(registry.is_instantiated("other"));
}

// ============================================================================
// Concurrency
// ============================================================================

TEST_F(LockManagerRegistryTest, ConcurrentFirstResolutionBuildsOnce)
{
    constexpr int kThreads = 16;
    std::atomic<int> built{0};
    RegistryOptions options = recording_options();
    options.factories[LockManagerKind::Null] = [&built](const LockManagerSettings &settings)
    {
        built.fetch_add(1);
        std::this_thread::sleep_for(20ms);
        return std::make_shared<RecordingLockManager>(settings);
    };
    LockManagerRegistry registry(
        "wiki",
        nlohmann::json::array({{{"name", "shared"}, {"class", "NullLockManager"}},
                               {{"name", "other"}, {"class", "NullLockManager"}}}),
        deps_, options);

    std::vector<std::shared_ptr<LockManager>> seen(kThreads);
    ThreadRacer racer(kThreads);
    ASSERT_TRUE(racer.race([&](int i) { seen[static_cast<size_t>(i)] = registry.get("shared"); }));

    EXPECT_EQ(built.load(), 1);
    for (const auto &manager : seen)
    {
        EXPECT_EQ(manager, seen.front());
    }
}

TEST_F(LockManagerRegistryTest, ConcurrentResolutionOfDifferentNames)
{
    constexpr int kThreads = 8;
    std::atomic<int> built{0};
    std::vector<std::string> names;
    nlohmann::json records = nlohmann::json::array();
    for (int i = 0; i < 4; ++i)
    {
        names.push_back(fmt::format("m{}", i));
        records.push_back(nlohmann::json{{"name", names.back()}, {"class", "NullLockManager"}});
    }
    LockManagerRegistry registry("wiki", records, deps_, recording_options(&built));

    ThreadRacer racer(kThreads);
    ASSERT_TRUE(racer.race([&](int i)
                           { (void)registry.get(names[static_cast<size_t>(i) % names.size()]); }));
    EXPECT_EQ(built.load(), 4);
    for (const auto &name : names)
    {
        EXPECT_TRUE(registry.is_instantiated(name));
    }
}
