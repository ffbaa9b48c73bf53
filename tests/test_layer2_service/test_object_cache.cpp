/**
 * @file test_object_cache.cpp
 * @brief Layer 2 tests for HashObjectCache.
 *
 * Expiry is driven by an injected clock, so no test sleeps.
 */
#include "lkh_service.hpp"
#include "shared_test_helpers.h"
#include <gtest/gtest.h>

#include <chrono>

using namespace lockhub::utils;
using namespace lockhub::tests::helper;
using namespace std::chrono_literals;

class HashObjectCacheTest : public ::testing::Test
{
  protected:
    HashObjectCache::Clock::time_point now_{HashObjectCache::Clock::now()};
    HashObjectCache cache_{[this] { return now_; }};

    void advance(std::chrono::seconds s) { now_ += s; }
};

TEST_F(HashObjectCacheTest, GetMissingReturnsNullopt)
{
    EXPECT_FALSE(cache_.get("absent").has_value());
}

TEST_F(HashObjectCacheTest, SetThenGet)
{
    cache_.set("k", "v");
    ASSERT_TRUE(cache_.get("k").has_value());
    EXPECT_EQ(*cache_.get("k"), "v");
    cache_.set("k", "w");
    EXPECT_EQ(*cache_.get("k"), "w");
}

TEST_F(HashObjectCacheTest, EntryExpiresAfterTtl)
{
    cache_.set("k", "v", 10s);
    advance(9s);
    EXPECT_TRUE(cache_.get("k").has_value());
    advance(1s);
    EXPECT_FALSE(cache_.get("k").has_value());
}

TEST_F(HashObjectCacheTest, ZeroTtlNeverExpires)
{
    cache_.set("k", "v", 0s);
    advance(std::chrono::hours(24 * 365));
    EXPECT_TRUE(cache_.get("k").has_value());
}

TEST_F(HashObjectCacheTest, AddOnlyStoresWhenAbsent)
{
    EXPECT_TRUE(cache_.add("k", "first", 5s));
    EXPECT_FALSE(cache_.add("k", "second", 5s));
    EXPECT_EQ(*cache_.get("k"), "first");

    advance(5s);
    EXPECT_TRUE(cache_.add("k", "third"));
    EXPECT_EQ(*cache_.get("k"), "third");
}

TEST_F(HashObjectCacheTest, EraseReportsLiveEntriesOnly)
{
    cache_.set("live", "1");
    cache_.set("stale", "1", 1s);
    advance(2s);
    EXPECT_TRUE(cache_.erase("live"));
    EXPECT_FALSE(cache_.erase("live"));
    EXPECT_FALSE(cache_.erase("stale"));
}

TEST_F(HashObjectCacheTest, IncrCreatesAndAccumulates)
{
    EXPECT_EQ(cache_.incr("n", 1), 1);
    EXPECT_EQ(cache_.incr("n", 2), 3);
    EXPECT_EQ(cache_.incr("n", -3), 0);
    EXPECT_EQ(*cache_.get("n"), "0");
}

TEST_F(HashObjectCacheTest, IncrReplacesNonInteger)
{
    cache_.set("n", "not-a-number");
    EXPECT_EQ(cache_.incr("n", 5), 5);
}

TEST_F(HashObjectCacheTest, IncrWithTtlRefreshesExpiry)
{
    cache_.incr("n", 1, 10s);
    advance(8s);
    cache_.incr("n", 1, 10s);
    advance(8s);
    ASSERT_TRUE(cache_.get("n").has_value());
    EXPECT_EQ(*cache_.get("n"), "2");

    // Zero ttl keeps the current expiry.
    cache_.incr("n", 1);
    advance(2s);
    EXPECT_FALSE(cache_.get("n").has_value());
    EXPECT_EQ(cache_.incr("n", 1), 1);
}

TEST_F(HashObjectCacheTest, DecrNeverCreatesAndStopsAtZero)
{
    EXPECT_FALSE(cache_.decr("n", 1).has_value());
    EXPECT_FALSE(cache_.get("n").has_value());

    cache_.incr("n", 2, 10s);
    EXPECT_EQ(cache_.decr("n", 1), 1);
    EXPECT_EQ(cache_.decr("n", 5), 0);
    EXPECT_EQ(*cache_.get("n"), "0");

    advance(10s);
    EXPECT_FALSE(cache_.decr("n", 1).has_value());
    EXPECT_FALSE(cache_.get("n").has_value());

    cache_.set("text", "abc");
    EXPECT_FALSE(cache_.decr("text", 1).has_value());
    EXPECT_EQ(*cache_.get("text"), "abc");
}

TEST_F(HashObjectCacheTest, SizeCountsLiveEntriesAndClearEmpties)
{
    cache_.set("a", "1");
    cache_.set("b", "1", 1s);
    EXPECT_EQ(cache_.size(), 2u);
    advance(1s);
    EXPECT_EQ(cache_.size(), 1u);
    cache_.clear();
    EXPECT_EQ(cache_.size(), 0u);
}

TEST(HashObjectCacheConcurrencyTest, AddHasExactlyOneWinner)
{
    HashObjectCache cache;
    std::atomic<int> winners{0};
    ThreadRacer racer(16);
    ASSERT_TRUE(racer.race(
        [&](int i)
        {
            if (cache.add("contended", std::to_string(i), 60s))
                winners.fetch_add(1);
        }));
    EXPECT_EQ(winners.load(), 1);
}

TEST(HashObjectCacheConcurrencyTest, IncrIsAtomic)
{
    HashObjectCache cache;
    constexpr int kThreads = 8;
    constexpr int kPerThread = 500;
    ThreadRacer racer(kThreads);
    ASSERT_TRUE(racer.race(
        [&](int)
        {
            for (int i = 0; i < kPerThread; ++i)
                cache.incr("counter", 1);
        }));
    EXPECT_EQ(*cache.get("counter"), std::to_string(kThreads * kPerThread));
}
