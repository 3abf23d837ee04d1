// Tests for the namespaced TTL cache.
#include "avlink/test_hooks.h"

#include <gtest/gtest.h>

#include <chrono>
#include <string>

using namespace std::chrono_literals;

TEST(CacheTest, StoresAndReturnsValues) {
  avlink::CacheManager cache;
  cache.Set("meters", "ZoneGain_0", -20.0, 1000ms);
  cache.Set("meters", "ZoneName_0", std::string("Bar"), 1000ms);

  auto gain = cache.Get("meters", "ZoneGain_0");
  ASSERT_TRUE(gain.has_value());
  EXPECT_DOUBLE_EQ(std::get<double>(*gain), -20.0);

  auto name = cache.Get("meters", "ZoneName_0");
  ASSERT_TRUE(name.has_value());
  EXPECT_EQ(std::get<std::string>(*name), "Bar");

  EXPECT_FALSE(cache.Get("meters", "Missing").has_value());
}

TEST(CacheTest, EntriesExpireAfterTtl) {
  avlink::CacheManager cache;
  const auto before = std::chrono::steady_clock::now();
  cache.Set("ns", "key", 1.0, 500ms);

  EXPECT_TRUE(avlink::test::CacheGetAt(cache, "ns", "key", before + 100ms).has_value());
  EXPECT_FALSE(avlink::test::CacheGetAt(cache, "ns", "key", before + 2s).has_value());
}

TEST(CacheTest, NonPositiveTtlExpiresImmediately) {
  avlink::CacheManager cache;
  cache.Set("ns", "key", 1.0, 0ms);
  EXPECT_FALSE(cache.Get("ns", "key").has_value());
}

TEST(CacheTest, WriteReplacesPreviousEntry) {
  avlink::CacheManager cache;
  cache.Set("ns", "key", 1.0, 1000ms);
  cache.Set("ns", "key", 2.0, 1000ms);
  auto value = cache.Get("ns", "key");
  ASSERT_TRUE(value.has_value());
  EXPECT_DOUBLE_EQ(std::get<double>(*value), 2.0);
}

TEST(CacheTest, NamespacesAreIndependent) {
  avlink::CacheManager cache;
  cache.Set("telemetry", "key", 1.0, 1000ms);
  cache.Set("other", "key", 2.0, 1000ms);

  EXPECT_EQ(cache.ClearNamespace("telemetry"), 1u);
  EXPECT_FALSE(cache.Get("telemetry", "key").has_value());

  auto other = cache.Get("other", "key");
  ASSERT_TRUE(other.has_value());
  EXPECT_DOUBLE_EQ(std::get<double>(*other), 2.0);
}

TEST(CacheTest, EraseAndPurge) {
  avlink::CacheManager cache;
  cache.Set("ns", "keep", 1.0, 60000ms);
  cache.Set("ns", "drop", 1.0, 60000ms);
  cache.Set("ns", "expired", 1.0, 0ms);

  EXPECT_TRUE(cache.Erase("ns", "drop"));
  EXPECT_FALSE(cache.Erase("ns", "drop"));
  EXPECT_EQ(cache.Purge(), 1u);
  EXPECT_EQ(cache.GetStats().entries, 1u);
}

TEST(CacheTest, EntryCarriesTimestamps) {
  avlink::CacheManager cache;
  cache.Set("ns", "key", 3.0, 1500ms);
  auto entry = cache.GetEntry("ns", "key");
  ASSERT_TRUE(entry.has_value());
  EXPECT_EQ(entry->expires_at - entry->stored_at, std::chrono::milliseconds(1500));
}

TEST(CacheTest, StatsCountHitsAndMisses) {
  avlink::CacheManager cache;
  cache.Set("ns", "key", 1.0, 1000ms);
  cache.Get("ns", "key");
  cache.Get("ns", "key");
  cache.Get("ns", "absent");

  const avlink::CacheStats stats = cache.GetStats();
  EXPECT_EQ(stats.sets, 1u);
  EXPECT_EQ(stats.hits, 2u);
  EXPECT_EQ(stats.misses, 1u);
}
