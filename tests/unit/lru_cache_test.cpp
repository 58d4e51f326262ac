#include <speakml/cache/lru_cache.h>
#include <gtest/gtest.h>
#include <string>

using speakml::cache::LruCache;

TEST(LruCache, GetMissingReturnsNullopt) {
    LruCache<std::string, int> cache(2);
    EXPECT_FALSE(cache.get("a").has_value());
    EXPECT_FALSE(cache.has("a"));
    EXPECT_TRUE(cache.empty());
}

TEST(LruCache, SetThenGet) {
    LruCache<std::string, int> cache(2);
    cache.set("a", 1);
    EXPECT_TRUE(cache.has("a"));
    EXPECT_EQ(cache.get("a").value(), 1);
    EXPECT_EQ(cache.size(), 1u);
}

TEST(LruCache, SetExistingUpdatesValueWithoutGrowing) {
    LruCache<std::string, int> cache(2);
    cache.set("a", 1);
    cache.set("a", 5);
    EXPECT_EQ(cache.size(), 1u);
    EXPECT_EQ(cache.get("a").value(), 5);
}

TEST(LruCache, EvictsLeastRecentlyUsed) {
    LruCache<std::string, int> cache(2);
    cache.set("a", 1);
    cache.set("b", 2);
    cache.set("c", 3);
    EXPECT_FALSE(cache.has("a"));
    EXPECT_TRUE(cache.has("b"));
    EXPECT_TRUE(cache.has("c"));
    EXPECT_EQ(cache.size(), 2u);
}

TEST(LruCache, GetRefreshesRecency) {
    LruCache<std::string, int> cache(2);
    cache.set("a", 1);
    cache.set("b", 2);
    ASSERT_TRUE(cache.get("a").has_value());
    cache.set("c", 3);
    EXPECT_TRUE(cache.has("a"));
    EXPECT_FALSE(cache.has("b"));
}

TEST(LruCache, HasRefreshesRecency) {
    LruCache<std::string, int> cache(2);
    cache.set("a", 1);
    cache.set("b", 2);
    EXPECT_TRUE(cache.has("a"));
    cache.set("c", 3);
    EXPECT_EQ(cache.get("a").value(), 1);
    EXPECT_FALSE(cache.get("b").has_value());
}

TEST(LruCache, SetRefreshesRecency) {
    LruCache<std::string, int> cache(2);
    cache.set("a", 1);
    cache.set("b", 2);
    cache.set("a", 10);
    cache.set("c", 3);
    EXPECT_EQ(cache.get("a").value(), 10);
    EXPECT_FALSE(cache.has("b"));
}

TEST(LruCache, ZeroCapacityStoresNothing) {
    LruCache<std::string, int> cache(0);
    cache.set("a", 1);
    EXPECT_FALSE(cache.has("a"));
    EXPECT_EQ(cache.size(), 0u);
}

TEST(LruCache, ClearEmptiesCache) {
    LruCache<int, std::string> cache(3);
    cache.set(1, "one");
    cache.set(2, "two");
    cache.clear();
    EXPECT_TRUE(cache.empty());
    EXPECT_FALSE(cache.has(1));
    EXPECT_EQ(cache.capacity(), 3u);
}
