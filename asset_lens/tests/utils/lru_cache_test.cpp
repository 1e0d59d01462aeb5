#include "utils/cache/lru_cache.hpp"

#include <gtest/gtest.h>

#include <string>

namespace assetlens {
TEST(LRUCacheTest, RecordAccess_Full_EvictsLeastRecentlyUsed) {
  LRUCache<std::string, int> cache(2);
  EXPECT_FALSE(cache.RecordAccess("a", 1).has_value());
  EXPECT_FALSE(cache.RecordAccess("b", 2).has_value());

  // Touch "a" so "b" becomes the oldest
  EXPECT_EQ(cache.AccessElement("a"), 1);
  auto evicted = cache.RecordAccess("c", 3);
  ASSERT_TRUE(evicted.has_value());
  EXPECT_EQ(*evicted, "b");
  EXPECT_TRUE(cache.Contains("a"));
  EXPECT_FALSE(cache.Contains("b"));
}

TEST(LRUCacheTest, RemoveRecord_AndFlush) {
  LRUCache<std::string, int> cache(4);
  cache.RecordAccess("a", 1);
  cache.RecordAccess("b", 2);
  cache.RemoveRecord("a");
  EXPECT_EQ(cache.Size(), 1u);
  cache.Flush();
  EXPECT_EQ(cache.Size(), 0u);
  EXPECT_FALSE(cache.AccessElement("b").has_value());
}
};  // namespace assetlens
