#include "cache/LRUCache.hpp"
#include "cache/listing_cache.h"
#include "test_helpers.h"
#include <gtest/gtest.h>
#include <string>

using namespace treescout;
using treescout::testing::FakeClock;

TEST(LRUCacheTest, PutGetAndEvictLeastRecent) {
    datastructures::LRUCache<std::string, int> cache(2);
    cache.Put("a", 1);
    cache.Put("b", 2);
    ASSERT_EQ(cache.Get("a").value_or(0), 1);// "a" is now most recent

    cache.Put("c", 3);
    EXPECT_FALSE(cache.Contains("b"));
    EXPECT_TRUE(cache.Contains("a"));
    EXPECT_TRUE(cache.Contains("c"));
    EXPECT_EQ(cache.Size(), 2u);
    EXPECT_EQ(cache.GetKeys(), (std::vector<std::string>{"c", "a"}));
}

TEST(LRUCacheTest, PutReplacesExistingValue) {
    datastructures::LRUCache<std::string, int> cache(2);
    cache.Put("a", 1);
    cache.Put("a", 5);
    EXPECT_EQ(cache.Size(), 1u);
    EXPECT_EQ(cache.Get("a").value_or(0), 5);
    EXPECT_TRUE(cache.Remove("a"));
    EXPECT_FALSE(cache.Remove("a"));
}

TEST(LRUCacheTest, ShrinkingCapacityEvicts) {
    datastructures::LRUCache<int, int> cache(3);
    cache.Put(1, 1);
    cache.Put(2, 2);
    cache.Put(3, 3);
    cache.setCacheCapacity(1);
    EXPECT_EQ(cache.Size(), 1u);
    EXPECT_TRUE(cache.Contains(3));
}

TEST(LRUCacheTest, EntriesExpireAfterTtl) {
    FakeClock clock;
    datastructures::LRUCache<std::string, int> cache(4, std::chrono::milliseconds(100), clock.fn());
    cache.Put("a", 1);
    cache.Put("b", 2, std::chrono::milliseconds(1000));

    clock.advance(std::chrono::milliseconds(99));
    EXPECT_TRUE(cache.HasKey("a"));

    clock.advance(std::chrono::milliseconds(1));
    EXPECT_FALSE(cache.HasKey("a"));
    EXPECT_TRUE(cache.Contains("a"));
    EXPECT_FALSE(cache.Get("a").has_value());
    EXPECT_FALSE(cache.Contains("a"));
    EXPECT_EQ(cache.Get("b").value_or(0), 2);

    clock.advance(std::chrono::seconds(1));
    EXPECT_EQ(cache.CleanUpExpiredItems(), 1u);
    EXPECT_EQ(cache.Size(), 0u);
}

TEST(ListingCacheTest, KeyIsDeterministicAndNormalised) {
    scanner::ScanOptions options;
    options.extensions = {"TXT", ".md"};
    scanner::ScanOptions reordered;
    reordered.extensions = {".md", ".txt", "txt"};

    auto key = cache::ListingCache::make_key("/tmp/data", options, {});
    EXPECT_EQ(key.size(), 16u);
    EXPECT_EQ(key, cache::ListingCache::make_key("/tmp/data/", reordered, {}));
    EXPECT_EQ(key, cache::ListingCache::make_key("/tmp/./data", options, {}));
}

TEST(ListingCacheTest, KeyDistinguishesFiltersAndSort) {
    scanner::ScanOptions base;
    auto key = cache::ListingCache::make_key("/tmp/data", base, {});

    scanner::ScanOptions deeper = base;
    deeper.max_depth = 2;
    scanner::ScanOptions hidden = base;
    hidden.include_hidden = true;
    scanner::ScanOptions files = base;
    files.files_only = true;
    scanner::ScanOptions filtered = base;
    filtered.extensions = {".py"};

    EXPECT_NE(key, cache::ListingCache::make_key("/tmp/other", base, {}));
    EXPECT_NE(key, cache::ListingCache::make_key("/tmp/data", deeper, {}));
    EXPECT_NE(key, cache::ListingCache::make_key("/tmp/data", hidden, {}));
    EXPECT_NE(key, cache::ListingCache::make_key("/tmp/data", files, {}));
    EXPECT_NE(key, cache::ListingCache::make_key("/tmp/data", filtered, {}));
    EXPECT_NE(key, cache::ListingCache::make_key("/tmp/data", base, {scanner::SortKey::Size, scanner::SortOrder::Asc}));
    EXPECT_NE(key, cache::ListingCache::make_key("/tmp/data", base, {scanner::SortKey::Name, scanner::SortOrder::Desc}));
}

class ListingCacheScanTest : public ::testing::Test {
protected:
    ListingCacheScanTest() : cache(4, std::chrono::milliseconds(1000), clock.fn()) {}

    cache::ListingCache::ScanFn counting_scan(scanner::PartialReason reason = scanner::PartialReason::None) {
        return [this, reason] {
            ++scans;
            scanner::Listing listing;
            listing.directory = "/tmp/data";
            listing.partial_reason = reason;
            listing.entries.resize(3);
            return listing;
        };
    }

    FakeClock clock;
    cache::ListingCache cache;
    int scans = 0;
};

TEST_F(ListingCacheScanTest, SecondCallIsServedFromCache) {
    bool hit = true;
    auto first = cache.get_or_scan("k", true, counting_scan(), &hit);
    EXPECT_FALSE(hit);
    auto second = cache.get_or_scan("k", true, counting_scan(), &hit);
    EXPECT_TRUE(hit);

    EXPECT_EQ(scans, 1);
    EXPECT_EQ(first.get(), second.get());
    EXPECT_EQ(cache.hits(), 1u);
    EXPECT_EQ(cache.misses(), 1u);
}

TEST_F(ListingCacheScanTest, BypassRescansAndRefreshes) {
    auto first = cache.get_or_scan("k", true, counting_scan());
    auto bypass = cache.get_or_scan("k", false, counting_scan());
    EXPECT_EQ(scans, 2);
    EXPECT_NE(first.get(), bypass.get());
    EXPECT_EQ(cache.get("k").get(), bypass.get());
}

TEST_F(ListingCacheScanTest, PartialListingIsNotStored) {
    cache.get_or_scan("k", true, counting_scan(scanner::PartialReason::Memory));
    EXPECT_EQ(cache.size(), 0u);
    cache.get_or_scan("k", true, counting_scan(scanner::PartialReason::Memory));
    EXPECT_EQ(scans, 2);
}

TEST_F(ListingCacheScanTest, ExpiredEntryIsRescanned) {
    cache.get_or_scan("k", true, counting_scan());
    clock.advance(std::chrono::milliseconds(1001));
    bool hit = true;
    cache.get_or_scan("k", true, counting_scan(), &hit);
    EXPECT_FALSE(hit);
    EXPECT_EQ(scans, 2);
}
