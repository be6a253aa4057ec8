#include "core/cache/TtlCache.hpp"
#include "support/TestHelpers.hpp"

#include <gtest/gtest.h>

#include <thread>

using namespace harbor::core;
using cache::TtlCache;
using cache::TtlCacheOptions;

namespace {

class FailingStore : public storage::MemoryStore {
public:
    bool write(const std::string&, const std::string&) override { return false; }
};

TtlCacheOptions smallCache(size_t maxEntries, std::chrono::milliseconds ttl = std::chrono::minutes(5)) {
    TtlCacheOptions options;
    options.maxEntries = maxEntries;
    options.ttl = ttl;
    options.keyPrefix = "test.";
    return options;
}

} // namespace

TEST(TtlCacheTest, SetThenGetReturnsValue) {
    auto store = std::make_shared<storage::MemoryStore>();
    TtlCache<std::string> cache(store, smallCache(10));

    cache.set("k", "v");

    auto value = cache.get("k");
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, "v");
    EXPECT_EQ(cache.hitCount(), 1u);
    EXPECT_FALSE(cache.get("other").has_value());
    EXPECT_EQ(cache.missCount(), 1u);
}

TEST(TtlCacheTest, DefaultsMatchDocumentedValues) {
    TtlCacheOptions options;
    EXPECT_EQ(options.ttl, std::chrono::minutes(5));
    EXPECT_EQ(options.maxEntries, 50u);
}

TEST(TtlCacheTest, ExpiredEntryIsNotReturnedFromEitherTier) {
    auto store = std::make_shared<storage::MemoryStore>();
    TtlCache<int> cache(store, smallCache(10));

    cache.set("short", 1, std::chrono::milliseconds(30));
    ASSERT_TRUE(store->read("test.short").has_value());

    std::this_thread::sleep_for(std::chrono::milliseconds(60));

    EXPECT_FALSE(cache.get("short").has_value());
    EXPECT_FALSE(store->read("test.short").has_value());
}

TEST(TtlCacheTest, EvictsOldestWriteBeyondMaxEntries) {
    auto store = std::make_shared<storage::MemoryStore>();
    TtlCache<int> cache(store, smallCache(3));

    cache.set("a", 1);
    cache.set("b", 2);
    cache.set("c", 3);
    cache.set("d", 4);

    EXPECT_EQ(cache.size(), 3u);
    EXPECT_FALSE(cache.get("a").has_value());
    EXPECT_EQ(cache.get("b").value_or(0), 2);
    EXPECT_EQ(cache.get("d").value_or(0), 4);

    // Not resurrected from the durable tier
    EXPECT_FALSE(store->read("test.a").has_value());
}

TEST(TtlCacheTest, RewritingKeyRefreshesItsAge) {
    auto store = std::make_shared<storage::MemoryStore>();
    TtlCache<int> cache(store, smallCache(2));

    cache.set("a", 1);
    cache.set("b", 2);
    cache.set("a", 10);
    cache.set("c", 3);

    EXPECT_EQ(cache.get("a").value_or(0), 10);
    EXPECT_FALSE(cache.get("b").has_value());
}

TEST(TtlCacheTest, DurableTierServesNewInstance) {
    auto store = std::make_shared<storage::MemoryStore>();
    {
        TtlCache<uint64_t> writer(store, smallCache(10));
        writer.set("https://cdn/x", 1234);
    }

    TtlCache<uint64_t> reader(store, smallCache(10));
    EXPECT_EQ(reader.size(), 0u);

    auto value = reader.get("https://cdn/x");
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, 1234u);
    EXPECT_EQ(reader.size(), 1u);
}

TEST(TtlCacheTest, CorruptDurableEntryIsDiscarded) {
    auto store = std::make_shared<storage::MemoryStore>();
    store->write("test.bad", "{not json");

    TtlCache<int> cache(store, smallCache(10));

    EXPECT_FALSE(cache.get("bad").has_value());
    EXPECT_FALSE(store->read("test.bad").has_value());
}

TEST(TtlCacheTest, ClearRemovesOnlyPrefixedDurableKeys) {
    auto store = std::make_shared<storage::MemoryStore>();
    store->write("downloads", "[]");
    store->write("test.stale", R"({"data":1,"timestamp":0,"ttl":1})");

    TtlCache<int> cache(store, smallCache(10));
    cache.set("a", 1);
    cache.clear();

    EXPECT_EQ(cache.size(), 0u);
    EXPECT_FALSE(cache.get("a").has_value());
    EXPECT_FALSE(store->read("test.stale").has_value());
    EXPECT_TRUE(store->read("downloads").has_value());
}

TEST(TtlCacheTest, DurableWriteFailureDoesNotFailSet) {
    auto store = std::make_shared<FailingStore>();
    TtlCache<std::string> cache(store, smallCache(10));

    EXPECT_NO_THROW(cache.set("k", "v"));
    EXPECT_EQ(cache.get("k").value_or(""), "v");
}

TEST(TtlCacheTest, WorksWithoutDurableStore) {
    TtlCache<int> cache(nullptr, smallCache(1));

    cache.set("a", 1);
    cache.set("b", 2);

    EXPECT_FALSE(cache.get("a").has_value());
    EXPECT_EQ(cache.get("b").value_or(0), 2);
}
