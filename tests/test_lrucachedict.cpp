// tests/test_lrucachedict.cpp
#include <atomic>
#include <chrono>
#include <ctime>
#include <limits>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "gtest/gtest.h"
#include "gmock/gmock.h"

#include "TestMocks.hpp"
#include "../src/cache/LruCacheDict.hpp"
#include "../src/codec/MsgPackCodec.hpp"
#include "../src/config/AppConfig.hpp"
#include "../src/store/InMemoryStore.hpp"

using testing::_;
using testing::NiceMock;
using testing::Return;
using testing::Throw;

class LruCacheDictTest : public ::testing::Test {
protected:
    std::shared_ptr<InMemoryStore> store = std::make_shared<InMemoryStore>();
    std::shared_ptr<NiceMock<MockLogger>> logger = std::make_shared<NiceMock<MockLogger>>();

    std::unique_ptr<LruCacheDict> makeCache(std::size_t max_size, int ttl, const std::string& ns = "test") {
        CacheOptions options;
        options.key_namespace = ns;
        options.max_size = max_size;
        options.default_ttl = ttl;
        return std::make_unique<LruCacheDict>(store, options, logger);
    }
};

TEST_F(LruCacheDictTest, SetThenGetReturnsValue) {
    auto cache = makeCache(3, 2);
    cache->set("a", "aaa");
    EXPECT_EQ(cache->get("a"), json("aaa"));

    json structured = {{"content_type", "text/html; charset=UTF-8"}, {"sizes", {1, 2, 3}}};
    cache->set("b", structured);
    EXPECT_EQ(cache->get("b"), structured);
}

TEST_F(LruCacheDictTest, GetMissingKeyThrowsKeyNotFound) {
    auto cache = makeCache(3, 2);
    EXPECT_THROW(cache->get("nope"), KeyNotFound);
    EXPECT_EQ(cache->getOr("nope", json(42)), json(42));
}

TEST_F(LruCacheDictTest, FourthInsertEvictsOldest) {
    auto cache = makeCache(3, 2);
    cache->set("a", "aaa");
    cache->set("b", "bbb");
    cache->set("c", "ccc");
    auto evicted = cache->set("d", "ddd");

    EXPECT_EQ(evicted, std::vector<std::string>{"a"});
    EXPECT_EQ(cache->get("b"), json("bbb"));
    EXPECT_EQ(cache->get("c"), json("ccc"));
    EXPECT_EQ(cache->get("d"), json("ddd"));
    EXPECT_THROW(cache->get("a"), KeyNotFound);
    EXPECT_EQ(cache->size(), 3u);
}

TEST_F(LruCacheDictTest, GetRefreshesRecency) {
    auto cache = makeCache(3, 0);
    cache->set("a", 1);
    cache->set("b", 2);
    cache->set("c", 3);
    cache->get("a");
    cache->set("d", 4);

    EXPECT_TRUE(cache->contains("a"));
    EXPECT_FALSE(cache->contains("b"));
    EXPECT_EQ(cache->keys(), (std::vector<std::string>{"c", "a", "d"}));
}

TEST_F(LruCacheDictTest, ContainsDoesNotRefreshRecency) {
    auto cache = makeCache(3, 0);
    cache->set("a", 1);
    cache->set("b", 2);
    cache->set("c", 3);
    EXPECT_TRUE(cache->contains("a"));
    cache->set("d", 4);

    EXPECT_FALSE(cache->contains("a"));
}

TEST_F(LruCacheDictTest, RetainsMostRecentlyAccessedKeys) {
    const std::size_t max_size = 5;
    auto cache = makeCache(max_size, 0);
    std::vector<std::string> written;
    for (int i = 0; i < 40; ++i) {
        std::string key = "k" + std::to_string(i);
        cache->set(key, i);
        written.push_back(key);
        // Re-read an older key every few writes so recency differs from insertion order
        if (i % 7 == 6) {
            std::string touched = written[written.size() - 3];
            cache->get(touched);
            written.erase(written.end() - 3);
            written.push_back(touched);
        }
        ASSERT_LE(cache->size(), max_size);
    }

    std::vector<std::string> expected(written.end() - max_size, written.end());
    EXPECT_EQ(cache->keys(), expected);
}

TEST_F(LruCacheDictTest, OverwriteDoesNotGrow) {
    auto cache = makeCache(2, 0);
    cache->set("a", "old");
    cache->set("a", "new");
    cache->set("b", "other");

    EXPECT_EQ(cache->size(), 2u);
    EXPECT_EQ(cache->get("a"), json("new"));
}

TEST_F(LruCacheDictTest, EntryExpiresAfterTtl) {
    auto cache = makeCache(3, 3);
    cache->set("foo", "bar");
    EXPECT_EQ(cache->get("foo"), json("bar"));

    std::this_thread::sleep_for(std::chrono::seconds(4));

    EXPECT_THROW(cache->get("foo"), KeyNotFound);
}

TEST_F(LruCacheDictTest, ExplicitTtlOverridesDefault) {
    auto cache = makeCache(3, 900);
    cache->set("short", 1, 10);
    cache->set("forever", 2, 0);
    cache->set("default", 3);

    auto short_ttl = cache->timeToLive("short");
    ASSERT_TRUE(short_ttl.has_value());
    EXPECT_LE(*short_ttl, 10);
    EXPECT_FALSE(cache->timeToLive("forever").has_value());
    auto default_ttl = cache->timeToLive("default");
    ASSERT_TRUE(default_ttl.has_value());
    EXPECT_GT(*default_ttl, 10);
}

TEST_F(LruCacheDictTest, OnWriteModeDoesNotExtendOnRead) {
    auto cache = makeCache(3, 2);
    cache->set("a", 1);
    std::this_thread::sleep_for(std::chrono::milliseconds(1200));
    EXPECT_EQ(cache->get("a"), json(1));
    std::this_thread::sleep_for(std::chrono::milliseconds(1200));
    EXPECT_THROW(cache->get("a"), KeyNotFound);
}

TEST_F(LruCacheDictTest, OnAccessModeRestartsTtlOnRead) {
    CacheOptions options;
    options.key_namespace = "access";
    options.max_size = 3;
    options.default_ttl = 2;
    options.expiration_mode = ExpirationMode::OnAccess;
    LruCacheDict cache(store, options, logger);

    cache.set("a", 1);
    std::this_thread::sleep_for(std::chrono::milliseconds(1200));
    EXPECT_EQ(cache.get("a"), json(1));
    std::this_thread::sleep_for(std::chrono::milliseconds(1200));
    EXPECT_EQ(cache.get("a"), json(1));
}

TEST_F(LruCacheDictTest, OnAccessModeRestartsEntryOwnTtl) {
    CacheOptions options;
    options.key_namespace = "access";
    options.max_size = 3;
    options.default_ttl = 900;
    options.expiration_mode = ExpirationMode::OnAccess;
    LruCacheDict cache(store, options, logger);

    cache.set("short", 1, 10);
    cache.set("forever", 2, 0);
    EXPECT_EQ(cache.get("short"), json(1));
    EXPECT_EQ(cache.get("forever"), json(2));

    auto short_ttl = cache.timeToLive("short");
    ASSERT_TRUE(short_ttl.has_value());
    EXPECT_LE(*short_ttl, 10);
    EXPECT_FALSE(cache.timeToLive("forever").has_value());
}

TEST_F(LruCacheDictTest, OnAccessModeRestartsExplicitTtlWithoutDefault) {
    CacheOptions options;
    options.key_namespace = "access";
    options.max_size = 3;
    options.default_ttl = 0;
    options.expiration_mode = ExpirationMode::OnAccess;
    LruCacheDict cache(store, options, logger);

    cache.set("a", 1, 2);
    std::this_thread::sleep_for(std::chrono::milliseconds(1200));
    EXPECT_EQ(cache.get("a"), json(1));
    std::this_thread::sleep_for(std::chrono::milliseconds(1200));
    EXPECT_EQ(cache.get("a"), json(1));
}

TEST_F(LruCacheDictTest, NonFiniteValueThrowsSerializationError) {
    auto cache = makeCache(3, 0);
    EXPECT_THROW(cache->set("nan", std::numeric_limits<double>::quiet_NaN()), SerializationError);
    EXPECT_THROW(cache->set("inf", json{{"x", -std::numeric_limits<double>::infinity()}}), SerializationError);
    EXPECT_FALSE(cache->contains("nan"));
    EXPECT_FALSE(cache->contains("inf"));
}

TEST_F(LruCacheDictTest, ExpireOnUsesTimeOfDay) {
    std::time_t now = std::time(nullptr);
    std::tm local{};
    localtime_r(&now, &local);

    CacheOptions options;
    options.key_namespace = "daily";
    options.max_size = 3;
    options.default_ttl = 5;
    options.expire_on = TimeOfDay{(local.tm_hour + 2) % 24, local.tm_min, local.tm_sec};
    LruCacheDict cache(store, options, logger);

    cache.set("a", 1);
    auto ttl = cache.timeToLive("a");
    ASSERT_TRUE(ttl.has_value());
    // Roughly two hours, give or take DST shifts and the second that may tick
    EXPECT_GT(*ttl, 3600);
    EXPECT_LE(*ttl, 3 * 3600);
}

TEST_F(LruCacheDictTest, RemoveIsIdempotent) {
    auto cache = makeCache(3, 0);
    cache->set("a", 1);

    EXPECT_TRUE(cache->remove("a"));
    EXPECT_FALSE(cache->remove("a"));
    EXPECT_FALSE(cache->contains("a"));
    EXPECT_EQ(cache->size(), 0u);
}

TEST_F(LruCacheDictTest, ExcludedValuesAreNotStored) {
    CacheOptions options;
    options.key_namespace = "excl";
    options.max_size = 3;
    options.exclude_values = {nullptr, json("")};
    LruCacheDict cache(store, options, logger);

    cache.set("null", nullptr);
    cache.set("empty", "");
    cache.set("kept", "x");

    EXPECT_FALSE(cache.contains("null"));
    EXPECT_FALSE(cache.contains("empty"));
    EXPECT_TRUE(cache.contains("kept"));
}

TEST_F(LruCacheDictTest, NamespacesAreIsolated) {
    auto first = makeCache(2, 0, "first");
    auto second = makeCache(2, 0, "second");

    first->set("a", 1);
    first->set("b", 2);
    second->set("a", 10);
    first->set("c", 3);

    EXPECT_EQ(second->get("a"), json(10));
    EXPECT_EQ(second->size(), 1u);

    EXPECT_GT(first->clear(), 0u);
    EXPECT_EQ(first->size(), 0u);
    EXPECT_FALSE(first->contains("b"));
    EXPECT_EQ(second->get("a"), json(10));
}

TEST_F(LruCacheDictTest, ClearOnExitRemovesEntries) {
    {
        CacheOptions options;
        options.key_namespace = "transient";
        options.clear_on_exit = true;
        LruCacheDict cache(store, options, logger);
        cache.set("a", 1);
        EXPECT_TRUE(store->exists("transient:value:a"));
    }
    EXPECT_FALSE(store->exists("transient:value:a"));
    EXPECT_FALSE(store->exists("transient:index"));
}

TEST_F(LruCacheDictTest, MsgPackCodecRoundTrip) {
    CacheOptions options;
    options.key_namespace = "packed";
    options.max_size = 3;
    LruCacheDict cache(store, options, logger, nullptr, std::make_shared<MsgPackCodec>());

    json value = {{"id", 7}, {"ratio", 0.25}, {"tags", {"x", "y"}}};
    cache.set("a", value);
    EXPECT_EQ(cache.get("a"), value);
}

TEST_F(LruCacheDictTest, UndecodableValueThrowsSerializationError) {
    auto cache = makeCache(3, 0, "corrupt");
    EntryKeys keys;
    keys.value_prefix = "corrupt:value:";
    keys.value_key = "corrupt:value:a";
    keys.index_key = "corrupt:index";
    keys.clock_key = "corrupt:clock";
    keys.ttl_key = "corrupt:ttl";
    keys.member = "a";
    store->writeEntry(keys, "{not json", 0, 3);

    EXPECT_THROW(cache->get("a"), SerializationError);
}

TEST_F(LruCacheDictTest, InvalidUtf8ValueThrowsSerializationError) {
    auto cache = makeCache(3, 0);
    EXPECT_THROW(cache->set("a", std::string("\xff\xfe")), SerializationError);
    EXPECT_FALSE(cache->contains("a"));
}

TEST_F(LruCacheDictTest, RejectsInvalidOptions) {
    CacheOptions zero;
    zero.max_size = 0;
    EXPECT_THROW(LruCacheDict(store, zero, logger), std::invalid_argument);

    CacheOptions unnamed;
    unnamed.key_namespace = "";
    EXPECT_THROW(LruCacheDict(store, unnamed, logger), std::invalid_argument);

    EXPECT_THROW(LruCacheDict(nullptr, CacheOptions{}, logger), std::invalid_argument);
    EXPECT_THROW(LruCacheDict(store, CacheOptions{}, nullptr), std::invalid_argument);
}

TEST_F(LruCacheDictTest, ConcurrentWritersNeverExceedMaxSize) {
    const std::size_t max_size = 8;
    auto cache = makeCache(max_size, 0, "shared");
    std::atomic<bool> over_limit{false};

    std::vector<std::thread> writers;
    for (int t = 0; t < 4; ++t) {
        writers.emplace_back([&, t]() {
            for (int i = 0; i < 200; ++i) {
                cache->set("t" + std::to_string(t) + "-" + std::to_string(i), i);
                if (cache->size() > max_size) {
                    over_limit = true;
                }
            }
        });
    }
    for (auto& w : writers) {
        w.join();
    }

    EXPECT_FALSE(over_limit);
    EXPECT_EQ(cache->size(), max_size);
}

// --- Store failures ---

class LruCacheDictStoreFailureTest : public ::testing::Test {
protected:
    std::shared_ptr<MockStore> store = std::make_shared<MockStore>();
    std::shared_ptr<NiceMock<MockLogger>> logger = std::make_shared<NiceMock<MockLogger>>();
    std::shared_ptr<NiceMock<MockStatsDClient>> statsd = std::make_shared<NiceMock<MockStatsDClient>>();
};

TEST_F(LruCacheDictStoreFailureTest, GetSurfacesStoreUnavailable) {
    LruCacheDict cache(store, CacheOptions{}, logger, statsd);
    EXPECT_CALL(*store, readEntry(_, _)).WillOnce(Throw(StoreUnavailable("connection refused")));
    EXPECT_CALL(*statsd, increment(MetricsDefinitions::STORE_ERROR, 1)).Times(1);
    EXPECT_CALL(*statsd, increment(MetricsDefinitions::CACHE_MISS, _)).Times(0);

    EXPECT_THROW(cache.get("a"), StoreUnavailable);
}

TEST_F(LruCacheDictStoreFailureTest, GetOrDoesNotHideStoreUnavailable) {
    LruCacheDict cache(store, CacheOptions{}, logger, statsd);
    EXPECT_CALL(*store, readEntry(_, _)).WillOnce(Throw(StoreUnavailable("timeout")));

    EXPECT_THROW(cache.getOr("a", json(1)), StoreUnavailable);
}

TEST_F(LruCacheDictStoreFailureTest, SetPassesNamespacedKeysAndBound) {
    CacheOptions options;
    options.key_namespace = "ns";
    options.max_size = 3;
    options.default_ttl = 60;
    LruCacheDict cache(store, options, logger, statsd);

    EXPECT_CALL(*statsd, increment(_, _)).Times(testing::AnyNumber());
    EXPECT_CALL(*store, writeEntry(testing::AllOf(
                                       testing::Field(&EntryKeys::value_key, "ns:value:k"),
                                       testing::Field(&EntryKeys::index_key, "ns:index"),
                                       testing::Field(&EntryKeys::clock_key, "ns:clock"),
                                       testing::Field(&EntryKeys::ttl_key, "ns:ttl"),
                                       testing::Field(&EntryKeys::member, "k")),
                                   R"({"v":1})", 60, 3u))
        .WillOnce(Return(std::vector<std::string>{"old"}));
    EXPECT_CALL(*statsd, increment(MetricsDefinitions::CACHE_EVICTED, 1)).Times(1);

    EXPECT_EQ(cache.set("k", json{{"v", 1}}), std::vector<std::string>{"old"});
}

TEST_F(LruCacheDictStoreFailureTest, OnlyOnAccessModeAsksStoreToRestartTtl) {
    CacheOptions options;
    options.key_namespace = "ns";
    LruCacheDict on_write(store, options, logger, statsd);
    options.expiration_mode = ExpirationMode::OnAccess;
    LruCacheDict on_access(store, options, logger, statsd);

    EXPECT_CALL(*store, readEntry(testing::Field(&EntryKeys::member, "w"), false))
        .WillOnce(Return(std::optional<std::string>("1")));
    EXPECT_CALL(*store, readEntry(testing::Field(&EntryKeys::member, "a"), true))
        .WillOnce(Return(std::optional<std::string>("2")));

    EXPECT_EQ(on_write.get("w"), json(1));
    EXPECT_EQ(on_access.get("a"), json(2));
}

TEST_F(LruCacheDictStoreFailureTest, SetSurfacesStoreUnavailable) {
    LruCacheDict cache(store, CacheOptions{}, logger, statsd);
    EXPECT_CALL(*store, writeEntry(_, _, _, _)).WillOnce(Throw(StoreUnavailable("broken pipe")));
    EXPECT_CALL(*logger, error(testing::HasSubstr("broken pipe"))).Times(1);

    EXPECT_THROW(cache.set("a", 1), StoreUnavailable);
}
