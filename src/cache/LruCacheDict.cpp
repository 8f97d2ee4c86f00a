#include "LruCacheDict.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

#include "../codec/JsonCodec.hpp"
#include "../config/AppConfig.hpp"
#include "../metrics/DummyStatsDClient.hpp"
#include "../utils/Utils.hpp"

LruCacheDict::LruCacheDict(std::shared_ptr<StoreInterface> store,
                           CacheOptions options,
                           std::shared_ptr<ILogger> logger,
                           std::shared_ptr<IStatsDClient> statsd_client,
                           std::shared_ptr<ValueCodec> codec)
    : store_(std::move(store)),
      options_(std::move(options)),
      logger_(std::move(logger)),
      statsd_client_(statsd_client ? std::move(statsd_client) : DummyStatsDClient::getInstance()),
      codec_(codec ? std::move(codec) : std::make_shared<JsonCodec>()),
      value_prefix_(options_.key_namespace + ":value:"),
      index_key_(options_.key_namespace + ":index"),
      clock_key_(options_.key_namespace + ":clock"),
      ttl_key_(options_.key_namespace + ":ttl") {
    if (!store_) {
        throw std::invalid_argument("Store cannot be null for LruCacheDict");
    }
    if (!logger_) {
        throw std::invalid_argument("Logger cannot be null for LruCacheDict");
    }
    if (options_.max_size == 0) {
        throw std::invalid_argument("max_size must be at least 1");
    }
    if (options_.key_namespace.empty()) {
        throw std::invalid_argument("Cache namespace cannot be empty");
    }
    if (options_.default_ttl < 0) {
        throw std::invalid_argument("default_ttl cannot be negative");
    }
    logger_->debug("LruCacheDict '" + options_.key_namespace + "' ready (max_size=" +
                   std::to_string(options_.max_size) + ", codec=" + codec_->name() + ")");
}

LruCacheDict::~LruCacheDict() {
    if (!options_.clear_on_exit) {
        return;
    }
    try {
        std::size_t removed = store_->removeByPrefix(options_.key_namespace + ":");
        logger_->info("Cleared " + std::to_string(removed) + " keys of cache '" +
                      options_.key_namespace + "' on exit");
    } catch (const std::exception& e) {
        logger_->error("Failed to clear cache '" + options_.key_namespace + "' on exit: " + e.what());
    }
}

EntryKeys LruCacheDict::entryKeys(const std::string& key) const {
    EntryKeys keys;
    keys.value_key = value_prefix_ + key;
    keys.index_key = index_key_;
    keys.clock_key = clock_key_;
    keys.ttl_key = ttl_key_;
    keys.value_prefix = value_prefix_;
    keys.member = key;
    return keys;
}

template <typename Call>
auto LruCacheDict::withStore(const std::string& operation, const std::string& key, Call&& call)
    -> decltype(call()) {
    try {
        return call();
    } catch (const StoreUnavailable& e) {
        statsd_client_->increment(MetricsDefinitions::STORE_ERROR);
        logger_->error("Cache '" + options_.key_namespace + "' " + operation +
                       (key.empty() ? "" : " '" + key + "'") + " failed: " + e.what());
        throw;
    }
}

json LruCacheDict::get(const std::string& key) {
    const bool restart_ttl = options_.expiration_mode == ExpirationMode::OnAccess;
    const EntryKeys keys = entryKeys(key);

    std::optional<std::string> bytes =
        withStore("get", key, [&]() { return store_->readEntry(keys, restart_ttl); });
    if (!bytes) {
        statsd_client_->increment(MetricsDefinitions::CACHE_MISS);
        throw KeyNotFound(key);
    }

    statsd_client_->increment(MetricsDefinitions::CACHE_HIT);
    try {
        return codec_->decode(*bytes);
    } catch (const SerializationError& e) {
        statsd_client_->increment(MetricsDefinitions::SERIALIZATION_ERROR);
        logger_->error("Cache '" + options_.key_namespace + "' holds an undecodable value for '" +
                       key + "': " + e.what());
        throw;
    }
}

json LruCacheDict::getOr(const std::string& key, const json& default_value) {
    try {
        return get(key);
    } catch (const KeyNotFound&) {
        return default_value;
    }
}

bool LruCacheDict::isExcluded(const json& value) const {
    return std::find(options_.exclude_values.begin(), options_.exclude_values.end(), value) !=
           options_.exclude_values.end();
}

int LruCacheDict::effectiveTtl(std::optional<int> ttl_seconds) const {
    if (ttl_seconds) {
        return std::max(*ttl_seconds, 0);
    }
    if (options_.expire_on) {
        return Utils::secondsUntil(*options_.expire_on);
    }
    return options_.default_ttl;
}

std::vector<std::string> LruCacheDict::set(const std::string& key,
                                           const json& value,
                                           std::optional<int> ttl_seconds) {
    if (isExcluded(value)) {
        logger_->debug("Not caching excluded value for '" + key + "'");
        return {};
    }

    std::string bytes;
    try {
        bytes = codec_->encode(value);
    } catch (const SerializationError&) {
        statsd_client_->increment(MetricsDefinitions::SERIALIZATION_ERROR);
        throw;
    }

    const int ttl = effectiveTtl(ttl_seconds);
    const EntryKeys keys = entryKeys(key);
    std::vector<std::string> evicted = withStore("set", key, [&]() {
        return store_->writeEntry(keys, bytes, ttl, options_.max_size);
    });

    statsd_client_->increment(MetricsDefinitions::CACHE_SET);
    if (!evicted.empty()) {
        statsd_client_->increment(MetricsDefinitions::CACHE_EVICTED, static_cast<int>(evicted.size()));
        if (logger_->getLogLevel() <= LogUtils::LogLevel::DEBUG) {
            logger_->debug("Cache '" + options_.key_namespace + "' evicted " + json(evicted).dump() +
                           " after setting '" + key + "'");
        }
    }
    return evicted;
}

bool LruCacheDict::remove(const std::string& key) {
    const EntryKeys keys = entryKeys(key);
    return withStore("remove", key, [&]() { return store_->removeEntry(keys); });
}

bool LruCacheDict::contains(const std::string& key) {
    const std::string value_key = value_prefix_ + key;
    return withStore("contains", key, [&]() { return store_->exists(value_key); });
}

std::size_t LruCacheDict::size() {
    return withStore("size", "", [&]() { return store_->indexSize(index_key_); });
}

std::vector<std::string> LruCacheDict::keys() {
    return withStore("keys", "", [&]() { return store_->indexMembers(index_key_); });
}

std::size_t LruCacheDict::clear() {
    const std::string prefix = options_.key_namespace + ":";
    std::size_t removed = withStore("clear", "", [&]() { return store_->removeByPrefix(prefix); });
    logger_->info("Cleared " + std::to_string(removed) + " keys of cache '" + options_.key_namespace + "'");
    return removed;
}

std::optional<long long> LruCacheDict::timeToLive(const std::string& key) {
    const std::string value_key = value_prefix_ + key;
    return withStore("ttl", key, [&]() { return store_->timeToLive(value_key); });
}
