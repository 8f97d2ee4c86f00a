#ifndef LRUCACHEDICT_HPP
#define LRUCACHEDICT_HPP

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "CacheErrors.hpp"
#include "../interfaces/ILogger.hpp"
#include "../interfaces/IStatsDClient.hpp"
#include "../interfaces/StoreInterface.hpp"
#include "../interfaces/ValueCodec.hpp"
#include "../models/CacheOptions.hpp"
#include "../models/EntryKeys.hpp"

using json = nlohmann::json;

// Dictionary-like view of one cache namespace in a shared store.
//
// At most options.max_size entries are kept; a set that overflows the bound
// evicts the least recently used entries in the same atomic store step.
// Expiration uses the store's per-key TTL. get() refreshes recency, contains()
// does not.
//
// Errors: KeyNotFound for absent/expired keys, StoreUnavailable when the store
// cannot be used, SerializationError when the codec fails. None of them is
// reported as a miss.
class LruCacheDict {
public:
    LruCacheDict(std::shared_ptr<StoreInterface> store,
                 CacheOptions options,
                 std::shared_ptr<ILogger> logger,
                 std::shared_ptr<IStatsDClient> statsd_client = nullptr,
                 std::shared_ptr<ValueCodec> codec = nullptr);
    ~LruCacheDict();

    LruCacheDict(const LruCacheDict&) = delete;
    LruCacheDict& operator=(const LruCacheDict&) = delete;

    json get(const std::string& key);
    json getOr(const std::string& key, const json& default_value);

    // Returns the keys evicted to make room, oldest first. ttl_seconds
    // overrides expire_on and default_ttl; 0 stores without expiration.
    std::vector<std::string> set(const std::string& key,
                                 const json& value,
                                 std::optional<int> ttl_seconds = std::nullopt);

    // Idempotent. True if a value was present.
    bool remove(const std::string& key);

    bool contains(const std::string& key);

    // Index count; may include entries whose TTL already ran out.
    std::size_t size();

    // Least recently used first.
    std::vector<std::string> keys();

    // Deletes every store key of this namespace. Returns the number removed.
    std::size_t clear();

    // Remaining TTL of an entry in seconds; nullopt if absent or persistent.
    std::optional<long long> timeToLive(const std::string& key);

    // TTL a set() without an explicit ttl would use right now.
    int effectiveTtl(std::optional<int> ttl_seconds) const;

    const CacheOptions& options() const { return options_; }
    const std::string& keyNamespace() const { return options_.key_namespace; }
    const std::shared_ptr<ILogger>& logger() const { return logger_; }
    const std::shared_ptr<IStatsDClient>& metrics() const { return statsd_client_; }

private:
    EntryKeys entryKeys(const std::string& key) const;
    bool isExcluded(const json& value) const;

    // Runs a store call, counting and logging store failures.
    template <typename Call>
    auto withStore(const std::string& operation, const std::string& key, Call&& call)
        -> decltype(call());

    std::shared_ptr<StoreInterface> store_;
    const CacheOptions options_;
    std::shared_ptr<ILogger> logger_;
    std::shared_ptr<IStatsDClient> statsd_client_;
    std::shared_ptr<ValueCodec> codec_;

    const std::string value_prefix_;
    const std::string index_key_;
    const std::string clock_key_;
    const std::string ttl_key_;
};

#endif // LRUCACHEDICT_HPP
