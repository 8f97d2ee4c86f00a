#ifndef INMEMORYSTORE_HPP
#define INMEMORYSTORE_HPP

#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "../interfaces/StoreInterface.hpp"

struct StoredValue {
    std::string bytes;
    std::optional<std::chrono::steady_clock::time_point> expiry; // unset = persistent
    int ttl_seconds = 0;
};

// Sorted-set stand-in: member <-> score, ordered by score.
struct RecencyIndex {
    std::map<long long, std::string> by_score;           // score -> member (lowest = LRU)
    std::unordered_map<std::string, long long> score_of; // member -> score
};

// Process-local StoreInterface with the same semantics as RedisStore.
// Every method runs under one mutex, which gives the atomicity the Lua
// scripts give on Redis.
class InMemoryStore : public StoreInterface {
private:
    std::unordered_map<std::string, StoredValue> values_;
    std::unordered_map<std::string, RecencyIndex> indexes_;
    std::unordered_map<std::string, long long> clocks_;

    mutable std::mutex mutex_;

    // Drops the value if its TTL has passed. Returns the live entry or nullptr.
    StoredValue* findLive(const std::string& key);
    long long tick(const std::string& clock_key);
    void touch(const EntryKeys& keys);
    void dropMember(const std::string& index_key, const std::string& member);

public:
    InMemoryStore() = default;
    ~InMemoryStore() override = default;

    std::vector<std::string> writeEntry(const EntryKeys& keys,
                                        const std::string& value,
                                        int ttl_seconds,
                                        std::size_t max_size) override;
    std::optional<std::string> readEntry(const EntryKeys& keys, bool restart_ttl) override;
    bool removeEntry(const EntryKeys& keys) override;
    bool exists(const std::string& key) override;
    std::size_t indexSize(const std::string& index_key) override;
    std::vector<std::string> indexMembers(const std::string& index_key) override;
    std::optional<long long> timeToLive(const std::string& key) override;
    std::size_t removeByPrefix(const std::string& prefix) override;
    bool ping() override { return true; }
};

#endif // INMEMORYSTORE_HPP
