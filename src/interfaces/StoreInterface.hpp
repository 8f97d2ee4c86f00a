#ifndef STOREINTERFACE_HPP
#define STOREINTERFACE_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "../models/EntryKeys.hpp"

// Backing-store protocol used by LruCacheDict. Every method either succeeds
// or throws StoreUnavailable; a missing key is never reported as an error here.
class StoreInterface {
public:
    virtual ~StoreInterface() = default;

    // Atomically: write the value (ttl_seconds <= 0 means no TTL) and record
    // its TTL, move the member to the top of the recency index, then trim the
    // index down to max_size by dropping the lowest scores along with their
    // value keys. Returns the evicted members, oldest first.
    virtual std::vector<std::string> writeEntry(const EntryKeys& keys,
                                                const std::string& value,
                                                int ttl_seconds,
                                                std::size_t max_size) = 0;

    // Atomically read the value and refresh its recency. With restart_ttl the
    // TTL the value was written with starts over; persistent values stay
    // persistent. A missing value also drops the dangling index member.
    virtual std::optional<std::string> readEntry(const EntryKeys& keys, bool restart_ttl) = 0;

    // Atomically delete value and index member. True if the value existed.
    virtual bool removeEntry(const EntryKeys& keys) = 0;

    virtual bool exists(const std::string& key) = 0;
    virtual std::size_t indexSize(const std::string& index_key) = 0;

    // Members ordered from least to most recently used.
    virtual std::vector<std::string> indexMembers(const std::string& index_key) = 0;

    // Remaining TTL in seconds; nullopt when the key is missing or persistent.
    virtual std::optional<long long> timeToLive(const std::string& key) = 0;

    // Delete every key starting with prefix. Returns the number removed.
    virtual std::size_t removeByPrefix(const std::string& prefix) = 0;

    virtual bool ping() = 0;
};

#endif // STOREINTERFACE_HPP
