#include "InMemoryStore.hpp"

#include <chrono>

using namespace std::chrono;

StoredValue* InMemoryStore::findLive(const std::string& key) {
    // No lock needed here as it's called by public methods which already hold the lock
    auto it = values_.find(key);
    if (it == values_.end()) {
        return nullptr;
    }
    if (it->second.expiry && *it->second.expiry <= steady_clock::now()) {
        values_.erase(it);
        return nullptr;
    }
    return &it->second;
}

long long InMemoryStore::tick(const std::string& clock_key) {
    return ++clocks_[clock_key];
}

void InMemoryStore::touch(const EntryKeys& keys) {
    RecencyIndex& index = indexes_[keys.index_key];
    auto score_it = index.score_of.find(keys.member);
    if (score_it != index.score_of.end()) {
        index.by_score.erase(score_it->second);
    }
    long long score = tick(keys.clock_key);
    index.by_score[score] = keys.member;
    index.score_of[keys.member] = score;
}

void InMemoryStore::dropMember(const std::string& index_key, const std::string& member) {
    auto index_it = indexes_.find(index_key);
    if (index_it == indexes_.end()) {
        return;
    }
    RecencyIndex& index = index_it->second;
    auto score_it = index.score_of.find(member);
    if (score_it != index.score_of.end()) {
        index.by_score.erase(score_it->second);
        index.score_of.erase(score_it);
    }
    // Redis deletes empty sorted sets
    if (index.score_of.empty()) {
        indexes_.erase(index_it);
    }
}

std::vector<std::string> InMemoryStore::writeEntry(const EntryKeys& keys,
                                                   const std::string& value,
                                                   int ttl_seconds,
                                                   std::size_t max_size) {
    std::lock_guard<std::mutex> lock(mutex_);

    StoredValue stored;
    stored.bytes = value;
    if (ttl_seconds > 0) {
        stored.expiry = steady_clock::now() + seconds(ttl_seconds);
        stored.ttl_seconds = ttl_seconds;
    }
    values_[keys.value_key] = std::move(stored);
    touch(keys);

    // --- LRU Logic ---
    std::vector<std::string> evicted;
    RecencyIndex& index = indexes_[keys.index_key];
    while (index.by_score.size() > max_size) {
        auto oldest = index.by_score.begin(); // lowest score = least recently used
        std::string member = oldest->second;
        index.score_of.erase(member);
        index.by_score.erase(oldest);
        values_.erase(keys.value_prefix + member);
        evicted.push_back(std::move(member));
    }
    // --- End LRU Logic ---

    return evicted;
}

std::optional<std::string> InMemoryStore::readEntry(const EntryKeys& keys, bool restart_ttl) {
    std::lock_guard<std::mutex> lock(mutex_);

    StoredValue* stored = findLive(keys.value_key);
    if (!stored) {
        dropMember(keys.index_key, keys.member);
        return std::nullopt;
    }
    if (restart_ttl && stored->ttl_seconds > 0) {
        stored->expiry = steady_clock::now() + seconds(stored->ttl_seconds);
    }
    std::string bytes = stored->bytes;
    touch(keys);
    return bytes;
}

bool InMemoryStore::removeEntry(const EntryKeys& keys) {
    std::lock_guard<std::mutex> lock(mutex_);
    dropMember(keys.index_key, keys.member);
    bool existed = findLive(keys.value_key) != nullptr;
    values_.erase(keys.value_key);
    return existed;
}

bool InMemoryStore::exists(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    return findLive(key) != nullptr || indexes_.count(key) > 0 || clocks_.count(key) > 0;
}

std::size_t InMemoryStore::indexSize(const std::string& index_key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = indexes_.find(index_key);
    return it == indexes_.end() ? 0 : it->second.by_score.size();
}

std::vector<std::string> InMemoryStore::indexMembers(const std::string& index_key) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> members;
    auto it = indexes_.find(index_key);
    if (it != indexes_.end()) {
        members.reserve(it->second.by_score.size());
        for (const auto& [score, member] : it->second.by_score) {
            members.push_back(member);
        }
    }
    return members;
}

std::optional<long long> InMemoryStore::timeToLive(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    StoredValue* stored = findLive(key);
    if (!stored || !stored->expiry) {
        return std::nullopt;
    }
    // Round up like Redis does for a key with sub-second time left
    auto remaining = duration_cast<milliseconds>(*stored->expiry - steady_clock::now()).count();
    return (remaining + 999) / 1000;
}

std::size_t InMemoryStore::removeByPrefix(const std::string& prefix) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t removed = 0;
    auto matches = [&prefix](const std::string& key) {
        return key.compare(0, prefix.size(), prefix) == 0;
    };

    for (auto it = values_.begin(); it != values_.end(); ) {
        if (matches(it->first)) {
            it = values_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    for (auto it = indexes_.begin(); it != indexes_.end(); ) {
        if (matches(it->first)) {
            it = indexes_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    for (auto it = clocks_.begin(); it != clocks_.end(); ) {
        if (matches(it->first)) {
            it = clocks_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}
