#ifndef CACHEOPTIONS_HPP
#define CACHEOPTIONS_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "TimeOfDay.hpp"

using json = nlohmann::json;

enum class ExpirationMode {
    OnWrite,  // TTL counts from the last set
    OnAccess  // TTL restarts on every successful get
};

struct CacheOptions {
    std::string key_namespace = "RedisLRU";
    std::size_t max_size = 1u << 20;
    int default_ttl = 15 * 60; // seconds, 0 disables expiration
    ExpirationMode expiration_mode = ExpirationMode::OnWrite;
    bool clear_on_exit = false;

    // Values equal to one of these are never written.
    std::vector<json> exclude_values;

    // When set, entries written without an explicit TTL expire at the next
    // occurrence of this local time of day instead of after default_ttl.
    std::optional<TimeOfDay> expire_on;
};

#endif // CACHEOPTIONS_HPP
