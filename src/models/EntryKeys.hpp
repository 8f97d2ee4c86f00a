#pragma once

#include <string>

// Store keys backing a single cache entry.
struct EntryKeys {
    std::string value_key;   // <ns>:value:<member>
    std::string index_key;   // <ns>:index (sorted set of member -> recency score)
    std::string clock_key;   // <ns>:clock (recency counter)
    std::string ttl_key;     // <ns>:ttl (hash of member -> TTL written with)
    std::string value_prefix; // <ns>:value:
    std::string member;      // the caller's key
};
