#ifndef LUASCRIPTS_HPP
#define LUASCRIPTS_HPP

// Server-side scripts that keep value keys and the recency index in step.
// All keys an entry touches are passed in KEYS so Redis runs each script
// atomically against a single namespace.
namespace LuaScripts {

// KEYS: value, index, clock, ttl hash
// ARGV: value, ttl seconds (<= 0 for none), member, max_size, value key prefix
// Returns the evicted members, oldest first.
static constexpr auto WRITE_ENTRY = R"lua(
if tonumber(ARGV[2]) > 0 then
    redis.call('SET', KEYS[1], ARGV[1], 'EX', ARGV[2])
    redis.call('HSET', KEYS[4], ARGV[3], ARGV[2])
else
    redis.call('SET', KEYS[1], ARGV[1])
    redis.call('HDEL', KEYS[4], ARGV[3])
end
local score = redis.call('INCR', KEYS[3])
redis.call('ZADD', KEYS[2], score, ARGV[3])
local overflow = redis.call('ZCARD', KEYS[2]) - tonumber(ARGV[4])
if overflow <= 0 then
    return {}
end
local evicted = redis.call('ZRANGE', KEYS[2], 0, overflow - 1)
for _, member in ipairs(evicted) do
    redis.call('DEL', ARGV[5] .. member)
    redis.call('HDEL', KEYS[4], member)
end
redis.call('ZREMRANGEBYRANK', KEYS[2], 0, overflow - 1)
return evicted
)lua";

// KEYS: value, index, clock, ttl hash
// ARGV: member, "1" to restart the TTL the value was written with
// Returns the value, or nil after dropping a dangling index member.
static constexpr auto READ_ENTRY = R"lua(
local value = redis.call('GET', KEYS[1])
if not value then
    redis.call('ZREM', KEYS[2], ARGV[1])
    redis.call('HDEL', KEYS[4], ARGV[1])
    return false
end
local score = redis.call('INCR', KEYS[3])
redis.call('ZADD', KEYS[2], score, ARGV[1])
if ARGV[2] == '1' then
    local ttl = tonumber(redis.call('HGET', KEYS[4], ARGV[1]))
    if ttl and ttl > 0 then
        redis.call('EXPIRE', KEYS[1], ttl)
    end
end
return value
)lua";

// KEYS: value, index, ttl hash
// ARGV: member
// Returns 1 if the value existed.
static constexpr auto REMOVE_ENTRY = R"lua(
redis.call('ZREM', KEYS[2], ARGV[1])
redis.call('HDEL', KEYS[3], ARGV[1])
return redis.call('DEL', KEYS[1])
)lua";

}

#endif // LUASCRIPTS_HPP
