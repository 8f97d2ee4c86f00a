#include <sys/time.h>

#include <stdexcept>

#include <hiredis/hiredis.h>

#include "RedisStore.hpp"
#include "LuaScripts.hpp"
#include "../cache/CacheErrors.hpp"
#include "../interfaces/ILogger.hpp"

namespace {

timeval toTimeval(int millis) {
    timeval tv;
    tv.tv_sec = millis / 1000;
    tv.tv_usec = (millis % 1000) * 1000;
    return tv;
}

std::string replyString(const redisReply* reply) {
    return std::string(reply->str, reply->len);
}

}

void RedisStore::ReplyDeleter::operator()(redisReply* reply) const {
    freeReplyObject(reply);
}

RedisStore::RedisStore(const AppConfig& config, std::shared_ptr<ILogger> logger)
    : config_(config), logger_(logger), redis_context_(nullptr),
      write_entry_{LuaScripts::WRITE_ENTRY, ""},
      read_entry_{LuaScripts::READ_ENTRY, ""},
      remove_entry_{LuaScripts::REMOVE_ENTRY, ""} {
    if (!logger_) {
        throw std::invalid_argument("Logger cannot be null for RedisStore");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    connect();
}

RedisStore::~RedisStore() {
    disconnect();
}

void RedisStore::connect() {
    const std::string endpoint = config_.redis_host + ":" + std::to_string(config_.redis_port);
    redis_context_ = redisConnectWithTimeout(config_.redis_host.c_str(), config_.redis_port,
                                             toTimeval(config_.connect_timeout_in_millis));
    if (redis_context_ == nullptr || redis_context_->err) {
        std::string error_msg;
        if (redis_context_) {
            error_msg = "Redis connection error (" + endpoint + "): " + std::string(redis_context_->errstr);
            redisFree(redis_context_);
            redis_context_ = nullptr;
        } else {
            error_msg = "Redis connection error: can't allocate redis context";
        }
        logger_->error(error_msg);
        return;
    }

    if (redisSetTimeout(redis_context_, toTimeval(config_.command_timeout_in_millis)) != REDIS_OK) {
        logger_->warn("Could not set Redis command timeout for " + endpoint);
    }

    try {
        if (!config_.redis_password.empty()) {
            command({"AUTH", config_.redis_password});
        }
        if (config_.redis_db != 0) {
            command({"SELECT", std::to_string(config_.redis_db)});
        }
        loadScripts();
        logger_->debug("Connected to Redis at " + endpoint);
    } catch (const StoreUnavailable& e) {
        logger_->error("Redis handshake failed (" + endpoint + "): " + e.what());
        disconnect();
    }
}

void RedisStore::disconnect() {
    if (redis_context_) {
        redisFree(redis_context_);
        redis_context_ = nullptr;
    }
}

void RedisStore::ensureConnected() {
    if (redis_context_ && redis_context_->err) {
        logger_->warn("Redis connection broken (" + std::string(redis_context_->errstr) + "), reconnecting");
        disconnect();
    }
    if (!redis_context_) {
        connect();
    }
    if (!redis_context_) {
        throw StoreUnavailable("Redis not connected at " + config_.redis_host + ":" +
                               std::to_string(config_.redis_port));
    }
}

// Caller holds mutex_.
RedisStore::ReplyPtr RedisStore::command(const std::vector<std::string>& args) {
    ensureConnected();

    std::vector<const char*> argv;
    std::vector<size_t> argvlen;
    argv.reserve(args.size());
    argvlen.reserve(args.size());
    for (const auto& arg : args) {
        argv.push_back(arg.data());
        argvlen.push_back(arg.size());
    }

    ReplyPtr reply(static_cast<redisReply*>(
        redisCommandArgv(redis_context_, static_cast<int>(argv.size()), argv.data(), argvlen.data())));
    if (!reply) {
        std::string error_msg = "Redis " + args.front() + " failed: " + std::string(redis_context_->errstr);
        disconnect();
        throw StoreUnavailable(error_msg);
    }
    if (reply->type == REDIS_REPLY_ERROR) {
        throw StoreUnavailable("Redis " + args.front() + " error: " + replyString(reply.get()));
    }
    return reply;
}

void RedisStore::loadScripts() {
    for (Script* script : {&write_entry_, &read_entry_, &remove_entry_}) {
        ReplyPtr reply = command({"SCRIPT", "LOAD", script->source});
        if (reply->type != REDIS_REPLY_STRING) {
            throw StoreUnavailable("Unexpected SCRIPT LOAD reply type " + std::to_string(reply->type));
        }
        script->sha = replyString(reply.get());
    }
}

RedisStore::ReplyPtr RedisStore::evalScript(Script& script,
                                            const std::vector<std::string>& keys,
                                            const std::vector<std::string>& args) {
    std::vector<std::string> tail;
    tail.push_back(std::to_string(keys.size()));
    tail.insert(tail.end(), keys.begin(), keys.end());
    tail.insert(tail.end(), args.begin(), args.end());

    if (!script.sha.empty()) {
        std::vector<std::string> evalsha{"EVALSHA", script.sha};
        evalsha.insert(evalsha.end(), tail.begin(), tail.end());
        try {
            return command(evalsha);
        } catch (const StoreUnavailable& e) {
            // Script cache flushed on the server; fall through to EVAL.
            if (std::string(e.what()).find("NOSCRIPT") == std::string::npos) {
                throw;
            }
            logger_->debug("Redis script cache miss, sending script source");
            script.sha.clear();
        }
    }

    std::vector<std::string> eval{"EVAL", script.source};
    eval.insert(eval.end(), tail.begin(), tail.end());
    return command(eval);
}

std::vector<std::string> RedisStore::writeEntry(const EntryKeys& keys,
                                                const std::string& value,
                                                int ttl_seconds,
                                                std::size_t max_size) {
    std::lock_guard<std::mutex> lock(mutex_);
    ReplyPtr reply = evalScript(write_entry_,
                                {keys.value_key, keys.index_key, keys.clock_key, keys.ttl_key},
                                {value, std::to_string(ttl_seconds), keys.member,
                                 std::to_string(max_size), keys.value_prefix});

    std::vector<std::string> evicted;
    if (reply->type == REDIS_REPLY_ARRAY) {
        for (size_t i = 0; i < reply->elements; ++i) {
            evicted.push_back(replyString(reply->element[i]));
        }
    }
    return evicted;
}

std::optional<std::string> RedisStore::readEntry(const EntryKeys& keys, bool restart_ttl) {
    std::lock_guard<std::mutex> lock(mutex_);
    ReplyPtr reply = evalScript(read_entry_,
                                {keys.value_key, keys.index_key, keys.clock_key, keys.ttl_key},
                                {keys.member, restart_ttl ? "1" : "0"});

    if (reply->type == REDIS_REPLY_STRING) {
        return replyString(reply.get());
    }
    return std::nullopt;
}

bool RedisStore::removeEntry(const EntryKeys& keys) {
    std::lock_guard<std::mutex> lock(mutex_);
    ReplyPtr reply = evalScript(remove_entry_, {keys.value_key, keys.index_key, keys.ttl_key}, {keys.member});
    return reply->type == REDIS_REPLY_INTEGER && reply->integer > 0;
}

bool RedisStore::exists(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    ReplyPtr reply = command({"EXISTS", key});
    return reply->type == REDIS_REPLY_INTEGER && reply->integer > 0;
}

std::size_t RedisStore::indexSize(const std::string& index_key) {
    std::lock_guard<std::mutex> lock(mutex_);
    ReplyPtr reply = command({"ZCARD", index_key});
    return reply->type == REDIS_REPLY_INTEGER ? static_cast<std::size_t>(reply->integer) : 0;
}

std::vector<std::string> RedisStore::indexMembers(const std::string& index_key) {
    std::lock_guard<std::mutex> lock(mutex_);
    ReplyPtr reply = command({"ZRANGE", index_key, "0", "-1"});

    std::vector<std::string> members;
    if (reply->type == REDIS_REPLY_ARRAY) {
        members.reserve(reply->elements);
        for (size_t i = 0; i < reply->elements; ++i) {
            members.push_back(replyString(reply->element[i]));
        }
    }
    return members;
}

std::optional<long long> RedisStore::timeToLive(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    ReplyPtr reply = command({"TTL", key});
    // -2: missing, -1: no expiry
    if (reply->type != REDIS_REPLY_INTEGER || reply->integer < 0) {
        return std::nullopt;
    }
    return reply->integer;
}

std::size_t RedisStore::removeByPrefix(const std::string& prefix) {
    std::lock_guard<std::mutex> lock(mutex_);
    const std::string pattern = escapeGlob(prefix) + "*";
    std::string cursor = "0";
    std::size_t removed = 0;

    do {
        ReplyPtr reply = command({"SCAN", cursor, "MATCH", pattern,
                                  "COUNT", std::to_string(Constants::SCAN_BATCH_SIZE)});
        if (reply->type != REDIS_REPLY_ARRAY || reply->elements != 2) {
            throw StoreUnavailable("Unexpected SCAN reply while clearing prefix " + prefix);
        }
        cursor = replyString(reply->element[0]);

        const redisReply* batch = reply->element[1];
        if (batch->elements > 0) {
            std::vector<std::string> del{"DEL"};
            for (size_t i = 0; i < batch->elements; ++i) {
                del.push_back(replyString(batch->element[i]));
            }
            ReplyPtr deleted = command(del);
            if (deleted->type == REDIS_REPLY_INTEGER) {
                removed += static_cast<std::size_t>(deleted->integer);
            }
        }
    } while (cursor != "0");

    return removed;
}

bool RedisStore::ping() {
    std::lock_guard<std::mutex> lock(mutex_);
    try {
        ReplyPtr reply = command({"PING"});
        return reply->type == REDIS_REPLY_STATUS && replyString(reply.get()) == "PONG";
    } catch (const StoreUnavailable& e) {
        logger_->debug(std::string("Redis ping failed: ") + e.what());
        return false;
    }
}

bool RedisStore::isConnected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return redis_context_ != nullptr && redis_context_->err == 0;
}

std::string RedisStore::escapeGlob(const std::string& text) {
    std::string escaped;
    escaped.reserve(text.size());
    for (char c : text) {
        if (c == '*' || c == '?' || c == '[' || c == ']' || c == '\\') {
            escaped.push_back('\\');
        }
        escaped.push_back(c);
    }
    return escaped;
}
