#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "../config/AppConfig.hpp"
#include "../interfaces/StoreInterface.hpp"

// Forward declarations
struct redisContext;
struct redisReply;
class ILogger;

// StoreInterface over a single hiredis connection. Calls are serialized on
// one mutex. A broken connection is re-established once per call before
// StoreUnavailable is raised.
class RedisStore : public StoreInterface {
public:
    RedisStore(const AppConfig& config, std::shared_ptr<ILogger> logger);
    ~RedisStore() override;

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
    bool ping() override;

    // Check if the store currently holds a live connection
    bool isConnected() const;

    // Escape glob metacharacters so the prefix matches literally in SCAN.
    static std::string escapeGlob(const std::string& text);

private:
    struct ReplyDeleter {
        void operator()(redisReply* reply) const;
    };
    using ReplyPtr = std::unique_ptr<redisReply, ReplyDeleter>;

    struct Script {
        const char* source;
        std::string sha;
    };

    void connect();
    void disconnect();
    void ensureConnected();
    ReplyPtr command(const std::vector<std::string>& args);
    ReplyPtr evalScript(Script& script,
                        const std::vector<std::string>& keys,
                        const std::vector<std::string>& args);
    void loadScripts();

    const AppConfig config_;
    std::shared_ptr<ILogger> logger_;
    redisContext* redis_context_;
    mutable std::mutex mutex_;

    Script write_entry_;
    Script read_entry_;
    Script remove_entry_;
};
