#ifndef APPCONFIG_HPP
#define APPCONFIG_HPP

#include <iostream>
#include <string>
#include <sstream>

#include "../interfaces/ILogger.hpp"
#include "../models/CacheOptions.hpp"

namespace MetricsDefinitions {
    static const std::string CACHE_HIT = "redislru.hit";

    static const std::string CACHE_MISS = "redislru.miss";

    static const std::string CACHE_SET = "redislru.set";

    static const std::string CACHE_EVICTED = "redislru.evicted";

    static const std::string STORE_ERROR = "redislru.store_error";

    static const std::string SERIALIZATION_ERROR = "redislru.serialization_error";

    // Wrapped function was called because the cache could not answer.
    static const std::string FUNCTION_FALLBACK = "redislru.function_fallback";
}

namespace Constants {
    static constexpr auto TIME_FORMAT = "%Y-%m-%dT%H:%M:%S";
    static constexpr auto CONFIG_FILE_NAME = "redislru.config";
    static constexpr std::size_t SCAN_BATCH_SIZE = 100;
};

// --- Configuration Struct ---
class AppConfig {
public:
    // Store configuration
    bool use_redis;
    std::string redis_host;
    int redis_port;
    int redis_db;
    std::string redis_password;
    int connect_timeout_in_millis;
    int command_timeout_in_millis;

    // Cache configuration
    CacheOptions cache;

    // Logging Level
    LogUtils::LogLevel log_level;

    // Metrics
    int metrics_batch_size;
    int metrics_send_interval_in_millis;

    AppConfig() {
        // --- Set Defaults  ---
        use_redis = true;
        redis_host = "localhost";
        redis_port = 6379;
        redis_db = 0;
        connect_timeout_in_millis = 1000;
        command_timeout_in_millis = 1000;
        log_level = LogUtils::LogLevel::WARN;
        metrics_batch_size = 100;
        metrics_send_interval_in_millis = 1000;
    }

    std::string to_string() const {
        std::stringstream ss;
        ss << "// --- Configuration Params Start --- //" << std::endl
            << "// --- Store Configuration --- //" << std::endl
            << "use_redis: " << std::boolalpha << use_redis << std::noboolalpha << std::endl
            << "redis_host: " << redis_host << std::endl
            << "redis_port: " << redis_port << std::endl
            << "redis_db: " << redis_db << std::endl
            << "redis_password: " << (redis_password.empty() ? "<none>" : "<set>") << std::endl
            << "connect_timeout_in_millis: " << connect_timeout_in_millis << std::endl
            << "command_timeout_in_millis: " << command_timeout_in_millis << std::endl
            << "// --- Cache Configuration --- //" << std::endl
            << "namespace: " << cache.key_namespace << std::endl
            << "max_size: " << cache.max_size << std::endl
            << "default_ttl: " << cache.default_ttl << std::endl
            << "expiration_mode: " << (cache.expiration_mode == ExpirationMode::OnAccess ? "access" : "write") << std::endl
            << "clear_on_exit: " << std::boolalpha << cache.clear_on_exit << std::noboolalpha << std::endl
            << "expire_on: " << (cache.expire_on ? cache.expire_on->to_string() : "<none>") << std::endl
            << "exclude_values: " << json(cache.exclude_values).dump() << std::endl
            << "// --- Logging & Metrics --- //" << std::endl
            << "log_level: " << static_cast<int>(log_level) << std::endl
            << "metrics_batch_size: " << metrics_batch_size << std::endl
            << "metrics_send_interval_in_millis: " << metrics_send_interval_in_millis << std::endl;
        ss << "// --- Configuration Params End --- //" << std::endl;
        return ss.str();
    }
};

#endif // APPCONFIG_HPP
