#include <cstdlib>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "cache/CacheErrors.hpp"
#include "cache/LruCacheDict.hpp"
#include "config/AppConfig.hpp"
#include "logging/ConsoleLogger.hpp"
#include "metrics/DummyStatsDClient.hpp"
#include "metrics/StatsDClient.hpp"
#include "store/InMemoryStore.hpp"
#include "store/RedisStore.hpp"
#include "utils/Utils.hpp"

using json = nlohmann::json;

namespace {

constexpr int EXIT_BAD_USAGE = 1;
constexpr int EXIT_KEY_NOT_FOUND = 2;
constexpr int EXIT_STORE_UNAVAILABLE = 3;

const char* USAGE =
    "Usage: redislru_cli op=<get|set|delete|contains|size|keys|clear|ping> [key=<key>] "
    "[value=<json>] [ttl=<seconds>] [<setting>=<value> ...]";

}

// --- Helper Function to Initialize Store ---
std::shared_ptr<StoreInterface> initializeStore(const AppConfig& config_, std::shared_ptr<ILogger> logger_) {
    if (config_.use_redis) {
        auto redis_store = std::make_shared<RedisStore>(config_, logger_);
        if (redis_store->isConnected()) {
            logger_->setup("Redis store connected successfully.");
            return redis_store;
        }
        logger_->warn("Redis unreachable at " + config_.redis_host + ":" + std::to_string(config_.redis_port) +
                      ", falling back to a process-local store.");
    }
    logger_->setup("Creating InMemoryStore.");
    return std::make_shared<InMemoryStore>();
}

// --- Helper Function to Initialize StatsD Client ---
std::shared_ptr<IStatsDClient> initializeStatsDClient(const AppConfig& config, std::shared_ptr<ILogger> logger_) {
    const char* statsd_server_value = std::getenv("STATSD_SERVER");
    if (statsd_server_value == nullptr || std::string(statsd_server_value).empty()) {
        logger_->debug("STATSD_SERVER not set. Using DummyStatsDClient.");
        return DummyStatsDClient::getInstance();
    }

    try {
        return std::make_shared<StatsDClient>(config, logger_, statsd_server_value);
    } catch (const std::runtime_error& e) {
        logger_->error("StatsDClient failed to get created (" + std::string(e.what()) +
                       "). Using DummyStatsDClient.");
    }
    return DummyStatsDClient::getInstance();
}

std::optional<std::string> requireArgument(const std::map<std::string, std::string>& args,
                                           const std::string& name,
                                           const std::string& op) {
    auto it = args.find(name);
    if (it == args.end()) {
        std::cerr << "Error: op=" << op << " requires " << name << "=..." << std::endl;
        return std::nullopt;
    }
    return it->second;
}

int runOperation(LruCacheDict& cache, StoreInterface& store, const std::map<std::string, std::string>& args) {
    auto op_it = args.find("op");
    if (op_it == args.end()) {
        std::cerr << USAGE << std::endl;
        return EXIT_BAD_USAGE;
    }
    const std::string& op = op_it->second;

    if (op == "ping") {
        std::cout << json(store.ping()).dump() << std::endl;
        return 0;
    }
    if (op == "size") {
        std::cout << cache.size() << std::endl;
        return 0;
    }
    if (op == "keys") {
        std::cout << json(cache.keys()).dump() << std::endl;
        return 0;
    }
    if (op == "clear") {
        std::cout << cache.clear() << std::endl;
        return 0;
    }

    auto key = requireArgument(args, "key", op);
    if (!key) {
        return EXIT_BAD_USAGE;
    }

    if (op == "get") {
        std::cout << cache.get(*key).dump() << std::endl;
    } else if (op == "contains") {
        std::cout << json(cache.contains(*key)).dump() << std::endl;
    } else if (op == "delete") {
        std::cout << json(cache.remove(*key)).dump() << std::endl;
    } else if (op == "set") {
        auto value_text = requireArgument(args, "value", op);
        if (!value_text) {
            return EXIT_BAD_USAGE;
        }
        json value = json::parse(*value_text, nullptr, false);
        if (value.is_discarded()) {
            std::cerr << "Error: value is not valid JSON: " << *value_text << std::endl;
            return EXIT_BAD_USAGE;
        }

        std::optional<int> ttl;
        if (auto ttl_it = args.find("ttl"); ttl_it != args.end()) {
            ttl = Utils::stringToInt(ttl_it->second);
            if (!ttl || *ttl < 0) {
                std::cerr << "Error: ttl must be a non-negative integer: " << ttl_it->second << std::endl;
                return EXIT_BAD_USAGE;
            }
        }
        json result;
        result["evicted"] = cache.set(*key, value, ttl);
        std::cout << result.dump() << std::endl;
    } else {
        std::cerr << "Error: unknown op '" << op << "'" << std::endl << USAGE << std::endl;
        return EXIT_BAD_USAGE;
    }
    return 0;
}

// --- Main Function ---
int main(int argc, char** argv) {
    try {
        std::vector<std::string> args_vec(argv + 1, argv + argc);

        std::optional<std::map<std::string, std::string>> parsedArgsOpt = Utils::parseArguments(args_vec);
        if (!parsedArgsOpt) {
            std::cerr << USAGE << std::endl;
            return EXIT_BAD_USAGE;
        }
        const std::map<std::string, std::string>& startupArguments = *parsedArgsOpt;

        AppConfig config_ = Utils::loadConfiguration(startupArguments);

        std::shared_ptr<ILogger> logger_ = ConsoleLogger::getInstance(config_.log_level);
        logger_->setup("Configuration loaded.");
        logger_->setup(config_.to_string());

        std::shared_ptr<IStatsDClient> statsd_client = initializeStatsDClient(config_, logger_);
        std::shared_ptr<StoreInterface> store = initializeStore(config_, logger_);

        LruCacheDict cache(store, config_.cache, logger_, statsd_client);
        try {
            return runOperation(cache, *store, startupArguments);
        } catch (const KeyNotFound& e) {
            logger_->info(e.what());
            std::cout << "null" << std::endl;
            return EXIT_KEY_NOT_FOUND;
        } catch (const StoreUnavailable& e) {
            std::cerr << "Error: " << e.what() << std::endl;
            return EXIT_STORE_UNAVAILABLE;
        }
    } catch (const std::exception& e) {
        ConsoleLogger::getInstance(LogUtils::LogLevel::CERROR)->error("Unhandled exception: " + std::string(e.what()));
        return EXIT_BAD_USAGE;
    }
}
