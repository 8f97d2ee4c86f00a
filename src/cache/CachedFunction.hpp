#ifndef CACHEDFUNCTION_HPP
#define CACHEDFUNCTION_HPP

#include <cmath>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

#include <nlohmann/json.hpp>

#include "CacheErrors.hpp"
#include "LruCacheDict.hpp"
#include "../config/AppConfig.hpp"
#include "../models/TimeOfDay.hpp"
#include "../utils/Utils.hpp"

using json = nlohmann::json;

struct DecoratorOptions {
    std::optional<int> ttl_seconds;       // wins over everything else
    std::optional<TimeOfDay> expire_on;   // wins over the cache's own expiry settings
};

namespace CallKey {

inline void rejectNonFinite(const json& value) {
    if (value.is_number_float() && !std::isfinite(value.get<double>())) {
        throw SerializationError("Non-finite floating point argument cannot be part of a cache key");
    }
    if (value.is_structured()) {
        for (const auto& item : value) {
            rejectNonFinite(item);
        }
    }
}

// Canonical form of a call's arguments: the compact JSON dump of an array of
// the arguments converted with nlohmann's to_json. Objects (std::map,
// std::unordered_map, keyword-style json objects) dump with sorted keys, so
// insertion order never changes the key. Arguments without a to_json
// overload do not compile. NaN/Inf and invalid UTF-8 throw SerializationError.
template <typename... Args>
std::string canonicalArguments(const Args&... args) {
    json arguments = json::array();
    (arguments.push_back(json(args)), ...);
    rejectNonFinite(arguments);
    try {
        return arguments.dump();
    } catch (const json::type_error& e) {
        throw SerializationError("Cannot canonicalize call arguments: " + std::string(e.what()));
    }
}

}

// Memoizes a callable through an LruCacheDict.
//
// The cache key is "<function_id>:<canonical arguments>". Hits are converted
// back with from_json and the callable is skipped. Misses, store failures and
// undecodable cached values fall back to calling the function; writing the
// result back is best effort. Exceptions thrown by the callable propagate.
template <typename Fn>
class CachedFunction {
public:
    CachedFunction(std::string function_id,
                   Fn fn,
                   std::shared_ptr<LruCacheDict> cache,
                   DecoratorOptions options = {})
        : function_id_(std::move(function_id)),
          fn_(std::move(fn)),
          cache_(std::move(cache)),
          options_(options) {
        if (!cache_) {
            throw std::invalid_argument("Cache cannot be null for CachedFunction");
        }
        if (function_id_.empty()) {
            throw std::invalid_argument("Function id cannot be empty");
        }
    }

    template <typename... Args>
    std::string cacheKey(const Args&... args) const {
        return function_id_ + ":" + CallKey::canonicalArguments(args...);
    }

    template <typename... Args>
    auto operator()(Args&&... args) -> std::decay_t<std::invoke_result_t<Fn&, Args...>> {
        using Result = std::decay_t<std::invoke_result_t<Fn&, Args...>>;
        static_assert(!std::is_void_v<Result>, "Cached functions must return a value");

        const std::string key = cacheKey(args...);
        const auto& logger = cache_->logger();

        try {
            json cached = cache_->get(key);
            try {
                return cached.template get<Result>();
            } catch (const json::exception& e) {
                logger->warn("Cached value for '" + key + "' does not convert to the result type: " + e.what());
                cache_->metrics()->increment(MetricsDefinitions::SERIALIZATION_ERROR);
            }
        } catch (const KeyNotFound&) {
            // Plain miss
        } catch (const CacheError& e) {
            logger->warn("Cache lookup for '" + key + "' failed, calling function: " + e.what());
            cache_->metrics()->increment(MetricsDefinitions::FUNCTION_FALLBACK);
        }

        Result result = std::invoke(fn_, std::forward<Args>(args)...);
        store(key, result);
        return result;
    }

    const std::string& functionId() const { return function_id_; }
    const std::shared_ptr<LruCacheDict>& cache() const { return cache_; }

private:
    template <typename Result>
    void store(const std::string& key, const Result& result) {
        std::optional<int> ttl = options_.ttl_seconds;
        if (!ttl && options_.expire_on) {
            ttl = Utils::secondsUntil(*options_.expire_on);
        }
        try {
            cache_->set(key, json(result), ttl);
        } catch (const CacheError& e) {
            cache_->logger()->error("Failed to cache result for '" + key + "': " + e.what());
        }
    }

    std::string function_id_;
    Fn fn_;
    std::shared_ptr<LruCacheDict> cache_;
    DecoratorOptions options_;
};

// Wraps fn around an existing cache.
template <typename Fn>
CachedFunction<std::decay_t<Fn>> cacheFunction(std::shared_ptr<LruCacheDict> cache,
                                               std::string function_id,
                                               Fn&& fn,
                                               DecoratorOptions options = {}) {
    return CachedFunction<std::decay_t<Fn>>(std::move(function_id), std::forward<Fn>(fn),
                                            std::move(cache), options);
}

// Builds a dedicated cache on store and wraps fn around it.
template <typename Fn>
CachedFunction<std::decay_t<Fn>> cacheFunction(std::shared_ptr<StoreInterface> store,
                                               CacheOptions cache_options,
                                               std::string function_id,
                                               Fn&& fn,
                                               std::shared_ptr<ILogger> logger,
                                               std::shared_ptr<IStatsDClient> statsd_client = nullptr) {
    auto cache = std::make_shared<LruCacheDict>(std::move(store), std::move(cache_options),
                                                std::move(logger), std::move(statsd_client));
    return cacheFunction(std::move(cache), std::move(function_id), std::forward<Fn>(fn));
}

#endif // CACHEDFUNCTION_HPP
