#ifndef UTILS_HPP
#define UTILS_HPP

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <iostream>
#include <map>
#include <optional>
#include <regex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "../config/AppConfig.hpp"
#include "../models/TimeOfDay.hpp"

using json = nlohmann::json;

class Utils {
public:
    // Converts a string to a LogLevel enum
    static LogUtils::LogLevel stringToLogLevel(const std::string& level) {
        if (level == "DEBUG") return LogUtils::LogLevel::DEBUG;
        if (level == "INFO") return LogUtils::LogLevel::INFO;
        if (level == "WARNING") return LogUtils::LogLevel::WARN;
        if (level == "CERROR") return LogUtils::LogLevel::CERROR;
        throw std::invalid_argument("Invalid log level: " + level);
    }

    // Helper to parse integer safely
    static std::optional<int> stringToInt(const std::string& str) {
        try {
            size_t pos;
            int val = std::stoi(str, &pos);
            // Check if the entire string was consumed
            if (pos == str.length()) {
                return val;
            }
        } catch (const std::invalid_argument&) {
            // Not an integer
        } catch (const std::out_of_range&) {
            // Integer out of range
        }
        return std::nullopt;
    }

    // Helper to trim whitespace from start and end of string
    static std::string trim(const std::string& str) {
        size_t first = str.find_first_not_of(" \t\n\r");
        if (std::string::npos == first) return "";
        size_t last = str.find_last_not_of(" \t\n\r");
        return str.substr(first, (last - first + 1));
    }

    // Parses "HH:MM" or "HH:MM:SS" (24h clock).
    static std::optional<TimeOfDay> parseTimeOfDay(const std::string& text) {
        static const std::regex time_regex(R"(^(\d{1,2}):(\d{2})(?::(\d{2}))?$)");
        std::smatch match;
        if (!std::regex_match(text, match, time_regex)) {
            return std::nullopt;
        }
        TimeOfDay t;
        t.hour = std::stoi(match[1].str());
        t.minute = std::stoi(match[2].str());
        t.second = match[3].matched ? std::stoi(match[3].str()) : 0;
        if (t.hour > 23 || t.minute > 59 || t.second > 59) {
            return std::nullopt;
        }
        return t;
    }

    // Seconds from now_local until the next occurrence of target, in (0, 86400].
    static int secondsUntil(const TimeOfDay& target, const std::tm& now_local) {
        constexpr int day = 24 * 3600;
        int now_seconds = now_local.tm_hour * 3600 + now_local.tm_min * 60 + now_local.tm_sec;
        int target_seconds = target.hour * 3600 + target.minute * 60 + target.second;
        int delta = ((target_seconds - now_seconds) % day + day) % day;
        return delta == 0 ? day : delta;
    }

    static int secondsUntil(const TimeOfDay& target) {
        std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        std::tm now_local{};
        localtime_r(&now, &now_local);
        return secondsUntil(target, now_local);
    }

    // Function to parse key-value pairs from a string (using optional version)
    static std::optional<std::map<std::string, std::string>> parseArguments(const std::vector<std::string>& args) {
        std::map<std::string, std::string> argMap;
        for (const std::string& arg : args) {
            size_t delimiterPos = arg.find('=');
            if (delimiterPos != std::string::npos && delimiterPos > 0) { // Ensure key is not empty
                std::string key = arg.substr(0, delimiterPos);
                std::string value = arg.substr(delimiterPos + 1);
                argMap[key] = value;
            } else {
                std::cerr << "Error: Invalid argument format: '" << arg << "'. Expected non-empty key=value format." << std::endl;
                return std::nullopt; // Signal failure
            }
        }
        return argMap; // Signal success
    }

    // Applies one configuration setting. Returns false for keys that are not
    // configuration (the CLI's op/key/value arguments end up here too).
    static bool applySetting(AppConfig& config, const std::string& key, const std::string& value) {
        auto setInt = [&](int& target, int min_value) {
            auto val = stringToInt(value);
            if (val && *val >= min_value) {
                target = *val;
            } else {
                std::cerr << "Warning: Invalid integer for " << key << ": " << value << std::endl;
            }
        };
        auto setFlag = [&](bool& target) {
            if (auto val = stringToInt(value); val && (*val == 0 || *val == 1)) {
                target = (*val == 1);
            } else {
                std::cerr << "Warning: Invalid flag for " << key << " (expected 0 or 1): " << value << std::endl;
            }
        };

        if (key == "use_redis") {
            setFlag(config.use_redis);
        } else if (key == "redis_host") {
            config.redis_host = value;
        } else if (key == "redis_port") {
            auto val = stringToInt(value);
            if (val && *val > 0 && *val <= 65535) {
                config.redis_port = *val;
            } else {
                std::cerr << "Warning: Invalid integer for redis_port: " << value << std::endl;
            }
        } else if (key == "redis_db") {
            setInt(config.redis_db, 0);
        } else if (key == "redis_password") {
            config.redis_password = value;
        } else if (key == "connect_timeout") {
            // value provided in millis
            setInt(config.connect_timeout_in_millis, 1);
        } else if (key == "command_timeout") {
            setInt(config.command_timeout_in_millis, 1);
        } else if (key == "namespace") {
            if (!value.empty()) {
                config.cache.key_namespace = value;
            } else {
                std::cerr << "Warning: Empty namespace ignored" << std::endl;
            }
        } else if (key == "max_size") {
            int max_size = 0;
            setInt(max_size, 1);
            if (max_size > 0) {
                config.cache.max_size = static_cast<std::size_t>(max_size);
            }
        } else if (key == "default_ttl") {
            // value provided in seconds, 0 disables expiration
            setInt(config.cache.default_ttl, 0);
        } else if (key == "expiration_mode") {
            if (value == "write") {
                config.cache.expiration_mode = ExpirationMode::OnWrite;
            } else if (value == "access") {
                config.cache.expiration_mode = ExpirationMode::OnAccess;
            } else {
                std::cerr << "Warning: Invalid expiration_mode (expected write or access): " << value << std::endl;
            }
        } else if (key == "clear_on_exit") {
            setFlag(config.cache.clear_on_exit);
        } else if (key == "expire_on") {
            if (auto t = parseTimeOfDay(value)) {
                config.cache.expire_on = *t;
            } else {
                std::cerr << "Warning: Invalid expire_on (expected HH:MM[:SS]): " << value << std::endl;
            }
        } else if (key == "exclude_values") {
            json parsed = json::parse(value, nullptr, false);
            if (parsed.is_array()) {
                config.cache.exclude_values.assign(parsed.begin(), parsed.end());
            } else {
                std::cerr << "Warning: Invalid exclude_values (expected a JSON array): " << value << std::endl;
            }
        } else if (key == "log_level") {
            try {
                config.log_level = stringToLogLevel(value);
            } catch (const std::invalid_argument& e) {
                std::cerr << "Warning: " << e.what() << std::endl;
            }
        } else if (key == "metrics_batch_size") {
            setInt(config.metrics_batch_size, 1);
        } else if (key == "metrics_send_interval") {
            // value provided in millis
            setInt(config.metrics_send_interval_in_millis, 1);
        } else {
            return false;
        }
        return true;
    }

    // Load configuration: defaults, then the first config file found, then
    // key=value startup arguments.
    static AppConfig loadConfiguration(const std::map<std::string, std::string>& startupArguments) {
        AppConfig config;

        // --- Load from Config File ---
        std::vector<std::string> config_paths = {
            Constants::CONFIG_FILE_NAME,                              // Current directory
            std::string("../") + Constants::CONFIG_FILE_NAME,         // Parent directory
            std::string("/etc/redislru/") + Constants::CONFIG_FILE_NAME
        };

        bool config_found = false;
        for (const auto& config_path : config_paths) {
            std::ifstream configFile(config_path);
            if (configFile.is_open()) {
                std::cerr << "Reading configuration from " << config_path << "..." << std::endl;
                config_found = true;
                std::string line;
                while (std::getline(configFile, line)) {
                    line = trim(line);
                    if (line.empty() || line[0] == '#') { // Skip empty lines and comments
                        continue;
                    }
                    size_t delimiterPos = line.find('=');
                    if (delimiterPos != std::string::npos && delimiterPos > 0) {
                        std::string key = trim(line.substr(0, delimiterPos));
                        std::string value = trim(line.substr(delimiterPos + 1));
                        if (!applySetting(config, key, value)) {
                            std::cerr << "Warning: Unknown key in config file: " << key << std::endl;
                        }
                    }
                }
                break;
            }
        }

        if (!config_found) {
            std::cerr << "Warning: Configuration file not found in any standard location. Using defaults and command-line arguments." << std::endl;
        }

        // Process StartUp Arguments
        for (const auto& [key, value] : startupArguments) {
            applySetting(config, key, value);
        }

        return config;
    }
};

#endif // UTILS_HPP
