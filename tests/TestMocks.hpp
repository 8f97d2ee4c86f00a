#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "gmock/gmock.h"

#include "../src/interfaces/ILogger.hpp"
#include "../src/interfaces/IStatsDClient.hpp"
#include "../src/interfaces/StoreInterface.hpp"

// --- Mock Logger ---
class MockLogger : public ILogger {
public:
    MockLogger() {
        ON_CALL(*this, getLogLevel()).WillByDefault(testing::Return(LogUtils::LogLevel::WARN));
    }
    MOCK_METHOD(void, info, (const std::string& message), (override));
    MOCK_METHOD(void, debug, (const std::string& message), (override));
    MOCK_METHOD(void, warn, (const std::string& message), (override));
    MOCK_METHOD(void, error, (const std::string& message), (override));
    MOCK_METHOD(void, setup, (const std::string& message), (override));
    MOCK_METHOD(int, getLogLevel, (), (override));
};

// Mock class for StatsDClient
class MockStatsDClient : public IStatsDClient {
public:
    MOCK_METHOD(void, increment, (const std::string& key, int value), (override));
    MOCK_METHOD(void, decrement, (const std::string& key, int value), (override));
    MOCK_METHOD(void, gauge, (const std::string& key, double value), (override));
    MOCK_METHOD(void, timing, (const std::string& key, std::chrono::milliseconds value), (override));
    MOCK_METHOD(void, set, (const std::string& key, const std::string& value), (override));
};

// --- Mock Store ---
class MockStore : public StoreInterface {
public:
    MOCK_METHOD(std::vector<std::string>, writeEntry,
                (const EntryKeys& keys, const std::string& value, int ttl_seconds, std::size_t max_size),
                (override));
    MOCK_METHOD(std::optional<std::string>, readEntry, (const EntryKeys& keys, bool restart_ttl), (override));
    MOCK_METHOD(bool, removeEntry, (const EntryKeys& keys), (override));
    MOCK_METHOD(bool, exists, (const std::string& key), (override));
    MOCK_METHOD(std::size_t, indexSize, (const std::string& index_key), (override));
    MOCK_METHOD(std::vector<std::string>, indexMembers, (const std::string& index_key), (override));
    MOCK_METHOD(std::optional<long long>, timeToLive, (const std::string& key), (override));
    MOCK_METHOD(std::size_t, removeByPrefix, (const std::string& prefix), (override));
    MOCK_METHOD(bool, ping, (), (override));
};
