#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

#include <cpp-statsd-client/UDPSender.hpp>

#include "../config/AppConfig.hpp"
#include "../interfaces/ILogger.hpp"
#include "../interfaces/IStatsDClient.hpp"

// Batches StatsD lines over UDP. Every metric name is prefixed with
// "<namespace>." so several caches can report to one server.
class StatsDClient : public IStatsDClient {
public:
    // statsd_address is "<host>:<port>"; throws std::runtime_error when malformed.
    StatsDClient(const AppConfig& config,
                 std::shared_ptr<ILogger> logger,
                 const std::string& statsd_address);
    ~StatsDClient() override;

    void increment(const std::string& key, int value = 1) override;
    void decrement(const std::string& key, int value = 1) override;
    void gauge(const std::string& key, double value) override;
    void timing(const std::string& key, std::chrono::milliseconds value) override;
    void set(const std::string& key, const std::string& value) override;

    // "<prefix><key>:<value>|<type>"
    static std::string formatLine(const std::string& prefix, const std::string& key,
                                  const std::string& value, const std::string& type);

private:
    void send(const std::string& key, const std::string& value, const std::string& type);

    std::shared_ptr<ILogger> logger_;
    std::string prefix_;
    std::unique_ptr<Statsd::UDPSender> udp_sender_;

    StatsDClient(const StatsDClient&) = delete;
    StatsDClient& operator=(const StatsDClient&) = delete;
};
