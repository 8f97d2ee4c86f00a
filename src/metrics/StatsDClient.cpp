#include <sstream>
#include <stdexcept>

#include "StatsDClient.hpp"

StatsDClient::StatsDClient(
    const AppConfig& config,
    std::shared_ptr<ILogger> logger,
    const std::string& statsd_address) : logger_(logger), prefix_(config.cache.key_namespace + ".") {
    auto colon_pos = statsd_address.rfind(':');
    if (colon_pos == std::string::npos || colon_pos == 0) {
        throw std::runtime_error("STATSD_SERVER must be in the format <host>:<port>");
    }

    std::string host = statsd_address.substr(0, colon_pos);
    if (host == "localhost") {
        host = "127.0.0.1";
    }

    int port;
    try {
        port = std::stoi(statsd_address.substr(colon_pos + 1));
    } catch (const std::exception& e) {
        throw std::runtime_error("Invalid port in STATSD_SERVER: " + std::string(e.what()));
    }
    if (port <= 0 || port > 65535) {
        throw std::runtime_error("Port out of range in STATSD_SERVER: " + std::to_string(port));
    }

    udp_sender_ = std::make_unique<Statsd::UDPSender>(
        host,
        static_cast<uint16_t>(port),
        static_cast<uint64_t>(config.metrics_batch_size),
        static_cast<uint64_t>(config.metrics_send_interval_in_millis));
    if (!udp_sender_->initialized()) {
        throw std::runtime_error("Failed to initialize UDPSender: " + udp_sender_->errorMessage());
    }
    logger_->setup("UDPSender initialized for " + host + ":" + std::to_string(port));
}

StatsDClient::~StatsDClient() {
    logger_->debug("StatsDClient destroyed.");
}

std::string StatsDClient::formatLine(const std::string& prefix, const std::string& key,
                                     const std::string& value, const std::string& type) {
    std::stringstream ss;
    ss << prefix << key << ":" << value << "|" << type;
    return ss.str();
}

void StatsDClient::send(const std::string& key, const std::string& value, const std::string& type) {
    udp_sender_->send(formatLine(prefix_, key, value, type));
}

void StatsDClient::increment(const std::string& key, int value) {
    send(key, std::to_string(value), "c");
}

void StatsDClient::decrement(const std::string& key, int value) {
    increment(key, -value);
}

void StatsDClient::gauge(const std::string& key, double value) {
    std::stringstream ss;
    ss << value;
    send(key, ss.str(), "g");
}

void StatsDClient::timing(const std::string& key, std::chrono::milliseconds value) {
    send(key, std::to_string(value.count()), "ms");
}

void StatsDClient::set(const std::string& key, const std::string& value) {
    send(key, value, "s");
}
