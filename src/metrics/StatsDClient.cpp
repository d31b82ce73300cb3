#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>

#include "StatsDClient.hpp"
#include "../utils/Utils.hpp"

std::shared_ptr<StatsDClient> StatsDClient::instance = nullptr;
std::once_flag StatsDClient::init_flag;

// The first successful call decides the endpoint for the process.
std::shared_ptr<StatsDClient> StatsDClient::getInstance(
    const AppConfig& config, 
    std::shared_ptr<ILogger> logger, 
    const std::string& stats_server_endpoint) {
    std::call_once(init_flag, [config, logger, stats_server_endpoint]() {
        instance = std::shared_ptr<StatsDClient>(new StatsDClient(config, logger, stats_server_endpoint));
    });

    return instance;
}

StatsDClient::StatsDClient(
    const AppConfig& config, 
    std::shared_ptr<ILogger> logger, 
    const std::string& statsd_address) : logger_(logger), prefix_(config.metrics_prefix), udp_sender_(nullptr) {
    if (!logger_) {
        throw std::invalid_argument("Logger cannot be null for StatsDClient");
    }
    auto colon_pos = statsd_address.find(':');
    if (colon_pos == std::string::npos) {
        throw std::runtime_error("STATSD_SERVER must be in the format <host>:<port>");
    }

    std::string host_ = statsd_address.substr(0, colon_pos);
    if (host_ == "localhost") {
        host_ = "127.0.0.1";
    }

    auto parsed_port = Utils::stringToInt(statsd_address.substr(colon_pos + 1));
    if (!parsed_port || *parsed_port <= 0 || *parsed_port > 65535) {
        throw std::runtime_error("Invalid port in STATSD_SERVER: " + statsd_address.substr(colon_pos + 1));
    }
    uint16_t port = static_cast<uint16_t>(*parsed_port);

    // UDPSender reports setup failures through initialized() instead of throwing
    udp_sender_ = std::make_unique<Statsd::UDPSender>(
        host_, port,
        static_cast<uint64_t>(config.metrics_batch_size),
        static_cast<uint64_t>(config.metrics_send_interval_in_millis));
    if (!udp_sender_->initialized()) {
        throw std::runtime_error("Failed to initialize UDPSender: " + udp_sender_->errorMessage());
    }
    logger_->setup("UDPSender initialized for " + host_ + ":" + std::to_string(port));
}


StatsDClient::~StatsDClient() {
    logger_->debug("StatsDClient destroyed.");
}

// Send a message to the StatsD server
void StatsDClient::send(const std::string& message) {
    if (!udp_sender_) {
        logger_->error("StatsDClient: UDPSender is not initialized, cannot send message.");
        return;
    }
    udp_sender_->send(message);
}

// Increment a counter
void StatsDClient::increment(const std::string& key, int value) {
    std::stringstream ss;
    ss << prefix_ << key << ":" << value << "|c";
    send(ss.str());
}

// Record a timing value
void StatsDClient::timing(const std::string& key, std::chrono::milliseconds value) {
    std::stringstream ss;
    ss << prefix_ << key << ":" << value.count() << "|ms";
    send(ss.str());
}