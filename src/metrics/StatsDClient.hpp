#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

#include <cpp-statsd-client/UDPSender.hpp>

#include "../config/AppConfig.hpp"
#include "../interfaces/ILogger.hpp"
#include "../interfaces/IStatsDClient.hpp"

// Sends counters and timings to a StatsD server over UDP. Every key is
// prefixed with AppConfig::metrics_prefix.
class StatsDClient : public IStatsDClient {
public:
    static std::shared_ptr<StatsDClient> getInstance(
        const AppConfig& config, 
        std::shared_ptr<ILogger> logger, 
        const std::string& stats_server_endpoint);
    ~StatsDClient() override;

    void increment(const std::string& key, int value = 1) override;
    void timing(const std::string& key, std::chrono::milliseconds value) override;

private:
    StatsDClient(
        const AppConfig& config, 
        std::shared_ptr<ILogger> logger, 
        const std::string& stats_server_endpoint);
    void send(const std::string& message);

    std::shared_ptr<ILogger> logger_;
    std::string prefix_;
    std::unique_ptr<Statsd::UDPSender> udp_sender_;

    static std::shared_ptr<StatsDClient> instance;
    static std::once_flag init_flag;

    StatsDClient(const StatsDClient&) = delete;
    StatsDClient& operator=(const StatsDClient&) = delete;
    StatsDClient(StatsDClient&&) = delete;
    StatsDClient& operator=(StatsDClient&&) = delete;
};