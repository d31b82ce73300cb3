#pragma once

#include <chrono>
#include <memory>
#include <string>

#include "../interfaces/ILogger.hpp"
#include "../interfaces/IStatsDClient.hpp"

// Fallback when STATSD_SERVER is not configured: metrics are written to the
// debug log in StatsD line format instead of being sent.
class LoggingStatsDClient : public IStatsDClient {
public:
    explicit LoggingStatsDClient(std::shared_ptr<ILogger> logger);
    ~LoggingStatsDClient() override = default;

    void increment(const std::string& key, int value = 1) override;
    void timing(const std::string& key, std::chrono::milliseconds value) override;

private:
    std::shared_ptr<ILogger> logger_;
};
