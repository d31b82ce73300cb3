#include <stdexcept>

#include "LoggingStatsDClient.hpp"
#include "../config/AppConfig.hpp"

LoggingStatsDClient::LoggingStatsDClient(std::shared_ptr<ILogger> logger) : logger_(logger) {
    if (!logger_) {
        throw std::invalid_argument("Logger cannot be null for LoggingStatsDClient");
    }
}

void LoggingStatsDClient::increment(const std::string& key, int value) {
    if (logger_->getLogLevel() <= LogUtils::LogLevel::DEBUG) {
        logger_->debug("metric " + key + ":" + std::to_string(value) + "|c");
    }
}

void LoggingStatsDClient::timing(const std::string& key, std::chrono::milliseconds value) {
    if (logger_->getLogLevel() <= LogUtils::LogLevel::DEBUG) {
        logger_->debug("metric " + key + ":" + std::to_string(value.count()) + "|ms");
    }
}
