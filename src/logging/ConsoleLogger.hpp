#pragma once

#include <iostream>
#include <memory>
#include <mutex>

#include "../config/AppConfig.hpp"
#include "../interfaces/ILogger.hpp"

// Line-oriented logger writing "<prefix><message>" to one stream.
// Setup messages are written whatever the configured level.
class ConsoleLogger : public ILogger {
public:
    // Process-wide logger on std::clog; the level of the first call wins.
    static std::shared_ptr<ConsoleLogger> getInstance(LogUtils::LogLevel logLevel);

    ConsoleLogger(LogUtils::LogLevel logLevel, std::ostream& out);
    ~ConsoleLogger() override = default;

    void info(const std::string& message) override;    
    void debug(const std::string& message) override;
    void warn(const std::string& message) override;
    void error(const std::string& message) override;
    void setup(const std::string& message) override;
    int getLogLevel() override { return logLevel; }

    ConsoleLogger(const ConsoleLogger&) = delete;
    ConsoleLogger& operator=(const ConsoleLogger&) = delete;
    ConsoleLogger(ConsoleLogger&&) = delete;
    ConsoleLogger& operator=(ConsoleLogger&&) = delete;

private:
    void write(LogUtils::LogLevel level, const std::string& prefix, const std::string& message);

    LogUtils::LogLevel logLevel;
    std::ostream& out_;
    std::mutex out_mutex_;

    static std::shared_ptr<ConsoleLogger> instance;
    static std::once_flag init_flag;
};
