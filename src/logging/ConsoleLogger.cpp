#include <iostream>
#include <mutex>
#include <string>

#include "ConsoleLogger.hpp"

std::shared_ptr<ConsoleLogger> ConsoleLogger::instance = nullptr;
std::once_flag ConsoleLogger::init_flag;

// stdout carries command results, so the shared logger writes to stderr.
std::shared_ptr<ConsoleLogger> ConsoleLogger::getInstance(LogUtils::LogLevel logLevel) {
    std::call_once(init_flag, [logLevel]() {
        instance = std::make_shared<ConsoleLogger>(logLevel, std::clog);
    });
    return instance;
}

ConsoleLogger::ConsoleLogger(LogUtils::LogLevel logLevel, std::ostream& out)
    : logLevel(logLevel), out_(out) {}

void ConsoleLogger::write(LogUtils::LogLevel level, const std::string& prefix, const std::string& message) {
    if (level < logLevel) {
        return;
    }
    std::lock_guard<std::mutex> lock(out_mutex_);
    out_ << prefix << message << std::endl;
}

void ConsoleLogger::info(const std::string& message) {
    write(LogUtils::LogLevel::INFO, LogUtils::INFO_LOG_PREFIX, message);
}

void ConsoleLogger::debug(const std::string& message) {
    write(LogUtils::LogLevel::DEBUG, LogUtils::DEBUG_LOG_PREFIX, message);
}

void ConsoleLogger::warn(const std::string& message) {
    write(LogUtils::LogLevel::WARN, LogUtils::WARN_LOG_PREFIX, message);
}

void ConsoleLogger::error(const std::string& message) {
    write(LogUtils::LogLevel::CERROR, LogUtils::CERROR_LOG_PREFIX, message);
}

void ConsoleLogger::setup(const std::string& message) {
    write(LogUtils::LogLevel::SETUP, LogUtils::SETUP_LOG_PREFIX, message);
}
