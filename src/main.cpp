#include <chrono>
#include <cstdlib>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "cache/LsCache.hpp"
#include "cli/CommandRunner.hpp"
#include "config/AppConfig.hpp"
#include "core/SystemClock.hpp"
#include "logging/ConsoleLogger.hpp"
#include "metrics/LoggingStatsDClient.hpp"
#include "metrics/StatsDClient.hpp"
#include "storage/InMemoryStorage.hpp"
#include "storage/RedisStorage.hpp"
#include "utils/Utils.hpp"

// --- Helper Function to Initialize the Storage Medium ---
std::shared_ptr<IStorageMedium> initializeStorage(const AppConfig& config_, std::shared_ptr<ILogger> logger_) {
    if (config_.use_redis) {
        auto redis_storage = std::make_shared<RedisStorage>(config_, logger_);
        if (redis_storage->isConnected()) {
            logger_->setup("Redis storage connected successfully.");
            return redis_storage;
        }
        logger_->error("Redis storage unavailable at " + config_.redis_host + ":" +
                       std::to_string(config_.redis_port) + ". Falling back to in-memory storage.");
    }
    logger_->setup("Creating InMemoryStorage with " + std::to_string(config_.storage_capacity_bytes) + " bytes.");
    return std::make_shared<InMemoryStorage>(static_cast<size_t>(config_.storage_capacity_bytes));
}

// --- Helper Function to Initialize StatsD Client ---
std::shared_ptr<IStatsDClient> initializeStatsDClient(const AppConfig& config, std::shared_ptr<ILogger> logger_) {
    std::string statsd_server_endpoint;
    const char* statsd_server_value = std::getenv("STATSD_SERVER");
    if (statsd_server_value != nullptr) {
        statsd_server_endpoint = std::string(statsd_server_value);
    }

    if (statsd_server_endpoint.empty()) {
        logger_->debug("STATSD_SERVER not set. Metrics go to the debug log.");
        return std::make_shared<LoggingStatsDClient>(logger_);
    }

    try {
        logger_->setup("STATSD_SERVER endpoint : " + statsd_server_endpoint);
        return StatsDClient::getInstance(config, logger_, statsd_server_endpoint);
    } catch (const std::exception& e) {
        logger_->error("StatsDClient failed to get created: " + std::string(e.what()) +
                       ". Metrics go to the debug log.");
    }
    return std::make_shared<LoggingStatsDClient>(logger_);
}

// --- Main Function ---
// Usage:
//   lscache_cli [config overrides] op=<set|get|remove|flush|supported|bucket> key=<key> value=<value> ttl=<units>
//   lscache_cli [config overrides] < script
int main(int argc, char** argv) {
    try {
        // Process command-line arguments.
        std::vector<std::string> args_vec;
        for (int i = 1; i < argc; ++i) {
            args_vec.push_back(argv[i]);
        }

        std::optional<std::map<std::string, std::string>> parsedArgsOpt = Utils::parseArguments(args_vec);
        if (!parsedArgsOpt) {
            // Use a temporary logger instance for early errors before config is loaded
            ConsoleLogger::getInstance(LogUtils::LogLevel::CERROR)->error("Failed to parse command-line arguments. Exiting.");
            return ExitCodes::BAD_ARGUMENTS;
        }

        std::map<std::string, std::string> startupArguments = parsedArgsOpt.value();

        // Load Configuration
        AppConfig config_ = Utils::loadConfiguration(startupArguments);

        // Initialize the main logger *after* loading the config
        std::shared_ptr<ILogger> logger_ = ConsoleLogger::getInstance(config_.log_level);
        if (logger_->getLogLevel() <= LogUtils::LogLevel::DEBUG) {
            logger_->debug(config_.to_string());
        }

        std::shared_ptr<IStatsDClient> statsd_client = initializeStatsDClient(config_, logger_);
        std::shared_ptr<IStorageMedium> storage = initializeStorage(config_, logger_);
        auto clock = std::make_shared<SystemClock>(std::chrono::milliseconds(config_.expiry_unit_millis));
        auto cache = std::make_shared<LsCache>(storage, clock, config_, logger_, statsd_client);

        CommandRunner runner(cache, logger_);
        if (startupArguments.count("op") == 0) {
            return runner.runScript(std::cin, std::cout);
        }

        std::optional<Command> command = CommandRunner::fromArguments(startupArguments);
        if (!command) {
            logger_->error("Invalid command. Expected op=<set|get|remove|flush|supported|bucket> with its arguments.");
            return ExitCodes::BAD_ARGUMENTS;
        }
        return runner.execute(*command, std::cout);
    } catch (const std::exception& e) {
        std::stringstream ss;
        ss << "Unhandled exception: " << e.what();
        ConsoleLogger::getInstance(LogUtils::LogLevel::CERROR)->error(ss.str());
        return ExitCodes::BAD_ARGUMENTS;
    }
}
