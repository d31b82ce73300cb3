#ifndef UTILS_HPP
#define UTILS_HPP

#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "../config/AppConfig.hpp"

class Utils {
public:
    // Converts a string to a LogLevel enum
    static LogUtils::LogLevel stringToLogLevel(const std::string& level) {
        if (level == "DEBUG") return LogUtils::LogLevel::DEBUG;
        if (level == "INFO") return LogUtils::LogLevel::INFO;
        if (level == "WARNING") return LogUtils::LogLevel::WARN;
        if (level == "CERROR") return LogUtils::LogLevel::CERROR;
        throw std::invalid_argument("Invalid log level: " + level);
    }

    // Helper to parse integer safely
    static std::optional<int> stringToInt(const std::string& str) {
        try {
            size_t pos;
            int val = std::stoi(str, &pos);
            // Check if the entire string was consumed
            if (pos == str.length()) {
                return val;
            }
        } catch (const std::invalid_argument&) {
            // Not an integer
        } catch (const std::out_of_range&) {
            // Integer out of range
        }
        return std::nullopt;
    }

    static std::optional<int64_t> stringToInt64(const std::string& str) {
        try {
            size_t pos;
            long long val = std::stoll(str, &pos);
            if (pos == str.length()) {
                return static_cast<int64_t>(val);
            }
        } catch (const std::invalid_argument&) {
        } catch (const std::out_of_range&) {
        }
        return std::nullopt;
    }

    // Helper to trim whitespace from start and end of string
    static std::string trim(const std::string& str) {
        size_t first = str.find_first_not_of(" \t\n\r");
        if (std::string::npos == first) return "";
        size_t last = str.find_last_not_of(" \t\n\r");
        return str.substr(first, (last - first + 1));
    }

    // Function to parse key-value pairs from a string (using optional version)
    static std::optional<std::map<std::string, std::string>> parseArguments(const std::vector<std::string>& args) {
        std::map<std::string, std::string> argMap;
        for (const std::string& arg : args) {
            size_t delimiterPos = arg.find('=');
            if (delimiterPos != std::string::npos && delimiterPos > 0) { // Ensure key is not empty
                std::string key = arg.substr(0, delimiterPos);
                std::string value = arg.substr(delimiterPos + 1);
                argMap[key] = value;
            } else {
                std::cerr << "Error: Invalid argument format: '" << arg << "'. Expected non-empty key=value format." << std::endl;
                return std::nullopt; // Signal failure
            }
        }
        return argMap; // Signal success
    }

    static std::vector<std::string> defaultConfigPaths() {
        return {
            Constants::CONFIG_FILE_NAME,                          // Current directory
            std::string("../") + Constants::CONFIG_FILE_NAME,     // Parent directory
            std::string("/app/") + Constants::CONFIG_FILE_NAME,   // Docker container path
            std::string("../../") + Constants::CONFIG_FILE_NAME   // Development path
        };
    }

    // Applies one configuration entry. Returns false if the key is not a
    // configuration key, so callers can pass other arguments through.
    // Invalid values are reported on stderr and leave the default in place.
    static bool applySetting(AppConfig& config, const std::string& key, const std::string& value) {
        if (key == "cache_prefix") {
            config.cache_prefix = value;
        } else if (key == "cache_bucket") {
            config.cache_bucket = value;
        } else if (key == "expiration_suffix") {
            if (value.empty()) {
                std::cerr << "Warning: expiration_suffix cannot be empty." << std::endl;
            } else {
                config.expiration_suffix = value;
            }
        } else if (key == "expiry_unit_millis") {
            auto val = stringToInt(value);
            if (val && *val > 0) {
                config.expiry_unit_millis = *val;
            } else {
                std::cerr << "Warning: Invalid integer for expiry_unit_millis: " << value << std::endl;
            }
        } else if (key == "use_redis") {
            if (auto val = stringToInt(value)) {
                config.use_redis = (*val == 1);
            } else {
                std::cerr << "Warning: Invalid integer for use_redis: " << value << std::endl;
            }
        } else if (key == "redis_host") {
            config.redis_host = value;
        } else if (key == "redis_port") {
            auto val = stringToInt(value);
            if (val && *val > 0 && *val <= 65535) {
                config.redis_port = *val;
            } else {
                std::cerr << "Warning: Invalid port for redis_port: " << value << std::endl;
            }
        } else if (key == "storage_capacity_bytes") {
            auto val = stringToInt(value);
            if (val && *val > 0) {
                config.storage_capacity_bytes = *val;
            } else {
                std::cerr << "Warning: Invalid integer for storage_capacity_bytes: " << value << std::endl;
            }
        } else if (key == "log_level") {
            config.log_level = stringToLogLevel(value);
        } else if (key == "metrics_prefix") {
            config.metrics_prefix = value;
        } else if (key == "metrics_batch_size") {
            if (auto val = stringToInt(value)) {
                config.metrics_batch_size = *val;
            } else {
                std::cerr << "Warning: Invalid integer for metrics_batch_size: " << value << std::endl;
            }
        } else if (key == "metrics_send_interval") {
            if (auto val = stringToInt(value)) {
                // value provided in millis
                config.metrics_send_interval_in_millis = *val;
            } else {
                std::cerr << "Warning: Invalid integer for metrics_send_interval: " << value << std::endl;
            }
        } else {
            return false;
        }
        return true;
    }

    // Load configuration from the first config file found, then let
    // command-line arguments override it.
    static AppConfig loadConfiguration(const std::map<std::string, std::string>& startupArguments,
                                       const std::vector<std::string>& config_paths = defaultConfigPaths()) {
        AppConfig config;

        // --- Load from Config File ---
        bool config_found = false;
        for (const auto& config_path : config_paths) {
            std::ifstream configFile(config_path);
            if (configFile.is_open()) {
                std::cerr << "Reading configuration from " << config_path << "..." << std::endl;
                config_found = true;
                std::string line;
                while (std::getline(configFile, line)) {
                    line = trim(line);
                    if (line.empty() || line[0] == '#') { // Skip empty lines and comments
                        continue;
                    }
                    size_t delimiterPos = line.find('=');
                    if (delimiterPos != std::string::npos && delimiterPos > 0) {
                        std::string key = trim(line.substr(0, delimiterPos));
                        std::string value = trim(line.substr(delimiterPos + 1));
                        if (!applySetting(config, key, value)) {
                            std::cerr << "Warning: Unknown key in config file: " << key << std::endl;
                        }
                    }
                }
                break;
            }
        }

        if (!config_found) {
            std::cerr << "Warning: Configuration file not found in any standard location. Using defaults and command-line arguments." << std::endl;
        }

        // --- Command-line overrides ---
        for (const auto& pair : startupArguments) {
            applySetting(config, pair.first, pair.second);
        }

        return config;
    }
};

#endif // UTILS_HPP
