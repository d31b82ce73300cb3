#ifndef APPCONFIG_HPP
#define APPCONFIG_HPP

#include <iostream>
#include <sstream>
#include <string>

namespace LogUtils {
    enum LogLevel {
        DEBUG = 0,
        INFO = 1,
        WARN = 2,
        CERROR = 3,
        SETUP = 4
    };

    static std::string DEBUG_LOG_PREFIX = "[Debug] ";
    static std::string INFO_LOG_PREFIX = "[Info] ";
    static std::string WARN_LOG_PREFIX = "[Warning] ";
    static std::string CERROR_LOG_PREFIX = "[Error] ";
    static std::string SETUP_LOG_PREFIX = "[Setup] ";
}

// Counter names reported through IStatsDClient.
namespace MetricsDefinitions {
    static const std::string CACHE_HIT = "cache.hit";

    static const std::string CACHE_MISS = "cache.miss";

    // Entry found with an elapsed expiration and deleted on read.
    static const std::string CACHE_EXPIRED = "cache.expired";

    // Medium rejected a write because it is full.
    static const std::string CAPACITY_EXCEEDED = "cache.capacity_exceeded";

    // Entry removed by the eviction engine to make room.
    static const std::string CACHE_EVICTED = "cache.evicted";

    // Wall time spent in one eviction pass.
    static const std::string EVICTION_DURATION = "cache.eviction_ms";

    // Write abandoned after the single retry.
    static const std::string WRITE_DROPPED = "cache.write_dropped";

    static const std::string SERIALIZATION_FAILURE = "cache.serialization_failure";

    static const std::string MEDIUM_UNAVAILABLE = "cache.unavailable";
}

namespace Constants {
    // Written and removed once to decide whether the medium is usable.
    static constexpr auto STORAGE_PROBE_KEY = "__lscachetest__";
    static constexpr char LEDGER_FIELD_DELIMITER = ',';
    static constexpr auto CONFIG_FILE_NAME = "lscache.config";
};

// --- Configuration Struct ---
class AppConfig {
public:
    // Namespacing: raw key = cache_prefix + cache_bucket + key
    std::string cache_prefix;
    std::string cache_bucket;
    std::string expiration_suffix;

    // Length of one expiry unit; TTLs are expressed in these units.
    int expiry_unit_millis;

    // Storage medium
    bool use_redis;
    std::string redis_host;
    int redis_port;
    int storage_capacity_bytes;

    // Logging Level
    LogUtils::LogLevel log_level;

    // Metrics
    std::string metrics_prefix;
    int metrics_batch_size;
    int metrics_send_interval_in_millis;

    AppConfig() {
        // --- Set Defaults  ---
        cache_prefix = "lscache-";
        cache_bucket = "";
        expiration_suffix = "-cacheexpiration";
        expiry_unit_millis = 60 * 1000; // 1 minute

        use_redis = false;
        redis_host = "localhost";
        redis_port = 6379;
        storage_capacity_bytes = 5 * 1024 * 1024; // Typical local storage quota

        log_level = LogUtils::LogLevel::CERROR; // Default log level
        metrics_prefix = "lscache.";
        metrics_batch_size = 100;
        metrics_send_interval_in_millis = 1000;
    }

    std::string to_string() const {
        std::stringstream ss;
        ss << "// --- Configuration Params Start --- //" << std::endl
            << "// --- Cache Configuration --- //" << std::endl
            << "cache_prefix: " << cache_prefix << std::endl
            << "cache_bucket: " << cache_bucket << std::endl
            << "expiration_suffix: " << expiration_suffix << std::endl
            << "expiry_unit_millis: " << expiry_unit_millis << std::endl
            << "// --- Storage Configuration --- //" << std::endl
            << "use_redis: " << std::boolalpha << use_redis << std::noboolalpha << std::endl
            << "redis_host: " << redis_host << std::endl
            << "redis_port: " << redis_port << std::endl
            << "storage_capacity_bytes: " << storage_capacity_bytes << std::endl
            << "// --- Logging & Metrics --- //" << std::endl
            << "log_level: " << static_cast<int>(log_level) << std::endl  // Cast enum to int
            << "metrics_prefix: " << metrics_prefix << std::endl
            << "metrics_batch_size: " << metrics_batch_size << std::endl
            << "metrics_send_interval_in_millis: " << metrics_send_interval_in_millis << std::endl
            << "// --- Configuration Params End --- //" << std::endl;
        return ss.str();
    }
};

#endif // APPCONFIG_HPP
