#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "../config/AppConfig.hpp"
#include "../interfaces/IStorageMedium.hpp"

// Forward declarations
struct redisContext;
struct redisReply;
class ILogger;

// Medium backed by a Redis server. The server's maxmemory limit is the
// capacity: with the noeviction policy a full server answers writes with an
// OOM error, which is reported as StorageStatus::CapacityExceeded.
class RedisStorage : public IStorageMedium {
public:
    explicit RedisStorage(const AppConfig& config, std::shared_ptr<ILogger> logger);
    ~RedisStorage() override;

    std::optional<std::string> getItem(const std::string& key) override;
    StorageStatus setItem(const std::string& key, const std::string& value) override;
    void removeItem(const std::string& key) override;
    std::vector<std::string> keys(const std::string& prefix) override;

    // Check if the medium is connected to Redis
    bool isConnected() const;

    // Escapes the glob metacharacters SCAN MATCH understands.
    static std::string escapeGlobPattern(const std::string& literal);

private:
    void connect();
    void dropConnection(const std::string& command);

    std::string redis_host_;
    int redis_port_;
    std::shared_ptr<ILogger> logger_;
    redisContext* redis_context_;
    mutable std::mutex mutex_;

    RedisStorage(const RedisStorage&) = delete;
    RedisStorage& operator=(const RedisStorage&) = delete;
};
