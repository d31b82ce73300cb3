#include <cstring>
#include <stdexcept>
#include <unordered_set>
#include <utility>

#include <hiredis/hiredis.h>

#include "RedisStorage.hpp"
#include "../interfaces/ILogger.hpp"

namespace {
    constexpr int SCAN_BATCH_SIZE = 100;
    constexpr auto OOM_ERROR_PREFIX = "OOM";
}

RedisStorage::RedisStorage(const AppConfig& config, std::shared_ptr<ILogger> logger)
    : redis_host_(config.redis_host),
      redis_port_(config.redis_port),
      logger_(logger),
      redis_context_(nullptr) {
    if (!logger_) {
        throw std::invalid_argument("Logger cannot be null for RedisStorage");
    }
    connect();
}

RedisStorage::~RedisStorage() {
    if (redis_context_) {
        redisFree(redis_context_);
    }
}

void RedisStorage::connect() {
    redis_context_ = redisConnect(redis_host_.c_str(), redis_port_);
    if (redis_context_ == nullptr || redis_context_->err) {
        std::string error_msg;
        if (redis_context_) {
            error_msg = "Redis connection error: " + std::string(redis_context_->errstr);
            redisFree(redis_context_);
            redis_context_ = nullptr;
        } else {
            error_msg = "Redis connection error: can't allocate redis context";
        }
        logger_->error(error_msg);
    }
}

// A context that returned a null reply is unusable; release it so later
// calls report Unavailable instead of reusing a broken connection.
void RedisStorage::dropConnection(const std::string& command) {
    logger_->error("Redis " + command + " failed: " + std::string(redis_context_->errstr) +
                   ". Dropping connection to " + redis_host_ + ":" + std::to_string(redis_port_));
    redisFree(redis_context_);
    redis_context_ = nullptr;
}

std::optional<std::string> RedisStorage::getItem(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!redis_context_) {
        logger_->error("Redis not connected. Cannot GET key: " + key);
        return std::nullopt;
    }

    redisReply* reply = (redisReply*)redisCommand(redis_context_, "GET %b", key.data(), key.size());
    if (reply == nullptr) {
        dropConnection("GET");
        return std::nullopt;
    }

    std::optional<std::string> result;
    if (reply->type == REDIS_REPLY_STRING) {
        result = std::string(reply->str, reply->len);
    }

    freeReplyObject(reply);
    return result;
}

StorageStatus RedisStorage::setItem(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!redis_context_) {
        logger_->error("Redis not connected. Cannot SET key: " + key);
        return StorageStatus::Unavailable;
    }

    redisReply* reply = (redisReply*)redisCommand(redis_context_,
        "SET %b %b",
        key.data(), key.size(),
        value.data(), value.size());
    if (reply == nullptr) {
        dropConnection("SET");
        return StorageStatus::Unavailable;
    }

    StorageStatus status = StorageStatus::Ok;
    if (reply->type == REDIS_REPLY_ERROR) {
        if (std::strncmp(reply->str, OOM_ERROR_PREFIX, std::strlen(OOM_ERROR_PREFIX)) == 0) {
            status = StorageStatus::CapacityExceeded;
        } else {
            logger_->error("Redis SET error for key '" + key + "': " + std::string(reply->str, reply->len));
            status = StorageStatus::Unavailable;
        }
    }

    freeReplyObject(reply);
    return status;
}

void RedisStorage::removeItem(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!redis_context_) {
        logger_->error("Redis not connected. Cannot DEL key: " + key);
        return;
    }

    redisReply* reply = (redisReply*)redisCommand(redis_context_, "DEL %b", key.data(), key.size());
    if (reply == nullptr) {
        dropConnection("DEL");
        return;
    }
    if (reply->type == REDIS_REPLY_ERROR) {
        logger_->error("Redis DEL error for key '" + key + "': " + std::string(reply->str, reply->len));
    }
    freeReplyObject(reply);
}

std::vector<std::string> RedisStorage::keys(const std::string& prefix) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> result;
    if (!redis_context_) {
        logger_->error("Redis not connected. Cannot SCAN prefix: " + prefix);
        return result;
    }

    const std::string pattern = escapeGlobPattern(prefix) + "*";
    std::unordered_set<std::string> seen; // SCAN may return a key more than once
    std::string cursor = "0";
    do {
        redisReply* reply = (redisReply*)redisCommand(redis_context_,
            "SCAN %s MATCH %b COUNT %d",
            cursor.c_str(),
            pattern.data(), pattern.size(),
            SCAN_BATCH_SIZE);
        if (reply == nullptr) {
            dropConnection("SCAN");
            return result;
        }

        if (reply->type != REDIS_REPLY_ARRAY || reply->elements != 2) {
            logger_->error("Unexpected SCAN reply for prefix: " + prefix);
            freeReplyObject(reply);
            return result;
        }

        redisReply* next_cursor = reply->element[0];
        redisReply* batch = reply->element[1];
        cursor = std::string(next_cursor->str, next_cursor->len);
        for (size_t i = 0; i < batch->elements; ++i) {
            std::string key(batch->element[i]->str, batch->element[i]->len);
            if (seen.insert(key).second) {
                result.push_back(std::move(key));
            }
        }
        freeReplyObject(reply);
    } while (cursor != "0");

    return result;
}

bool RedisStorage::isConnected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return redis_context_ != nullptr;
}

std::string RedisStorage::escapeGlobPattern(const std::string& literal) {
    std::string escaped;
    escaped.reserve(literal.size());
    for (char c : literal) {
        if (c == '*' || c == '?' || c == '[' || c == ']' || c == '\\') {
            escaped.push_back('\\');
        }
        escaped.push_back(c);
    }
    return escaped;
}
