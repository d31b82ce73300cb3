#ifndef TYPEDCACHE_HPP
#define TYPEDCACHE_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

#include "../config/AppConfig.hpp"
#include "../interfaces/CacheInterface.hpp"
#include "../interfaces/ILogger.hpp"
#include "../interfaces/IStatsDClient.hpp"
#include "../interfaces/IValueCodec.hpp"

// Stores structured values in a string cache through a caller-supplied codec.
template <typename T>
class TypedCache {
public:
    TypedCache(std::shared_ptr<CacheInterface> cache,
               std::shared_ptr<IValueCodec<T>> codec,
               std::shared_ptr<ILogger> logger,
               std::shared_ptr<IStatsDClient> statsd_client)
        : cache_(cache), codec_(codec), logger_(logger), statsd_client_(statsd_client) {
        if (!cache_) {
            throw std::invalid_argument("Cache pointer cannot be null");
        }
        if (!codec_) {
            throw std::invalid_argument("Codec pointer cannot be null");
        }
        if (!logger_) {
            throw std::invalid_argument("Logger pointer cannot be null");
        }
        if (!statsd_client_) {
            throw std::invalid_argument("StatsDClient pointer cannot be null");
        }
    }

    // A value the codec cannot encode is not stored and nothing is written.
    void set(const std::string& key, const T& value, int64_t ttl = 0) {
        auto encoded = codec_->encode(value);
        if (!encoded) {
            statsd_client_->increment(MetricsDefinitions::SERIALIZATION_FAILURE);
            logger_->warn("Cannot serialize value for key '" + key + "'; write abandoned");
            return;
        }
        cache_->set(key, *encoded, ttl);
    }

    std::optional<T> get(const std::string& key) {
        auto raw = cache_->get(key);
        if (!raw) {
            return std::nullopt;
        }
        auto decoded = codec_->decode(*raw);
        if (!decoded) {
            logger_->warn("Cannot deserialize value for key '" + key + "'");
        }
        return decoded;
    }

    void remove(const std::string& key) { cache_->remove(key); }

private:
    std::shared_ptr<CacheInterface> cache_;
    std::shared_ptr<IValueCodec<T>> codec_;
    std::shared_ptr<ILogger> logger_;
    std::shared_ptr<IStatsDClient> statsd_client_;
};

#endif // TYPEDCACHE_HPP
