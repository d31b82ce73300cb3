#ifndef CACHEINTERFACE_HPP
#define CACHEINTERFACE_HPP

#include <cstdint>
#include <optional>
#include <string>

// Best-effort cache contract: no operation reports a failure to the caller.
class CacheInterface {
public:
    virtual ~CacheInterface() = default;
    // ttl is in expiry units; 0 stores the value without an expiration.
    virtual void set(const std::string& key, const std::string& value, int64_t ttl = 0) = 0;
    virtual std::optional<std::string> get(const std::string& key) = 0;
    virtual void remove(const std::string& key) = 0;
    virtual void flush() = 0;
    virtual bool supported() = 0;
};

#endif // CACHEINTERFACE_HPP
