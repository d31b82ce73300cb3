#ifndef LSCACHE_HPP
#define LSCACHE_HPP

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "EvictionEngine.hpp"
#include "ExpirationLedger.hpp"
#include "StorageAdapter.hpp"
#include "../config/AppConfig.hpp"
#include "../interfaces/CacheInterface.hpp"
#include "../interfaces/IClock.hpp"
#include "../interfaces/ILogger.hpp"
#include "../interfaces/IStatsDClient.hpp"
#include "../interfaces/IStorageMedium.hpp"

/**
 * Expiration-aware cache over a capacity-bounded storage medium.
 *
 * - Values are opaque strings stored under prefix + bucket + key.
 * - A positive TTL adds a ledger record; every successful get() slides the
 *   expiration to now + ttl, and an expired entry is deleted on read.
 * - A write rejected for capacity triggers one eviction pass followed by a
 *   single retry; a second rejection drops the write.
 * - Nothing is reported to the caller: failures turn into absent / no-op.
 *
 * Public operations are serialized by one mutex, so eviction and the
 * read-then-refresh sequence run without interleaving within this process.
 */
class LsCache : public CacheInterface {
public:
    LsCache(std::shared_ptr<IStorageMedium> medium,
            std::shared_ptr<IClock> clock,
            const AppConfig& config,
            std::shared_ptr<ILogger> logger,
            std::shared_ptr<IStatsDClient> statsd_client);

    ~LsCache() override = default;

    void set(const std::string& key, const std::string& value, int64_t ttl = 0) override;
    std::optional<std::string> get(const std::string& key) override;
    void remove(const std::string& key) override;
    void flush() override;

    // Probes the medium on first call with the raw key "__lscachetest__";
    // the answer is kept for the lifetime of this cache.
    bool supported() override;

    // Switches the namespace segment used by later operations.
    void setBucket(const std::string& bucket);
    void resetBucket();

    LsCache(const LsCache&) = delete;
    LsCache& operator=(const LsCache&) = delete;
    LsCache(LsCache&&) = delete;
    LsCache& operator=(LsCache&&) = delete;

private:
    bool probeStorage();
    // Runs write; on CapacityExceeded reclaims target_bytes (never evicting
    // key itself) and runs write once more.
    StorageStatus writeWithReclaim(const std::string& key,
                                   size_t target_bytes,
                                   const std::function<StorageStatus()>& write);
    static int64_t expirationFrom(int64_t now, int64_t ttl);

    std::shared_ptr<IStorageMedium> medium_;
    std::shared_ptr<StorageAdapter> adapter_;
    std::shared_ptr<ExpirationLedger> ledger_;
    std::unique_ptr<EvictionEngine> eviction_engine_;
    std::shared_ptr<IClock> clock_;
    std::shared_ptr<ILogger> logger_;
    std::shared_ptr<IStatsDClient> statsd_client_;

    std::mutex mutex_;
    std::once_flag probe_flag_;
    bool supported_{false};
};

#endif // LSCACHE_HPP
