#include <limits>
#include <stdexcept>

#include "LsCache.hpp"

LsCache::LsCache(std::shared_ptr<IStorageMedium> medium,
                 std::shared_ptr<IClock> clock,
                 const AppConfig& config,
                 std::shared_ptr<ILogger> logger,
                 std::shared_ptr<IStatsDClient> statsd_client)
    : medium_(medium), clock_(clock), logger_(logger), statsd_client_(statsd_client) {
    if (!clock_) {
        throw std::invalid_argument("Clock cannot be null");
    }
    if (!logger_) {
        throw std::invalid_argument("Logger cannot be null");
    }
    if (!statsd_client_) {
        throw std::invalid_argument("StatsDClient cannot be null");
    }
    adapter_ = std::make_shared<StorageAdapter>(medium, config.cache_prefix, config.cache_bucket);
    ledger_ = std::make_shared<ExpirationLedger>(adapter_, config.expiration_suffix);
    eviction_engine_ = std::make_unique<EvictionEngine>(adapter_, ledger_, logger_, statsd_client_);
    logger_->debug("LsCache initialized with namespace '" + adapter_->namespacePrefix() + "'");
}

bool LsCache::supported() {
    std::call_once(probe_flag_, [this]() {
        std::lock_guard<std::mutex> lock(mutex_);
        supported_ = probeStorage();
        if (!supported_) {
            logger_->error("Storage medium unavailable; cache operations are disabled.");
        }
    });
    return supported_;
}

bool LsCache::probeStorage() {
    // The probe key is raw, outside the cache namespace. A full medium still
    // works; only an unusable one disables the cache.
    StorageStatus status = medium_->setItem(Constants::STORAGE_PROBE_KEY, Constants::STORAGE_PROBE_KEY);
    medium_->removeItem(Constants::STORAGE_PROBE_KEY);
    return status != StorageStatus::Unavailable;
}

int64_t LsCache::expirationFrom(int64_t now, int64_t ttl) {
    if (ttl > std::numeric_limits<int64_t>::max() - now) {
        return std::numeric_limits<int64_t>::max() - 1;
    }
    return now + ttl;
}

StorageStatus LsCache::writeWithReclaim(const std::string& key,
                                        size_t target_bytes,
                                        const std::function<StorageStatus()>& write) {
    StorageStatus status = write();
    if (status == StorageStatus::CapacityExceeded) {
        statsd_client_->increment(MetricsDefinitions::CAPACITY_EXCEEDED);
        size_t freed = eviction_engine_->reclaim(target_bytes, key);
        logger_->debug("Capacity exceeded writing '" + key + "'; reclaimed " + std::to_string(freed) + " bytes");
        status = write();
    }
    if (status != StorageStatus::Ok) {
        statsd_client_->increment(MetricsDefinitions::WRITE_DROPPED);
        logger_->warn("Dropping write for key '" + key + "': " + toString(status));
    }
    return status;
}

void LsCache::set(const std::string& key, const std::string& value, int64_t ttl) {
    if (!supported()) {
        statsd_client_->increment(MetricsDefinitions::MEDIUM_UNAVAILABLE);
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);

    StorageStatus status = writeWithReclaim(key, value.size(), [&]() {
        return adapter_->set(key, value);
    });
    if (status != StorageStatus::Ok) {
        // The previous value is gone; its expiration must not linger.
        ledger_->clear(key);
        return;
    }

    if (ttl <= 0) {
        // In case a previous write set a TTL
        ledger_->clear(key);
        return;
    }

    LedgerRecord record{expirationFrom(clock_->now(), ttl), ttl};
    status = writeWithReclaim(key, ExpirationLedger::encode(record).size(), [&]() {
        return ledger_->write(key, record);
    });
    if (status != StorageStatus::Ok) {
        // Without its record the value would never expire.
        adapter_->remove(key);
    }
}

std::optional<std::string> LsCache::get(const std::string& key) {
    if (!supported()) {
        statsd_client_->increment(MetricsDefinitions::MEDIUM_UNAVAILABLE);
        return std::nullopt;
    }
    std::lock_guard<std::mutex> lock(mutex_);

    auto record = ledger_->read(key);
    if (!record) {
        auto value = adapter_->get(key);
        statsd_client_->increment(value ? MetricsDefinitions::CACHE_HIT : MetricsDefinitions::CACHE_MISS);
        return value;
    }

    const int64_t now = clock_->now();
    if (now >= record->expiration) {
        adapter_->remove(key);
        ledger_->clear(key);
        statsd_client_->increment(MetricsDefinitions::CACHE_EXPIRED);
        statsd_client_->increment(MetricsDefinitions::CACHE_MISS);
        logger_->debug("Key '" + key + "' expired at " + std::to_string(record->expiration));
        return std::nullopt;
    }

    auto value = adapter_->get(key);
    if (!value) {
        // The medium dropped the value on its own; its record must not outlive it.
        ledger_->clear(key);
        statsd_client_->increment(MetricsDefinitions::CACHE_MISS);
        return std::nullopt;
    }
    LedgerRecord refreshed{expirationFrom(now, record->ttl), record->ttl};
    StorageStatus status = writeWithReclaim(key, ExpirationLedger::encode(refreshed).size(), [&]() {
        return ledger_->write(key, refreshed);
    });
    if (status != StorageStatus::Ok) {
        adapter_->remove(key);
    }

    statsd_client_->increment(MetricsDefinitions::CACHE_HIT);
    return value;
}

void LsCache::remove(const std::string& key) {
    if (!supported()) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    adapter_->remove(key);
    ledger_->clear(key);
}

void LsCache::flush() {
    if (!supported()) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    // Ledger records share the namespace, so one pass removes both kinds.
    for (const auto& key : adapter_->enumerate()) {
        adapter_->remove(key);
    }
    logger_->debug("Flushed namespace '" + adapter_->namespacePrefix() + "'");
}

void LsCache::setBucket(const std::string& bucket) {
    std::lock_guard<std::mutex> lock(mutex_);
    adapter_->setBucket(bucket);
}

void LsCache::resetBucket() {
    setBucket("");
}
