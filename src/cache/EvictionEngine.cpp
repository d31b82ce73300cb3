#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <utility>

#include "EvictionEngine.hpp"
#include "../config/AppConfig.hpp"

EvictionEngine::EvictionEngine(std::shared_ptr<StorageAdapter> adapter,
                               std::shared_ptr<ExpirationLedger> ledger,
                               std::shared_ptr<ILogger> logger,
                               std::shared_ptr<IStatsDClient> statsd_client)
    : adapter_(std::move(adapter)),
      ledger_(std::move(ledger)),
      logger_(std::move(logger)),
      statsd_client_(std::move(statsd_client)) {
    if (!adapter_ || !ledger_) {
        throw std::invalid_argument("EvictionEngine requires a storage adapter and a ledger");
    }
    if (!logger_) {
        throw std::invalid_argument("Logger cannot be null for EvictionEngine");
    }
    if (!statsd_client_) {
        throw std::invalid_argument("StatsDClient cannot be null for EvictionEngine");
    }
}

std::vector<EvictionEngine::Candidate> EvictionEngine::collectCandidates(
    const std::optional<std::string>& protected_key) {
    std::vector<Candidate> candidates;
    for (const auto& key : adapter_->enumerate()) {
        // Ledger records leave only together with the entry that owns them.
        // A record whose value is gone becomes a zero-sized candidate for its owner.
        if (ledger_->isLedgerKey(key)) {
            std::string owner = ledger_->ownerKey(key);
            if ((protected_key && owner == *protected_key) || adapter_->get(owner)) {
                continue;
            }
            auto record = ledger_->read(owner);
            candidates.push_back(Candidate{owner, 0, record ? record->expiration : NO_EXPIRATION});
            continue;
        }
        if (protected_key && key == *protected_key) {
            continue;
        }
        auto record = ledger_->read(key);
        auto value = adapter_->get(key);
        candidates.push_back(Candidate{
            key,
            value ? value->size() : 0,
            record ? record->expiration : NO_EXPIRATION});
    }

    // Stable: equal expirations keep enumeration order.
    std::stable_sort(candidates.begin(), candidates.end(),
        [](const Candidate& a, const Candidate& b) { return a.expiration < b.expiration; });
    return candidates;
}

size_t EvictionEngine::reclaim(size_t target_bytes, const std::optional<std::string>& protected_key) {
    size_t freed = 0;
    if (target_bytes == 0) {
        return freed;
    }

    auto start_time = std::chrono::steady_clock::now();
    std::vector<Candidate> candidates = collectCandidates(protected_key);
    for (const auto& candidate : candidates) {
        if (freed >= target_bytes) {
            break;
        }
        adapter_->remove(candidate.key);
        ledger_->clear(candidate.key);
        freed += candidate.size;
        statsd_client_->increment(MetricsDefinitions::CACHE_EVICTED);
        logger_->debug("Evicted key '" + candidate.key + "' (" + std::to_string(candidate.size) + " bytes)");
    }

    statsd_client_->timing(MetricsDefinitions::EVICTION_DURATION,
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start_time));

    if (freed < target_bytes) {
        logger_->warn("Eviction freed " + std::to_string(freed) + " of " +
                      std::to_string(target_bytes) + " requested bytes; no candidates left");
    }
    return freed;
}
