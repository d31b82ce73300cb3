#ifndef EVICTIONENGINE_HPP
#define EVICTIONENGINE_HPP

#include <cstddef>
#include <cstdint>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "ExpirationLedger.hpp"
#include "StorageAdapter.hpp"
#include "../interfaces/ILogger.hpp"
#include "../interfaces/IStatsDClient.hpp"

// Frees space after a write failed for capacity. Entries are removed in order
// of soonest expiration; because reads slide expirations forward this
// approximates least-recently-used order. Entries without an expiration go last.
class EvictionEngine {
public:
    // Expiration assigned to entries that have no ledger record.
    static constexpr int64_t NO_EXPIRATION = std::numeric_limits<int64_t>::max();

    EvictionEngine(std::shared_ptr<StorageAdapter> adapter,
                   std::shared_ptr<ExpirationLedger> ledger,
                   std::shared_ptr<ILogger> logger,
                   std::shared_ptr<IStatsDClient> statsd_client);

    // Removes entries until at least target_bytes of value data have been
    // freed or no candidate is left. protected_key, if set, is never removed.
    // Ledger records without a value are removed in expiration order as well
    // and count as zero bytes.
    // Returns the number of value bytes freed.
    size_t reclaim(size_t target_bytes, const std::optional<std::string>& protected_key = std::nullopt);

private:
    struct Candidate {
        std::string key;
        size_t size;
        int64_t expiration;
    };

    std::vector<Candidate> collectCandidates(const std::optional<std::string>& protected_key);

    std::shared_ptr<StorageAdapter> adapter_;
    std::shared_ptr<ExpirationLedger> ledger_;
    std::shared_ptr<ILogger> logger_;
    std::shared_ptr<IStatsDClient> statsd_client_;
};

#endif // EVICTIONENGINE_HPP
