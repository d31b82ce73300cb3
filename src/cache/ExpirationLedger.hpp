#ifndef EXPIRATIONLEDGER_HPP
#define EXPIRATIONLEDGER_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "StorageAdapter.hpp"

// Absolute expiration and the TTL that produced it, both in expiry units.
struct LedgerRecord {
    int64_t expiration;
    int64_t ttl;

    bool operator==(const LedgerRecord& other) const {
        return expiration == other.expiration && ttl == other.ttl;
    }
};

// Side records stored next to each value under key + suffix, encoded as
// "<expiration>,<ttl>" in decimal.
class ExpirationLedger {
public:
    ExpirationLedger(std::shared_ptr<StorageAdapter> adapter, std::string suffix);

    // An undecodable record is cleared and reported as absent.
    std::optional<LedgerRecord> read(const std::string& key);
    StorageStatus write(const std::string& key, const LedgerRecord& record);
    void clear(const std::string& key);

    std::string ledgerKey(const std::string& key) const { return key + suffix_; }
    bool isLedgerKey(const std::string& key) const;
    // Inverse of ledgerKey(); only meaningful when isLedgerKey(ledger_key).
    std::string ownerKey(const std::string& ledger_key) const {
        return ledger_key.substr(0, ledger_key.size() - suffix_.size());
    }

    static std::string encode(const LedgerRecord& record);
    static std::optional<LedgerRecord> decode(const std::string& raw);

private:
    std::shared_ptr<StorageAdapter> adapter_;
    std::string suffix_;
};

#endif // EXPIRATIONLEDGER_HPP
