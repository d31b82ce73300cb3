#include <stdexcept>
#include <utility>

#include "ExpirationLedger.hpp"
#include "../config/AppConfig.hpp"
#include "../utils/Utils.hpp"

ExpirationLedger::ExpirationLedger(std::shared_ptr<StorageAdapter> adapter, std::string suffix)
    : adapter_(std::move(adapter)), suffix_(std::move(suffix)) {
    if (!adapter_) {
        throw std::invalid_argument("Storage adapter cannot be null for ExpirationLedger");
    }
    if (suffix_.empty()) {
        throw std::invalid_argument("Ledger suffix cannot be empty");
    }
}

std::optional<LedgerRecord> ExpirationLedger::read(const std::string& key) {
    auto raw = adapter_->get(ledgerKey(key));
    if (!raw) {
        return std::nullopt;
    }
    auto record = decode(*raw);
    if (!record) {
        clear(key);
    }
    return record;
}

StorageStatus ExpirationLedger::write(const std::string& key, const LedgerRecord& record) {
    return adapter_->set(ledgerKey(key), encode(record));
}

void ExpirationLedger::clear(const std::string& key) {
    adapter_->remove(ledgerKey(key));
}

bool ExpirationLedger::isLedgerKey(const std::string& key) const {
    return key.size() >= suffix_.size() &&
           key.compare(key.size() - suffix_.size(), suffix_.size(), suffix_) == 0;
}

std::string ExpirationLedger::encode(const LedgerRecord& record) {
    return std::to_string(record.expiration) + Constants::LEDGER_FIELD_DELIMITER + std::to_string(record.ttl);
}

std::optional<LedgerRecord> ExpirationLedger::decode(const std::string& raw) {
    size_t delimiter_pos = raw.find(Constants::LEDGER_FIELD_DELIMITER);
    if (delimiter_pos == std::string::npos) {
        return std::nullopt;
    }
    auto expiration = Utils::stringToInt64(raw.substr(0, delimiter_pos));
    auto ttl = Utils::stringToInt64(raw.substr(delimiter_pos + 1));
    // Records are only ever written for a positive TTL.
    if (!expiration || !ttl || *ttl <= 0) {
        return std::nullopt;
    }
    return LedgerRecord{*expiration, *ttl};
}
