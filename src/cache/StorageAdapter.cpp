#include <stdexcept>
#include <utility>

#include "StorageAdapter.hpp"

StorageAdapter::StorageAdapter(std::shared_ptr<IStorageMedium> medium, std::string prefix, std::string bucket)
    : medium_(std::move(medium)), prefix_(std::move(prefix)), bucket_(std::move(bucket)) {
    if (!medium_) {
        throw std::invalid_argument("Storage medium cannot be null");
    }
}

std::optional<std::string> StorageAdapter::get(const std::string& key) const {
    return medium_->getItem(rawKey(key));
}

StorageStatus StorageAdapter::set(const std::string& key, const std::string& value) {
    const std::string raw_key = rawKey(key);
    medium_->removeItem(raw_key);
    return medium_->setItem(raw_key, value);
}

void StorageAdapter::remove(const std::string& key) {
    medium_->removeItem(rawKey(key));
}

std::vector<std::string> StorageAdapter::enumerate() const {
    const std::string scope = namespacePrefix();
    std::vector<std::string> result;
    for (const auto& raw_key : medium_->keys(scope)) {
        // Media are trusted to filter, but a stray key must not be mangled.
        if (raw_key.compare(0, scope.size(), scope) == 0) {
            result.push_back(raw_key.substr(scope.size()));
        }
    }
    return result;
}
