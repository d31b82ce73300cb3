#include "InMemoryStorage.hpp"

#include <iterator>

InMemoryStorage::InMemoryStorage(size_t capacity_bytes)
    : capacity_bytes_(capacity_bytes), used_bytes_(0) {}

std::optional<std::string> InMemoryStorage::getItem(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = items_.find(key);
    if (it == items_.end()) {
        return std::nullopt;
    }
    return it->second.value;
}

StorageStatus InMemoryStorage::setItem(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);

    const size_t required = key.size() + value.size();
    auto it = items_.find(key);
    // An overwrite releases the bytes of the item it replaces.
    const size_t released = (it != items_.end()) ? key.size() + it->second.value.size() : 0;

    if (used_bytes_ - released + required > capacity_bytes_) {
        return StorageStatus::CapacityExceeded;
    }

    if (it != items_.end()) {
        // Overwrites keep their enumeration position
        it->second.value = value;
    } else {
        insertion_order_.push_back(key);
        items_[key] = StoredItem{value, std::prev(insertion_order_.end())};
    }
    used_bytes_ = used_bytes_ - released + required;
    return StorageStatus::Ok;
}

void InMemoryStorage::removeItem(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = items_.find(key);
    if (it == items_.end()) {
        return;
    }
    used_bytes_ -= key.size() + it->second.value.size();
    insertion_order_.erase(it->second.order_it);
    items_.erase(it);
}

std::vector<std::string> InMemoryStorage::keys(const std::string& prefix) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> result;
    for (const auto& key : insertion_order_) {
        if (key.compare(0, prefix.size(), prefix) == 0) {
            result.push_back(key);
        }
    }
    return result;
}

size_t InMemoryStorage::usedBytes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return used_bytes_;
}

size_t InMemoryStorage::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return items_.size();
}
