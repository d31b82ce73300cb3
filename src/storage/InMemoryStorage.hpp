#ifndef INMEMORYSTORAGE_HPP
#define INMEMORYSTORAGE_HPP

#include <cstddef>
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "../interfaces/IStorageMedium.hpp"

// Process-local medium with a byte quota, modelled on browser local storage.
// Every item costs key.size() + value.size() bytes against the quota.
class InMemoryStorage : public IStorageMedium {
private:
    struct StoredItem {
        std::string value;
        std::list<std::string>::iterator order_it; // Position in insertion_order_
    };

    std::unordered_map<std::string, StoredItem> items_;
    std::list<std::string> insertion_order_; // Enumeration order, oldest first

    mutable std::mutex mutex_;
    const size_t capacity_bytes_;
    size_t used_bytes_;

public:
    explicit InMemoryStorage(size_t capacity_bytes = 5 * 1024 * 1024);

    ~InMemoryStorage() override = default;

    std::optional<std::string> getItem(const std::string& key) override;
    StorageStatus setItem(const std::string& key, const std::string& value) override;
    void removeItem(const std::string& key) override;
    std::vector<std::string> keys(const std::string& prefix) override;

    size_t usedBytes() const;
    size_t capacityBytes() const { return capacity_bytes_; }
    size_t size() const;
};

#endif // INMEMORYSTORAGE_HPP
