#ifndef STORAGEADAPTER_HPP
#define STORAGEADAPTER_HPP

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "../interfaces/IStorageMedium.hpp"

// Maps cache keys onto the medium as prefix + bucket + key and restricts
// enumeration to that namespace. No retries: medium failures are returned as is.
class StorageAdapter {
public:
    StorageAdapter(std::shared_ptr<IStorageMedium> medium, std::string prefix, std::string bucket = "");

    std::optional<std::string> get(const std::string& key) const;

    // Removes any existing item before writing. Some media report a capacity
    // failure when a large value is overwritten by a smaller one.
    StorageStatus set(const std::string& key, const std::string& value);

    void remove(const std::string& key);

    // Cache keys (namespace stripped) in the medium's enumeration order.
    std::vector<std::string> enumerate() const;

    void setBucket(const std::string& bucket) { bucket_ = bucket; }
    const std::string& bucket() const { return bucket_; }

    std::string namespacePrefix() const { return prefix_ + bucket_; }
    std::string rawKey(const std::string& key) const { return prefix_ + bucket_ + key; }

private:
    std::shared_ptr<IStorageMedium> medium_;
    std::string prefix_;
    std::string bucket_;
};

#endif // STORAGEADAPTER_HPP
