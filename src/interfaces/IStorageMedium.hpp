#ifndef ISTORAGEMEDIUM_HPP
#define ISTORAGEMEDIUM_HPP

#include <optional>
#include <string>
#include <vector>

enum class StorageStatus {
    Ok,
    CapacityExceeded,
    Unavailable
};

inline const char* toString(StorageStatus status) {
    switch (status) {
        case StorageStatus::Ok: return "Ok";
        case StorageStatus::CapacityExceeded: return "CapacityExceeded";
        case StorageStatus::Unavailable: return "Unavailable";
    }
    return "Unknown";
}

// External string store with a fixed total capacity.
class IStorageMedium {
public:
    virtual ~IStorageMedium() = default;
    virtual std::optional<std::string> getItem(const std::string& key) = 0;
    virtual StorageStatus setItem(const std::string& key, const std::string& value) = 0;
    virtual void removeItem(const std::string& key) = 0;
    // Keys starting with prefix, in the medium's enumeration order.
    virtual std::vector<std::string> keys(const std::string& prefix) = 0;
};

#endif // ISTORAGEMEDIUM_HPP
