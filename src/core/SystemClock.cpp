#include <stdexcept>

#include "SystemClock.hpp"

SystemClock::SystemClock(std::chrono::milliseconds unit) : unit_(unit) {
    if (unit_.count() <= 0) {
        throw std::invalid_argument("Expiry unit must be positive");
    }
}

int64_t SystemClock::now() const {
    auto since_epoch = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch());
    return static_cast<int64_t>(since_epoch.count() / unit_.count());
}
