#ifndef SYSTEMCLOCK_HPP
#define SYSTEMCLOCK_HPP

#include <chrono>
#include <cstdint>

#include "../interfaces/IClock.hpp"

// Wall clock truncated to whole expiry units (one minute by default).
class SystemClock : public IClock {
public:
    explicit SystemClock(std::chrono::milliseconds unit = std::chrono::minutes(1));

    int64_t now() const override;

    std::chrono::milliseconds unit() const { return unit_; }

private:
    std::chrono::milliseconds unit_;
};

#endif // SYSTEMCLOCK_HPP
