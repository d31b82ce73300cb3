#ifndef ICLOCK_HPP
#define ICLOCK_HPP

#include <cstdint>

class IClock {
public:
    virtual ~IClock() = default;
    // Current time in whole expiry units since the epoch.
    virtual int64_t now() const = 0;
};

#endif // ICLOCK_HPP
