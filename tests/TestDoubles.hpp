// tests/TestDoubles.hpp
#ifndef TESTDOUBLES_HPP
#define TESTDOUBLES_HPP

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "gmock/gmock.h"

#include "../src/interfaces/IClock.hpp"
#include "../src/interfaces/ILogger.hpp"
#include "../src/interfaces/IStatsDClient.hpp"
#include "../src/interfaces/IStorageMedium.hpp"

// --- Mock Logger ---
class MockLogger : public ILogger {
public:
    MOCK_METHOD(void, info, (const std::string& message), (override));
    MOCK_METHOD(void, debug, (const std::string& message), (override));
    MOCK_METHOD(void, warn, (const std::string& message), (override));
    MOCK_METHOD(void, error, (const std::string& message), (override));
    MOCK_METHOD(void, setup, (const std::string& message), (override));
    MOCK_METHOD(int, getLogLevel, (), (override));
};

// --- Mock StatsD client ---
class MockStatsDClient : public IStatsDClient {
public:
    MOCK_METHOD(void, increment, (const std::string& key, int value), (override));
    MOCK_METHOD(void, timing, (const std::string& key, std::chrono::milliseconds value), (override));
};

// --- Mock storage medium ---
class MockStorageMedium : public IStorageMedium {
public:
    MOCK_METHOD(std::optional<std::string>, getItem, (const std::string& key), (override));
    MOCK_METHOD(StorageStatus, setItem, (const std::string& key, const std::string& value), (override));
    MOCK_METHOD(void, removeItem, (const std::string& key), (override));
    MOCK_METHOD(std::vector<std::string>, keys, (const std::string& prefix), (override));
};

// Clock that only moves when a test advances it.
class ManualClock : public IClock {
public:
    explicit ManualClock(int64_t start = 0) : now_(start) {}

    int64_t now() const override { return now_; }

    void set(int64_t now) { now_ = now; }
    void advance(int64_t units) { now_ += units; }

private:
    int64_t now_;
};

#endif // TESTDOUBLES_HPP
