// tests/test_inmemorystorage.cpp
#include <string>
#include <vector>

#include "gtest/gtest.h"

#include "../src/storage/InMemoryStorage.hpp"

TEST(InMemoryStorageTest, SetAndGet) {
    InMemoryStorage storage;
    std::string key = "lscache-profile";
    std::string value = R"({"name":"TestCo"})";

    EXPECT_EQ(storage.setItem(key, value), StorageStatus::Ok);
    auto retrievedData = storage.getItem(key);
    ASSERT_TRUE(retrievedData.has_value());
    EXPECT_EQ(*retrievedData, value);
}

TEST(InMemoryStorageTest, GetNonExistent) {
    InMemoryStorage storage;
    EXPECT_FALSE(storage.getItem("missing").has_value());
}

TEST(InMemoryStorageTest, UsedBytesCountsKeyAndValue) {
    InMemoryStorage storage(100);
    EXPECT_EQ(storage.setItem("abc", "12345"), StorageStatus::Ok);
    EXPECT_EQ(storage.usedBytes(), 8u);
    EXPECT_EQ(storage.setItem("xy", "z"), StorageStatus::Ok);
    EXPECT_EQ(storage.usedBytes(), 11u);
}

TEST(InMemoryStorageTest, RejectsWriteBeyondCapacity) {
    InMemoryStorage storage(10);
    EXPECT_EQ(storage.setItem("k1", "123456"), StorageStatus::Ok); // 8 bytes
    EXPECT_EQ(storage.setItem("k2", "1"), StorageStatus::CapacityExceeded); // would be 11
    EXPECT_FALSE(storage.getItem("k2").has_value());
    EXPECT_EQ(storage.usedBytes(), 8u);
    EXPECT_EQ(storage.capacityBytes(), 10u);
}

TEST(InMemoryStorageTest, DefaultCapacityIsFiveMebibytes) {
    InMemoryStorage storage;
    EXPECT_EQ(storage.capacityBytes(), 5u * 1024 * 1024);
    EXPECT_EQ(storage.usedBytes(), 0u);
}

TEST(InMemoryStorageTest, WriteThatExactlyFillsCapacitySucceeds) {
    InMemoryStorage storage(10);
    EXPECT_EQ(storage.setItem("k1", "12345678"), StorageStatus::Ok);
    EXPECT_EQ(storage.usedBytes(), 10u);
}

TEST(InMemoryStorageTest, OverwriteReleasesPreviousValue) {
    InMemoryStorage storage(10);
    EXPECT_EQ(storage.setItem("k", "12345678"), StorageStatus::Ok); // 9 bytes
    EXPECT_EQ(storage.setItem("k", "abcdefghi"), StorageStatus::Ok); // 10 bytes after replacing
    EXPECT_EQ(*storage.getItem("k"), "abcdefghi");
    EXPECT_EQ(storage.usedBytes(), 10u);
    EXPECT_EQ(storage.size(), 1u);
}

TEST(InMemoryStorageTest, RemoveEntry) {
    InMemoryStorage storage(20);
    EXPECT_EQ(storage.setItem("k", "value"), StorageStatus::Ok);
    storage.removeItem("k");
    EXPECT_FALSE(storage.getItem("k").has_value());
    EXPECT_EQ(storage.usedBytes(), 0u);
}

TEST(InMemoryStorageTest, RemoveMissingIsNoOp) {
    InMemoryStorage storage;
    storage.removeItem("never-set");
    EXPECT_EQ(storage.size(), 0u);
}

TEST(InMemoryStorageTest, KeysFilterByPrefixInInsertionOrder) {
    InMemoryStorage storage;
    storage.setItem("p-b", "1");
    storage.setItem("other", "2");
    storage.setItem("p-a", "3");
    storage.setItem("p-c", "4");
    storage.setItem("p-b", "5"); // overwrite keeps position

    std::vector<std::string> expected = {"p-b", "p-a", "p-c"};
    EXPECT_EQ(storage.keys("p-"), expected);
    EXPECT_EQ(storage.keys("").size(), 4u);
    EXPECT_TRUE(storage.keys("zzz").empty());
}

TEST(InMemoryStorageTest, KeysAfterRemoval) {
    InMemoryStorage storage;
    storage.setItem("p-1", "a");
    storage.setItem("p-2", "b");
    storage.setItem("p-3", "c");
    storage.removeItem("p-2");

    std::vector<std::string> expected = {"p-1", "p-3"};
    EXPECT_EQ(storage.keys("p-"), expected);
}
