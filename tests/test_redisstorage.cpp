// tests/test_redisstorage.cpp
#include <algorithm>
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include "gtest/gtest.h"
#include "gmock/gmock.h"

#include "TestDoubles.hpp"
#include "../src/config/AppConfig.hpp"
#include "../src/storage/RedisStorage.hpp"

using ::testing::_;
using ::testing::AtLeast;
using ::testing::ElementsAre;
using ::testing::NiceMock;

// Nothing listens on port 1, so the connection is refused immediately.
class RedisStorageDisconnectedTest : public ::testing::Test {
protected:
    void SetUp() override {
        config.redis_host = "127.0.0.1";
        config.redis_port = 1;
        logger = std::make_shared<NiceMock<MockLogger>>();
    }

    AppConfig config;
    std::shared_ptr<NiceMock<MockLogger>> logger;
};

TEST_F(RedisStorageDisconnectedTest, ReportsConnectionFailure) {
    EXPECT_CALL(*logger, error(_)).Times(AtLeast(1));
    RedisStorage storage(config, logger);
    EXPECT_FALSE(storage.isConnected());
}

TEST_F(RedisStorageDisconnectedTest, OperationsDegradeToUnavailable) {
    RedisStorage storage(config, logger);

    EXPECT_EQ(storage.setItem("k", "v"), StorageStatus::Unavailable);
    EXPECT_FALSE(storage.getItem("k").has_value());
    EXPECT_TRUE(storage.keys("lscache-").empty());
    storage.removeItem("k"); // must not throw
}

TEST(RedisStorageTest, NullLoggerThrows) {
    AppConfig config;
    EXPECT_THROW({ RedisStorage storage(config, nullptr); }, std::invalid_argument);
}

TEST(RedisStorageTest, EscapeGlobPatternLeavesPlainTextAlone) {
    EXPECT_EQ(RedisStorage::escapeGlobPattern("lscache-users-"), "lscache-users-");
}

TEST(RedisStorageTest, EscapeGlobPatternEscapesMetacharacters) {
    EXPECT_EQ(RedisStorage::escapeGlobPattern("a*b?c[d]e\\f"), "a\\*b\\?c\\[d\\]e\\\\f");
}

// --- Against a fake server ---

// Loopback server speaking just enough RESP for one client connection. Each
// command is passed to the handler, which returns the raw reply to send; an
// empty reply closes the connection.
class FakeRedisServer {
public:
    using Handler = std::function<std::string(const std::vector<std::string>&)>;

    explicit FakeRedisServer(Handler handler) : handler_(std::move(handler)) {
        listen_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0; // Any free port
        if (listen_fd_ < 0 ||
            ::bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0 ||
            ::listen(listen_fd_, 1) != 0) {
            throw std::runtime_error("Failed to start fake Redis server");
        }
        socklen_t len = sizeof(addr);
        ::getsockname(listen_fd_, reinterpret_cast<sockaddr*>(&addr), &len);
        port_ = ntohs(addr.sin_port);
        server_thread_ = std::thread([this]() { serve(); });
    }

    ~FakeRedisServer() {
        ::shutdown(listen_fd_, SHUT_RDWR);
        int client = client_fd_.load();
        if (client >= 0) {
            ::shutdown(client, SHUT_RDWR);
        }
        if (server_thread_.joinable()) {
            server_thread_.join();
        }
        ::close(listen_fd_);
    }

    int port() const { return port_; }

    std::vector<std::vector<std::string>> commands() {
        std::lock_guard<std::mutex> lock(mutex_);
        return commands_;
    }

private:
    void serve() {
        int client = ::accept(listen_fd_, nullptr, nullptr);
        if (client < 0) {
            return;
        }
        client_fd_ = client;
        std::vector<std::string> args;
        while (readCommand(client, args)) {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                commands_.push_back(args);
            }
            std::string reply = handler_(args);
            if (reply.empty() || ::send(client, reply.data(), reply.size(), 0) < 0) {
                break;
            }
        }
        client_fd_ = -1;
        ::close(client);
    }

    static bool readExact(int fd, size_t count, std::string& out) {
        out.clear();
        while (out.size() < count) {
            char buffer[256];
            size_t wanted = std::min(sizeof(buffer), count - out.size());
            ssize_t received = ::recv(fd, buffer, wanted, 0);
            if (received <= 0) {
                return false;
            }
            out.append(buffer, static_cast<size_t>(received));
        }
        return true;
    }

    static bool readLine(int fd, std::string& line) {
        line.clear();
        char c;
        while (::recv(fd, &c, 1, 0) == 1) {
            if (c == '\n' && !line.empty() && line.back() == '\r') {
                line.pop_back();
                return true;
            }
            line.push_back(c);
        }
        return false;
    }

    // Commands arrive as "*<n>\r\n" followed by n "$<len>\r\n<bytes>\r\n".
    static bool readCommand(int fd, std::vector<std::string>& args) {
        args.clear();
        std::string line;
        if (!readLine(fd, line) || line.empty() || line[0] != '*') {
            return false;
        }
        int count = std::stoi(line.substr(1));
        for (int i = 0; i < count; ++i) {
            std::string arg;
            if (!readLine(fd, line) || line.empty() || line[0] != '$' ||
                !readExact(fd, std::stoul(line.substr(1)) + 2, arg)) {
                return false;
            }
            arg.resize(arg.size() - 2);
            args.push_back(arg);
        }
        return true;
    }

    Handler handler_;
    int listen_fd_ = -1;
    int port_ = 0;
    std::atomic<int> client_fd_{-1};
    std::thread server_thread_;
    std::mutex mutex_;
    std::vector<std::vector<std::string>> commands_;
};

static std::string bulk(const std::string& value) {
    return "$" + std::to_string(value.size()) + "\r\n" + value + "\r\n";
}

static std::string scanPage(const std::string& cursor, const std::vector<std::string>& keys) {
    std::string reply = "*2\r\n" + bulk(cursor) + "*" + std::to_string(keys.size()) + "\r\n";
    for (const auto& key : keys) {
        reply += bulk(key);
    }
    return reply;
}

// Replies modelled on a server at maxmemory with the noeviction policy.
static std::string respond(const std::vector<std::string>& args) {
    const std::string& command = args[0];
    if (command == "SET") {
        if (args[1] == "full") {
            return "-OOM command not allowed when used memory > 'maxmemory'.\r\n";
        }
        if (args[1] == "replica") {
            return "-READONLY You can't write against a read only replica.\r\n";
        }
        if (args[1] == "hangup") {
            return "";
        }
        return "+OK\r\n";
    }
    if (command == "GET") {
        return args[1] == "stored" ? bulk("hello") : "$-1\r\n";
    }
    if (command == "DEL") {
        return ":1\r\n";
    }
    if (command == "SCAN") {
        // Two pages; "p-b" is reported by both.
        if (args[1] == "0") {
            return scanPage("17", {"p-a#e", "p-b"});
        }
        return scanPage("0", {"p-b", "p-c"});
    }
    return "-ERR unknown command '" + command + "'\r\n";
}

class RedisStorageServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        server = std::make_unique<FakeRedisServer>(respond);
        config.redis_host = "127.0.0.1";
        config.redis_port = server->port();
        logger = std::make_shared<NiceMock<MockLogger>>();
        storage = std::make_unique<RedisStorage>(config, logger);
        ASSERT_TRUE(storage->isConnected());
    }

    void TearDown() override {
        storage.reset(); // Disconnect before the server stops
        server.reset();
    }

    std::unique_ptr<FakeRedisServer> server;
    AppConfig config;
    std::shared_ptr<NiceMock<MockLogger>> logger;
    std::unique_ptr<RedisStorage> storage;
};

TEST_F(RedisStorageServerTest, SetSucceeds) {
    EXPECT_EQ(storage->setItem("k", "v"), StorageStatus::Ok);
}

TEST_F(RedisStorageServerTest, OutOfMemoryIsCapacityExceeded) {
    EXPECT_CALL(*logger, error(_)).Times(0);
    EXPECT_EQ(storage->setItem("full", "v"), StorageStatus::CapacityExceeded);
    EXPECT_TRUE(storage->isConnected());
}

TEST_F(RedisStorageServerTest, OtherErrorsAreUnavailable) {
    EXPECT_CALL(*logger, error(_)).Times(1);
    EXPECT_EQ(storage->setItem("replica", "v"), StorageStatus::Unavailable);
}

TEST_F(RedisStorageServerTest, LostConnectionIsUnavailable) {
    EXPECT_EQ(storage->setItem("hangup", "v"), StorageStatus::Unavailable);
    EXPECT_FALSE(storage->isConnected());
    EXPECT_EQ(storage->setItem("k", "v"), StorageStatus::Unavailable);
}

TEST_F(RedisStorageServerTest, ValuesAreBinarySafe) {
    const std::string value("a\0b c", 5);
    ASSERT_EQ(storage->setItem("bin key", value), StorageStatus::Ok);

    auto commands = server->commands();
    ASSERT_EQ(commands.size(), 1u);
    EXPECT_THAT(commands[0], ElementsAre("SET", "bin key", value));
}

TEST_F(RedisStorageServerTest, GetReturnsStoredValueOrNothing) {
    EXPECT_EQ(*storage->getItem("stored"), "hello");
    EXPECT_FALSE(storage->getItem("missing").has_value());
}

TEST_F(RedisStorageServerTest, RemoveSendsDel) {
    storage->removeItem("k");
    auto commands = server->commands();
    ASSERT_EQ(commands.size(), 1u);
    EXPECT_THAT(commands[0], ElementsAre("DEL", "k"));
}

TEST_F(RedisStorageServerTest, KeysFollowsCursorAndDropsDuplicates) {
    auto keys = storage->keys("p-");
    EXPECT_THAT(keys, ElementsAre("p-a#e", "p-b", "p-c"));

    auto commands = server->commands();
    ASSERT_EQ(commands.size(), 2u);
    EXPECT_THAT(commands[0], ElementsAre("SCAN", "0", "MATCH", "p-*", "COUNT", "100"));
    EXPECT_THAT(commands[1], ElementsAre("SCAN", "17", "MATCH", "p-*", "COUNT", "100"));
}

TEST_F(RedisStorageServerTest, KeysEscapesPrefix) {
    storage->keys("p*[x]");
    auto commands = server->commands();
    ASSERT_FALSE(commands.empty());
    EXPECT_EQ(commands[0][3], "p\\*\\[x\\]*");
}
