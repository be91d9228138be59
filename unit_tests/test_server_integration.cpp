#include "gtest/gtest.h"
#include "http/handlers.h"
#include "http/http_server.h"
#include "net/event_loop.h"
#include "security/credential_verifier.h"
#include "test_utils.h"
#include <arpa/inet.h>
#include <chrono>
#include <cstring>
#include <future>
#include <memory>
#include <netinet/in.h>
#include <string>
#include <sys/socket.h>
#include <sys/time.h>
#include <thread>
#include <unistd.h>

namespace {

// 在独立线程里跑一个完整的服务端，端口由内核分配
class ServerRunner {
public:
    ServerRunner(const ServerSettings& settings, int idle_timeout_sec) {
        std::future<std::pair<EventLoop*, uint16_t>> ready_future = ready_.get_future();
        thread_ = std::thread([this, settings, idle_timeout_sec]() {
            EventLoop loop;
            auto router = std::make_shared<HttpRouter>();
            DownloadHandlers handlers(settings, std::make_shared<StaticTokenVerifier>(settings.auth_token));
            handlers.registerRoutes(router.get());
            HttpServer server(&loop, "test", 0, idle_timeout_sec, 1, router);
            server.start();
            ready_.set_value(std::make_pair(&loop, server.port()));
            loop.loop();
        });
        std::pair<EventLoop*, uint16_t> info = ready_future.get();
        loop_ = info.first;
        port_ = info.second;
    }

    ~ServerRunner() {
        loop_->quit();
        thread_.join();
    }

    uint16_t port() const { return port_; }

private:
    std::promise<std::pair<EventLoop*, uint16_t>> ready_;
    std::thread thread_;
    EventLoop* loop_ = nullptr;
    uint16_t port_ = 0;
};

int connectTo(uint16_t port) {
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        return -1;
    }
    struct timeval tv;
    tv.tv_sec = 5;
    tv.tv_usec = 0;
    ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

    struct sockaddr_in addr;
    memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    if (::connect(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        ::close(fd);
        return -1;
    }
    return fd;
}

bool sendAll(int fd, const std::string& data) {
    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = ::send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n <= 0) {
            return false;
        }
        sent += static_cast<size_t>(n);
    }
    return true;
}

// 读到对端关闭或超时
std::string readUntilClose(int fd) {
    std::string out;
    char buf[4096];
    while (true) {
        ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
        if (n <= 0) {
            break;
        }
        out.append(buf, static_cast<size_t>(n));
    }
    return out;
}

std::string roundTrip(uint16_t port, const std::string& request) {
    int fd = connectTo(port);
    if (fd < 0) {
        return std::string();
    }
    std::string response;
    if (sendAll(fd, request)) {
        response = readUntilClose(fd);
    }
    ::close(fd);
    return response;
}

size_t countOccurrences(const std::string& haystack, const std::string& needle) {
    size_t count = 0;
    for (size_t pos = haystack.find(needle); pos != std::string::npos; pos = haystack.find(needle, pos + 1)) {
        ++count;
    }
    return count;
}

} // namespace

class ServerIntegrationTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = std::make_unique<TempDir>("integration");
        write_test_file(*root_ / "userguides" / "user-guide.pdf", "%PDF-1.4 integration");
        settings_.user_guide_dir = (*root_ / "userguides").string();
        settings_.public_document = (*root_ / "public" / "user-guide.pdf").string();
        settings_.static_dir = (*root_ / "static").string();
    }

    std::unique_ptr<TempDir> root_;
    ServerSettings settings_;
};

TEST_F(ServerIntegrationTest, HealthOverLoopback) {
    ServerRunner runner(settings_, 60);
    std::string response = roundTrip(runner.port(),
        "GET /health HTTP/1.1\r\nHost: localhost\r\nConnection: close\r\n\r\n");
    EXPECT_EQ(response.rfind("HTTP/1.1 200 OK\r\n", 0), 0u) << response;
    EXPECT_NE(response.find("{\"status\": \"healthy\"}"), std::string::npos) << response;
    EXPECT_NE(response.find("X-Frame-Options: DENY\r\n"), std::string::npos) << response;
    EXPECT_NE(response.find("Connection: close\r\n"), std::string::npos) << response;
}

TEST_F(ServerIntegrationTest, ProtectedDownloadOverLoopback) {
    ServerRunner runner(settings_, 60);
    std::string denied = roundTrip(runner.port(),
        "GET /protected/download HTTP/1.1\r\nConnection: close\r\n\r\n");
    EXPECT_EQ(denied.rfind("HTTP/1.1 401 Unauthorized\r\n", 0), 0u) << denied;

    std::string granted = roundTrip(runner.port(),
        "GET /protected/download HTTP/1.1\r\n"
        "Authorization: Bearer valid-oauth-token\r\n"
        "Connection: close\r\n\r\n");
    ASSERT_GE(granted.size(), 20u) << granted;
    EXPECT_EQ(granted.rfind("HTTP/1.1 200 OK\r\n", 0), 0u) << granted;
    EXPECT_NE(granted.find("Content-Type: application/pdf\r\n"), std::string::npos);
    EXPECT_EQ(granted.substr(granted.size() - 20), "%PDF-1.4 integration");
}

TEST_F(ServerIntegrationTest, PipelinedKeepAliveRequests) {
    ServerRunner runner(settings_, 60);
    std::string response = roundTrip(runner.port(),
        "GET /health HTTP/1.1\r\n\r\n"
        "GET /nope HTTP/1.1\r\n\r\n"
        "GET /health HTTP/1.1\r\nConnection: close\r\n\r\n");
    EXPECT_EQ(countOccurrences(response, "HTTP/1.1 200 OK\r\n"), 2u) << response;
    EXPECT_EQ(countOccurrences(response, "HTTP/1.1 404 Not Found\r\n"), 1u) << response;
    EXPECT_NE(response.find("Keep-Alive: timeout="), std::string::npos) << response;
}

TEST_F(ServerIntegrationTest, MalformedRequestGets400AndClose) {
    ServerRunner runner(settings_, 60);
    std::string response = roundTrip(runner.port(), "GET /static/%zz HTTP/1.1\r\n\r\n");
    EXPECT_EQ(response.rfind("HTTP/1.1 400 Bad Request\r\n", 0), 0u) << response;
    EXPECT_NE(response.find("Connection: close\r\n"), std::string::npos) << response;
}

TEST_F(ServerIntegrationTest, IdleConnectionIsClosed) {
    ServerRunner runner(settings_, 1);
    int fd = connectTo(runner.port());
    ASSERT_GE(fd, 0);
    auto start = std::chrono::steady_clock::now();
    char buf[16];
    ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
    auto elapsed = std::chrono::steady_clock::now() - start;
    ::close(fd);
    EXPECT_EQ(n, 0);
    EXPECT_LT(elapsed, std::chrono::seconds(4));
}
