#include <gtest/gtest.h>
#include <platform/socket_util.hpp>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>
#include <chrono>
#include <cstring>

using namespace std::chrono_literals;

// A loopback port that is bound but not listening, so connects are refused.
class ClosedPort {
public:
    ClosedPort() {
        sock_ = ::socket(AF_INET, SOCK_STREAM, 0);
        struct sockaddr_in addr;
        std::memset(&addr, 0, sizeof(addr));
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        if (sock_ >= 0 && ::bind(sock_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) == 0) {
            socklen_t len = sizeof(addr);
            ::getsockname(sock_, reinterpret_cast<struct sockaddr*>(&addr), &len);
            port_ = ntohs(addr.sin_port);
        }
    }
    ~ClosedPort() {
        if (sock_ >= 0) ::close(sock_);
    }
    int port() const { return port_; }

private:
    int sock_ = -1;
    int port_ = 0;
};

TEST(TcpConnect, RefusedPortIsHostUnreachable) {
    ClosedPort closed;
    ASSERT_NE(closed.port(), 0);

    auto started = std::chrono::steady_clock::now();
    auto r = platform::tcp_connect("127.0.0.1", closed.port(), 2000);
    auto elapsed = std::chrono::steady_clock::now() - started;

    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ConnectErrorKind::HostUnreachable);
    EXPECT_LT(elapsed, 1500ms);
}

TEST(TcpConnect, ConnectsToListeningPort) {
    int listener = ::socket(AF_INET, SOCK_STREAM, 0);
    ASSERT_GE(listener, 0);
    struct sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    ASSERT_EQ(::bind(listener, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)), 0);
    ASSERT_EQ(::listen(listener, 1), 0);
    socklen_t len = sizeof(addr);
    ::getsockname(listener, reinterpret_cast<struct sockaddr*>(&addr), &len);

    auto r = platform::tcp_connect("localhost", ntohs(addr.sin_port), 2000);
    ASSERT_TRUE(r.is_ok()) << r.error;
    platform::close_socket(r.value);
    ::close(listener);
}

TEST(TcpConnect, UnansweredAddressStopsAtDeadline) {
    // Non-routable: either no answer (Timeout) or no route (HostUnreachable)
    auto started = std::chrono::steady_clock::now();
    auto r = platform::tcp_connect("10.255.255.1", 22, 300);
    auto elapsed = std::chrono::steady_clock::now() - started;

    ASSERT_TRUE(r.is_err());
    EXPECT_TRUE(r.kind == ConnectErrorKind::Timeout ||
                r.kind == ConnectErrorKind::HostUnreachable);
    EXPECT_LT(elapsed, 1500ms);
}

TEST(TcpConnect, ExpiredBudgetIsTimeout) {
    ClosedPort closed;
    auto r = platform::tcp_connect("127.0.0.1", closed.port(), -1);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ConnectErrorKind::Timeout);
}
