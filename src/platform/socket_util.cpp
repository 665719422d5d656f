#include "socket_util.hpp"
#include <sys/socket.h>
#include <sys/types.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <netdb.h>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>
#include <fmt/format.h>

namespace platform {

void set_nonblocking(socket_t sock) {
    int flags = fcntl(sock, F_GETFL, 0);
    fcntl(sock, F_SETFL, flags | O_NONBLOCK);
}

int poll_socket(socket_t sock, short events, int timeout_ms) {
    struct pollfd pfd;
    pfd.fd = sock;
    pfd.events = events;
    pfd.revents = 0;
    int ret = poll(&pfd, 1, timeout_ms);
    return (ret > 0) ? pfd.revents : 0;
}

void close_socket(socket_t sock) {
    close(sock);
}

namespace {

// Result slot shared with the resolver thread. Whoever finishes last
// (the caller giving up, or the lookup completing) frees the addrinfo.
struct Resolution {
    std::mutex mutex;
    std::condition_variable cv;
    bool done = false;
    bool abandoned = false;
    int gai = 0;
    struct addrinfo* res = nullptr;
};

// getaddrinfo has no timeout of its own, so it runs on a detached thread
// and the caller waits on it only until the deadline.
bool resolve_until(const std::string& host, int port,
                   std::chrono::steady_clock::time_point deadline,
                   struct addrinfo** out, int* gai_out) {
    auto slot = std::make_shared<Resolution>();
    std::string port_str = std::to_string(port);

    std::thread([slot, host, port_str] {
        struct addrinfo hints;
        std::memset(&hints, 0, sizeof(hints));
        hints.ai_family = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;

        struct addrinfo* res = nullptr;
        int gai = getaddrinfo(host.c_str(), port_str.c_str(), &hints, &res);

        std::lock_guard<std::mutex> lock(slot->mutex);
        if (slot->abandoned) {
            if (res) freeaddrinfo(res);
            return;
        }
        slot->gai = gai;
        slot->res = res;
        slot->done = true;
        slot->cv.notify_all();
    }).detach();

    std::unique_lock<std::mutex> lock(slot->mutex);
    if (!slot->cv.wait_until(lock, deadline, [&] { return slot->done; })) {
        slot->abandoned = true;
        return false;
    }
    *out = slot->res;
    *gai_out = slot->gai;
    return true;
}

} // namespace

Outcome<socket_t, ConnectErrorKind> tcp_connect(const std::string& host, int port,
                                                int timeout_ms) {
    using Out = Outcome<socket_t, ConnectErrorKind>;

    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);

    struct addrinfo* res = nullptr;
    int gai = 0;
    if (!resolve_until(host, port, deadline, &res, &gai)) {
        return Out::Err(ConnectErrorKind::Timeout,
                        fmt::format("Resolving {} timed out", host));
    }
    if (gai != 0 || !res) {
        if (res) freeaddrinfo(res);
        return Out::Err(ConnectErrorKind::HostUnreachable,
                        fmt::format("Failed to resolve host {}: {}", host, gai_strerror(gai)));
    }

    std::string last_error = "no usable address";
    bool timed_out = false;

    for (struct addrinfo* ai = res; ai; ai = ai->ai_next) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (remaining <= 0) {
            timed_out = true;
            break;
        }

        socket_t sock = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (sock < 0) {
            last_error = std::string("socket: ") + strerror(errno);
            continue;
        }
        set_nonblocking(sock);

        int ret = ::connect(sock, ai->ai_addr, ai->ai_addrlen);
        if (ret < 0 && errno != EINPROGRESS) {
            last_error = strerror(errno);
            close_socket(sock);
            continue;
        }

        if (ret < 0) {
            int revents = poll_socket(sock, POLLOUT, static_cast<int>(remaining));
            if (revents == 0) {
                close_socket(sock);
                timed_out = true;
                last_error = "no answer";
                continue;
            }
            int sock_err = 0;
            socklen_t err_len = sizeof(sock_err);
            getsockopt(sock, SOL_SOCKET, SO_ERROR, &sock_err, &err_len);
            if (sock_err != 0) {
                last_error = strerror(sock_err);
                close_socket(sock);
                continue;
            }
        }

        freeaddrinfo(res);
        return Out::Ok(sock);
    }

    freeaddrinfo(res);
    if (timed_out) {
        return Out::Err(ConnectErrorKind::Timeout,
                        fmt::format("Connection to {}:{} timed out", host, port));
    }
    return Out::Err(ConnectErrorKind::HostUnreachable,
                    fmt::format("Failed to connect to {}:{}: {}", host, port, last_error));
}

void enable_tcp_keepalive(socket_t sock) {
    int tcp_keepalive = 1;
    setsockopt(sock, SOL_SOCKET, SO_KEEPALIVE, &tcp_keepalive, sizeof(tcp_keepalive));
    int keepidle = 60;
    int keepintvl = 15;
    int keepcnt = 4;
#ifdef TCP_KEEPIDLE
    setsockopt(sock, IPPROTO_TCP, TCP_KEEPIDLE, &keepidle, sizeof(keepidle));
#endif
#ifdef TCP_KEEPINTVL
    setsockopt(sock, IPPROTO_TCP, TCP_KEEPINTVL, &keepintvl, sizeof(keepintvl));
#endif
#ifdef TCP_KEEPCNT
    setsockopt(sock, IPPROTO_TCP, TCP_KEEPCNT, &keepcnt, sizeof(keepcnt));
#endif
}

} // namespace platform
