#include "platform/linux/tcp_socket_client.hpp"

#include "envelope.hpp"

#include <cerrno>
#include <cstring>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <string>
#include <sys/socket.h>
#include <unistd.h>

namespace {

constexpr int CONNECT_TIMEOUT_MS = 5000;
constexpr int SEND_TIMEOUT_MS = 5000;

// Non-blocking connect bounded by a timeout.
int connect_with_timeout(const addrinfo* ai, int timeout_ms) {
    int fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_NONBLOCK | SOCK_CLOEXEC,
                      ai->ai_protocol);
    if (fd < 0) return -1;

    if (::connect(fd, ai->ai_addr, ai->ai_addrlen) < 0) {
        if (errno != EINPROGRESS) {
            ::close(fd);
            return -1;
        }
        pollfd pfd{.fd = fd, .events = POLLOUT, .revents = 0};
        int ret;
        do {
            ret = ::poll(&pfd, 1, timeout_ms);
        } while (ret < 0 && errno == EINTR);

        int err = 0;
        socklen_t len = sizeof(err);
        if (ret <= 0 || ::getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &len) < 0 || err != 0) {
            ::close(fd);
            return -1;
        }
    }

    int one = 1;
    ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
    return fd;
}

} // namespace

TcpSocketClient::TcpSocketClient() = default;

TcpSocketClient::~TcpSocketClient() {
    close();
}

bool TcpSocketClient::connect(const std::string& host, uint16_t port) {
    close();

    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* res = nullptr;
    if (::getaddrinfo(host.c_str(), std::to_string(port).c_str(), &hints, &res) != 0) {
        return false;
    }

    int fd = -1;
    for (auto* ai = res; ai && fd < 0; ai = ai->ai_next) {
        fd = connect_with_timeout(ai, CONNECT_TIMEOUT_MS);
    }
    ::freeaddrinfo(res);
    if (fd < 0) return false;

    std::lock_guard lock(send_mutex_);
    fd_.store(fd, std::memory_order_release);
    buf_.clear();
    return true;
}

bool TcpSocketClient::send(const nlohmann::json& msg) {
    std::string data = envelope::frame(msg);

    std::lock_guard lock(send_mutex_);
    int fd = fd_.load(std::memory_order_acquire);
    if (fd < 0) return false;

    size_t total = 0;
    while (total < data.size()) {
        ssize_t n = ::send(fd, data.data() + total, data.size() - total, MSG_NOSIGNAL);
        if (n >= 0) {
            total += static_cast<size_t>(n);
            continue;
        }
        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            // interrupt() shuts the socket down, which wakes this poll.
            pollfd pfd{.fd = fd, .events = POLLOUT, .revents = 0};
            int ret = ::poll(&pfd, 1, SEND_TIMEOUT_MS);
            if (ret < 0 && errno == EINTR) continue;
            if (ret <= 0) return false;
            continue;
        }
        return false;
    }
    return true;
}

RecvStatus TcpSocketClient::recv(nlohmann::json& msg, std::string& raw, int timeout_ms) {
    int fd = fd_.load(std::memory_order_acquire);
    if (fd < 0) return RecvStatus::Closed;

    while (true) {
        if (auto line = buf_.next_line()) {
            raw = std::move(*line);
            try {
                msg = nlohmann::json::parse(raw);
                return RecvStatus::Message;
            } catch (const nlohmann::json::exception&) {
                return RecvStatus::Malformed;
            }
        }

        pollfd pfd{.fd = fd, .events = POLLIN, .revents = 0};
        int ret = ::poll(&pfd, 1, timeout_ms);
        if (ret < 0) {
            if (errno == EINTR) continue;
            return RecvStatus::Closed;
        }
        if (ret == 0) return RecvStatus::Timeout;

        char tmp[4096];
        ssize_t n = ::recv(fd, tmp, sizeof(tmp), 0);
        if (n < 0 && (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK)) continue;
        if (n <= 0) return RecvStatus::Closed;

        if (!buf_.append(tmp, static_cast<size_t>(n))) {
            return RecvStatus::Closed;
        }
    }
}

void TcpSocketClient::interrupt() {
    int fd = fd_.load(std::memory_order_acquire);
    if (fd >= 0) ::shutdown(fd, SHUT_RDWR);
}

void TcpSocketClient::close() {
    // A sender stuck in poll() is woken before we wait for its lock.
    interrupt();
    std::lock_guard lock(send_mutex_);
    int fd = fd_.exchange(-1, std::memory_order_acq_rel);
    if (fd >= 0) ::close(fd);
    buf_.clear();
}
