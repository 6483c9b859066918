#include "platform/net.hpp"

#include <cerrno>
#include <cstring>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

namespace platform {

std::expected<int, std::string> listen_tcp(const std::string& host, uint16_t port, int backlog) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags = AI_PASSIVE;

    const char* node = (host.empty() || host == "0.0.0.0") ? nullptr : host.c_str();
    if (!node) hints.ai_family = AF_INET;

    addrinfo* res = nullptr;
    int rc = ::getaddrinfo(node, std::to_string(port).c_str(), &hints, &res);
    if (rc != 0) {
        return std::unexpected(std::string("getaddrinfo: ") + ::gai_strerror(rc));
    }

    std::string last_error = "no usable address";
    int fd = -1;
    for (auto* ai = res; ai; ai = ai->ai_next) {
        fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_NONBLOCK | SOCK_CLOEXEC,
                      ai->ai_protocol);
        if (fd < 0) {
            last_error = std::string("socket: ") + std::strerror(errno);
            continue;
        }

        int one = 1;
        ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));

        if (::bind(fd, ai->ai_addr, ai->ai_addrlen) < 0) {
            last_error = std::string("bind: ") + std::strerror(errno);
            ::close(fd);
            fd = -1;
            continue;
        }
        if (::listen(fd, backlog) < 0) {
            last_error = std::string("listen: ") + std::strerror(errno);
            ::close(fd);
            fd = -1;
            continue;
        }
        break;
    }
    ::freeaddrinfo(res);

    if (fd < 0) return std::unexpected(last_error);
    return fd;
}

uint16_t local_port(int fd) {
    sockaddr_storage addr{};
    socklen_t len = sizeof(addr);
    if (::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) < 0) return 0;

    if (addr.ss_family == AF_INET) {
        return ntohs(reinterpret_cast<sockaddr_in*>(&addr)->sin_port);
    }
    if (addr.ss_family == AF_INET6) {
        return ntohs(reinterpret_cast<sockaddr_in6*>(&addr)->sin6_port);
    }
    return 0;
}

} // namespace platform
