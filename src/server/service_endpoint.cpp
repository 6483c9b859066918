#include "service_endpoint.hpp"

#include "platform/net.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <print>
#include <sys/epoll.h>
#include <sys/socket.h>
#include <unistd.h>

ServiceEndpoint::ServiceEndpoint(MessageRouter& router, Options opts, bool verbose)
    : router_(router), opts_(opts), verbose_(verbose) {}

ServiceEndpoint::~ServiceEndpoint() {
    stop();
}

bool ServiceEndpoint::start(const std::string& host, uint16_t port) {
    auto fd = platform::listen_tcp(host, port);
    if (!fd) {
        std::println(stderr, "endpoint: cannot listen on {}:{}: {}", host, port, fd.error());
        return false;
    }
    server_fd_ = *fd;
    port_ = platform::local_port(server_fd_);

    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        std::println(stderr, "endpoint: epoll_create1 failed: {}", std::strerror(errno));
        ::close(server_fd_);
        server_fd_ = -1;
        return false;
    }

    epoll_event ev{.events = EPOLLIN, .data = {.fd = server_fd_}};
    epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, server_fd_, &ev);

    log("listening on " + host + ":" + std::to_string(port_));
    return true;
}

void ServiceEndpoint::stop() {
    if (server_fd_ >= 0) {
        ::close(server_fd_);
        server_fd_ = -1;
    }

    for (int id : connection_ids()) {
        close_client(id);
    }

    // Joins workers still inside a handler.
    std::vector<std::shared_ptr<Connection>> retired;
    {
        std::lock_guard lock(mutex_);
        retired.swap(retired_);
    }
    retired.clear();

    if (epoll_fd_ >= 0) {
        ::close(epoll_fd_);
        epoll_fd_ = -1;
    }
}

void ServiceEndpoint::poll(int timeout_ms) {
    if (epoll_fd_ < 0) return;

    constexpr int MAX_EVENTS = 32;
    epoll_event events[MAX_EVENTS];

    int n = epoll_wait(epoll_fd_, events, MAX_EVENTS, timeout_ms);
    if (n < 0 && errno != EINTR) {
        std::println(stderr, "endpoint: epoll_wait error: {}", std::strerror(errno));
    }

    for (int i = 0; i < n; i++) {
        int fd = events[i].data.fd;

        if (fd == server_fd_) {
            accept_clients();
            continue;
        }

        auto conn = find(fd);
        if (!conn) continue;

        auto status = (events[i].events & EPOLLERR) ? Connection::ReadStatus::Failed
                                                    : conn->on_readable();
        if (status == Connection::ReadStatus::Open) continue;
        if (retire(fd, status == Connection::ReadStatus::PeerClosed)) {
            log("client " + std::to_string(fd) + " disconnected");
        }
    }

    sweep_idle();
    reap_retired();
}

bool ServiceEndpoint::send_to(int conn_id, const nlohmann::json& env) {
    auto conn = find(conn_id);
    if (!conn) return false;
    return conn->send(env);
}

bool ServiceEndpoint::close_client(int conn_id) {
    return retire(conn_id, false);
}

bool ServiceEndpoint::retire(int conn_id, bool drain) {
    std::shared_ptr<Connection> conn;
    {
        std::lock_guard lock(mutex_);
        auto it = clients_.find(conn_id);
        if (it == clients_.end()) return false;
        conn = std::move(it->second);
        clients_.erase(it);
        if (epoll_fd_ >= 0) epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, conn_id, nullptr);
        retired_.push_back(conn);
    }
    if (!drain) conn->close();
    return true;
}

size_t ServiceEndpoint::connection_count() const {
    std::lock_guard lock(mutex_);
    return clients_.size();
}

std::vector<int> ServiceEndpoint::connection_ids() const {
    std::lock_guard lock(mutex_);
    std::vector<int> ids;
    ids.reserve(clients_.size());
    for (auto& [id, conn] : clients_) ids.push_back(id);
    return ids;
}

void ServiceEndpoint::accept_clients() {
    while (true) {
        int fd = ::accept4(server_fd_, nullptr, nullptr, SOCK_NONBLOCK | SOCK_CLOEXEC);
        if (fd < 0) {
            if (errno == EINTR) continue;
            if (errno != EAGAIN && errno != EWOULDBLOCK) {
                std::println(stderr, "endpoint: accept failed: {}", std::strerror(errno));
            }
            return;
        }

        int one = 1;
        ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));

        auto conn = std::make_shared<Connection>(
            fd, [this](std::string_view raw) { return router_.handle(raw); },
            opts_.max_message_bytes);

        {
            std::lock_guard lock(mutex_);
            clients_[fd] = std::move(conn);
            epoll_event ev{.events = EPOLLIN | EPOLLRDHUP, .data = {.fd = fd}};
            epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &ev);
        }
        log("client " + std::to_string(fd) + " connected");
    }
}

void ServiceEndpoint::sweep_idle() {
    if (opts_.idle_timeout.count() <= 0) return;

    auto deadline = std::chrono::steady_clock::now() - opts_.idle_timeout;
    std::vector<int> stale;
    {
        std::lock_guard lock(mutex_);
        for (auto& [id, conn] : clients_) {
            if (conn->last_activity() < deadline) stale.push_back(id);
        }
    }
    for (int id : stale) {
        if (close_client(id)) log("client " + std::to_string(id) + " timed out");
    }
}

void ServiceEndpoint::reap_retired() {
    std::vector<std::shared_ptr<Connection>> done;
    {
        std::lock_guard lock(mutex_);
        auto it = std::partition(retired_.begin(), retired_.end(),
                                 [](const auto& c) { return !c->finished(); });
        done.assign(std::make_move_iterator(it), std::make_move_iterator(retired_.end()));
        retired_.erase(it, retired_.end());
    }
    // Destroyed outside the lock; their workers have already exited.
}

std::shared_ptr<Connection> ServiceEndpoint::find(int conn_id) const {
    std::lock_guard lock(mutex_);
    auto it = clients_.find(conn_id);
    return it != clients_.end() ? it->second : nullptr;
}

void ServiceEndpoint::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[ask-anywhere-server] {}", msg);
    }
}
