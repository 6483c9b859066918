#pragma once

#include "connection.hpp"
#include "message_router.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <unordered_map>
#include <vector>

// TCP listener plus the registry of live connections. poll() is the reactor
// step and must always run on the same thread; the registry accessors may be
// used from any thread.
class ServiceEndpoint {
public:
    struct Options {
        size_t max_message_bytes = 32 * 1024 * 1024;
        // Connections silent for longer than this are dropped. Zero disables.
        std::chrono::milliseconds idle_timeout{std::chrono::seconds(50)};
    };

    ServiceEndpoint(MessageRouter& router, Options opts, bool verbose = false);
    ~ServiceEndpoint();

    ServiceEndpoint(const ServiceEndpoint&) = delete;
    ServiceEndpoint& operator=(const ServiceEndpoint&) = delete;

    // Port 0 binds an ephemeral port, see port().
    bool start(const std::string& host, uint16_t port);
    void stop();

    uint16_t port() const { return port_; }
    // Readable whenever poll() has work; lets an outer loop nest the reactor.
    int epoll_fd() const { return epoll_fd_; }

    void poll(int timeout_ms);

    // No-op returning false when the connection is gone or closing.
    bool send_to(int conn_id, const nlohmann::json& env);

    // Removes a connection from the registry. Returns true only for the call
    // that actually removed it.
    bool close_client(int conn_id);

    size_t connection_count() const;
    std::vector<int> connection_ids() const;

private:
    void accept_clients();
    void sweep_idle();
    void reap_retired();
    // Drops conn_id from the registry. With drain set the worker answers the
    // lines it already holds before the socket is closed.
    bool retire(int conn_id, bool drain);
    std::shared_ptr<Connection> find(int conn_id) const;

    void log(const std::string& msg);

    MessageRouter& router_;
    Options opts_;
    bool verbose_;

    int server_fd_ = -1;
    int epoll_fd_ = -1;
    uint16_t port_ = 0;

    mutable std::mutex mutex_;
    std::unordered_map<int, std::shared_ptr<Connection>> clients_;
    // Closed or draining connections whose worker may still be running.
    std::vector<std::shared_ptr<Connection>> retired_;
};
