#pragma once

#include <httplib.h>

#include <cstdint>
#include <string>
#include <thread>

// Serves the web variant of the overlay out of a directory. Requests are
// handled on httplib's own threads, never on the server's event loop.
class StaticFileServer {
public:
    explicit StaticFileServer(std::string root, bool verbose = false);
    ~StaticFileServer();

    StaticFileServer(const StaticFileServer&) = delete;
    StaticFileServer& operator=(const StaticFileServer&) = delete;

    // Port 0 binds an ephemeral port, see port().
    bool start(const std::string& host, uint16_t port);
    void stop();

    uint16_t port() const { return port_; }

private:
    void log(const std::string& msg);

    std::string root_;
    bool verbose_;
    uint16_t port_ = 0;

    httplib::Server svr_;
    std::jthread thread_;
};
