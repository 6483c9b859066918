#pragma once

#include "ai/gemini_backend.hpp"
#include "capture/command_capture.hpp"
#include "config.hpp"
#include "message_router.hpp"
#include "service_endpoint.hpp"
#include "static_server.hpp"

#include <atomic>

class ServerEventLoop {
public:
    explicit ServerEventLoop(Config config, bool verbose = false);
    ~ServerEventLoop();

    ServerEventLoop(const ServerEventLoop&) = delete;
    ServerEventLoop& operator=(const ServerEventLoop&) = delete;

    bool init();
    void run();

private:
    void log(const std::string& msg);

    Config config_;
    bool verbose_;

    // Collaborators (constructed before router_)
    GeminiBackend backend_;
    CommandCapture capture_;

    MessageRouter router_;
    ServiceEndpoint endpoint_;
    StaticFileServer http_;

    int epoll_fd_ = -1;
    int signal_fd_ = -1;

    std::atomic<bool> running_{false};
};
