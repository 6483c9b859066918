#include "platform/linux/server_event_loop.hpp"

#include <cerrno>
#include <cstring>
#include <print>
#include <signal.h>
#include <sys/epoll.h>
#include <sys/signalfd.h>
#include <unistd.h>

ServerEventLoop::ServerEventLoop(Config config, bool verbose)
    : config_(std::move(config)), verbose_(verbose),
      backend_(config_.ai.url, config_.ai.model, config_.ai.api_key,
               config_.ai.timeout, config_.ai.image_prompt),
      capture_(config_.screenshot.command),
      router_(backend_, capture_, verbose_),
      endpoint_(router_,
                ServiceEndpoint::Options{
                    .max_message_bytes = config_.server.max_message_bytes,
                    .idle_timeout = std::chrono::seconds(config_.server.idle_timeout()),
                },
                verbose_),
      http_(config_.server.static_dir, verbose_) {}

ServerEventLoop::~ServerEventLoop() {
    if (epoll_fd_ >= 0) ::close(epoll_fd_);
    if (signal_fd_ >= 0) ::close(signal_fd_);
}

bool ServerEventLoop::init() {
    if (!backend_.configured()) {
        std::println(stderr, "Warning: no Gemini API key configured (set GEMINI_API_KEY)");
    }

    // Block before any worker thread exists so they all inherit the mask.
    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    sigprocmask(SIG_BLOCK, &mask, nullptr);

    signal_fd_ = signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC);
    if (signal_fd_ < 0) {
        std::println(stderr, "signalfd failed: {}", std::strerror(errno));
        return false;
    }

    if (!endpoint_.start(config_.server.host, config_.server.ws_port)) return false;
    log("Socket server on " + config_.server.host + ":" + std::to_string(endpoint_.port()));

    if (!http_.start(config_.server.host, config_.server.http_port)) return false;

    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        std::println(stderr, "epoll_create1 failed: {}", std::strerror(errno));
        return false;
    }

    auto add_fd = [this](int fd, uint32_t events) {
        epoll_event ev{.events = events, .data = {.fd = fd}};
        return epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &ev) == 0;
    };

    add_fd(signal_fd_, EPOLLIN);
    add_fd(endpoint_.epoll_fd(), EPOLLIN);

    running_.store(true, std::memory_order_release);
    return true;
}

void ServerEventLoop::run() {
    constexpr int MAX_EVENTS = 8;
    // Wakes periodically so idle connections are swept even without traffic.
    constexpr int TICK_MS = 1000;
    epoll_event events[MAX_EVENTS];

    while (running_.load(std::memory_order_relaxed)) {
        int n = epoll_wait(epoll_fd_, events, MAX_EVENTS, TICK_MS);
        if (n < 0) {
            if (errno == EINTR) continue;
            std::println(stderr, "epoll_wait error: {}", std::strerror(errno));
            break;
        }

        for (int i = 0; i < n; i++) {
            int fd = events[i].data.fd;

            if (fd == signal_fd_) {
                signalfd_siginfo info;
                ::read(signal_fd_, &info, sizeof(info));
                log("Received signal, shutting down");
                running_.store(false, std::memory_order_release);
                break;
            }
        }

        if (!running_.load(std::memory_order_relaxed)) break;

        // Endpoint readiness or a bare tick: either way run one reactor step,
        // which also sweeps idle connections.
        endpoint_.poll(0);
    }

    // Waits for handlers still talking to the inference backend.
    log("Closing " + std::to_string(endpoint_.connection_count()) + " connection(s)");
    http_.stop();
    endpoint_.stop();
}

void ServerEventLoop::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[ask-anywhere-server] {}", msg);
    }
}
