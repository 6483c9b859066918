#include "platform/linux/supervisor_loop.hpp"

#include "launch_specs.hpp"
#include "platform/platform_paths.hpp"

#include <cerrno>
#include <cstring>
#include <format>
#include <print>
#include <signal.h>
#include <sys/epoll.h>
#include <sys/signalfd.h>
#include <unistd.h>

namespace {

ProcessSupervisor::Options supervisor_options(const Config::Supervisor& s) {
    return ProcessSupervisor::Options{
        .max_restart_attempts = s.max_restart_attempts,
        .restart_delay = std::chrono::milliseconds(s.restart_delay_ms),
        .warmup = std::chrono::milliseconds(s.warmup_ms),
        .term_grace = std::chrono::milliseconds(s.term_grace_ms),
        .kill_timeout = std::chrono::milliseconds(s.kill_timeout_ms),
    };
}

} // namespace

SupervisorLoop::SupervisorLoop(Config config, std::string config_path, bool verbose)
    : config_(std::move(config)), config_path_(std::move(config_path)), verbose_(verbose),
      supervisor_(supervisor_options(config_.supervisor), verbose_) {}

SupervisorLoop::~SupervisorLoop() {
    if (epoll_fd_ >= 0) ::close(epoll_fd_);
    if (signal_fd_ >= 0) ::close(signal_fd_);
}

bool SupervisorLoop::init() {
    // Blocked before any child is forked; children unblock them again.
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

    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        std::println(stderr, "epoll_create1 failed: {}", std::strerror(errno));
        return false;
    }

    epoll_event ev{.events = EPOLLIN, .data = {.fd = signal_fd_}};
    if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, signal_fd_, &ev) < 0) {
        std::println(stderr, "epoll_ctl failed: {}", std::strerror(errno));
        return false;
    }

    auto specs = build_launch_specs(config_, config_path_, platform::executable_dir(), verbose_);
    for (const auto& spec : specs) {
        log("starting " + spec.name + ": " + spec.executable);
        auto started = supervisor_.start(spec);
        if (!started) {
            // Left to the restart policy; keep supervising the others.
            const auto& err = started.error();
            std::println(stderr, "supervisor: failed to start {}: {}: {}",
                         spec.name, to_string(err.kind), err.message);
            if (!err.output.empty()) {
                std::println(stderr, "supervisor: output of {}:\n{}", spec.name, err.output);
            }
            continue;
        }
        log(spec.name + " is running");
    }

    running_.store(true, std::memory_order_release);
    return true;
}

int SupervisorLoop::run() {
    constexpr int MAX_EVENTS = 4;
    epoll_event events[MAX_EVENTS];
    int poll_ms = static_cast<int>(config_.supervisor.poll_interval_ms);
    int status = 0;

    while (running_.load(std::memory_order_relaxed)) {
        int n = epoll_wait(epoll_fd_, events, MAX_EVENTS, poll_ms);
        if (n < 0) {
            if (errno == EINTR) continue;
            std::println(stderr, "epoll_wait error: {}", std::strerror(errno));
            status = 1;
            break;
        }

        bool signalled = false;
        for (int i = 0; i < n; i++) {
            if (events[i].data.fd == signal_fd_) {
                signalfd_siginfo info;
                ::read(signal_fd_, &info, sizeof(info));
                log(std::string("Received ") + strsignal(static_cast<int>(info.ssi_signo)) +
                    ", shutting down");
                signalled = true;
            }
        }
        if (signalled) break;

        supervisor_.poll();

        if (supervisor_.all_failed()) {
            std::println(stderr, "supervisor: every service has failed, exiting");
            status = 1;
            break;
        }
    }

    supervisor_.shutdown();

    for (const auto& st : supervisor_.snapshot()) {
        log(std::format("{}: {} (restarts: {})", st.name, to_string(st.state), st.restart_count));
    }
    return status;
}

void SupervisorLoop::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[ask-anywhere] {}", msg);
    }
}
