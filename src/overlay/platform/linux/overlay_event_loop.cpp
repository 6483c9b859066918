#include "platform/linux/overlay_event_loop.hpp"

#include "base64.hpp"
#include "envelope.hpp"
#include "platform/linux/tcp_socket_client.hpp"

#include <cerrno>
#include <cstring>
#include <print>
#include <signal.h>
#include <sys/epoll.h>
#include <sys/signalfd.h>
#include <unistd.h>

namespace {

constexpr size_t MAX_INPUT_LINE = 64 * 1024;

ReconnectingClient::Options client_options(const Config::Client& c) {
    return ReconnectingClient::Options{
        .host = c.host,
        .port = c.port,
        .initial_backoff = std::chrono::seconds(c.initial_backoff),
        .max_backoff = std::chrono::seconds(c.max_backoff),
        .ping_interval = std::chrono::seconds(c.ping_interval),
        .ping_timeout = std::chrono::seconds(c.ping_timeout),
    };
}

} // namespace

OverlayEventLoop::OverlayEventLoop(Config config, bool verbose)
    : config_(std::move(config)), verbose_(verbose),
      client_(std::make_unique<TcpSocketClient>(), client_options(config_.client),
              // Runs on the client thread
              [this](const ClientEvent& event) { channel_.push(event); },
              verbose_),
      input_(MAX_INPUT_LINE) {}

OverlayEventLoop::~OverlayEventLoop() {
    client_.stop();
    if (epoll_fd_ >= 0) ::close(epoll_fd_);
    if (signal_fd_ >= 0) ::close(signal_fd_);
}

bool OverlayEventLoop::init() {
    if (!channel_.valid()) return false;

    // Block before the client thread starts so it inherits the mask.
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

    auto add_fd = [this](int fd, uint32_t events) {
        epoll_event ev{.events = events, .data = {.fd = fd}};
        return epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &ev) == 0;
    };

    add_fd(signal_fd_, EPOLLIN);
    add_fd(channel_.notify_fd(), EPOLLIN);

    // stdin may be a regular file or /dev/null, which epoll rejects.
    if (!add_fd(STDIN_FILENO, EPOLLIN)) log("stdin not pollable, input triggers disabled");

    log("connecting to " + config_.client.host + ":" + std::to_string(config_.client.port));
    client_.start();

    running_.store(true, std::memory_order_release);
    return true;
}

void OverlayEventLoop::run() {
    constexpr int MAX_EVENTS = 8;
    epoll_event events[MAX_EVENTS];

    while (running_.load(std::memory_order_relaxed)) {
        int n = epoll_wait(epoll_fd_, events, MAX_EVENTS, -1);
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

            if (fd == channel_.notify_fd()) {
                on_events();
                continue;
            }

            if (fd == STDIN_FILENO) {
                on_stdin();
                continue;
            }
        }
    }

    client_.stop();
}

void OverlayEventLoop::on_stdin() {
    char buf[4096];
    ssize_t n = ::read(STDIN_FILENO, buf, sizeof(buf));
    if (n < 0 && (errno == EINTR || errno == EAGAIN)) return;

    if (n <= 0) {
        // EOF: keep showing messages, stop taking input.
        epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, STDIN_FILENO, nullptr);
        log("stdin closed, input triggers disabled");
        return;
    }

    if (!input_.append(buf, static_cast<size_t>(n))) {
        view_.status("Input line too long, discarded");
        input_.clear();
        return;
    }

    while (auto line = input_.next_line()) {
        if (line->find_first_not_of(" \t") == std::string::npos) continue;

        auto trigger = parse_trigger(*line);
        if (!trigger) {
            view_.status(trigger.error() +
                         " (commands: ask, image, clip, shot, ping, quit)");
            continue;
        }
        handle_trigger(*trigger);
        if (!running_.load(std::memory_order_relaxed)) return;
    }
}

void OverlayEventLoop::handle_trigger(const Trigger& trigger) {
    const auto& prefix = config_.client.prompt_prefix;

    switch (trigger.kind) {
        case Trigger::Kind::Ask:
            send(make_text_query(prefix, trigger.argument), "question");
            break;

        case Trigger::Kind::Image: {
            auto png = read_file(trigger.argument);
            if (!png) {
                view_.status(png.error());
                return;
            }
            send(make_image_query(prefix, trigger.question, *png), "image");
            break;
        }

        case Trigger::Kind::Clip: {
            auto content = clipboard_.read();
            if (!content) {
                view_.status("Clipboard unavailable: " + content.error());
                return;
            }
            if (content->kind == ClipboardContent::Kind::Image) {
                send(make_image_query(prefix, "", content->png), "clipboard image");
            } else {
                send(make_text_query(prefix, content->text), "clipboard text");
            }
            break;
        }

        case Trigger::Kind::Shot:
            pending_shot_ = trigger.question;
            send(envelope::make_screenshot_request(), "screenshot request");
            break;

        case Trigger::Kind::Ping:
            send(envelope::make_ping(), "ping");
            break;

        case Trigger::Kind::Quit:
            log("quit requested");
            running_.store(false, std::memory_order_release);
            break;
    }
}

void OverlayEventLoop::on_events() {
    for (auto& event : channel_.drain()) {
        if (event.kind == ClientEvent::Kind::Screenshot && pending_shot_) {
            auto png = base64::decode(event.text);
            if (!png) {
                view_.status("Screenshot could not be decoded");
                pending_shot_.reset();
                continue;
            }
            view_.show(event);
            send(make_image_query(config_.client.prompt_prefix, *pending_shot_, *png),
                 "screenshot");
            pending_shot_.reset();
            continue;
        }

        if (event.kind == ClientEvent::Kind::Retrying) {
            // The request will not be answered on the new connection.
            pending_shot_.reset();
        }
        view_.show(event);
    }
}

void OverlayEventLoop::send(const nlohmann::json& env, const std::string& what) {
    if (client_.send(env)) {
        view_.status("Sent " + what);
    } else {
        view_.status("Not connected, " + what + " dropped");
    }
}

void OverlayEventLoop::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[ask-anywhere-overlay] {}", msg);
    }
}
