#include "connection.hpp"

#include "envelope.hpp"

#include <cerrno>
#include <exception>
#include <poll.h>
#include <print>
#include <sys/socket.h>
#include <unistd.h>

namespace {

constexpr int SEND_TIMEOUT_MS = 5000;

std::chrono::steady_clock::rep now_ticks() {
    return std::chrono::steady_clock::now().time_since_epoch().count();
}

} // namespace

Connection::Connection(int fd, Handler handler, size_t max_line_bytes)
    : fd_(fd), handler_(std::move(handler)), buf_(max_line_bytes),
      last_activity_(now_ticks()) {
    worker_ = std::jthread([this](std::stop_token st) { worker_loop(st); });
}

Connection::~Connection() {
    close();
    if (worker_.joinable()) {
        worker_.request_stop();
        worker_.join();
    }
    ::close(fd_);
}

Connection::ReadStatus Connection::on_readable() {
    char tmp[8192];
    bool open = true;

    while (true) {
        ssize_t n = ::recv(fd_, tmp, sizeof(tmp), 0);
        if (n > 0) {
            last_activity_.store(now_ticks(), std::memory_order_relaxed);
            if (!buf_.append(tmp, static_cast<size_t>(n))) {
                std::println(stderr, "endpoint: connection {} exceeded the message size limit", fd_);
                return ReadStatus::Failed;
            }
            continue;
        }
        if (n == 0) {
            open = false;
            break;
        }
        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) break;
        return ReadStatus::Failed;
    }

    {
        std::lock_guard lock(queue_mutex_);
        while (auto line = buf_.next_line()) {
            if (line->empty()) continue;
            queue_.push_back(std::move(*line));
        }
        if (!open) input_done_ = true;
    }
    queue_cv_.notify_one();
    return open ? ReadStatus::Open : ReadStatus::PeerClosed;
}

std::chrono::steady_clock::time_point Connection::last_activity() const {
    return std::chrono::steady_clock::time_point(
        std::chrono::steady_clock::duration(last_activity_.load(std::memory_order_relaxed)));
}

bool Connection::send(const nlohmann::json& env) {
    if (state() != ConnectionState::Connected) return false;

    std::string data = envelope::frame(env);

    std::lock_guard lock(send_mutex_);
    size_t total = 0;
    while (total < data.size()) {
        if (state() != ConnectionState::Connected) return false;

        ssize_t n = ::send(fd_, data.data() + total, data.size() - total, MSG_NOSIGNAL);
        if (n >= 0) {
            total += static_cast<size_t>(n);
            continue;
        }
        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            pollfd pfd{.fd = fd_, .events = POLLOUT, .revents = 0};
            if (::poll(&pfd, 1, SEND_TIMEOUT_MS) <= 0) return false;
            continue;
        }
        return false;
    }
    return true;
}

void Connection::close() {
    auto expected = ConnectionState::Connected;
    if (!state_.compare_exchange_strong(expected, ConnectionState::Closing,
                                        std::memory_order_acq_rel)) {
        return;
    }
    ::shutdown(fd_, SHUT_RDWR);
    worker_.request_stop();
}

void Connection::worker_loop(std::stop_token st) {
    while (!st.stop_requested()) {
        std::string line;
        {
            std::unique_lock lock(queue_mutex_);
            if (!queue_cv_.wait(lock, st, [this] { return !queue_.empty() || input_done_; })) {
                break;
            }
            if (queue_.empty()) break;
            line = std::move(queue_.front());
            queue_.pop_front();
        }

        try {
            auto response = handler_(line);
            if (response) send(*response);
        } catch (const std::exception& e) {
            std::println(stderr, "endpoint: handler error on connection {}: {}", fd_, e.what());
        }
    }
    finished_.store(true, std::memory_order_release);
}
