#pragma once

#include "connection_state.hpp"
#include "line_buffer.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <thread>

// One accepted client. The reactor thread feeds it raw bytes; a dedicated
// worker handles complete lines in receipt order and writes the responses,
// so a slow handler only ever delays its own connection.
class Connection {
public:
    using Handler = std::function<std::optional<nlohmann::json>(std::string_view)>;

    enum class ReadStatus {
        Open,
        // EOF from the peer. Lines already received are still answered,
        // then the worker exits on its own.
        PeerClosed,
        // Socket error or an oversized line.
        Failed,
    };

    Connection(int fd, Handler handler, size_t max_line_bytes);
    ~Connection();

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    int fd() const { return fd_; }
    ConnectionState state() const { return state_.load(std::memory_order_acquire); }

    // Reactor thread only. Reads everything available and queues complete lines.
    ReadStatus on_readable();

    std::chrono::steady_clock::time_point last_activity() const;

    // Any thread. Returns false without side effects once the connection is closing.
    bool send(const nlohmann::json& env);

    // Idempotent. Pending lines are dropped; an in-flight handler completes
    // but its response is discarded.
    void close();

    // True once the worker thread has exited and the object can be destroyed
    // without blocking.
    bool finished() const { return finished_.load(std::memory_order_acquire); }

private:
    void worker_loop(std::stop_token st);

    int fd_;
    Handler handler_;
    LineBuffer buf_;
    std::atomic<ConnectionState> state_{ConnectionState::Connected};
    std::atomic<std::chrono::steady_clock::rep> last_activity_;

    std::mutex send_mutex_;

    std::mutex queue_mutex_;
    std::condition_variable_any queue_cv_;
    std::deque<std::string> queue_;
    bool input_done_ = false;

    std::atomic<bool> finished_{false};
    std::jthread worker_;
};
