#pragma once

#include "backoff.hpp"
#include "connection_state.hpp"
#include "platform/transport.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <thread>

struct ClientEvent {
    enum class Kind {
        Connected,      // "Successfully connected to server"
        Retrying,       // "Connection lost. Retrying in N seconds..."
        Answer,         // ai_response answer text
        ServerError,    // "Server error: <message>"
        Screenshot,     // base64 PNG from a screenshot envelope
        InvalidMessage, // undecodable or unrecognised envelope
    };

    Kind kind;
    std::string text;
};

// Keeps one connection to the server alive for as long as it is running:
// reconnects with exponential backoff after every loss, forever, until stop().
// Every status change and every inbound envelope is reported through a single
// callback, invoked on the client's own thread.
class ReconnectingClient {
public:
    using Callback = std::function<void(const ClientEvent&)>;

    struct Options {
        std::string host = "localhost";
        uint16_t port = 8765;
        std::chrono::milliseconds initial_backoff{std::chrono::seconds(1)};
        std::chrono::milliseconds max_backoff{std::chrono::seconds(30)};
        // Zero disables keep-alive pings.
        std::chrono::milliseconds ping_interval{std::chrono::seconds(20)};
        std::chrono::milliseconds ping_timeout{std::chrono::seconds(60)};
        // Upper bound on how long stop() takes to be observed by a receive.
        std::chrono::milliseconds poll_quantum{100};
    };

    ReconnectingClient(std::unique_ptr<Transport> transport, Options opts, Callback callback,
                       bool verbose = false);
    ~ReconnectingClient();

    ReconnectingClient(const ReconnectingClient&) = delete;
    ReconnectingClient& operator=(const ReconnectingClient&) = delete;

    // Runs connect_and_listen() on a background thread.
    void start();

    // Blocks until stop() is called.
    void connect_and_listen();

    void stop();

    // Best effort: dropped (returns false) unless currently connected.
    bool send(const nlohmann::json& env);

    ConnectionState state() const { return state_.load(std::memory_order_acquire); }
    bool should_retry() const { return should_retry_.load(std::memory_order_acquire); }
    std::chrono::milliseconds current_backoff() const;

private:
    // Returns when the connection is lost or stop() was called.
    void listen();
    void handle_message(const nlohmann::json& msg);
    // False if stop() interrupted the wait.
    bool wait_backoff(std::chrono::milliseconds delay);
    void notify(ClientEvent::Kind kind, std::string text);
    void log(const std::string& msg);

    std::unique_ptr<Transport> transport_;
    Options opts_;
    Callback callback_;
    bool verbose_;

    std::atomic<ConnectionState> state_{ConnectionState::Disconnected};
    std::atomic<bool> should_retry_{true};

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    Backoff backoff_;

    std::jthread thread_;
};
