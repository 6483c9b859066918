#include "reconnecting_client.hpp"

#include "envelope.hpp"

#include <exception>
#include <format>
#include <optional>
#include <print>

using Clock = std::chrono::steady_clock;

ReconnectingClient::ReconnectingClient(std::unique_ptr<Transport> transport, Options opts,
                                       Callback callback, bool verbose)
    : transport_(std::move(transport)), opts_(std::move(opts)),
      callback_(std::move(callback)), verbose_(verbose),
      backoff_(opts_.initial_backoff, opts_.max_backoff) {}

ReconnectingClient::~ReconnectingClient() {
    stop();
    if (thread_.joinable()) thread_.join();
}

void ReconnectingClient::start() {
    thread_ = std::jthread([this] { connect_and_listen(); });
}

void ReconnectingClient::connect_and_listen() {
    while (should_retry()) {
        state_.store(ConnectionState::Connecting, std::memory_order_release);

        if (transport_->connect(opts_.host, opts_.port)) {
            // stop() may have run while connect() was in progress.
            if (!should_retry()) break;

            state_.store(ConnectionState::Connected, std::memory_order_release);
            {
                std::lock_guard lock(mutex_);
                backoff_.reset();
            }
            log(std::format("connected to {}:{}", opts_.host, opts_.port));
            notify(ClientEvent::Kind::Connected, "Successfully connected to server");

            listen();
        } else {
            log(std::format("connect to {}:{} failed", opts_.host, opts_.port));
        }

        state_.store(ConnectionState::Closing, std::memory_order_release);
        transport_->close();
        state_.store(ConnectionState::Disconnected, std::memory_order_release);

        if (!should_retry()) break;

        auto delay = current_backoff();
        notify(ClientEvent::Kind::Retrying,
               std::format("Connection lost. Retrying in {:g} seconds...",
                           std::chrono::duration<double>(delay).count()));

        if (!wait_backoff(delay)) break;

        std::lock_guard lock(mutex_);
        backoff_.next();
    }

    transport_->close();
    state_.store(ConnectionState::Disconnected, std::memory_order_release);
    log("client stopped");
}

void ReconnectingClient::stop() {
    {
        // Under the lock so a concurrent wait_backoff() cannot miss the wakeup.
        std::lock_guard lock(mutex_);
        should_retry_.store(false, std::memory_order_release);
    }
    cv_.notify_all();
    transport_->interrupt();
}

bool ReconnectingClient::send(const nlohmann::json& env) {
    if (state() != ConnectionState::Connected) {
        log("not connected, dropping " + env.value("command", std::string("message")));
        return false;
    }
    return transport_->send(env);
}

std::chrono::milliseconds ReconnectingClient::current_backoff() const {
    std::lock_guard lock(mutex_);
    return backoff_.current();
}

void ReconnectingClient::listen() {
    auto last_inbound = Clock::now();
    auto last_ping = last_inbound;
    bool keepalive = opts_.ping_interval.count() > 0;
    auto quantum = static_cast<int>(opts_.poll_quantum.count());

    while (should_retry()) {
        nlohmann::json msg;
        std::string raw;

        switch (transport_->recv(msg, raw, quantum)) {
            case RecvStatus::Message:
                last_inbound = Clock::now();
                handle_message(msg);
                break;
            case RecvStatus::Malformed:
                last_inbound = Clock::now();
                log("undecodable message: " + raw.substr(0, 80));
                notify(ClientEvent::Kind::InvalidMessage, "Received invalid message format");
                break;
            case RecvStatus::Timeout:
                break;
            case RecvStatus::Closed:
                log("connection closed");
                return;
        }

        if (!keepalive) continue;

        auto now = Clock::now();
        if (now - last_ping >= opts_.ping_interval) {
            transport_->send(envelope::make_ping());
            last_ping = now;
        }
        if (now - last_inbound > opts_.ping_interval + opts_.ping_timeout) {
            log("keep-alive timed out");
            return;
        }
    }
}

void ReconnectingClient::handle_message(const nlohmann::json& msg) {
    std::optional<envelope::Type> type;
    if (msg.is_object() && msg.contains("type") && msg["type"].is_string()) {
        type = envelope::parse_type(msg["type"].get_ref<const std::string&>());
    }

    if (!type) {
        notify(ClientEvent::Kind::InvalidMessage, "Received invalid message format");
        return;
    }

    try {
        switch (*type) {
            case envelope::Type::AiResponse:
                notify(ClientEvent::Kind::Answer, msg.value("answer", std::string("No answer")));
                break;
            case envelope::Type::Error:
                notify(ClientEvent::Kind::ServerError,
                       "Server error: " + msg.value("message", std::string("Unknown error")));
                break;
            case envelope::Type::Screenshot:
                notify(ClientEvent::Kind::Screenshot, msg.value("data", std::string()));
                break;
            case envelope::Type::Pong:
                // Keep-alive reply; last_inbound already refreshed.
                break;
        }
    } catch (const nlohmann::json::exception& e) {
        // Field present with the wrong type.
        notify(ClientEvent::Kind::InvalidMessage,
               std::string("Error processing message: ") + e.what());
    }
}

bool ReconnectingClient::wait_backoff(std::chrono::milliseconds delay) {
    std::unique_lock lock(mutex_);
    return !cv_.wait_for(lock, delay, [this] { return !should_retry(); });
}

void ReconnectingClient::notify(ClientEvent::Kind kind, std::string text) {
    if (!callback_) return;
    try {
        callback_(ClientEvent{kind, std::move(text)});
    } catch (const std::exception& e) {
        std::println(stderr, "client: message callback failed: {}", e.what());
    }
}

void ReconnectingClient::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[ask-anywhere-overlay] {}", msg);
    }
}
