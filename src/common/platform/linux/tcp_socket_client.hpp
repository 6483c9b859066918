#pragma once

#include "line_buffer.hpp"
#include "platform/transport.hpp"

#include <atomic>
#include <mutex>

// Non-blocking socket underneath; writes wait for POLLOUT with a bound, so a
// peer that stops reading fails the send instead of wedging the caller.
class TcpSocketClient : public Transport {
public:
    TcpSocketClient();
    ~TcpSocketClient() override;

    TcpSocketClient(const TcpSocketClient&) = delete;
    TcpSocketClient& operator=(const TcpSocketClient&) = delete;

    bool connect(const std::string& host, uint16_t port) override;
    bool send(const nlohmann::json& msg) override;
    RecvStatus recv(nlohmann::json& msg, std::string& raw, int timeout_ms) override;
    void interrupt() override;
    void close() override;

private:
    std::atomic<int> fd_{-1};
    // Serialises senders and fd replacement. interrupt() never takes it.
    std::mutex send_mutex_;
    LineBuffer buf_;
};
