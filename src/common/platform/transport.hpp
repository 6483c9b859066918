#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

enum class RecvStatus { Message, Timeout, Closed, Malformed };

// Client side of one message channel. A transport may be connected, closed and
// connected again any number of times.
class Transport {
public:
    virtual ~Transport() = default;
    virtual bool connect(const std::string& host, uint16_t port) = 0;
    virtual bool send(const nlohmann::json& msg) = 0;
    // Malformed leaves the undecodable line in `raw`.
    virtual RecvStatus recv(nlohmann::json& msg, std::string& raw, int timeout_ms) = 0;
    // Wakes a blocked recv() from another thread; the next recv() reports Closed.
    virtual void interrupt() = 0;
    virtual void close() = 0;
};
