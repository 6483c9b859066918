#pragma once

#include <cstdint>
#include <expected>
#include <string>

namespace platform {

// Non-blocking listening TCP socket with SO_REUSEADDR. Host "0.0.0.0" or ""
// binds all interfaces; port 0 picks an ephemeral port.
std::expected<int, std::string> listen_tcp(const std::string& host, uint16_t port, int backlog = 16);

// Port a bound socket ended up on, 0 on error.
uint16_t local_port(int fd);

} // namespace platform
