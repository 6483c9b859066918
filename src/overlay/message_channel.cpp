#include "message_channel.hpp"

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <print>
#include <sys/eventfd.h>
#include <unistd.h>

MessageChannel::MessageChannel() {
    event_fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (event_fd_ < 0) {
        std::println(stderr, "channel: eventfd failed: {}", std::strerror(errno));
    }
}

MessageChannel::~MessageChannel() {
    if (event_fd_ >= 0) ::close(event_fd_);
}

void MessageChannel::push(ClientEvent event) {
    {
        std::lock_guard lock(mutex_);
        queue_.push_back(std::move(event));
    }
    if (event_fd_ >= 0) {
        uint64_t val = 1;
        ::write(event_fd_, &val, sizeof(val));
    }
}

std::vector<ClientEvent> MessageChannel::drain() {
    if (event_fd_ >= 0) {
        uint64_t val;
        ::read(event_fd_, &val, sizeof(val));
    }

    std::lock_guard lock(mutex_);
    std::vector<ClientEvent> out(std::make_move_iterator(queue_.begin()),
                                 std::make_move_iterator(queue_.end()));
    queue_.clear();
    return out;
}
