#pragma once

#include "reconnecting_client.hpp"

#include <deque>
#include <mutex>
#include <vector>

// Hands client events from the networking thread to the presentation loop.
// push() may be called from any thread; notify_fd() becomes readable while
// events are pending so the consumer can wait on it with epoll.
class MessageChannel {
public:
    MessageChannel();
    ~MessageChannel();

    MessageChannel(const MessageChannel&) = delete;
    MessageChannel& operator=(const MessageChannel&) = delete;

    bool valid() const { return event_fd_ >= 0; }
    int notify_fd() const { return event_fd_; }

    void push(ClientEvent event);

    // Takes everything queued so far, oldest first.
    std::vector<ClientEvent> drain();

private:
    int event_fd_ = -1;
    std::mutex mutex_;
    std::deque<ClientEvent> queue_;
};
