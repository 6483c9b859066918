#pragma once

#include "clipboard.hpp"
#include "config.hpp"
#include "line_buffer.hpp"
#include "message_channel.hpp"
#include "reconnecting_client.hpp"
#include "terminal_view.hpp"
#include "trigger.hpp"

#include <atomic>
#include <optional>
#include <string>

class OverlayEventLoop {
public:
    explicit OverlayEventLoop(Config config, bool verbose = false);
    ~OverlayEventLoop();

    OverlayEventLoop(const OverlayEventLoop&) = delete;
    OverlayEventLoop& operator=(const OverlayEventLoop&) = delete;

    bool init();
    void run();

private:
    void on_stdin();
    void on_events();
    void handle_trigger(const Trigger& trigger);
    void send(const nlohmann::json& env, const std::string& what);
    void log(const std::string& msg);

    Config config_;
    bool verbose_;

    MessageChannel channel_;
    TerminalView view_;
    WaylandClipboard clipboard_;
    ReconnectingClient client_;

    LineBuffer input_;
    // Question to attach once the requested screenshot arrives.
    std::optional<std::string> pending_shot_;

    int epoll_fd_ = -1;
    int signal_fd_ = -1;

    std::atomic<bool> running_{false};
};
