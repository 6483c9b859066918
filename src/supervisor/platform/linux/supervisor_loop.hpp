#pragma once

#include "config.hpp"
#include "process_supervisor.hpp"

#include <atomic>
#include <string>

class SupervisorLoop {
public:
    SupervisorLoop(Config config, std::string config_path, bool verbose = false);
    ~SupervisorLoop();

    SupervisorLoop(const SupervisorLoop&) = delete;
    SupervisorLoop& operator=(const SupervisorLoop&) = delete;

    bool init();
    // Returns the process exit status.
    int run();

private:
    void log(const std::string& msg);

    Config config_;
    std::string config_path_;
    bool verbose_;

    ProcessSupervisor supervisor_;

    int epoll_fd_ = -1;
    int signal_fd_ = -1;

    std::atomic<bool> running_{false};
};
