#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>

// How to launch one supervised service.
struct LaunchSpec {
    std::string name;
    std::string executable;
    std::vector<std::string> args;
    // Layered over the supervisor's own environment.
    std::map<std::string, std::string> env;
    std::string working_dir; // empty: inherit

    // Ports that must be bindable on host before launch.
    std::string host = "0.0.0.0";
    std::vector<uint16_t> required_ports;

    // Pipe stdout/stderr back to the supervisor instead of inheriting them.
    bool capture_output = true;
    // Keep the terminal as stdin (and stay in the supervisor's process
    // group so reads are allowed); otherwise stdin is /dev/null.
    bool inherit_stdin = false;
};

enum class ProcessState { NotStarted, Running, Exited, Restarting, Failed };

inline std::string_view to_string(ProcessState state) {
    switch (state) {
        case ProcessState::NotStarted: return "not_started";
        case ProcessState::Running:    return "running";
        case ProcessState::Exited:     return "exited";
        case ProcessState::Restarting: return "restarting";
        case ProcessState::Failed:     return "failed";
    }
    return "unknown";
}

// Point-in-time view of a managed process.
struct ProcessStatus {
    std::string name;
    ProcessState state = ProcessState::NotStarted;
    int pid = -1;
    int exit_code = 0; // last exit; 128 + signal when killed by a signal
    uint32_t restart_count = 0;
};

struct SupervisorError {
    enum class Kind { LaunchError, PortUnavailable, EarlyExit };

    Kind kind;
    std::string message;
    std::string output; // captured stdout/stderr tail (EarlyExit)
};

inline std::string_view to_string(SupervisorError::Kind kind) {
    switch (kind) {
        case SupervisorError::Kind::LaunchError:     return "LaunchError";
        case SupervisorError::Kind::PortUnavailable: return "PortUnavailable";
        case SupervisorError::Kind::EarlyExit:       return "EarlyExit";
    }
    return "Unknown";
}
