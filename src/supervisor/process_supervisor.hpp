#pragma once

#include "managed_process.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <expected>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Launches services as child processes, restarts them when they die and
// tears down their whole process trees on shutdown.
//
// start(), poll() and shutdown() belong to the supervising thread;
// status() may be called from anywhere.
class ProcessSupervisor {
public:
    struct Options {
        uint32_t max_restart_attempts = 3;
        std::chrono::milliseconds restart_delay{2000};
        std::chrono::milliseconds warmup{1000};
        std::chrono::milliseconds term_grace{3000};
        std::chrono::milliseconds kill_timeout{2000};
        size_t output_tail_bytes = 16 * 1024;
    };

    // Receives captured child output, one line at a time.
    using OutputSink = std::function<void(std::string_view name, std::string_view line)>;

    explicit ProcessSupervisor(Options opts, bool verbose = false, OutputSink sink = {});
    ~ProcessSupervisor();

    ProcessSupervisor(const ProcessSupervisor&) = delete;
    ProcessSupervisor& operator=(const ProcessSupervisor&) = delete;

    // Launches spec.name and waits the warmup interval. Any failure is also
    // handed to the restart policy, so a later poll() may still bring the
    // service up.
    std::expected<void, SupervisorError> start(const LaunchSpec& spec);

    // One monitoring step: forwards output, detects exits, restarts.
    void poll();

    // Terminates every live process tree. Idempotent.
    void shutdown();

    std::optional<ProcessStatus> status(const std::string& name) const;
    std::vector<ProcessStatus> snapshot() const;

    // True when at least one process is managed and all of them are Failed.
    bool all_failed() const;

private:
    struct ManagedProcess {
        LaunchSpec spec;
        ProcessState state = ProcessState::NotStarted;
        int pid = -1;
        int output_fd = -1;
        std::string partial_line;
        std::string tail;
        int exit_code = 0;
        uint32_t restart_count = 0;
        std::chrono::steady_clock::time_point restart_at;
    };

    struct Spawned {
        int pid;
        int output_fd;
    };

    std::expected<Spawned, SupervisorError> launch(const LaunchSpec& spec);
    void attach(ManagedProcess& mp, const Spawned& spawned);

    // Reads whatever output is available without blocking.
    void drain_output(ManagedProcess& mp);
    void flush_output(ManagedProcess& mp);
    void emit_line(ManagedProcess& mp, std::string_view line);

    // Non-blocking reap of mp's process; true once it has exited.
    bool reap(ManagedProcess& mp);
    // Reaps re-parented descendants that are not managed processes.
    void reap_orphans();

    // Live descendants that no managed process accounts for: orphans
    // re-parented to us because we are their subreaper.
    std::vector<int> orphaned_descendants() const;
    // Kills what a dead process left running: its process group and any orphans.
    void kill_leftovers(const ManagedProcess& mp);

    void on_exit(ManagedProcess& mp);
    void on_launch_failure(ManagedProcess& mp, const SupervisorError& err);
    void schedule_restart(ManagedProcess& mp);
    void try_restart(ManagedProcess& mp);

    // Sends sig to every pid still alive; returns how many were signalled.
    size_t signal_all(const std::vector<int>& pids, int sig);
    // Waits until none of pids is running or timeout passes.
    bool wait_gone(const std::vector<int>& pids, std::chrono::milliseconds timeout);

    void log(const std::string& msg);

    Options opts_;
    bool verbose_;
    OutputSink sink_;

    mutable std::mutex mutex_;
    std::map<std::string, ManagedProcess> processes_;
    std::atomic<bool> shutting_down_{false};
};
