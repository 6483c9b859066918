#include "process_supervisor.hpp"

#include "platform/net.hpp"
#include "proc_tree.hpp"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <format>
#include <print>
#include <sys/prctl.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

extern char** environ;

namespace fs = std::filesystem;
using Clock = std::chrono::steady_clock;

namespace {

// Longest partial line held back before it is forwarded anyway.
constexpr size_t MAX_PENDING_LINE = 4096;

// Written by the child to the status pipe when it cannot exec.
enum class ChildStage : int { Chdir, Exec };

struct ChildFailure {
    ChildStage stage;
    int error;
};

std::optional<std::string> resolve_executable(const std::string& name) {
    std::error_code ec;
    if (name.find('/') != std::string::npos) {
        if (fs::exists(name, ec) && !fs::is_directory(name, ec)) return name;
        return std::nullopt;
    }

    const char* path = std::getenv("PATH");
    std::string_view dirs = path ? path : "/usr/local/bin:/usr/bin:/bin";
    while (!dirs.empty()) {
        auto sep = dirs.find(':');
        auto dir = dirs.substr(0, sep);
        dirs = sep == std::string_view::npos ? std::string_view{} : dirs.substr(sep + 1);
        if (dir.empty()) dir = ".";

        auto candidate = (fs::path(dir) / name).string();
        if (fs::is_regular_file(candidate, ec) && ::access(candidate.c_str(), X_OK) == 0) {
            return candidate;
        }
    }
    return std::nullopt;
}

std::vector<std::string> build_environment(const std::map<std::string, std::string>& overrides) {
    std::map<std::string, std::string> env;
    for (char** e = environ; e && *e; ++e) {
        std::string_view entry(*e);
        auto eq = entry.find('=');
        if (eq == std::string_view::npos) continue;
        env[std::string(entry.substr(0, eq))] = std::string(entry.substr(eq + 1));
    }
    for (const auto& [key, value] : overrides) env[key] = value;

    std::vector<std::string> out;
    out.reserve(env.size());
    for (const auto& [key, value] : env) out.push_back(key + "=" + value);
    return out;
}

std::vector<char*> c_strings(std::vector<std::string>& strings) {
    std::vector<char*> out;
    out.reserve(strings.size() + 1);
    for (auto& s : strings) out.push_back(s.data());
    out.push_back(nullptr);
    return out;
}

int decode_status(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

} // namespace

ProcessSupervisor::ProcessSupervisor(Options opts, bool verbose, OutputSink sink)
    : opts_(opts), verbose_(verbose), sink_(std::move(sink)) {
    // Orphaned grandchildren are re-parented to us instead of init, so they
    // can still be found and reaped.
    if (::prctl(PR_SET_CHILD_SUBREAPER, 1) < 0) {
        std::println(stderr, "supervisor: PR_SET_CHILD_SUBREAPER failed: {}", std::strerror(errno));
    }
}

ProcessSupervisor::~ProcessSupervisor() {
    shutdown();
}

std::expected<void, SupervisorError> ProcessSupervisor::start(const LaunchSpec& spec) {
    {
        std::lock_guard lock(mutex_);
        if (shutting_down_.load(std::memory_order_acquire)) {
            return std::unexpected(SupervisorError{SupervisorError::Kind::LaunchError,
                                                   "supervisor is shutting down", {}});
        }
        auto it = processes_.find(spec.name);
        if (it != processes_.end() && (it->second.state == ProcessState::Running ||
                                       it->second.state == ProcessState::Restarting)) {
            return std::unexpected(SupervisorError{SupervisorError::Kind::LaunchError,
                                                   spec.name + " is already running", {}});
        }
    }

    auto spawned = launch(spec);

    std::unique_lock lock(mutex_);
    // In the map before the warmup, so status() and shutdown() see the child.
    auto& mp = processes_.insert_or_assign(spec.name, ManagedProcess{.spec = spec}).first->second;
    if (!spawned) {
        mp.state = ProcessState::Exited;
        schedule_restart(mp);
        return std::unexpected(spawned.error());
    }
    attach(mp, *spawned);
    log(std::format("started {} (pid {})", spec.name, mp.pid));
    lock.unlock();

    auto deadline = Clock::now() + opts_.warmup;
    while (true) {
        lock.lock();
        if (shutting_down_.load(std::memory_order_acquire)) {
            return std::unexpected(SupervisorError{SupervisorError::Kind::LaunchError,
                                                   "supervisor is shutting down", {}});
        }
        drain_output(mp);
        if (reap(mp)) break;
        lock.unlock();

        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
        if (left.count() <= 0) return {};
        std::this_thread::sleep_for(std::min(left, std::chrono::milliseconds(20)));
    }

    // Exited during the warmup; the lock is held again here.
    flush_output(mp);
    kill_leftovers(mp);
    mp.pid = -1;
    mp.state = ProcessState::Exited;
    schedule_restart(mp);
    return std::unexpected(SupervisorError{
        SupervisorError::Kind::EarlyExit,
        std::format("{} exited with code {} during startup", spec.name, mp.exit_code),
        mp.tail});
}

void ProcessSupervisor::poll() {
    std::lock_guard lock(mutex_);
    if (shutting_down_.load(std::memory_order_acquire)) return;

    auto now = Clock::now();
    for (auto& [name, mp] : processes_) {
        switch (mp.state) {
            case ProcessState::Running:
                drain_output(mp);
                if (reap(mp)) on_exit(mp);
                break;
            case ProcessState::Restarting:
                if (now >= mp.restart_at) try_restart(mp);
                break;
            case ProcessState::NotStarted:
            case ProcessState::Exited:
            case ProcessState::Failed:
                break;
        }
    }

    reap_orphans();
}

void ProcessSupervisor::shutdown() {
    if (shutting_down_.exchange(true, std::memory_order_acq_rel)) return;

    std::lock_guard lock(mutex_);

    std::vector<int> targets;
    std::vector<int> groups;
    for (auto& [name, mp] : processes_) {
        if (mp.pid <= 0) continue;
        drain_output(mp);

        auto tree = proc::process_tree(mp.pid);
        log(std::format("stopping {} ({} process(es))", name, tree.size()));
        targets.insert(targets.end(), tree.begin(), tree.end());
        if (!mp.spec.inherit_stdin) groups.push_back(mp.pid);
    }

    auto orphans = orphaned_descendants();
    if (!orphans.empty()) log(std::format("stopping {} orphaned process(es)", orphans.size()));
    targets.insert(targets.end(), orphans.begin(), orphans.end());

    auto signal_groups = [&](int sig) {
        for (int pgid : groups) {
            if (::killpg(pgid, sig) < 0 && errno != ESRCH) {
                std::println(stderr, "supervisor: killpg({}): {}", pgid, std::strerror(errno));
            }
        }
    };

    if (!targets.empty()) {
        signal_all(targets, SIGTERM);
        signal_groups(SIGTERM);

        if (!wait_gone(targets, opts_.term_grace)) {
            // Descendants forked during the grace period.
            std::vector<int> alive;
            auto add_alive = [&](int p) {
                if (std::find(alive.begin(), alive.end(), p) == alive.end()) alive.push_back(p);
            };
            for (int pid : targets) {
                if (!proc::is_running(pid)) continue;
                for (int p : proc::process_tree(pid)) add_alive(p);
            }
            for (int p : orphaned_descendants()) add_alive(p);

            log(std::format("{} process(es) ignored SIGTERM, killing", alive.size()));
            signal_all(alive, SIGKILL);
            signal_groups(SIGKILL);

            if (!wait_gone(alive, opts_.kill_timeout)) {
                for (int pid : alive) {
                    if (proc::is_running(pid)) {
                        std::println(stderr, "supervisor: process {} still alive after SIGKILL", pid);
                    }
                }
            }
        }
    }

    for (auto& [name, mp] : processes_) {
        if (mp.pid > 0 && !reap(mp)) {
            std::println(stderr, "supervisor: {} (pid {}) could not be reaped", name, mp.pid);
        }
        flush_output(mp);
        mp.pid = -1;
        mp.state = ProcessState::NotStarted;
    }
    reap_orphans();
}

std::optional<ProcessStatus> ProcessSupervisor::status(const std::string& name) const {
    std::lock_guard lock(mutex_);
    auto it = processes_.find(name);
    if (it == processes_.end()) return std::nullopt;

    const auto& mp = it->second;
    return ProcessStatus{
        .name = name,
        .state = mp.state,
        .pid = mp.pid,
        .exit_code = mp.exit_code,
        .restart_count = mp.restart_count,
    };
}

std::vector<ProcessStatus> ProcessSupervisor::snapshot() const {
    std::lock_guard lock(mutex_);
    std::vector<ProcessStatus> out;
    for (const auto& [name, mp] : processes_) {
        out.push_back(ProcessStatus{
            .name = name,
            .state = mp.state,
            .pid = mp.pid,
            .exit_code = mp.exit_code,
            .restart_count = mp.restart_count,
        });
    }
    return out;
}

bool ProcessSupervisor::all_failed() const {
    std::lock_guard lock(mutex_);
    if (processes_.empty()) return false;
    return std::all_of(processes_.begin(), processes_.end(), [](const auto& entry) {
        return entry.second.state == ProcessState::Failed;
    });
}

std::expected<ProcessSupervisor::Spawned, SupervisorError>
ProcessSupervisor::launch(const LaunchSpec& spec) {
    auto path = resolve_executable(spec.executable);
    if (!path) {
        return std::unexpected(SupervisorError{SupervisorError::Kind::LaunchError,
                                               "executable not found: " + spec.executable, {}});
    }

    for (uint16_t port : spec.required_ports) {
        auto fd = platform::listen_tcp(spec.host, port, 1);
        if (!fd) {
            return std::unexpected(SupervisorError{
                SupervisorError::Kind::PortUnavailable,
                std::format("port {} on {} is not available: {}", port, spec.host, fd.error()),
                {}});
        }
        ::close(*fd);
    }

    // Everything the child needs is prepared before fork().
    std::vector<std::string> args{*path};
    args.insert(args.end(), spec.args.begin(), spec.args.end());
    auto argv = c_strings(args);
    auto env = build_environment(spec.env);
    auto envp = c_strings(env);
    const char* working_dir = spec.working_dir.empty() ? nullptr : spec.working_dir.c_str();

    auto os_error = [&](const char* what) {
        return std::unexpected(SupervisorError{SupervisorError::Kind::LaunchError,
                                               std::format("{}: {}", what, std::strerror(errno)),
                                               {}});
    };

    int status_pipe[2];
    if (::pipe2(status_pipe, O_CLOEXEC) < 0) return os_error("pipe() failed");

    int out_pipe[2] = {-1, -1};
    if (spec.capture_output && ::pipe2(out_pipe, O_CLOEXEC) < 0) {
        ::close(status_pipe[0]);
        ::close(status_pipe[1]);
        return os_error("pipe() failed");
    }

    int devnull = -1;
    if (!spec.inherit_stdin) devnull = ::open("/dev/null", O_RDONLY | O_CLOEXEC);

    auto close_all = [&] {
        for (int fd : {status_pipe[0], status_pipe[1], out_pipe[0], out_pipe[1], devnull}) {
            if (fd >= 0) ::close(fd);
        }
    };

    sigset_t empty;
    sigemptyset(&empty);

    pid_t pid = ::fork();
    if (pid < 0) {
        close_all();
        return os_error("fork() failed");
    }

    if (pid == 0) {
        // Child: only async-signal-safe calls from here on.
        if (!spec.inherit_stdin) ::setpgid(0, 0);
        // The supervisor blocks SIGINT/SIGTERM for its signalfd.
        ::sigprocmask(SIG_SETMASK, &empty, nullptr);

        if (devnull >= 0) ::dup2(devnull, STDIN_FILENO);
        if (out_pipe[1] >= 0) {
            ::dup2(out_pipe[1], STDOUT_FILENO);
            ::dup2(out_pipe[1], STDERR_FILENO);
        }

        ChildFailure failure{ChildStage::Chdir, 0};
        if (working_dir && ::chdir(working_dir) < 0) {
            failure.error = errno;
        } else {
            ::execve(argv[0], argv.data(), envp.data());
            failure = {ChildStage::Exec, errno};
        }
        ::write(status_pipe[1], &failure, sizeof(failure));
        ::_exit(127);
    }

    // Parent. Also set here so the group exists before we might signal it.
    if (!spec.inherit_stdin) ::setpgid(pid, pid);

    ::close(status_pipe[1]);
    if (out_pipe[1] >= 0) ::close(out_pipe[1]);
    if (devnull >= 0) ::close(devnull);

    ChildFailure failure{};
    ssize_t n;
    do {
        n = ::read(status_pipe[0], &failure, sizeof(failure));
    } while (n < 0 && errno == EINTR);
    ::close(status_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(failure))) {
        while (::waitpid(pid, nullptr, 0) < 0 && errno == EINTR) {}
        if (out_pipe[0] >= 0) ::close(out_pipe[0]);

        auto what = failure.stage == ChildStage::Chdir
                        ? std::format("cannot enter {}", spec.working_dir)
                        : std::format("cannot execute {}", *path);
        return std::unexpected(SupervisorError{SupervisorError::Kind::LaunchError,
                                               what + ": " + std::strerror(failure.error), {}});
    }

    if (out_pipe[0] >= 0) {
        int flags = ::fcntl(out_pipe[0], F_GETFL);
        ::fcntl(out_pipe[0], F_SETFL, flags | O_NONBLOCK);
    }

    return Spawned{.pid = pid, .output_fd = out_pipe[0]};
}

void ProcessSupervisor::attach(ManagedProcess& mp, const Spawned& spawned) {
    mp.pid = spawned.pid;
    mp.output_fd = spawned.output_fd;
    mp.partial_line.clear();
    mp.tail.clear();
    mp.exit_code = 0;
    mp.state = ProcessState::Running;
}

void ProcessSupervisor::drain_output(ManagedProcess& mp) {
    if (mp.output_fd < 0) return;

    char buf[4096];
    while (true) {
        ssize_t n = ::read(mp.output_fd, buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) return;
            break;
        }
        if (n == 0) break;

        mp.tail.append(buf, static_cast<size_t>(n));
        if (mp.tail.size() > opts_.output_tail_bytes) {
            mp.tail.erase(0, mp.tail.size() - opts_.output_tail_bytes);
        }

        mp.partial_line.append(buf, static_cast<size_t>(n));
        size_t start = 0;
        size_t pos;
        while ((pos = mp.partial_line.find('\n', start)) != std::string::npos) {
            emit_line(mp, std::string_view(mp.partial_line).substr(start, pos - start));
            start = pos + 1;
        }
        mp.partial_line.erase(0, start);
        if (mp.partial_line.size() > MAX_PENDING_LINE) {
            emit_line(mp, mp.partial_line);
            mp.partial_line.clear();
        }
    }

    // EOF or read error: the pipe is done.
    ::close(mp.output_fd);
    mp.output_fd = -1;
    if (!mp.partial_line.empty()) {
        emit_line(mp, mp.partial_line);
        mp.partial_line.clear();
    }
}

void ProcessSupervisor::flush_output(ManagedProcess& mp) {
    drain_output(mp);
    // Descendants may still hold the write end; stop listening anyway.
    if (mp.output_fd >= 0) {
        ::close(mp.output_fd);
        mp.output_fd = -1;
    }
    if (!mp.partial_line.empty()) {
        emit_line(mp, mp.partial_line);
        mp.partial_line.clear();
    }
}

void ProcessSupervisor::emit_line(ManagedProcess& mp, std::string_view line) {
    if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
    if (sink_) {
        sink_(mp.spec.name, line);
    } else {
        std::println(stderr, "[{}] {}", mp.spec.name, line);
    }
}

bool ProcessSupervisor::reap(ManagedProcess& mp) {
    if (mp.pid <= 0) return true;

    int status;
    pid_t r = ::waitpid(mp.pid, &status, WNOHANG);
    if (r == 0) return false;
    if (r < 0) {
        if (errno == EINTR) return false;
        // ECHILD: no longer ours to wait for.
        mp.exit_code = -1;
        return true;
    }

    mp.exit_code = decode_status(status);
    return true;
}

void ProcessSupervisor::reap_orphans() {
    while (true) {
        siginfo_t info{};
        if (::waitid(P_ALL, 0, &info, WEXITED | WNOHANG | WNOWAIT) < 0) return;
        if (info.si_pid == 0) return;

        bool managed = std::any_of(processes_.begin(), processes_.end(), [&](const auto& entry) {
            return entry.second.pid == info.si_pid;
        });
        // Managed children are collected by reap() with their exit status.
        if (managed) return;

        ::waitpid(info.si_pid, nullptr, WNOHANG);
    }
}

std::vector<int> ProcessSupervisor::orphaned_descendants() const {
    std::vector<int> out;
    for (int child : proc::children(::getpid())) {
        bool managed = std::any_of(processes_.begin(), processes_.end(), [&](const auto& entry) {
            return entry.second.pid == child;
        });
        if (managed) continue;
        auto tree = proc::process_tree(child);
        out.insert(out.end(), tree.begin(), tree.end());
    }
    return out;
}

void ProcessSupervisor::kill_leftovers(const ManagedProcess& mp) {
    // The group id outlives its leader for as long as any member is alive.
    if (!mp.spec.inherit_stdin && mp.pid > 0 && ::killpg(mp.pid, SIGKILL) < 0 && errno != ESRCH) {
        std::println(stderr, "supervisor: killpg({}): {}", mp.pid, std::strerror(errno));
    }

    auto orphans = orphaned_descendants();
    if (orphans.empty()) return;
    log(std::format("killing {} process(es) left behind by {}", orphans.size(), mp.spec.name));
    signal_all(orphans, SIGKILL);
}

void ProcessSupervisor::on_exit(ManagedProcess& mp) {
    flush_output(mp);
    std::println(stderr, "supervisor: {} (pid {}) exited with code {}",
                 mp.spec.name, mp.pid, mp.exit_code);
    kill_leftovers(mp);
    mp.pid = -1;
    mp.state = ProcessState::Exited;
    schedule_restart(mp);
}

void ProcessSupervisor::on_launch_failure(ManagedProcess& mp, const SupervisorError& err) {
    std::println(stderr, "supervisor: {}: {}: {}", mp.spec.name, to_string(err.kind), err.message);
    mp.pid = -1;
    mp.exit_code = -1;
    mp.state = ProcessState::Exited;
    schedule_restart(mp);
}

void ProcessSupervisor::schedule_restart(ManagedProcess& mp) {
    if (mp.restart_count >= opts_.max_restart_attempts) {
        mp.state = ProcessState::Failed;
        std::println(stderr, "supervisor: {} failed after {} restart attempt(s), giving up",
                     mp.spec.name, mp.restart_count);
        return;
    }

    mp.state = ProcessState::Restarting;
    mp.restart_at = Clock::now() + opts_.restart_delay;
    log(std::format("restarting {} in {} ms (attempt {}/{})", mp.spec.name,
                    opts_.restart_delay.count(), mp.restart_count + 1,
                    opts_.max_restart_attempts));
}

void ProcessSupervisor::try_restart(ManagedProcess& mp) {
    mp.restart_count++;

    auto spawned = launch(mp.spec);
    if (!spawned) {
        on_launch_failure(mp, spawned.error());
        return;
    }

    attach(mp, *spawned);
    log(std::format("restarted {} (pid {})", mp.spec.name, mp.pid));
}

size_t ProcessSupervisor::signal_all(const std::vector<int>& pids, int sig) {
    size_t signalled = 0;
    for (int pid : pids) {
        if (!proc::is_running(pid)) continue;
        if (::kill(pid, sig) == 0) {
            signalled++;
        } else if (errno != ESRCH) {
            // Keep going: one failure must not spare the rest.
            std::println(stderr, "supervisor: kill({}, {}): {}", pid, sig, std::strerror(errno));
        }
    }
    return signalled;
}

bool ProcessSupervisor::wait_gone(const std::vector<int>& pids, std::chrono::milliseconds timeout) {
    auto deadline = Clock::now() + timeout;
    while (true) {
        // Collect exits so our own children do not linger as zombies.
        for (auto& [name, mp] : processes_) {
            if (mp.pid > 0 && reap(mp)) {
                flush_output(mp);
                log(std::format("{} (pid {}) exited with code {}", name, mp.pid, mp.exit_code));
                mp.pid = -1;
            }
        }
        reap_orphans();

        bool any = std::any_of(pids.begin(), pids.end(), [](int pid) {
            return proc::is_running(pid);
        });
        if (!any) return true;
        if (Clock::now() >= deadline) return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
}

void ProcessSupervisor::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[ask-anywhere] {}", msg);
    }
}
