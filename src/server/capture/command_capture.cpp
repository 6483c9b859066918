#include "command_capture.hpp"

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace {

constexpr uint8_t PNG_MAGIC[] = {0x89, 'P', 'N', 'G', '\r', '\n', 0x1A, '\n'};

std::expected<int, std::string> reap(pid_t pid) {
    int status;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno == EINTR) continue;
        return std::unexpected(std::string("waitpid() failed: ") + std::strerror(errno));
    }
    return status;
}

} // namespace

CommandCapture::CommandCapture(std::vector<std::string> command, int timeout_ms)
    : command_(std::move(command)), timeout_ms_(timeout_ms) {}

std::expected<std::vector<uint8_t>, std::string> CommandCapture::capture() {
    if (command_.empty()) {
        return std::unexpected("no screenshot command configured");
    }

    std::vector<char*> argv;
    for (auto& arg : command_) argv.push_back(arg.data());
    argv.push_back(nullptr);

    int pipefd[2];
    if (::pipe2(pipefd, O_CLOEXEC) < 0) {
        return std::unexpected(std::string("pipe() failed: ") + std::strerror(errno));
    }

    sigset_t empty;
    sigemptyset(&empty);

    pid_t pid = ::fork();
    if (pid < 0) {
        ::close(pipefd[0]);
        ::close(pipefd[1]);
        return std::unexpected(std::string("fork() failed: ") + std::strerror(errno));
    }

    if (pid == 0) {
        // Child: stdout into the pipe, exec the capture tool
        ::sigprocmask(SIG_SETMASK, &empty, nullptr);
        ::dup2(pipefd[1], STDOUT_FILENO);
        ::execvp(argv[0], argv.data());
        ::_exit(127);
    }

    ::close(pipefd[1]);

    std::vector<uint8_t> png;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms_);
    bool timed_out = false;

    while (true) {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (left <= 0) {
            timed_out = true;
            break;
        }

        pollfd pfd{.fd = pipefd[0], .events = POLLIN, .revents = 0};
        int ret = ::poll(&pfd, 1, static_cast<int>(left));
        if (ret < 0 && errno == EINTR) continue;
        if (ret == 0) {
            timed_out = true;
            break;
        }

        uint8_t buf[65536];
        ssize_t n = ::read(pipefd[0], buf, sizeof(buf));
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) break;
        png.insert(png.end(), buf, buf + n);
    }
    ::close(pipefd[0]);

    if (timed_out) ::kill(pid, SIGKILL);

    auto status = reap(pid);
    if (!status) return std::unexpected(status.error());

    if (timed_out) {
        return std::unexpected(command_[0] + " timed out");
    }
    if (WIFEXITED(*status) && WEXITSTATUS(*status) != 0) {
        return std::unexpected(command_[0] + " exited with code " + std::to_string(WEXITSTATUS(*status)));
    }
    if (WIFSIGNALED(*status)) {
        return std::unexpected(command_[0] + " killed by signal " + std::to_string(WTERMSIG(*status)));
    }
    if (png.size() < sizeof(PNG_MAGIC) || std::memcmp(png.data(), PNG_MAGIC, sizeof(PNG_MAGIC)) != 0) {
        return std::unexpected(command_[0] + " did not produce a PNG image");
    }

    return png;
}
