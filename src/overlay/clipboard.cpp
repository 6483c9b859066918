#include "clipboard.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <sstream>
#include <sys/wait.h>
#include <unistd.h>

namespace {

// Runs wl-paste with the given arguments and returns its stdout.
std::expected<std::string, std::string> wl_paste(std::vector<std::string> args) {
    args.insert(args.begin(), "wl-paste");
    std::vector<char*> argv;
    for (auto& arg : args) argv.push_back(arg.data());
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
        // Child: clear the inherited mask, then exec wl-paste into the pipe
        ::sigprocmask(SIG_SETMASK, &empty, nullptr);
        ::dup2(pipefd[1], STDOUT_FILENO);
        ::execvp(argv[0], argv.data());
        ::_exit(127);
    }

    ::close(pipefd[1]);
    std::string out;
    char buf[65536];
    while (true) {
        ssize_t n = ::read(pipefd[0], buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR) continue;
            ::close(pipefd[0]);
            ::waitpid(pid, nullptr, 0);
            return std::unexpected(std::string("read() failed: ") + std::strerror(errno));
        }
        if (n == 0) break;
        out.append(buf, static_cast<size_t>(n));
    }
    ::close(pipefd[0]);

    int status;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno == EINTR) continue;
        return std::unexpected(std::string("waitpid() failed: ") + std::strerror(errno));
    }

    if (WIFEXITED(status) && WEXITSTATUS(status) == 127) {
        return std::unexpected("wl-paste not found");
    }
    // wl-paste exits 1 for an empty clipboard; treat that as no content.
    if (WIFEXITED(status) && WEXITSTATUS(status) > 1) {
        return std::unexpected("wl-paste exited with code " + std::to_string(WEXITSTATUS(status)));
    }
    return out;
}

} // namespace

ClipboardContent::Kind WaylandClipboard::classify(const std::vector<std::string>& mime_types) {
    bool has_text = false;
    bool has_image = false;
    for (const auto& type : mime_types) {
        if (type.starts_with("text/") || type == "UTF8_STRING" || type == "STRING" ||
            type == "TEXT") {
            has_text = true;
        } else if (type == "image/png") {
            has_image = true;
        }
    }
    return has_image && !has_text ? ClipboardContent::Kind::Image : ClipboardContent::Kind::Text;
}

std::expected<ClipboardContent, std::string> WaylandClipboard::read() {
    auto listing = wl_paste({"--list-types"});
    if (!listing) return std::unexpected(listing.error());

    std::vector<std::string> types;
    std::istringstream in(*listing);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty()) types.push_back(line);
    }

    if (classify(types) == ClipboardContent::Kind::Image) {
        auto data = wl_paste({"--type", "image/png"});
        if (!data) return std::unexpected(data.error());
        return ClipboardContent{
            .kind = ClipboardContent::Kind::Image,
            .png = std::vector<uint8_t>(data->begin(), data->end()),
        };
    }

    if (types.empty()) return ClipboardContent{.kind = ClipboardContent::Kind::Text};

    auto text = wl_paste({"--no-newline"});
    if (!text) return std::unexpected(text.error());
    return ClipboardContent{.kind = ClipboardContent::Kind::Text, .text = std::move(*text)};
}
