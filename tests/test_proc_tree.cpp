#include <catch2/catch_test_macros.hpp>

#include "proc_tree.hpp"

#include <algorithm>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <format>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

using namespace std::chrono_literals;

namespace {

pid_t spawn_shell(const char* script) {
    pid_t pid = ::fork();
    if (pid == 0) {
        ::execl("/bin/sh", "sh", "-c", script, static_cast<char*>(nullptr));
        ::_exit(127);
    }
    return pid;
}

template <typename Pred>
bool eventually(Pred pred, std::chrono::milliseconds timeout = 3s) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(10ms);
    }
    return pred();
}

} // namespace

TEST_CASE("Process tree", "[proc]") {

    SECTION("SelfIsRunning") {
        REQUIRE(proc::is_running(::getpid()));
        auto tree = proc::process_tree(::getpid());
        REQUIRE_FALSE(tree.empty());
        REQUIRE(tree[0] == ::getpid());
    }

    SECTION("InvalidPids") {
        REQUIRE_FALSE(proc::is_running(0));
        REQUIRE_FALSE(proc::is_running(-1));
        REQUIRE(proc::process_tree(0).empty());
        // Above the kernel's pid_max ceiling.
        REQUIRE_FALSE(proc::is_running(1 << 23));
        REQUIRE(proc::children(1 << 23).empty());
    }

    SECTION("ShellWithTwoChildren") {
        pid_t sh = spawn_shell("sleep 5 & sleep 5 & wait");
        REQUIRE(sh > 0);

        REQUIRE(eventually([&] { return proc::process_tree(sh).size() == 3; }));
        auto tree = proc::process_tree(sh);
        REQUIRE(tree[0] == sh);
        auto kids = proc::children(sh);
        REQUIRE(kids.size() == 2);
        for (int kid : kids) {
            REQUIRE(std::find(tree.begin(), tree.end(), kid) != tree.end());
            REQUIRE(proc::is_running(kid));
        }

        // Killing the sleeps lets the shell's wait return and the shell exit.
        for (int kid : kids) ::kill(kid, SIGKILL);
        int status = 0;
        REQUIRE(::waitpid(sh, &status, 0) == sh);
        REQUIRE(WIFEXITED(status));
        REQUIRE_FALSE(proc::is_running(sh));
    }

    SECTION("ZombieIsNotRunning") {
        pid_t pid = ::fork();
        if (pid == 0) ::_exit(0);
        REQUIRE(pid > 0);

        // Not yet reaped: procfs still has the entry, in state Z.
        REQUIRE(eventually([&] { return !proc::is_running(pid); }));
        REQUIRE(std::filesystem::exists(std::format("/proc/{}", pid)));

        REQUIRE(::waitpid(pid, nullptr, 0) == pid);
    }
}
