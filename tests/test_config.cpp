#include <catch2/catch_test_macros.hpp>

#include "config.hpp"

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>
#include <vector>

namespace {

// RAII temp file that auto-deletes.
struct TmpFile {
    std::string path;

    explicit TmpFile(const std::string& content) {
        path = std::filesystem::temp_directory_path() / "aa_test_config_XXXXXX";
        // mkstemp needs a mutable char*
        std::vector<char> tmpl(path.begin(), path.end());
        tmpl.push_back('\0');
        int fd = mkstemp(tmpl.data());
        path.assign(tmpl.data());
        ::write(fd, content.data(), content.size());
        ::close(fd);
    }

    ~TmpFile() { std::filesystem::remove(path); }
};

} // namespace

TEST_CASE("Config", "[config]") {

    SECTION("DefaultValues") {
        Config cfg;
        REQUIRE(cfg.server.host == "0.0.0.0");
        REQUIRE(cfg.server.http_port == 8080);
        REQUIRE(cfg.server.ws_port == 8765);
        REQUIRE(cfg.server.idle_timeout() == 50);
        REQUIRE(cfg.ai.model == "gemini-1.5-flash");
        REQUIRE(cfg.ai.timeout == 120);
        REQUIRE(cfg.screenshot.command == std::vector<std::string>{"grim", "-"});
        REQUIRE(cfg.client.host == "localhost");
        REQUIRE(cfg.client.port == 8765);
        REQUIRE(cfg.client.initial_backoff == 1);
        REQUIRE(cfg.client.max_backoff == 30);
        REQUIRE(cfg.client.prompt_prefix == "use code to solve: ");
        REQUIRE(cfg.supervisor.max_restart_attempts == 3);
        REQUIRE(cfg.supervisor.restart_delay_ms == 2000);
        REQUIRE(cfg.supervisor.server.executable.empty());
    }

    SECTION("LoadFullConfig") {
        TmpFile f(R"({
            "server": { "host": "127.0.0.1", "http_port": 9000, "ws_port": 9001,
                        "ping_interval": 5, "ping_timeout": 10 },
            "ai": { "model": "gemini-2.0-flash", "api_key": "k", "timeout": 30 },
            "screenshot": { "command": ["spectacle", "-b", "-n", "-o", "/dev/stdout"] },
            "client": { "host": "10.0.0.2", "port": 9001, "max_backoff": 8,
                        "prompt_prefix": "" },
            "supervisor": {
                "max_restart_attempts": 5,
                "restart_delay_ms": 100,
                "services": {
                    "server": { "executable": "/opt/aa/server", "args": ["-x"],
                                "env": { "RUST_LOG": "debug" }, "working_dir": "/opt/aa" }
                }
            }
        })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.server.host == "127.0.0.1");
        REQUIRE(cfg.server.http_port == 9000);
        REQUIRE(cfg.server.ws_port == 9001);
        REQUIRE(cfg.server.idle_timeout() == 15);
        REQUIRE(cfg.ai.model == "gemini-2.0-flash");
        REQUIRE(cfg.ai.api_key == "k");
        REQUIRE(cfg.ai.timeout == 30);
        REQUIRE(cfg.screenshot.command.size() == 5);
        REQUIRE(cfg.screenshot.command[0] == "spectacle");
        REQUIRE(cfg.client.host == "10.0.0.2");
        REQUIRE(cfg.client.port == 9001);
        REQUIRE(cfg.client.max_backoff == 8);
        REQUIRE(cfg.client.prompt_prefix.empty());
        REQUIRE(cfg.supervisor.max_restart_attempts == 5);
        REQUIRE(cfg.supervisor.restart_delay_ms == 100);
        REQUIRE(cfg.supervisor.server.executable == "/opt/aa/server");
        REQUIRE(cfg.supervisor.server.args == std::vector<std::string>{"-x"});
        REQUIRE(cfg.supervisor.server.env.at("RUST_LOG") == "debug");
        REQUIRE(cfg.supervisor.server.working_dir == "/opt/aa");
        REQUIRE(cfg.supervisor.overlay.executable.empty());
    }

    SECTION("LoadPartialConfig") {
        TmpFile f(R"({ "client": { "port": 7000 } })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.client.port == 7000);
        // Other fields retain defaults
        REQUIRE(cfg.client.host == "localhost");
        REQUIRE(cfg.server.ws_port == 8765);
        REQUIRE(cfg.ai.url == "https://generativelanguage.googleapis.com");
        REQUIRE(cfg.supervisor.warmup_ms == 1000);
    }

    SECTION("LoadInvalidJson") {
        TmpFile f("not json {{{");

        auto cfg = Config::load(f.path);
        // Falls back to defaults
        REQUIRE(cfg.server.ws_port == 8765);
        REQUIRE(cfg.client.port == 8765);
    }

    SECTION("LoadMissingFile") {
        auto cfg = Config::load("/tmp/aa_test_nonexistent_config_file.json");
        REQUIRE(cfg.server.ws_port == 8765);
        REQUIRE(cfg.supervisor.max_restart_attempts == 3);
    }
}
