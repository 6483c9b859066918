#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

struct Config {
    struct Server {
        std::string host = "0.0.0.0";
        uint16_t http_port = 8080;
        uint16_t ws_port = 8765;
        std::string static_dir = "static";
        uint32_t ping_interval = 20; // seconds
        uint32_t ping_timeout = 30;  // seconds
        size_t max_message_bytes = 32 * 1024 * 1024;

        // Silence after which a connection is considered dead.
        uint32_t idle_timeout() const { return ping_interval + ping_timeout; }
    } server;

    struct Ai {
        std::string url = "https://generativelanguage.googleapis.com";
        std::string model = "gemini-1.5-flash";
        std::string api_key; // empty: read GEMINI_API_KEY
        uint32_t timeout = 120;
        std::string image_prompt = "Please analyze this screenshot and answer: ";
    } ai;

    struct Screenshot {
        std::vector<std::string> command = {"grim", "-"};
    } screenshot;

    struct Client {
        std::string host = "localhost";
        uint16_t port = 8765;
        uint32_t initial_backoff = 1; // seconds
        uint32_t max_backoff = 30;
        uint32_t ping_interval = 20;
        uint32_t ping_timeout = 60;
        std::string prompt_prefix = "use code to solve: ";
    } client;

    struct Service {
        std::string executable; // empty: sibling binary of the supervisor
        std::vector<std::string> args;
        std::map<std::string, std::string> env;
        std::string working_dir;
    };

    struct Supervisor {
        uint32_t max_restart_attempts = 3;
        uint32_t restart_delay_ms = 2000;
        uint32_t warmup_ms = 1000;
        uint32_t poll_interval_ms = 500;
        uint32_t term_grace_ms = 3000;
        uint32_t kill_timeout_ms = 2000;
        Service server;
        Service overlay;
    } supervisor;

    static Config load(const std::string& path);
    static Config load_default();
    static std::string default_path();
};
