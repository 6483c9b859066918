#include "config.hpp"

#include "platform/platform_paths.hpp"

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

template <typename T>
void read_key(const json& obj, const char* key, T& out) {
    if (obj.contains(key)) out = obj[key].get<T>();
}

void read_service(const json& j, Config::Service& svc) {
    read_key(j, "executable", svc.executable);
    read_key(j, "args", svc.args);
    read_key(j, "env", svc.env);
    read_key(j, "working_dir", svc.working_dir);
}

} // namespace

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return cfg;
    }

    try {
        auto j = json::parse(f);

        if (j.contains("server")) {
            auto& s = j["server"];
            read_key(s, "host", cfg.server.host);
            read_key(s, "http_port", cfg.server.http_port);
            read_key(s, "ws_port", cfg.server.ws_port);
            read_key(s, "static_dir", cfg.server.static_dir);
            read_key(s, "ping_interval", cfg.server.ping_interval);
            read_key(s, "ping_timeout", cfg.server.ping_timeout);
            read_key(s, "max_message_bytes", cfg.server.max_message_bytes);
        }

        if (j.contains("ai")) {
            auto& a = j["ai"];
            read_key(a, "url", cfg.ai.url);
            read_key(a, "model", cfg.ai.model);
            read_key(a, "api_key", cfg.ai.api_key);
            read_key(a, "timeout", cfg.ai.timeout);
            read_key(a, "image_prompt", cfg.ai.image_prompt);
        }

        if (j.contains("screenshot")) {
            read_key(j["screenshot"], "command", cfg.screenshot.command);
        }

        if (j.contains("client")) {
            auto& c = j["client"];
            read_key(c, "host", cfg.client.host);
            read_key(c, "port", cfg.client.port);
            read_key(c, "initial_backoff", cfg.client.initial_backoff);
            read_key(c, "max_backoff", cfg.client.max_backoff);
            read_key(c, "ping_interval", cfg.client.ping_interval);
            read_key(c, "ping_timeout", cfg.client.ping_timeout);
            read_key(c, "prompt_prefix", cfg.client.prompt_prefix);
        }

        if (j.contains("supervisor")) {
            auto& s = j["supervisor"];
            read_key(s, "max_restart_attempts", cfg.supervisor.max_restart_attempts);
            read_key(s, "restart_delay_ms", cfg.supervisor.restart_delay_ms);
            read_key(s, "warmup_ms", cfg.supervisor.warmup_ms);
            read_key(s, "poll_interval_ms", cfg.supervisor.poll_interval_ms);
            read_key(s, "term_grace_ms", cfg.supervisor.term_grace_ms);
            read_key(s, "kill_timeout_ms", cfg.supervisor.kill_timeout_ms);
            if (s.contains("services")) {
                auto& svcs = s["services"];
                if (svcs.contains("server")) read_service(svcs["server"], cfg.supervisor.server);
                if (svcs.contains("overlay")) read_service(svcs["overlay"], cfg.supervisor.overlay);
            }
        }

    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
    }

    return cfg;
}

std::string Config::default_path() {
    auto dir = platform::config_dir();
    if (dir.empty()) return {};
    return (fs::path(dir) / "config.json").string();
}

Config Config::load_default() {
    auto config_path = default_path();
    if (!config_path.empty() && fs::exists(config_path)) {
        return load(config_path);
    }
    return Config{};
}
