#include "config.hpp"
#include "platform/linux/server_event_loop.hpp"

#include <print>
#include <string>

int main(int argc, char* argv[]) {
    bool verbose = false;
    std::string config_path;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--verbose" || arg == "-v") {
            verbose = true;
        } else if (arg == "--config" || arg == "-c") {
            if (i + 1 < argc) config_path = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            std::println("Usage: ask-anywhere-server [options]");
            std::println("Options:");
            std::println("  -v, --verbose       Enable verbose logging");
            std::println("  -c, --config PATH   Config file path");
            std::println("  -h, --help          Show this help");
            return 0;
        }
    }

    Config config;
    if (!config_path.empty()) {
        config = Config::load(config_path);
    } else {
        config = Config::load_default();
    }

    if (verbose) {
        std::println(stderr, "[ask-anywhere-server] Starting (model: {} @ {})",
                     config.ai.model, config.ai.url);
    }

    ServerEventLoop loop(std::move(config), verbose);
    if (!loop.init()) {
        std::println(stderr, "Failed to initialize server");
        return 1;
    }

    loop.run();
    return 0;
}
