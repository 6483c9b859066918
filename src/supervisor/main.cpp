#include "config.hpp"
#include "platform/linux/supervisor_loop.hpp"

#include <filesystem>
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
            std::println("Usage: ask-anywhere [options]");
            std::println("Starts the ask-anywhere server and overlay and keeps them running.");
            std::println("Options:");
            std::println("  -v, --verbose       Enable verbose logging (passed to both services)");
            std::println("  -c, --config PATH   Config file path (passed to both services)");
            std::println("  -h, --help          Show this help");
            return 0;
        }
    }

    Config config;
    if (!config_path.empty()) {
        config = Config::load(config_path);
    } else {
        config = Config::load_default();
        // Hand the resolved file to both services.
        auto default_path = Config::default_path();
        if (!default_path.empty() && std::filesystem::exists(default_path)) {
            config_path = default_path;
        }
    }

    SupervisorLoop loop(std::move(config), config_path, verbose);
    if (!loop.init()) {
        std::println(stderr, "Failed to initialize supervisor");
        return 1;
    }

    return loop.run();
}
