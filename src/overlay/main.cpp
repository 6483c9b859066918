#include "config.hpp"
#include "platform/linux/overlay_event_loop.hpp"

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
            std::println("Usage: ask-anywhere-overlay [options]");
            std::println("Options:");
            std::println("  -v, --verbose       Enable verbose logging");
            std::println("  -c, --config PATH   Config file path");
            std::println("  -h, --help          Show this help");
            std::println("");
            std::println("Commands (stdin):");
            std::println("  ask <text>                Ask a text question");
            std::println("  image <path> [question]   Ask about a PNG file");
            std::println("  clip                      Send the clipboard (image or text)");
            std::println("  shot [question]           Capture the screen and ask about it");
            std::println("  ping                      Check the server connection");
            std::println("  quit                      Exit");
            return 0;
        }
    }

    Config config;
    if (!config_path.empty()) {
        config = Config::load(config_path);
    } else {
        config = Config::load_default();
    }

    OverlayEventLoop loop(std::move(config), verbose);
    if (!loop.init()) {
        std::println(stderr, "Failed to initialize overlay");
        return 1;
    }

    loop.run();
    return 0;
}
