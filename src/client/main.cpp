#include "base64.hpp"
#include "config.hpp"
#include "envelope.hpp"
#include "platform/linux/tcp_socket_client.hpp"

#include <cstdlib>
#include <fstream>
#include <nlohmann/json.hpp>
#include <optional>
#include <print>
#include <string>

using json = nlohmann::json;

static void usage(const char* prog) {
    std::println(stderr, "Usage: {} [options] <command>", prog);
    std::println(stderr, "Options:");
    std::println(stderr, "  -c, --config PATH   Config file path");
    std::println(stderr, "  --host H            Server host (default from config)");
    std::println(stderr, "  --port P            Server port (default from config)");
    std::println(stderr, "  --timeout S         Seconds to wait for the response");
    std::println(stderr, "  -v, --verbose       Print the raw response");
    std::println(stderr, "Commands:");
    std::println(stderr, "  ping                      Check that the server answers");
    std::println(stderr, "  ask <text>                Ask a text-only question");
    std::println(stderr, "  screenshot [--out FILE]   Capture the server's screen (default: screenshot.png)");
}

int main(int argc, char* argv[]) {
    std::string config_path;
    std::optional<std::string> host_arg;
    std::optional<int> port_arg;
    std::optional<int> timeout_arg;
    bool verbose = false;
    std::string out_path = "screenshot.png";
    std::string command;
    std::string text;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if ((arg == "--config" || arg == "-c") && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--host" && i + 1 < argc) {
            host_arg = argv[++i];
        } else if (arg == "--port" && i + 1 < argc) {
            port_arg = std::atoi(argv[++i]);
        } else if (arg == "--timeout" && i + 1 < argc) {
            timeout_arg = std::atoi(argv[++i]);
        } else if (arg == "--out" && i + 1 < argc) {
            out_path = argv[++i];
        } else if (arg == "--verbose" || arg == "-v") {
            verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            usage(argv[0]);
            return 0;
        } else if (command.empty()) {
            command = arg;
        } else {
            if (!text.empty()) text += ' ';
            text += arg;
        }
    }

    auto config = config_path.empty() ? Config::load_default() : Config::load(config_path);
    std::string host = host_arg.value_or(config.client.host);
    int port = port_arg.value_or(config.client.port);
    int timeout_s = timeout_arg.value_or(static_cast<int>(config.ai.timeout) + 10);

    if (port <= 0 || port > 65535) {
        std::println(stderr, "Invalid port: {}", port);
        return 1;
    }

    // Build command envelope
    json cmd;
    if (command == "ping") {
        cmd = envelope::make_ping();
    } else if (command == "ask") {
        if (text.empty()) {
            std::println(stderr, "ask needs a question");
            return 1;
        }
        cmd = envelope::make_ai_query_text(text);
    } else if (command == "screenshot") {
        cmd = envelope::make_screenshot_request();
    } else {
        if (!command.empty()) std::println(stderr, "Unknown command: {}", command);
        usage(argv[0]);
        return 1;
    }

    // Connect and send
    TcpSocketClient client;
    if (!client.connect(host, static_cast<uint16_t>(port))) {
        std::println(stderr, "Failed to connect to server at {}:{}", host, port);
        std::println(stderr, "Is ask-anywhere-server running?");
        return 1;
    }

    if (!client.send(cmd)) {
        std::println(stderr, "Failed to send command");
        return 1;
    }

    json response;
    std::string raw;
    switch (client.recv(response, raw, timeout_s * 1000)) {
        case RecvStatus::Message:
            break;
        case RecvStatus::Timeout:
            std::println(stderr, "No response from server (timeout)");
            return 1;
        case RecvStatus::Closed:
            std::println(stderr, "Connection closed by server");
            return 1;
        case RecvStatus::Malformed:
            std::println(stderr, "Malformed response: {}", raw);
            return 1;
    }

    if (!response.is_object()) {
        std::println(stderr, "Malformed response: {}", response.dump());
        return 1;
    }

    if (verbose) std::println(stderr, "{}", response.dump());

    // Display response
    auto type = response.value("type", "");

    if (type == "error") {
        std::println(stderr, "Error: {}", response.value("message", "unknown error"));
        return 1;
    } else if (type == "pong") {
        std::println("pong {}", response.value("timestamp", ""));
    } else if (type == "ai_response") {
        std::println("{}", response.value("answer", ""));
    } else if (type == "screenshot") {
        auto png = base64::decode(response.value("data", ""));
        if (!png) {
            std::println(stderr, "Screenshot payload is not valid base64");
            return 1;
        }
        std::ofstream f(out_path, std::ios::binary);
        f.write(reinterpret_cast<const char*>(png->data()), static_cast<std::streamsize>(png->size()));
        if (!f) {
            std::println(stderr, "Failed to write {}", out_path);
            return 1;
        }
        std::println("Saved {} bytes to {}", png->size(), out_path);
    } else {
        std::println("{}", response.dump(2));
    }

    return 0;
}
