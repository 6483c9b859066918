#include "launch_specs.hpp"

#include <filesystem>

namespace fs = std::filesystem;

namespace {

LaunchSpec service_spec(const std::string& name, const Config::Service& svc,
                        const char* binary, const std::string& config_path,
                        const std::string& bin_dir, bool verbose) {
    LaunchSpec spec{
        .name = name,
        .executable = svc.executable,
        .env = svc.env,
        .working_dir = svc.working_dir,
    };

    if (spec.executable.empty()) {
        spec.executable = bin_dir.empty() ? binary : (fs::path(bin_dir) / binary).string();
    }

    if (!config_path.empty()) {
        spec.args.push_back("--config");
        spec.args.push_back(config_path);
    }
    if (verbose) spec.args.push_back("--verbose");
    spec.args.insert(spec.args.end(), svc.args.begin(), svc.args.end());

    return spec;
}

} // namespace

std::vector<LaunchSpec> build_launch_specs(const Config& config, const std::string& config_path,
                                           const std::string& bin_dir, bool verbose) {
    auto server = service_spec("server", config.supervisor.server, SERVER_BINARY,
                               config_path, bin_dir, verbose);
    server.host = config.server.host;
    server.required_ports = {config.server.http_port, config.server.ws_port};
    server.capture_output = true;
    server.inherit_stdin = false;

    // The overlay is interactive: it keeps the terminal.
    auto overlay = service_spec("overlay", config.supervisor.overlay, OVERLAY_BINARY,
                                config_path, bin_dir, verbose);
    overlay.capture_output = false;
    overlay.inherit_stdin = true;

    return {std::move(server), std::move(overlay)};
}
