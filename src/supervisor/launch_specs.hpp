#pragma once

#include "config.hpp"
#include "managed_process.hpp"

#include <string>
#include <vector>

inline constexpr const char* SERVER_BINARY = "ask-anywhere-server";
inline constexpr const char* OVERLAY_BINARY = "ask-anywhere-overlay";

// Launch specs for the server and the overlay. Services without a configured
// executable run the sibling binary from bin_dir; both are handed the same
// config file (and -v) as the supervisor.
std::vector<LaunchSpec> build_launch_specs(const Config& config, const std::string& config_path,
                                           const std::string& bin_dir, bool verbose);
