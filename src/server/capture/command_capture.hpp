#pragma once

#include "screen_capture.hpp"

#include <string>
#include <vector>

// Runs an external screenshot tool (grim by default) that writes a PNG to stdout.
class CommandCapture : public ScreenCapture {
public:
    explicit CommandCapture(std::vector<std::string> command, int timeout_ms = 10000);

    std::expected<std::vector<uint8_t>, std::string> capture() override;

private:
    std::vector<std::string> command_;
    int timeout_ms_;
};
