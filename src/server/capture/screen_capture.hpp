#pragma once

#include <cstdint>
#include <expected>
#include <string>
#include <vector>

class ScreenCapture {
public:
    virtual ~ScreenCapture() = default;
    // PNG bytes of the current screen.
    virtual std::expected<std::vector<uint8_t>, std::string> capture() = 0;
};
