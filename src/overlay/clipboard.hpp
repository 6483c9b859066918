#pragma once

#include <cstdint>
#include <expected>
#include <string>
#include <vector>

struct ClipboardContent {
    enum class Kind { Text, Image };

    Kind kind;
    std::string text;         // Kind::Text
    std::vector<uint8_t> png; // Kind::Image
};

// Reads the Wayland clipboard through wl-paste.
class WaylandClipboard {
public:
    // An image is only used when the clipboard offers no text at all;
    // everything else (including an empty clipboard) is read as text.
    std::expected<ClipboardContent, std::string> read();

    // Decides the modality from the MIME types the clipboard offers.
    static ClipboardContent::Kind classify(const std::vector<std::string>& mime_types);
};
