#pragma once

#include <cstdint>
#include <expected>
#include <nlohmann/json.hpp>
#include <span>
#include <string>
#include <string_view>
#include <vector>

// One line typed on the overlay's stdin.
struct Trigger {
    enum class Kind { Ask, Image, Clip, Shot, Ping, Quit };

    Kind kind;
    std::string argument; // Ask: text, Image: path
    std::string question; // Image/Shot: optional question
};

// Parses "ask <text>", "image <path> [question]", "clip", "shot [question]",
// "ping" and "quit". Unknown words and missing arguments are errors.
std::expected<Trigger, std::string> parse_trigger(std::string_view line);

// Question sent to the server: prefix followed by the user's text, with
// surrounding whitespace trimmed.
std::string prefixed_question(std::string_view prefix, std::string_view text);

nlohmann::json make_text_query(std::string_view prefix, std::string_view text);
nlohmann::json make_image_query(std::string_view prefix, std::string_view question,
                                std::span<const uint8_t> png);

// Reads a whole file into memory.
std::expected<std::vector<uint8_t>, std::string> read_file(const std::string& path);
