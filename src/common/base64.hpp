#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

// Standard (RFC 4648) base64 with padding, used for binary envelope payloads.
namespace base64 {

inline constexpr std::string_view alphabet =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

inline std::string encode(std::span<const uint8_t> data) {
    std::string out;
    out.reserve((data.size() + 2) / 3 * 4);

    size_t i = 0;
    for (; i + 3 <= data.size(); i += 3) {
        uint32_t n = (uint32_t(data[i]) << 16) | (uint32_t(data[i + 1]) << 8) | data[i + 2];
        out += alphabet[(n >> 18) & 0x3F];
        out += alphabet[(n >> 12) & 0x3F];
        out += alphabet[(n >> 6) & 0x3F];
        out += alphabet[n & 0x3F];
    }

    size_t rest = data.size() - i;
    if (rest == 1) {
        uint32_t n = uint32_t(data[i]) << 16;
        out += alphabet[(n >> 18) & 0x3F];
        out += alphabet[(n >> 12) & 0x3F];
        out += "==";
    } else if (rest == 2) {
        uint32_t n = (uint32_t(data[i]) << 16) | (uint32_t(data[i + 1]) << 8);
        out += alphabet[(n >> 18) & 0x3F];
        out += alphabet[(n >> 12) & 0x3F];
        out += alphabet[(n >> 6) & 0x3F];
        out += '=';
    }
    return out;
}

inline std::string encode(std::string_view data) {
    return encode(std::span(reinterpret_cast<const uint8_t*>(data.data()), data.size()));
}

// Returns nullopt on characters outside the alphabet or bad padding.
inline std::optional<std::vector<uint8_t>> decode(std::string_view text) {
    static constexpr auto table = [] {
        std::array<int8_t, 256> t{};
        t.fill(-1);
        for (size_t i = 0; i < alphabet.size(); i++) {
            t[static_cast<uint8_t>(alphabet[i])] = static_cast<int8_t>(i);
        }
        return t;
    }();

    if (text.size() % 4 != 0) return std::nullopt;

    std::vector<uint8_t> out;
    out.reserve(text.size() / 4 * 3);

    for (size_t i = 0; i < text.size(); i += 4) {
        bool last = i + 4 == text.size();
        int pad = 0;
        uint32_t n = 0;
        for (size_t k = 0; k < 4; k++) {
            char c = text[i + k];
            if (c == '=') {
                // Padding only in the last two positions of the final quantum.
                if (!last || k < 2) return std::nullopt;
                pad++;
                n <<= 6;
                continue;
            }
            if (pad > 0) return std::nullopt;
            int8_t v = table[static_cast<uint8_t>(c)];
            if (v < 0) return std::nullopt;
            n = (n << 6) | static_cast<uint32_t>(v);
        }

        out.push_back(static_cast<uint8_t>(n >> 16));
        if (pad < 2) out.push_back(static_cast<uint8_t>(n >> 8));
        if (pad < 1) out.push_back(static_cast<uint8_t>(n));
    }
    return out;
}

} // namespace base64
