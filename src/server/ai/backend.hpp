#pragma once

#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include <string>

// Answers a question, optionally about a PNG image. Implementations must be
// callable from several connection workers at once.
class InferenceBackend {
public:
    virtual ~InferenceBackend() = default;
    virtual std::expected<std::string, std::string>
        query(const std::string& question, std::optional<std::span<const uint8_t>> png) = 0;

    // False when queries cannot succeed for lack of credentials.
    virtual bool configured() const { return true; }
};
