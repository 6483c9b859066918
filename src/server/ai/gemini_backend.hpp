#pragma once

#include "backend.hpp"

#include <cstdint>
#include <string>

// Google Gemini generateContent over HTTPS.
class GeminiBackend : public InferenceBackend {
public:
    // An empty api_key falls back to $GEMINI_API_KEY.
    GeminiBackend(std::string url, std::string model, std::string api_key,
                  uint32_t timeout_s = 120,
                  std::string image_prompt = "Please analyze this screenshot and answer: ");
    ~GeminiBackend() override;

    std::expected<std::string, std::string>
        query(const std::string& question, std::optional<std::span<const uint8_t>> png) override;

    bool configured() const override { return !api_key_.empty(); }

    // Exposed for tests: request body and answer extraction.
    std::string build_request(const std::string& question,
                              std::optional<std::span<const uint8_t>> png) const;
    static std::expected<std::string, std::string> parse_response(const std::string& body);

private:
    std::string url_;
    std::string model_;
    std::string api_key_;
    uint32_t timeout_s_;
    std::string image_prompt_;
};
