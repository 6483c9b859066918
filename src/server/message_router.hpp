#pragma once

#include "ai/backend.hpp"
#include "capture/screen_capture.hpp"

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>

// Decodes one inbound line, runs the handler named by its "command" and
// returns the envelope to send back, or nullopt when nothing is sent.
// Holds no per-connection state; safe to call from several workers at once
// as long as the collaborators are.
class MessageRouter {
public:
    MessageRouter(InferenceBackend& backend, ScreenCapture& capture, bool verbose = false);

    std::optional<nlohmann::json> handle(std::string_view raw);
    std::optional<nlohmann::json> dispatch(const nlohmann::json& env);

private:
    nlohmann::json handle_screenshot();
    nlohmann::json handle_ai_query(const nlohmann::json& env);
    nlohmann::json handle_ai_query_text(const nlohmann::json& env);

    static std::string question_of(const nlohmann::json& env);

    void log(const std::string& msg);

    InferenceBackend& backend_;
    ScreenCapture& capture_;
    bool verbose_;
};
