#include "message_router.hpp"

#include "base64.hpp"
#include "envelope.hpp"

#include <exception>
#include <format>
#include <print>

namespace {

constexpr const char* NO_API_KEY = "Error: Gemini API key not configured";

} // namespace

MessageRouter::MessageRouter(InferenceBackend& backend, ScreenCapture& capture, bool verbose)
    : backend_(backend), capture_(capture), verbose_(verbose) {}

std::optional<nlohmann::json> MessageRouter::handle(std::string_view raw) {
    nlohmann::json env;
    try {
        env = nlohmann::json::parse(raw);
    } catch (const nlohmann::json::exception&) {
        return envelope::make_error("Invalid JSON format");
    }

    try {
        return dispatch(env);
    } catch (const std::exception& e) {
        std::println(stderr, "router: handler failed: {}", e.what());
        return envelope::make_error(std::string("Error processing message: ") + e.what());
    }
}

std::optional<nlohmann::json> MessageRouter::dispatch(const nlohmann::json& env) {
    if (!env.is_object()) {
        return envelope::make_error("Error processing message: envelope must be a JSON object");
    }

    auto it = env.find("command");
    if (it == env.end() || !it->is_string()) return std::nullopt;

    auto cmd = envelope::parse_command(it->get_ref<const std::string&>());
    if (!cmd) {
        log("ignoring unknown command " + it->get<std::string>());
        return std::nullopt;
    }

    switch (*cmd) {
        case envelope::Command::Screenshot: return handle_screenshot();
        case envelope::Command::AiQuery: return handle_ai_query(env);
        case envelope::Command::AiQueryText: return handle_ai_query_text(env);
        case envelope::Command::Ping: return envelope::make_pong();
    }
    return std::nullopt;
}

nlohmann::json MessageRouter::handle_screenshot() {
    auto png = capture_.capture();
    if (!png) {
        std::println(stderr, "router: screenshot failed: {}", png.error());
        return envelope::make_error("Screenshot failed");
    }
    log(std::format("screenshot captured, {} bytes", png->size()));
    return envelope::make_screenshot(base64::encode(*png));
}

nlohmann::json MessageRouter::handle_ai_query(const nlohmann::json& env) {
    auto it = env.find("image_data");
    if (it == env.end() || !it->is_string() || it->get_ref<const std::string&>().empty()) {
        return envelope::make_error("No image provided");
    }
    if (!backend_.configured()) return envelope::make_ai_response(NO_API_KEY);

    auto png = base64::decode(it->get_ref<const std::string&>());
    if (!png) {
        return envelope::make_ai_response("Analysis failed: invalid base64 image data");
    }

    auto question = question_of(env);
    log(std::format("image query ({} bytes): {}", png->size(), question));

    auto answer = backend_.query(question, std::span<const uint8_t>(*png));
    if (!answer) {
        std::println(stderr, "router: image query failed: {}", answer.error());
        return envelope::make_ai_response("Analysis failed: " + answer.error());
    }
    return envelope::make_ai_response(std::move(*answer));
}

nlohmann::json MessageRouter::handle_ai_query_text(const nlohmann::json& env) {
    if (!backend_.configured()) return envelope::make_ai_response(NO_API_KEY);

    auto question = question_of(env);
    log("text query: " + question);

    auto answer = backend_.query(question, std::nullopt);
    if (!answer) {
        std::println(stderr, "router: text query failed: {}", answer.error());
        return envelope::make_ai_response("Analysis failed: " + answer.error());
    }
    return envelope::make_ai_response(std::move(*answer));
}

std::string MessageRouter::question_of(const nlohmann::json& env) {
    auto it = env.find("question");
    if (it == env.end() || !it->is_string()) return {};
    return it->get<std::string>();
}

void MessageRouter::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[ask-anywhere-server] {}", msg);
    }
}
