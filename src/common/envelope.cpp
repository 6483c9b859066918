#include "envelope.hpp"

#include <chrono>
#include <ctime>
#include <format>

namespace envelope {

std::optional<Command> parse_command(std::string_view name) {
    if (name == "screenshot") return Command::Screenshot;
    if (name == "ai_query") return Command::AiQuery;
    if (name == "ai_query_text") return Command::AiQueryText;
    if (name == "ping") return Command::Ping;
    return std::nullopt;
}

std::optional<Type> parse_type(std::string_view name) {
    if (name == "screenshot") return Type::Screenshot;
    if (name == "ai_response") return Type::AiResponse;
    if (name == "error") return Type::Error;
    if (name == "pong") return Type::Pong;
    return std::nullopt;
}

std::string_view to_string(Command cmd) {
    switch (cmd) {
        case Command::Screenshot: return "screenshot";
        case Command::AiQuery: return "ai_query";
        case Command::AiQueryText: return "ai_query_text";
        case Command::Ping: return "ping";
    }
    return "";
}

std::string_view to_string(Type type) {
    switch (type) {
        case Type::Screenshot: return "screenshot";
        case Type::AiResponse: return "ai_response";
        case Type::Error: return "error";
        case Type::Pong: return "pong";
    }
    return "";
}

std::string timestamp_now() {
    auto now = std::chrono::system_clock::now();
    auto secs = std::chrono::time_point_cast<std::chrono::seconds>(now);
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(now - secs).count();

    std::time_t t = std::chrono::system_clock::to_time_t(secs);
    std::tm tm{};
    localtime_r(&t, &tm);

    return std::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:06}",
                       tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                       tm.tm_hour, tm.tm_min, tm.tm_sec, micros);
}

nlohmann::json make_screenshot(std::string data_b64) {
    return {{"type", "screenshot"}, {"data", std::move(data_b64)}, {"timestamp", timestamp_now()}};
}

nlohmann::json make_ai_response(std::string answer) {
    return {{"type", "ai_response"}, {"answer", std::move(answer)}, {"timestamp", timestamp_now()}};
}

nlohmann::json make_error(std::string message) {
    return {{"type", "error"}, {"message", std::move(message)}, {"timestamp", timestamp_now()}};
}

nlohmann::json make_pong() {
    return {{"type", "pong"}, {"timestamp", timestamp_now()}};
}

nlohmann::json make_screenshot_request() {
    return {{"command", "screenshot"}};
}

nlohmann::json make_ai_query(std::string question, std::string image_b64) {
    return {{"command", "ai_query"}, {"question", std::move(question)},
            {"image_data", std::move(image_b64)}};
}

nlohmann::json make_ai_query_text(std::string question) {
    return {{"command", "ai_query_text"}, {"question", std::move(question)}};
}

nlohmann::json make_ping() {
    return {{"command", "ping"}};
}

std::string frame(const nlohmann::json& env) {
    // Non-UTF-8 input from a peer must not throw on the way back out.
    return env.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) + "\n";
}

} // namespace envelope
