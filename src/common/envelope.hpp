#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>

// Wire envelopes exchanged between the overlay and the server.
// Client->server envelopes carry a "command" discriminator,
// server->client envelopes a "type" discriminator.
namespace envelope {

enum class Command { Screenshot, AiQuery, AiQueryText, Ping };
enum class Type { Screenshot, AiResponse, Error, Pong };

std::optional<Command> parse_command(std::string_view name);
std::optional<Type> parse_type(std::string_view name);
std::string_view to_string(Command cmd);
std::string_view to_string(Type type);

// Local time, ISO-8601 with microseconds: 2024-05-01T12:34:56.123456
std::string timestamp_now();

// Server -> client
nlohmann::json make_screenshot(std::string data_b64);
nlohmann::json make_ai_response(std::string answer);
nlohmann::json make_error(std::string message);
nlohmann::json make_pong();

// Client -> server
nlohmann::json make_screenshot_request();
nlohmann::json make_ai_query(std::string question, std::string image_b64);
nlohmann::json make_ai_query_text(std::string question);
nlohmann::json make_ping();

// One envelope per line on the wire.
std::string frame(const nlohmann::json& env);

} // namespace envelope
