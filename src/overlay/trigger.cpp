#include "trigger.hpp"

#include "base64.hpp"
#include "envelope.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <iterator>

namespace {

constexpr std::string_view whitespace = " \t\r\n";

std::string_view trim(std::string_view s) {
    auto start = s.find_first_not_of(whitespace);
    if (start == std::string_view::npos) return {};
    auto end = s.find_last_not_of(whitespace);
    return s.substr(start, end - start + 1);
}

// Splits off the first whitespace-delimited word.
std::pair<std::string_view, std::string_view> split_word(std::string_view s) {
    s = trim(s);
    auto pos = s.find_first_of(whitespace);
    if (pos == std::string_view::npos) return {s, {}};
    return {s.substr(0, pos), trim(s.substr(pos))};
}

} // namespace

std::expected<Trigger, std::string> parse_trigger(std::string_view line) {
    auto [word, rest] = split_word(line);

    if (word == "ask") {
        if (rest.empty()) return std::unexpected("usage: ask <text>");
        return Trigger{.kind = Trigger::Kind::Ask, .argument = std::string(rest)};
    }
    if (word == "image") {
        auto [path, question] = split_word(rest);
        if (path.empty()) return std::unexpected("usage: image <path> [question]");
        return Trigger{.kind = Trigger::Kind::Image,
                       .argument = std::string(path),
                       .question = std::string(question)};
    }
    if (word == "shot") {
        return Trigger{.kind = Trigger::Kind::Shot, .question = std::string(rest)};
    }
    if (word == "clip") return Trigger{.kind = Trigger::Kind::Clip};
    if (word == "ping") return Trigger{.kind = Trigger::Kind::Ping};
    if (word == "quit" || word == "exit") return Trigger{.kind = Trigger::Kind::Quit};

    if (word.empty()) return std::unexpected("empty command");
    return std::unexpected("unknown command: " + std::string(word));
}

std::string prefixed_question(std::string_view prefix, std::string_view text) {
    std::string q(prefix);
    q += text;
    return std::string(trim(q));
}

nlohmann::json make_text_query(std::string_view prefix, std::string_view text) {
    return envelope::make_ai_query_text(prefixed_question(prefix, text));
}

nlohmann::json make_image_query(std::string_view prefix, std::string_view question,
                                std::span<const uint8_t> png) {
    return envelope::make_ai_query(prefixed_question(prefix, question), base64::encode(png));
}

std::expected<std::vector<uint8_t>, std::string> read_file(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) {
        return std::unexpected("cannot open " + path + ": " + std::strerror(errno));
    }
    std::vector<uint8_t> data((std::istreambuf_iterator<char>(f)),
                              std::istreambuf_iterator<char>());
    if (f.bad()) return std::unexpected("read failed: " + path);
    return data;
}
