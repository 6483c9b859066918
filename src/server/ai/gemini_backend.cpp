#include "gemini_backend.hpp"

#include "base64.hpp"

#include <cstdlib>
#include <curl/curl.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

static size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* resp = static_cast<std::string*>(userdata);
    resp->append(ptr, size * nmemb);
    return size * nmemb;
}

GeminiBackend::GeminiBackend(std::string url, std::string model, std::string api_key,
                             uint32_t timeout_s, std::string image_prompt)
    : url_(std::move(url)), model_(std::move(model)), api_key_(std::move(api_key)),
      timeout_s_(timeout_s), image_prompt_(std::move(image_prompt)) {
    if (api_key_.empty()) {
        if (const char* env = std::getenv("GEMINI_API_KEY")) api_key_ = env;
    }
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

GeminiBackend::~GeminiBackend() {
    curl_global_cleanup();
}

std::string GeminiBackend::build_request(const std::string& question,
                                         std::optional<std::span<const uint8_t>> png) const {
    json parts = json::array();
    if (png) {
        parts.push_back({{"text", image_prompt_ + question}});
        parts.push_back({{"inline_data", {{"mime_type", "image/png"}, {"data", base64::encode(*png)}}}});
    } else {
        parts.push_back({{"text", question}});
    }

    json body = {{"contents", json::array({{{"parts", parts}}})}};
    return body.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::expected<std::string, std::string> GeminiBackend::parse_response(const std::string& body) {
    try {
        auto j = json::parse(body);

        if (j.contains("error")) {
            auto& err = j["error"];
            std::string msg = err.is_object() ? err.value("message", err.dump()) : err.dump();
            return std::unexpected("server error: " + msg);
        }

        if (!j.contains("candidates") || !j["candidates"].is_array() || j["candidates"].empty()) {
            if (j.contains("promptFeedback")) {
                return std::unexpected("prompt blocked: " + j["promptFeedback"].dump());
            }
            return std::unexpected("unexpected response: " + body);
        }

        auto& content = j["candidates"][0]["content"];
        std::string text;
        if (content.is_object() && content.contains("parts")) {
            for (auto& part : content["parts"]) {
                if (part.contains("text") && part["text"].is_string()) {
                    text += part["text"].get<std::string>();
                }
            }
        }
        if (text.empty()) {
            return std::unexpected("response contained no text");
        }
        return text;
    } catch (const json::exception& e) {
        return std::unexpected(std::string("JSON parse error: ") + e.what());
    }
}

std::expected<std::string, std::string>
GeminiBackend::query(const std::string& question, std::optional<std::span<const uint8_t>> png) {
    if (!configured()) {
        return std::unexpected("Gemini API key not configured");
    }

    CURL* curl = curl_easy_init();
    if (!curl) {
        return std::unexpected("curl_easy_init failed");
    }

    std::string endpoint = url_ + "/v1beta/models/" + model_ + ":generateContent";
    std::string request = build_request(question, png);
    std::string key_header = "x-goog-api-key: " + api_key_;
    std::string response_body;

    curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Content-Type: application/json");
    headers = curl_slist_append(headers, key_header.c_str());

    curl_easy_setopt(curl, CURLOPT_URL, endpoint.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.size()));
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(timeout_s_));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 10L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    CURLcode res = curl_easy_perform(curl);

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        return std::unexpected(std::string("curl error: ") + curl_easy_strerror(res));
    }

    return parse_response(response_body);
}
