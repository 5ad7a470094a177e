#include "chat_post_processor.hpp"

#include "http_util.hpp"

#include <curl/curl.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

ChatPostProcessor::ChatPostProcessor(std::string url, std::string model, std::string prompt)
    : url_(std::move(url)), model_(std::move(model)), prompt_(std::move(prompt)) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

ChatPostProcessor::~ChatPostProcessor() {
    curl_global_cleanup();
}

std::string ChatPostProcessor::request_body(const std::string& transcript) const {
    json body = {
        {"model", model_},
        {"temperature", 0.2},
        {"messages", json::array({
            {{"role", "system"}, {"content", prompt_}},
            {{"role", "user"}, {"content", transcript}},
        })},
    };
    return body.dump();
}

std::expected<std::string, std::string> ChatPostProcessor::process(const std::string& transcript) {
    if (transcript.empty()) return transcript;

    CURL* curl = curl_easy_init();
    if (!curl) {
        return std::unexpected("curl_easy_init failed");
    }

    auto endpoint = url_ + "/v1/chat/completions";
    auto payload = request_body(transcript);
    std::string response_body;

    curl_slist* headers = curl_slist_append(nullptr, "Content-Type: application/json");

    curl_easy_setopt(curl, CURLOPT_URL, endpoint.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, payload.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(payload.size()));
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, http::append_body);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, 60L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 10L);

    CURLcode res = curl_easy_perform(curl);

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        return std::unexpected(std::string("curl error: ") + curl_easy_strerror(res));
    }
    return parse_response(response_body);
}

std::expected<std::string, std::string> ChatPostProcessor::parse_response(const std::string& body) {
    try {
        auto j = json::parse(body);
        if (j.contains("choices") && j["choices"].is_array() && !j["choices"].empty()) {
            auto& message = j["choices"][0]["message"];
            auto text = http::trim(message.value("content", ""));
            if (text.empty()) return std::unexpected("empty completion");
            return text;
        }
        if (j.contains("error")) {
            auto& err = j["error"];
            if (err.is_object()) return std::unexpected("server error: " + err.value("message", err.dump()));
            return std::unexpected("server error: " + err.dump());
        }
        return std::unexpected("unexpected response: " + body);
    } catch (const json::exception& e) {
        return std::unexpected(std::string("JSON parse error: ") + e.what());
    }
}
