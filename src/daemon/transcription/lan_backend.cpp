#include "lan_backend.hpp"

#include "http_util.hpp"
#include "wav_encoder.hpp"

#include <chrono>
#include <curl/curl.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

void add_field(curl_mime* mime, const char* name, const std::string& value) {
    auto* part = curl_mime_addpart(mime);
    curl_mime_name(part, name);
    curl_mime_data(part, value.c_str(), CURL_ZERO_TERMINATED);
}

} // namespace

LanBackend::LanBackend(std::string url, std::string api_format, std::string language)
    : url_(std::move(url)), api_format_(std::move(api_format)),
      language_(std::move(language)) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

LanBackend::~LanBackend() {
    curl_global_cleanup();
}

std::expected<TranscriptResult, std::string>
LanBackend::transcribe(std::span<const uint8_t> wav_payload) {
    auto duration_ms = wav::duration_ms(wav_payload);
    if (!duration_ms) {
        return std::unexpected("payload is not a PCM WAV recording");
    }
    if (*duration_ms == 0) {
        return std::unexpected("empty audio");
    }

    auto start = std::chrono::steady_clock::now();

    CURL* curl = curl_easy_init();
    if (!curl) {
        return std::unexpected("curl_easy_init failed");
    }

    std::string endpoint;
    curl_mime* mime = curl_mime_init(curl);

    auto* file = curl_mime_addpart(mime);
    curl_mime_name(file, "file");
    curl_mime_data(file, reinterpret_cast<const char*>(wav_payload.data()), wav_payload.size());
    curl_mime_filename(file, "audio.wav");
    curl_mime_type(file, "audio/wav");

    if (api_format_ == "openai") {
        endpoint = url_ + "/v1/audio/transcriptions";
        add_field(mime, "model", "whisper-1");
        add_field(mime, "language", language_);
    } else {
        endpoint = url_ + "/inference";
        add_field(mime, "temperature", "0.0");
        if (!language_.empty()) add_field(mime, "language", language_);
    }
    add_field(mime, "response_format", "json");

    std::string response_body;

    curl_easy_setopt(curl, CURLOPT_URL, endpoint.c_str());
    curl_easy_setopt(curl, CURLOPT_MIMEPOST, mime);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, http::append_body);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, 120L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 10L);

    CURLcode res = curl_easy_perform(curl);

    curl_mime_free(mime);
    curl_easy_cleanup(curl);

    double processing_s = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - start).count();

    if (res != CURLE_OK) {
        return std::unexpected(std::string("curl error: ") + curl_easy_strerror(res));
    }

    auto text = parse_response(response_body);
    if (!text) return std::unexpected(text.error());

    return TranscriptResult{
        .text = std::move(*text),
        .duration_s = static_cast<double>(*duration_ms) / 1000.0,
        .processing_s = processing_s,
    };
}

std::expected<std::string, std::string> LanBackend::parse_response(const std::string& body) {
    try {
        auto j = json::parse(body);
        if (j.contains("text")) {
            return http::trim(j["text"].get<std::string>());
        }
        if (j.contains("error")) {
            auto& err = j["error"];
            // OpenAI nests the message, whisper.cpp sends a bare string.
            if (err.is_object()) return std::unexpected("server error: " + err.value("message", err.dump()));
            return std::unexpected("server error: " + err.get<std::string>());
        }
        return std::unexpected("unexpected response: " + body);
    } catch (const json::exception& e) {
        return std::unexpected(std::string("JSON parse error: ") + e.what());
    }
}
