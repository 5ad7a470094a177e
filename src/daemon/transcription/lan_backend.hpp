#pragma once

#include "backend.hpp"

#include <string>

// whisper.cpp server or OpenAI-compatible transcription endpoint over HTTP.
class LanBackend : public WhisperBackend {
public:
    // api_format: "whisper.cpp" or "openai"
    LanBackend(std::string url, std::string api_format = "whisper.cpp",
               std::string language = "en");
    ~LanBackend() override;

    std::expected<TranscriptResult, std::string>
        transcribe(std::span<const uint8_t> wav_payload) override;
    std::string name() const override { return "lan"; }

    // Pulls the transcript out of a server response body.
    static std::expected<std::string, std::string> parse_response(const std::string& body);

private:
    std::string url_;
    std::string api_format_;
    std::string language_;
};
