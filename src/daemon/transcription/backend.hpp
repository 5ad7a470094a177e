#pragma once

#include <cstdint>
#include <expected>
#include <span>
#include <string>

struct TranscriptResult {
    std::string text;
    double duration_s = 0.0;
    double processing_s = 0.0;
};

// Speech-to-text engine. Takes an encoded WAV file in memory.
class WhisperBackend {
public:
    virtual ~WhisperBackend() = default;
    virtual std::expected<TranscriptResult, std::string>
        transcribe(std::span<const uint8_t> wav_payload) = 0;
    virtual std::string name() const = 0;
};

// Optional rewrite of a raw transcript (cleanup, formatting, summarizing).
class PostProcessor {
public:
    virtual ~PostProcessor() = default;
    virtual std::expected<std::string, std::string> process(const std::string& transcript) = 0;
};
