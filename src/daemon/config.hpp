#pragma once

#include <cstdint>
#include <string>

struct RecorderSettings;

struct Config {
    struct Backend {
        std::string type = "lan";
        std::string url = "http://localhost:8080";
        std::string api_format = "whisper.cpp"; // "whisper.cpp" or "openai"
        std::string language = "en";
    } backend;

    struct PostProcessing {
        bool enabled = false;
        std::string url = "http://localhost:8081";
        std::string model = "default";
        std::string prompt =
            "Clean up this dictated text. Fix punctuation and obvious recognition "
            "errors. Reply with the corrected text only.";
    } post_processing;

    struct Output {
        std::string default_method = "clipboard"; // "clipboard", "type" or "none"
    } output;

    struct Audio {
        uint32_t sample_rate = 16000;
        uint32_t max_seconds = 120;
        std::string node_name = "tapedeck";

        // Computed from max_seconds and sample_rate (no independent config key).
        size_t ring_buffer_bytes() const {
            return static_cast<size_t>(max_seconds) * sample_rate * sizeof(int16_t);
        }
    } audio;

    struct Recorder {
        std::string recordings_dir; // empty means <data dir>/recordings
        bool auto_transcribe = true;
        bool keep_after_transcription = true;
    } recorder;

    static Config load(const std::string& path);
    static Config load_default();

    RecorderSettings recorder_settings(bool verbose) const;
};
