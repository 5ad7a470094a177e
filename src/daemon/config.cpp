#include "config.hpp"

#include "platform/platform_paths.hpp"
#include "recorder.hpp"

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

template <typename T>
void read_key(const json& section, const char* key, T& out) {
    if (section.contains(key)) out = section[key].get<T>();
}

} // namespace

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return cfg;
    }

    try {
        auto j = json::parse(f);

        if (j.contains("backend")) {
            auto& b = j["backend"];
            read_key(b, "type", cfg.backend.type);
            read_key(b, "url", cfg.backend.url);
            read_key(b, "api_format", cfg.backend.api_format);
            read_key(b, "language", cfg.backend.language);
        }

        if (j.contains("post_processing")) {
            auto& p = j["post_processing"];
            read_key(p, "enabled", cfg.post_processing.enabled);
            read_key(p, "url", cfg.post_processing.url);
            read_key(p, "model", cfg.post_processing.model);
            read_key(p, "prompt", cfg.post_processing.prompt);
        }

        if (j.contains("output")) {
            read_key(j["output"], "default", cfg.output.default_method);
        }

        if (j.contains("audio")) {
            auto& a = j["audio"];
            read_key(a, "sample_rate", cfg.audio.sample_rate);
            read_key(a, "max_seconds", cfg.audio.max_seconds);
            read_key(a, "node_name", cfg.audio.node_name);
        }

        if (j.contains("recorder")) {
            auto& r = j["recorder"];
            read_key(r, "recordings_dir", cfg.recorder.recordings_dir);
            read_key(r, "auto_transcribe", cfg.recorder.auto_transcribe);
            read_key(r, "keep_after_transcription", cfg.recorder.keep_after_transcription);
        }

    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
        return Config{};
    }

    return cfg;
}

Config Config::load_default() {
    auto dir = platform::config_dir();
    if (dir.empty()) return Config{};

    auto config_path = fs::path(dir) / "config.json";
    if (fs::exists(config_path)) {
        return load(config_path.string());
    }
    return Config{};
}

RecorderSettings Config::recorder_settings(bool verbose) const {
    RecorderSettings s;
    s.recordings_dir = recorder.recordings_dir.empty() ? platform::recordings_dir()
                                                       : recorder.recordings_dir;
    s.auto_transcribe = recorder.auto_transcribe;
    s.post_processing_enabled = post_processing.enabled;
    s.keep_after_transcription = recorder.keep_after_transcription;
    s.verbose = verbose;
    return s;
}
