#include "storage/file_recording_store.hpp"

#include <filesystem>
#include <format>
#include <fstream>
#include <print>

namespace fs = std::filesystem;

FileRecordingStore::FileRecordingStore(HistoryDb& history)
    : history_(history) {}

std::expected<void, std::string> FileRecordingStore::ensure_directory(const std::string& path) {
    std::error_code ec;
    fs::create_directories(path, ec);
    if (ec) {
        return std::unexpected(std::format("cannot create {}: {}", path, ec.message()));
    }
    if (!fs::is_directory(path, ec)) {
        return std::unexpected(std::format("{} is not a directory", path));
    }
    return {};
}

std::expected<void, std::string> FileRecordingStore::persist(const RecordingResult& result) {
    if (result.output_path.empty()) {
        return std::unexpected("recording has no output path");
    }

    auto parent = fs::path(result.output_path).parent_path();
    if (!parent.empty()) {
        auto dir = ensure_directory(parent.string());
        if (!dir) return dir;
    }

    // Write beside the target and rename so a reader never sees half a file.
    auto tmp_path = result.output_path + ".part";
    {
        std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            return std::unexpected(std::format("cannot open {} for writing", tmp_path));
        }
        out.write(reinterpret_cast<const char*>(result.payload.data()),
                  static_cast<std::streamsize>(result.payload.size()));
        out.flush();
        if (!out) {
            std::error_code ec;
            fs::remove(tmp_path, ec);
            return std::unexpected(std::format("write to {} failed", tmp_path));
        }
    }

    std::error_code ec;
    fs::rename(tmp_path, result.output_path, ec);
    if (ec) {
        auto reason = ec.message();
        fs::remove(tmp_path, ec);
        return std::unexpected(std::format("cannot move recording into {}: {}",
                                           result.output_path, reason));
    }

    if (history_.is_open() &&
        !history_.insert_recording(result.output_path, result.duration_ms,
                                   std::string(to_string(result.stop_reason)))) {
        std::println(stderr, "store: recording {} saved but not indexed", result.output_path);
    }
    return {};
}

std::expected<void, std::string> FileRecordingStore::attach_transcript(const std::string& output_path,
                                                                       const std::string& text,
                                                                       const std::string& backend) {
    if (!history_.is_open()) {
        return std::unexpected("history database is not open");
    }
    if (!history_.set_transcript(output_path, text, backend)) {
        return std::unexpected(std::format("no history entry for {}", output_path));
    }
    return {};
}

std::expected<void, std::string> FileRecordingStore::discard_audio(const std::string& output_path) {
    std::error_code ec;
    fs::remove(output_path, ec);
    if (ec) {
        return std::unexpected(std::format("cannot remove {}: {}", output_path, ec.message()));
    }
    if (history_.is_open()) {
        history_.mark_audio_removed(output_path);
    }
    return {};
}
