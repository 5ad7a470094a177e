#pragma once

#include "capture/capture_session.hpp"

#include <expected>
#include <string>

// Durable side of a recording: directories, audio files and the history index.
class RecordingStore {
public:
    virtual ~RecordingStore() = default;

    virtual std::expected<void, std::string> ensure_directory(const std::string& path) = 0;
    virtual std::expected<void, std::string> persist(const RecordingResult& result) = 0;
    virtual std::expected<void, std::string> attach_transcript(const std::string& output_path,
                                                               const std::string& text,
                                                               const std::string& backend) = 0;
    // Removes the audio file but keeps its history row.
    virtual std::expected<void, std::string> discard_audio(const std::string& output_path) = 0;
};
