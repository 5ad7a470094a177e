#pragma once

#include <chrono>
#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

enum class StopReason { Manual, BackgroundHidden, Error };

std::string_view to_string(StopReason reason);

struct RecordingResult {
    std::string output_path;
    std::vector<uint8_t> payload;
    std::chrono::system_clock::time_point started_at;
    int64_t duration_ms = 0;
    StopReason stop_reason = StopReason::Manual;
};

// Read-only description of the live input, for level meters and status.
struct MediaStream {
    std::string node_name;
    uint32_t sample_rate = 0;
    uint16_t channels = 0;
};

// One in-progress recording. start() resolves asynchronously; stop() is
// fire-and-forget and eventually produces exactly one on_complete or on_error.
class CaptureSession {
public:
    using StartCallback = std::function<void(std::expected<void, std::string>)>;

    virtual ~CaptureSession() = default;

    virtual void start(StartCallback done) = 0;
    virtual void stop() = 0;
    virtual void dispose() = 0;
    virtual bool is_active() const = 0;
    virtual std::optional<MediaStream> media_stream() const = 0;
    virtual std::string output_path() const = 0;
};

struct SessionCallbacks {
    std::function<void(RecordingResult)> on_complete;
    std::function<void(const std::string&)> on_status;
    std::function<void(const std::string&)> on_error;
    std::function<void(const MediaStream&)> on_stream_changed;
};

class CaptureSessionFactory {
public:
    virtual ~CaptureSessionFactory() = default;
    virtual std::unique_ptr<CaptureSession> create(const std::string& directory,
                                                   SessionCallbacks callbacks) = 0;
};
