#pragma once

#include "presentation.hpp"

#include <chrono>
#include <functional>
#include <optional>
#include <string>

struct SurfaceSnapshot {
    bool visible = false;
    bool recording = false;
    std::string status;
    std::string linger_message;
    double elapsed_s = 0.0;
    std::optional<MediaStream> stream;
};

// Headless presentation surface. It keeps what an overlay would show so the
// IPC clients can render it; timed closes are applied lazily against the
// clock whenever the surface is read.
class StatusSurface : public PresentationSurface {
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    explicit StatusSurface(bool verbose = false, Clock clock = {});

    void open(StopCallback on_stop) override;
    void close() override;
    void set_status(const std::string& message) override;
    void set_recording_state(bool recording) override;
    void start_timer() override;
    void stop_timer() override;
    void attach_stream(const MediaStream& stream) override;
    void detach_stream() override;
    void linger(const std::string& message, int duration_ms) override;
    void close_after(int duration_ms) override;
    bool is_visible() const override;

    // The stop button. False when there is nothing to stop.
    bool trigger_stop();

    SurfaceSnapshot snapshot();

private:
    std::chrono::steady_clock::time_point now() const;
    bool expired() const;
    void apply_deadline();
    void log(const std::string& msg);

    bool verbose_;
    Clock clock_;

    bool visible_ = false;
    bool recording_ = false;
    std::string status_;
    std::string linger_message_;
    StopCallback on_stop_;
    std::optional<MediaStream> stream_;

    std::optional<std::chrono::steady_clock::time_point> timer_start_;
    std::chrono::steady_clock::duration timer_elapsed_{};
    std::optional<std::chrono::steady_clock::time_point> close_deadline_;
};
