#pragma once

#include "capture/capture_session.hpp"

#include <functional>
#include <string>

// Whatever shows the user that a recording is in progress. The recorder only
// pushes state into it; the one thing flowing back is the stop action.
class PresentationSurface {
public:
    using StopCallback = std::function<void()>;

    virtual ~PresentationSurface() = default;

    virtual void open(StopCallback on_stop) = 0;
    virtual void close() = 0;
    virtual void set_status(const std::string& message) = 0;
    virtual void set_recording_state(bool recording) = 0;
    virtual void start_timer() = 0;
    virtual void stop_timer() = 0;
    virtual void attach_stream(const MediaStream& stream) = 0;
    virtual void detach_stream() = 0;
    // Show message, then close after duration_ms.
    virtual void linger(const std::string& message, int duration_ms) = 0;
    virtual void close_after(int duration_ms) = 0;
    virtual bool is_visible() const = 0;
};
