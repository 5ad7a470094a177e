#pragma once

#include "capture/capture_session.hpp"

#include <functional>
#include <string>

class AudioCapture {
public:
    // Capture ended without stop() being called. Runs on the capture thread.
    using InterruptCallback = std::function<void(StopReason reason, const std::string& detail)>;

    virtual ~AudioCapture() = default;
    virtual bool start() = 0;
    virtual void stop() = 0;
    virtual bool is_capturing() const = 0;

    virtual void set_interrupt_callback(InterruptCallback cb) = 0;
    virtual std::string node_name() const = 0;
    virtual uint32_t sample_rate() const = 0;
};
