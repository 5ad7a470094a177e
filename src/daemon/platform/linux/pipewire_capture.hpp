#pragma once

#include "platform/audio_capture.hpp"
#include "ring_buffer.hpp"

#include <atomic>
#include <cstdint>
#include <mutex>
#include <pipewire/pipewire.h>
#include <spa/param/audio/format-utils.h>
#include <string>

class PipeWireCapture : public AudioCapture {
public:
    PipeWireCapture(RingBuffer& ring_buf, uint32_t sample_rate = 16000,
                    std::string node_name = "tapedeck");
    ~PipeWireCapture() override;

    PipeWireCapture(const PipeWireCapture&) = delete;
    PipeWireCapture& operator=(const PipeWireCapture&) = delete;

    bool start() override;
    void stop() override;
    bool is_capturing() const override { return capturing_.load(std::memory_order_relaxed); }

    void set_interrupt_callback(InterruptCallback cb) override;
    std::string node_name() const override { return node_name_; }
    uint32_t sample_rate() const override { return sample_rate_; }

private:
    static void on_process(void* userdata);
    static void on_state_changed(void* userdata, enum pw_stream_state old,
                                 enum pw_stream_state state, const char* error);

    void interrupt(StopReason reason, const std::string& detail);
    void teardown();

    RingBuffer& ring_buf_;
    uint32_t sample_rate_;
    std::string node_name_;
    std::atomic<bool> capturing_{false};

    std::mutex interrupt_mutex_;
    InterruptCallback on_interrupt_;

    pw_thread_loop* loop_ = nullptr;
    pw_stream* stream_ = nullptr;

    static constexpr pw_stream_events stream_events_ = {
        .version = PW_VERSION_STREAM_EVENTS,
        .state_changed = on_state_changed,
        .process = on_process,
    };
};
