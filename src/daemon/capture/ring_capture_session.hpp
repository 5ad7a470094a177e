#pragma once

#include "capture/capture_session.hpp"
#include "dispatcher.hpp"
#include "platform/audio_capture.hpp"
#include "ring_buffer.hpp"
#include "storage/recording_store.hpp"

#include <chrono>
#include <memory>
#include <string>

// Capture session backed by the shared ring buffer. Audio accumulates in the
// ring while active; stopping drains it into one WAV payload.
class RingCaptureSession : public CaptureSession {
public:
    RingCaptureSession(Dispatcher& dispatcher, AudioCapture& capture, RingBuffer& ring_buf,
                       RecordingStore& store, std::string directory, SessionCallbacks callbacks);
    ~RingCaptureSession() override;

    RingCaptureSession(const RingCaptureSession&) = delete;
    RingCaptureSession& operator=(const RingCaptureSession&) = delete;

    void start(StartCallback done) override;
    void stop() override;
    void dispose() override;
    bool is_active() const override { return state_ == State::Active; }
    std::optional<MediaStream> media_stream() const override;
    std::string output_path() const override { return output_path_; }

    // <directory>/YYYY-MM-DD_HH-MM-SS.wav in local time, suffixed when taken.
    static std::string make_output_path(const std::string& directory,
                                        std::chrono::system_clock::time_point when);

private:
    enum class State { Idle, Active, Finished, Disposed };

    void on_interrupted(StopReason reason, const std::string& detail);
    void finish(StopReason reason);

    Dispatcher& dispatcher_;
    AudioCapture& capture_;
    RingBuffer& ring_buf_;
    RecordingStore& store_;
    std::string directory_;
    SessionCallbacks callbacks_;

    State state_ = State::Idle;
    std::string output_path_;
    std::chrono::system_clock::time_point started_at_;
    // Interrupts arrive on the capture thread and are posted; they only run
    // while this token is still alive.
    std::shared_ptr<bool> alive_ = std::make_shared<bool>(true);
};

class RingCaptureSessionFactory : public CaptureSessionFactory {
public:
    RingCaptureSessionFactory(Dispatcher& dispatcher, AudioCapture& capture, RingBuffer& ring_buf,
                              RecordingStore& store);

    std::unique_ptr<CaptureSession> create(const std::string& directory,
                                           SessionCallbacks callbacks) override;

private:
    Dispatcher& dispatcher_;
    AudioCapture& capture_;
    RingBuffer& ring_buf_;
    RecordingStore& store_;
};
