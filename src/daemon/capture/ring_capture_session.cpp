#include "capture/ring_capture_session.hpp"

#include "wav_encoder.hpp"

#include <ctime>
#include <filesystem>
#include <format>
#include <print>

namespace fs = std::filesystem;

RingCaptureSession::RingCaptureSession(Dispatcher& dispatcher, AudioCapture& capture,
                                       RingBuffer& ring_buf, RecordingStore& store,
                                       std::string directory, SessionCallbacks callbacks)
    : dispatcher_(dispatcher), capture_(capture), ring_buf_(ring_buf), store_(store),
      directory_(std::move(directory)), callbacks_(std::move(callbacks)) {}

RingCaptureSession::~RingCaptureSession() {
    dispose();
}

std::string RingCaptureSession::make_output_path(const std::string& directory,
                                                 std::chrono::system_clock::time_point when) {
    std::time_t t = std::chrono::system_clock::to_time_t(when);
    std::tm tm{};
    localtime_r(&t, &tm);

    char stamp[32];
    std::strftime(stamp, sizeof(stamp), "%Y-%m-%d_%H-%M-%S", &tm);

    auto path = fs::path(directory) / (std::string(stamp) + ".wav");
    for (int n = 1; fs::exists(path); ++n) {
        path = fs::path(directory) / std::format("{}-{}.wav", stamp, n);
    }
    return path.string();
}

void RingCaptureSession::start(StartCallback done) {
    if (state_ != State::Idle) {
        done(std::unexpected("session was already started"));
        return;
    }

    auto dir = store_.ensure_directory(directory_);
    if (!dir) {
        state_ = State::Finished;
        done(std::unexpected(dir.error()));
        return;
    }

    std::weak_ptr<bool> alive = alive_;
    capture_.set_interrupt_callback([this, alive](StopReason reason, const std::string& detail) {
        dispatcher_.post([this, alive, reason, detail] {
            if (alive.lock()) on_interrupted(reason, detail);
        });
    });

    ring_buf_.reset();
    if (!capture_.start()) {
        capture_.set_interrupt_callback({});
        state_ = State::Finished;
        done(std::unexpected("audio capture could not be started"));
        return;
    }

    started_at_ = std::chrono::system_clock::now();
    output_path_ = make_output_path(directory_, started_at_);
    state_ = State::Active;
    done({});
}

void RingCaptureSession::stop() {
    if (state_ != State::Active) return;
    capture_.stop();
    finish(StopReason::Manual);
}

void RingCaptureSession::dispose() {
    if (state_ == State::Disposed) return;
    bool was_active = state_ == State::Active;
    state_ = State::Disposed;
    alive_.reset();
    capture_.set_interrupt_callback({});
    if (was_active) capture_.stop();
}

std::optional<MediaStream> RingCaptureSession::media_stream() const {
    if (state_ != State::Active) return std::nullopt;
    return MediaStream{capture_.node_name(), capture_.sample_rate(), 1};
}

void RingCaptureSession::on_interrupted(StopReason reason, const std::string& detail) {
    if (state_ != State::Active) return;
    std::println(stderr, "capture: interrupted ({}): {}", to_string(reason), detail);
    capture_.stop();
    finish(reason);
}

void RingCaptureSession::finish(StopReason reason) {
    state_ = State::Finished;
    capture_.set_interrupt_callback({});

    auto samples = ring_buf_.drain_samples();
    uint32_t rate = capture_.sample_rate();

    if (size_t dropped = ring_buf_.dropped_bytes(); dropped > 0 && callbacks_.on_status) {
        auto lost_ms = wav::duration_ms(dropped / sizeof(int16_t), rate);
        callbacks_.on_status(std::format("Buffer full, the last {:.1f}s were not recorded",
                                         static_cast<double>(lost_ms) / 1000.0));
    }

    if (samples.empty()) {
        if (callbacks_.on_error) callbacks_.on_error("No audio data recorded");
        return;
    }

    RecordingResult result;
    result.output_path = output_path_;
    result.started_at = started_at_;
    result.duration_ms = wav::duration_ms(samples.size(), rate);
    result.payload = wav::encode(samples, rate);
    result.stop_reason = reason;

    if (callbacks_.on_complete) callbacks_.on_complete(std::move(result));
}

RingCaptureSessionFactory::RingCaptureSessionFactory(Dispatcher& dispatcher, AudioCapture& capture,
                                                     RingBuffer& ring_buf, RecordingStore& store)
    : dispatcher_(dispatcher), capture_(capture), ring_buf_(ring_buf), store_(store) {}

std::unique_ptr<CaptureSession> RingCaptureSessionFactory::create(const std::string& directory,
                                                                  SessionCallbacks callbacks) {
    return std::make_unique<RingCaptureSession>(dispatcher_, capture_, ring_buf_, store_,
                                                directory, std::move(callbacks));
}
