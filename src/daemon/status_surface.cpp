#include "status_surface.hpp"

#include <print>

StatusSurface::StatusSurface(bool verbose, Clock clock)
    : verbose_(verbose), clock_(std::move(clock)) {}

std::chrono::steady_clock::time_point StatusSurface::now() const {
    return clock_ ? clock_() : std::chrono::steady_clock::now();
}

void StatusSurface::open(StopCallback on_stop) {
    visible_ = true;
    on_stop_ = std::move(on_stop);
    linger_message_.clear();
    close_deadline_.reset();
}

void StatusSurface::close() {
    visible_ = false;
    recording_ = false;
    on_stop_ = nullptr;
    linger_message_.clear();
    close_deadline_.reset();
    stream_.reset();
    stop_timer();
}

void StatusSurface::set_status(const std::string& message) {
    apply_deadline();
    status_ = message;
    log("status: " + message);
}

void StatusSurface::set_recording_state(bool recording) {
    recording_ = recording;
}

void StatusSurface::start_timer() {
    timer_start_ = now();
    timer_elapsed_ = {};
}

void StatusSurface::stop_timer() {
    if (timer_start_) {
        timer_elapsed_ = now() - *timer_start_;
        timer_start_.reset();
    }
}

void StatusSurface::attach_stream(const MediaStream& stream) {
    stream_ = stream;
}

void StatusSurface::detach_stream() {
    stream_.reset();
}

void StatusSurface::linger(const std::string& message, int duration_ms) {
    status_ = message;
    linger_message_ = message;
    visible_ = true;
    close_deadline_ = now() + std::chrono::milliseconds(duration_ms);
    log("linger: " + message);
}

void StatusSurface::close_after(int duration_ms) {
    close_deadline_ = now() + std::chrono::milliseconds(duration_ms);
}

bool StatusSurface::is_visible() const {
    return visible_ && !expired();
}

bool StatusSurface::trigger_stop() {
    apply_deadline();
    if (!visible_ || !on_stop_) return false;
    // Copy: the callback may reopen the surface and replace on_stop_.
    auto stop = on_stop_;
    stop();
    return true;
}

SurfaceSnapshot StatusSurface::snapshot() {
    apply_deadline();

    SurfaceSnapshot s;
    s.visible = visible_;
    s.recording = recording_;
    s.status = status_;
    s.linger_message = linger_message_;
    auto elapsed = timer_start_ ? now() - *timer_start_ : timer_elapsed_;
    s.elapsed_s = std::chrono::duration<double>(elapsed).count();
    s.stream = stream_;
    return s;
}

bool StatusSurface::expired() const {
    return close_deadline_ && now() >= *close_deadline_;
}

void StatusSurface::apply_deadline() {
    if (expired()) close();
}

void StatusSurface::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[tapedeck] surface {}", msg);
    }
}
