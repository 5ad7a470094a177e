#include "recorder.hpp"

#include <exception>
#include <filesystem>
#include <format>
#include <print>
#include <stdexcept>
#include <utility>

namespace {

constexpr int SAVED_LINGER_MS = 2400;
constexpr int UNEXPECTED_STOP_LINGER_MS = 4200;
constexpr int ERROR_LINGER_MS = 2600;
constexpr int BACKUP_ERROR_LINGER_MS = 3200;
constexpr int TRANSCRIPT_READY_LINGER_MS = 2600;
constexpr int CALLBACK_FAILED_LINGER_MS = 3000;
constexpr int CALLBACK_CLOSE_MS = 800;

std::string file_name(const std::string& path) {
    return std::filesystem::path(path).filename().string();
}

std::string completion_message(StopReason reason, const std::string& name) {
    switch (reason) {
        case StopReason::BackgroundHidden:
            return std::format("The system forcibly ended capture (the audio device or session "
                               "went away). Saved what was captured to {}.", name);
        case StopReason::Error:
            return std::format("Capture ended with an error. Saved what was captured to {}.", name);
        case StopReason::Manual:
            break;
    }
    return name.empty() ? "Recording saved." : std::format("Saved to {}", name);
}

} // namespace

std::string_view to_string(LifecycleState state) {
    switch (state) {
        case LifecycleState::Idle: return "idle";
        case LifecycleState::Starting: return "starting";
        case LifecycleState::Recording: return "recording";
        case LifecycleState::Stopping: return "stopping";
    }
    return "unknown";
}

std::unique_ptr<Recorder> Recorder::instance_;

Recorder& Recorder::get_instance() {
    if (!instance_) {
        throw std::logic_error("Recorder has not been initialized");
    }
    return *instance_;
}

Recorder& Recorder::get_instance(Dependencies deps, Options options) {
    if (!instance_) {
        instance_ = std::make_unique<Recorder>(PrivateTag{}, std::move(deps), std::move(options));
    } else if (options.on_transcription_complete) {
        instance_->on_transcription_done_ = std::move(options.on_transcription_complete);
    }
    return *instance_;
}

void Recorder::reset_instance() {
    instance_.reset();
}

Recorder::Recorder(PrivateTag, Dependencies deps, Options options)
    : dispatcher_(deps.dispatcher), sessions_(deps.sessions), surface_(deps.surface),
      transcriber_(deps.transcriber), store_(deps.store),
      settings_(std::move(deps.settings)),
      on_transcription_done_(std::move(options.on_transcription_complete)) {}

Recorder::~Recorder() {
    if (session_) {
        session_->dispose();
    }
}

ListenerSet::Unsubscribe Recorder::on_toggle(ListenerSet::Listener listener) {
    return listeners_.subscribe(std::move(listener));
}

// Toggle queue

void Recorder::toggle_recording(Completion done) {
    debug("toggle_recording invoked");
    toggle_queue_.push_back(std::move(done));
    if (!toggle_running_) {
        run_next_toggle();
    }
}

void Recorder::run_next_toggle() {
    if (toggle_queue_.empty()) {
        toggle_running_ = false;
        return;
    }

    toggle_running_ = true;
    perform_toggle([this] {
        auto done = std::move(toggle_queue_.front());
        toggle_queue_.pop_front();
        if (done) {
            try {
                done();
            } catch (const std::exception& e) {
                std::println(stderr, "recorder: toggle completion failed: {}", e.what());
            }
        }
        run_next_toggle();
    });
}

void Recorder::perform_toggle(Completion done) {
    debug("perform_toggle running");
    if (unloaded_) {
        debug("perform_toggle ignored, recorder unloaded");
        done();
        return;
    }

    switch (state_) {
        case LifecycleState::Recording:
            stop_recording(std::move(done));
            return;
        case LifecycleState::Idle:
            start_recording(std::move(done));
            return;
        case LifecycleState::Starting:
        case LifecycleState::Stopping:
            break;
    }

    // Previous session is still winding down. Decide against whatever state
    // it settles into.
    if (!lifecycle_.pending()) {
        std::println(stderr, "recorder: {} with no pending session, resetting",
                     to_string(state_));
        cleanup(false);
        start_recording(std::move(done));
        return;
    }
    lifecycle_.wait([this, done = std::move(done)] { perform_toggle(done); });
}

// Start / stop

void Recorder::start_recording(Completion done) {
    debug("start_recording requested");
    if (state_ != LifecycleState::Idle) {
        debug("start_recording aborted, session already active");
        done();
        return;
    }

    stop_requested_during_start_ = false;
    lifecycle_.wait([this, done = std::move(done)] { begin_start(done); });
}

void Recorder::begin_start(Completion done) {
    if (state_ != LifecycleState::Idle || unloaded_) {
        done();
        return;
    }

    state_ = LifecycleState::Starting;
    last_recording_path_.reset();
    debug("start_recording transitioning to starting");

    surface_.open([this] { request_stop(); });
    surface_.set_status("Preparing recorder...");
    begin_session_lifecycle();

    uint64_t generation = next_generation_++;
    generation_ = generation;
    session_ = sessions_.create(settings_.recordings_dir, make_session_callbacks(generation));
    if (!session_) {
        handle_error("Failed to start recording: no capture session available");
        done();
        return;
    }

    session_->start([this, generation, done = std::move(done)](std::expected<void, std::string> started) {
        dispatcher_.post([this, generation, started = std::move(started), done] {
            on_session_started(generation, started, done);
        });
    });
}

void Recorder::on_session_started(uint64_t generation, std::expected<void, std::string> started,
                                  Completion done) {
    if (generation != generation_ || !session_) {
        debug("start resolved for a retired session");
        done();
        return;
    }

    if (!started) {
        std::println(stderr, "recorder: start failed for session {}: {}", generation, started.error());
        handle_error("Failed to start recording: " + started.error());
        done();
        return;
    }

    if (stop_requested_during_start_) {
        debug("stop requested during start, stopping now");
        stop_requested_during_start_ = false;
        state_ = LifecycleState::Recording;
        stop_recording(std::move(done));
        return;
    }

    state_ = LifecycleState::Recording;
    info("Recording started");
    surface_.set_recording_state(true);
    surface_.start_timer();
    notify_listeners();

    if (auto stream = session_->media_stream()) {
        surface_.attach_stream(*stream);
    }
    done();
}

void Recorder::request_stop() {
    debug("request_stop invoked");
    if (state_ == LifecycleState::Starting) {
        // The device may not exist yet. Remember the intent; on_session_started
        // issues the stop once start has resolved.
        if (!stop_requested_during_start_) {
            stop_requested_during_start_ = true;
            update_status("Stopping recording...");
            surface_.set_recording_state(false);
            surface_.stop_timer();
            notify_listeners();
        }
        return;
    }
    stop_recording({});
}

void Recorder::stop_recording(Completion done) {
    debug("stop_recording requested");
    if (!session_ || state_ != LifecycleState::Recording) {
        debug("stop_recording aborted, nothing active");
        if (done) done();
        return;
    }

    state_ = LifecycleState::Stopping;
    update_status("Stopping recording...");
    session_->stop();
    surface_.set_recording_state(false);
    surface_.stop_timer();
    notify_listeners();

    lifecycle_.wait([this, done = std::move(done)] {
        info("Recording stopped");
        if (done) done();
    });
}

void Recorder::unload() {
    info("unload");
    unloaded_ = true;

    if (state_ == LifecycleState::Recording) {
        stop_recording({});
    } else if (state_ == LifecycleState::Starting) {
        request_stop();
    }

    cleanup(true);
    listeners_.clear();
}

// Session callbacks

SessionCallbacks Recorder::make_session_callbacks(uint64_t generation) {
    SessionCallbacks callbacks;

    callbacks.on_complete = [this, generation](RecordingResult result) {
        dispatcher_.post([this, generation, result = std::move(result)] {
            handle_recording_complete(generation, result);
        });
    };

    callbacks.on_status = [this, generation](const std::string& status) {
        dispatcher_.post([this, generation, status] {
            if (generation == generation_) update_status(status);
        });
    };

    callbacks.on_error = [this, generation](const std::string& error) {
        dispatcher_.post([this, generation, error] {
            if (generation != generation_) {
                std::println(stderr, "recorder: error from retired session {}: {}", generation, error);
                return;
            }
            handle_error(error);
        });
    };

    callbacks.on_stream_changed = [this, generation](const MediaStream& stream) {
        dispatcher_.post([this, generation, stream] {
            handle_stream_changed(generation, stream);
        });
    };

    return callbacks;
}

void Recorder::handle_recording_complete(uint64_t generation, RecordingResult result) {
    info(std::format("Recording session completed: {} ({} ms, {})", result.output_path,
                     result.duration_ms, to_string(result.stop_reason)));

    if (generation != generation_) {
        // Retired by unload or an error before it finished. Keep the audio
        // anyway, the state machine has already moved on.
        store_recording_in_memory(result);
        auto persisted = persist_recording(result);
        if (!persisted) {
            std::println(stderr, "recorder: late recording {} kept in memory only: {}",
                         result.output_path, persisted.error());
        }
        return;
    }

    dispose_session();
    state_ = LifecycleState::Idle;
    stop_requested_during_start_ = false;
    surface_.set_recording_state(false);
    surface_.stop_timer();
    surface_.detach_stream();
    notify_listeners();

    store_recording_in_memory(result);
    last_recording_path_ = result.output_path;
    auto persisted = persist_recording(result);
    if (!persisted) {
        handle_error("Failed to save recording: " + persisted.error());
        return;
    }

    auto message = completion_message(result.stop_reason, file_name(result.output_path));
    bool unexpected_stop = result.stop_reason != StopReason::Manual;
    if (unexpected_stop) {
        surface_.linger(message, UNEXPECTED_STOP_LINGER_MS);
    }

    if (!settings_.auto_transcribe) {
        if (!unexpected_stop) {
            surface_.linger(message, SAVED_LINGER_MS);
        }
        resolve_session_lifecycle();
        return;
    }

    if (!unexpected_stop) {
        surface_.set_status("Saved. Transcribing...");
    }
    transcribe_recording(result);
}

void Recorder::handle_stream_changed(uint64_t generation, const MediaStream& stream) {
    if (generation != generation_) return;
    debug("capture stream updated");
    surface_.attach_stream(stream);
}

void Recorder::transcribe_recording(const RecordingResult& result) {
    debug("starting transcription");

    TranscriptionRequest request{
        .payload = result.payload,
        .output_path = result.output_path,
        .options = {
            .post_process = settings_.post_processing_enabled,
            .keep_audio = settings_.keep_after_transcription,
        },
    };

    transcriber_.start(
        std::move(request),
        [this](const std::string& status) { update_status(status); },
        [this](std::expected<std::string, std::string> text) {
            // handle_error settles the lifecycle itself.
            if (!text) {
                handle_error("Transcription failed: " + text.error());
                return;
            }
            handle_transcription_complete(*text);
            resolve_session_lifecycle();
        });
}

void Recorder::handle_transcription_complete(const std::string& text) {
    info(std::format("Transcription complete, {} chars", text.size()));
    try {
        if (on_transcription_done_) {
            on_transcription_done_(text);
            surface_.close_after(CALLBACK_CLOSE_MS);
        } else {
            surface_.linger(settings_.post_processing_enabled
                                ? "Transcription ready. Post-processing complete."
                                : "Transcription ready.",
                            TRANSCRIPT_READY_LINGER_MS);
        }
    } catch (const std::exception& e) {
        update_status(std::format("Failed to process transcription: {}", e.what()));
        surface_.linger("Transcription failed", CALLBACK_FAILED_LINGER_MS);
    }
}

void Recorder::handle_error(const std::string& message) {
    std::println(stderr, "recorder: failure (session {}, last recording {}): {}",
                 generation_, last_recording_path_.value_or("-"), message);

    bool has_backup = last_recording_path_ && offline_recordings_.contains(*last_recording_path_);
    auto status = has_backup
        ? std::format("Processing failed for {}. Your recording is still available in memory.",
                      file_name(*last_recording_path_))
        : "Recording error: " + message;

    update_status(status);
    surface_.linger(status, has_backup ? BACKUP_ERROR_LINGER_MS : ERROR_LINGER_MS);

    dispose_session();
    state_ = LifecycleState::Idle;
    stop_requested_during_start_ = false;
    surface_.stop_timer();
    surface_.detach_stream();
    notify_listeners();
    resolve_session_lifecycle();
}

// Offline cache

std::string Recorder::unused_offline_path(const std::string& path) const {
    std::filesystem::path p(path);
    auto stem = p.stem().string();
    auto ext = p.extension().string();

    std::string candidate = path;
    for (int n = 1; offline_recordings_.contains(candidate); ++n) {
        candidate = (p.parent_path() / std::format("{}-{}{}", stem, n, ext)).string();
    }
    return candidate;
}

void Recorder::store_recording_in_memory(RecordingResult& result) {
    if (offline_recordings_.contains(result.output_path)) {
        auto moved = unused_offline_path(result.output_path);
        std::println(stderr, "recorder: {} is already cached, keeping this take as {}",
                     result.output_path, moved);
        result.output_path = std::move(moved);
    }

    auto& entry = offline_recordings_[result.output_path];
    entry.recording = result;
    entry.persisted = false;
    debug(std::format("offline recording cached, {} in memory", offline_recordings_.size()));
}

std::expected<void, std::string> Recorder::persist_recording(const RecordingResult& result) {
    auto persisted = store_.persist(result);
    if (persisted) {
        offline_recordings_[result.output_path].persisted = true;
    }
    return persisted;
}

size_t Recorder::recover_offline() {
    size_t recovered = 0;
    for (auto& [path, entry] : offline_recordings_) {
        if (entry.persisted) continue;

        auto persisted = store_.persist(entry.recording);
        if (persisted) {
            entry.persisted = true;
            ++recovered;
            info("Recovered offline recording " + path);
        } else {
            std::println(stderr, "recorder: recovery of {} failed: {}", path, persisted.error());
        }
    }
    return recovered;
}

size_t Recorder::unpersisted_count() const {
    size_t count = 0;
    for (auto& [path, entry] : offline_recordings_) {
        if (!entry.persisted) ++count;
    }
    return count;
}

// Helpers

void Recorder::update_status(const std::string& status) {
    surface_.set_status(status);
}

void Recorder::notify_listeners() {
    debug("notify_listeners firing");
    listeners_.notify(is_recording());
}

void Recorder::dispose_session() {
    if (session_) {
        session_->dispose();
        session_.reset();
    }
    generation_ = 0;
}

void Recorder::cleanup(bool hide_surface) {
    debug(hide_surface ? "cleanup invoked, hiding surface" : "cleanup invoked");
    dispose_session();
    state_ = LifecycleState::Idle;
    stop_requested_during_start_ = false;
    surface_.stop_timer();
    surface_.detach_stream();
    if (hide_surface) {
        surface_.close();
    }
    notify_listeners();
    resolve_session_lifecycle();
}

void Recorder::begin_session_lifecycle() {
    if (!lifecycle_.begin()) {
        debug("begin_session_lifecycle skipped, already pending");
    }
}

void Recorder::resolve_session_lifecycle() {
    if (lifecycle_.pending()) {
        debug("resolve_session_lifecycle resolving");
        lifecycle_.resolve();
    }
}

void Recorder::wait_for_session_lifecycle(Completion next) {
    lifecycle_.wait(std::move(next));
}

RecorderSnapshot Recorder::snapshot() const {
    return RecorderSnapshot{
        .state = state_,
        .recording = is_recording(),
        .has_session = session_ != nullptr,
        .session_active = session_ && session_->is_active(),
        .surface_visible = surface_.is_visible(),
        .listeners = listeners_.size(),
        .lifecycle_pending = lifecycle_.pending(),
        .queued_toggles = toggle_queue_.size(),
        .offline_recordings = offline_recordings_.size(),
    };
}

std::string Recorder::describe() const {
    auto s = snapshot();
    return std::format("state={} recording={} session={} active={} visible={} listeners={} "
                       "pending={} queued={}",
                       to_string(s.state), s.recording, s.has_session, s.session_active,
                       s.surface_visible, s.listeners, s.lifecycle_pending, s.queued_toggles);
}

void Recorder::debug(std::string_view msg) const {
    if (settings_.verbose) {
        std::println(stderr, "[tapedeck] recorder: {} ({})", msg, describe());
    }
}

void Recorder::info(std::string_view msg) const {
    if (settings_.verbose) {
        std::println(stderr, "[tapedeck] {}", msg);
    }
}
