#pragma once

#include "capture/capture_session.hpp"
#include "dispatcher.hpp"
#include "listener_set.hpp"
#include "presentation.hpp"
#include "session_gate.hpp"
#include "storage/recording_store.hpp"
#include "transcription/transcription_coordinator.hpp"

#include <cstdint>
#include <deque>
#include <expected>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

enum class LifecycleState { Idle, Starting, Recording, Stopping };

std::string_view to_string(LifecycleState state);

struct RecorderSettings {
    std::string recordings_dir;
    bool auto_transcribe = false;
    bool post_processing_enabled = false;
    bool keep_after_transcription = true;
    bool verbose = false;
};

// A finished recording held in memory whether or not it reached disk.
struct OfflineRecording {
    RecordingResult recording;
    bool persisted = false;
};

struct RecorderSnapshot {
    LifecycleState state = LifecycleState::Idle;
    bool recording = false;
    bool has_session = false;
    bool session_active = false;
    bool surface_visible = false;
    size_t listeners = 0;
    bool lifecycle_pending = false;
    size_t queued_toggles = 0;
    size_t offline_recordings = 0;
};

// Drives one capture session at a time from a toggle through capture,
// persistence and optional transcription.
//
// Every method must be called on the loop thread. Callbacks from the capture
// session are re-posted through the dispatcher before they touch any state,
// so a session never re-enters the recorder from inside one of its own calls.
//
// There is one recorder per process. The entry point creates it with
// get_instance(deps) and hands the reference to whoever needs it;
// get_instance() without arguments returns the same object and throws
// std::logic_error before that. reset_instance() destroys it.
class Recorder {
    struct PrivateTag {
        explicit PrivateTag() = default;
    };

public:
    using Completion = std::function<void()>;
    using TranscriptionCallback = std::function<void(const std::string&)>;

    struct Dependencies {
        Dispatcher& dispatcher;
        CaptureSessionFactory& sessions;
        PresentationSurface& surface;
        TranscriptionCoordinator& transcriber;
        RecordingStore& store;
        RecorderSettings settings;
    };

    struct Options {
        TranscriptionCallback on_transcription_complete;
    };

    static Recorder& get_instance();
    // Creates the instance on first use. Later calls ignore deps and only
    // replace the transcription callback when one is given.
    static Recorder& get_instance(Dependencies deps, Options options = {});
    static void reset_instance();

    Recorder(PrivateTag, Dependencies deps, Options options);
    ~Recorder();

    Recorder(const Recorder&) = delete;
    Recorder& operator=(const Recorder&) = delete;

    // listener(true) when recording begins, listener(false) when it ends.
    ListenerSet::Unsubscribe on_toggle(ListenerSet::Listener listener);

    // Queued; done runs once this particular request has been handled.
    void toggle_recording(Completion done = {});

    // The surface's stop action. While starting it only records the intent.
    void request_stop();

    // Stops whatever is active, drops listeners and refuses further toggles.
    void unload();

    // Runs next once the current session has fully settled, or now if idle.
    void wait_for_session_lifecycle(Completion next);

    // Retries persistence of offline recordings that never reached disk.
    // Returns how many were saved this time.
    size_t recover_offline();

    LifecycleState state() const { return state_; }
    bool is_recording() const { return state_ == LifecycleState::Recording; }
    bool session_pending() const { return lifecycle_.pending(); }
    bool unloaded() const { return unloaded_; }
    size_t listener_count() const { return listeners_.size(); }
    size_t queued_toggles() const { return toggle_queue_.size(); }
    const std::optional<std::string>& last_recording_path() const { return last_recording_path_; }
    const std::map<std::string, OfflineRecording>& offline_recordings() const {
        return offline_recordings_;
    }
    size_t unpersisted_count() const;
    const RecorderSettings& settings() const { return settings_; }

    RecorderSnapshot snapshot() const;

private:
    void run_next_toggle();
    void perform_toggle(Completion done);
    void start_recording(Completion done);
    void begin_start(Completion done);
    void on_session_started(uint64_t generation, std::expected<void, std::string> started,
                            Completion done);
    void stop_recording(Completion done);

    SessionCallbacks make_session_callbacks(uint64_t generation);
    void handle_recording_complete(uint64_t generation, RecordingResult result);
    void handle_stream_changed(uint64_t generation, const MediaStream& stream);
    void transcribe_recording(const RecordingResult& result);
    void handle_transcription_complete(const std::string& text);
    void handle_error(const std::string& message);

    // Caches result, moving it to a fresh path first when that path already
    // holds an entry.
    void store_recording_in_memory(RecordingResult& result);
    std::string unused_offline_path(const std::string& path) const;
    std::expected<void, std::string> persist_recording(const RecordingResult& result);
    void update_status(const std::string& status);
    void notify_listeners();
    void dispose_session();
    void cleanup(bool hide_surface);

    void begin_session_lifecycle();
    void resolve_session_lifecycle();

    std::string describe() const;
    void debug(std::string_view msg) const;
    void info(std::string_view msg) const;

    Dispatcher& dispatcher_;
    CaptureSessionFactory& sessions_;
    PresentationSurface& surface_;
    TranscriptionCoordinator& transcriber_;
    RecordingStore& store_;
    RecorderSettings settings_;
    TranscriptionCallback on_transcription_done_;

    LifecycleState state_ = LifecycleState::Idle;
    std::unique_ptr<CaptureSession> session_;
    // Generation of session_, 0 when there is none. Callbacks carrying any
    // other value belong to a retired session.
    uint64_t generation_ = 0;
    uint64_t next_generation_ = 1;
    bool stop_requested_during_start_ = false;
    bool unloaded_ = false;

    std::optional<std::string> last_recording_path_;
    std::map<std::string, OfflineRecording> offline_recordings_;

    ListenerSet listeners_;
    SessionGate lifecycle_;

    std::deque<Completion> toggle_queue_;
    bool toggle_running_ = false;

    static std::unique_ptr<Recorder> instance_;
};
