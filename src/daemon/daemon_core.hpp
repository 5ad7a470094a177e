#pragma once

#include "capture/ring_capture_session.hpp"
#include "config.hpp"
#include "dispatcher.hpp"
#include "output/output.hpp"
#include "platform/audio_capture.hpp"
#include "platform/ipc_server.hpp"
#include "recorder.hpp"
#include "ring_buffer.hpp"
#include "status_surface.hpp"
#include "storage/file_recording_store.hpp"
#include "storage/history_db.hpp"
#include "transcription/backend.hpp"
#include "transcription/transcription_coordinator.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

// Portable daemon logic: owns the recorder's collaborators and maps IPC
// commands onto it. Replies that depend on a recording settling are sent
// later through the IpcServer instead of being returned.
class DaemonCore {
public:
    DaemonCore(Config config, bool verbose, Dispatcher& dispatcher,
               RingBuffer& ring_buf, AudioCapture& audio, StatusSurface& surface,
               IpcServer& ipc, OutputFactory output_factory);
    ~DaemonCore();

    DaemonCore(const DaemonCore&) = delete;
    DaemonCore& operator=(const DaemonCore&) = delete;

    // Creates the backend, opens history and brings up the recorder.
    // Pass a backend to use it instead of the one named in config.
    bool init(std::unique_ptr<WhisperBackend> backend = nullptr);

    void add_client(int fd);
    void remove_client(int fd);

    // nullopt when the reply will be sent later.
    std::optional<nlohmann::json> handle_command(int client_fd, const nlohmann::json& cmd);

    // Stops any recording and waits for the transcription worker. Tasks it
    // posts still need to be drained by the caller.
    void shutdown();

    Recorder& recorder() { return *recorder_; }
    HistoryDb& history() { return history_db_; }
    const std::optional<std::string>& last_transcript() const { return last_transcript_; }

private:
    std::optional<nlohmann::json> dispatch_command(int client_fd, const nlohmann::json& cmd);
    std::optional<nlohmann::json> handle_start(int client_fd, const nlohmann::json& cmd);
    std::optional<nlohmann::json> handle_stop(int client_fd, const nlohmann::json& cmd);
    nlohmann::json handle_status();
    nlohmann::json handle_history(const nlohmann::json& cmd);
    nlohmann::json handle_recover();
    nlohmann::json handle_subscribe(int client_fd);
    void handle_wait(int client_fd);

    void queue_toggle(int client_fd, const nlohmann::json& cmd);
    void deliver_transcript(const std::string& text);
    void broadcast_recording(bool recording);
    nlohmann::json state_response() const;
    void reply_later(int client_fd, uint64_t serial, const nlohmann::json& response);

    void log(const std::string& msg);

    Config config_;
    bool verbose_;

    Dispatcher& dispatcher_;
    RingBuffer& ring_buf_;
    AudioCapture& audio_;
    StatusSurface& surface_;
    IpcServer& ipc_;
    OutputFactory output_factory_;

    HistoryDb history_db_;
    std::unique_ptr<FileRecordingStore> store_;
    std::unique_ptr<WhisperBackend> backend_;
    std::unique_ptr<PostProcessor> post_processor_;
    std::unique_ptr<ThreadedTranscriptionCoordinator> transcriber_;
    std::unique_ptr<RingCaptureSessionFactory> sessions_;
    Recorder* recorder_ = nullptr;
    ListenerSet::Unsubscribe unsubscribe_;

    // Connected clients by fd, with a serial so a deferred reply never lands
    // on a reused descriptor.
    std::map<int, uint64_t> clients_;
    uint64_t next_serial_ = 1;
    std::vector<int> subscribers_;

    std::string pending_output_method_;
    std::optional<std::string> last_transcript_;
    std::optional<std::string> last_transcript_path_;
};
