#include "daemon_core.hpp"

#include "platform/platform_paths.hpp"
#include "transcription/chat_post_processor.hpp"
#include "transcription/lan_backend.hpp"

#include <algorithm>
#include <format>
#include <print>
#include <stdexcept>
#include <utility>

namespace {

constexpr int DEFAULT_HISTORY_LIMIT = 10;

} // namespace

DaemonCore::DaemonCore(Config config, bool verbose, Dispatcher& dispatcher,
                       RingBuffer& ring_buf, AudioCapture& audio, StatusSurface& surface,
                       IpcServer& ipc, OutputFactory output_factory)
    : config_(std::move(config)), verbose_(verbose),
      dispatcher_(dispatcher), ring_buf_(ring_buf), audio_(audio),
      surface_(surface), ipc_(ipc),
      output_factory_(std::move(output_factory)),
      pending_output_method_(config_.output.default_method) {}

DaemonCore::~DaemonCore() {
    if (unsubscribe_) unsubscribe_();
    if (recorder_) Recorder::reset_instance();
}

bool DaemonCore::init(std::unique_ptr<WhisperBackend> backend) {
    if (backend) {
        backend_ = std::move(backend);
    } else if (config_.backend.type == "lan") {
        backend_ = std::make_unique<LanBackend>(
            config_.backend.url, config_.backend.api_format, config_.backend.language);
    } else {
        std::println(stderr, "Unknown backend type: {}", config_.backend.type);
        return false;
    }

    if (config_.post_processing.enabled) {
        post_processor_ = std::make_unique<ChatPostProcessor>(
            config_.post_processing.url, config_.post_processing.model,
            config_.post_processing.prompt);
    }

    auto data = platform::data_dir();
    std::string db_path = !data.empty() ? data + "/history.db" : "/tmp/tapedeck/history.db";
    if (!history_db_.open(db_path)) {
        std::println(stderr, "Warning: history DB failed to open, history disabled");
    }

    store_ = std::make_unique<FileRecordingStore>(history_db_);
    transcriber_ = std::make_unique<ThreadedTranscriptionCoordinator>(
        dispatcher_, *backend_, post_processor_.get(), *store_);
    sessions_ = std::make_unique<RingCaptureSessionFactory>(dispatcher_, audio_, ring_buf_, *store_);

    recorder_ = &Recorder::get_instance(
        Recorder::Dependencies{
            .dispatcher = dispatcher_,
            .sessions = *sessions_,
            .surface = surface_,
            .transcriber = *transcriber_,
            .store = *store_,
            .settings = config_.recorder_settings(verbose_),
        },
        Recorder::Options{
            .on_transcription_complete = [this](const std::string& text) { deliver_transcript(text); },
        });

    unsubscribe_ = recorder_->on_toggle([this](bool recording) { broadcast_recording(recording); });

    log("Recordings go to " + recorder_->settings().recordings_dir);
    return true;
}

void DaemonCore::add_client(int fd) {
    clients_[fd] = next_serial_++;
}

void DaemonCore::remove_client(int fd) {
    clients_.erase(fd);
    std::erase(subscribers_, fd);
}

std::optional<nlohmann::json> DaemonCore::handle_command(int client_fd, const nlohmann::json& cmd) {
    try {
        return dispatch_command(client_fd, cmd);
    } catch (const nlohmann::json::exception& e) {
        log(std::format("Rejected command from client {}: {}", client_fd, e.what()));
        return nlohmann::json{{"status", "error"}, {"message", std::string("bad request: ") + e.what()}};
    }
}

std::optional<nlohmann::json> DaemonCore::dispatch_command(int client_fd, const nlohmann::json& cmd) {
    std::string cmd_str = cmd.is_object() ? cmd.value("cmd", "") : "";

    if (cmd_str == "toggle") {
        queue_toggle(client_fd, cmd);
        return std::nullopt;
    }
    if (cmd_str == "start") return handle_start(client_fd, cmd);
    if (cmd_str == "stop") return handle_stop(client_fd, cmd);
    if (cmd_str == "status") return handle_status();
    if (cmd_str == "history") return handle_history(cmd);
    if (cmd_str == "recover") return handle_recover();
    if (cmd_str == "subscribe") return handle_subscribe(client_fd);
    if (cmd_str == "wait") {
        handle_wait(client_fd);
        return std::nullopt;
    }
    return nlohmann::json{{"status", "error"}, {"message", "unknown command"}};
}

void DaemonCore::queue_toggle(int client_fd, const nlohmann::json& cmd) {
    if (cmd.contains("output")) {
        pending_output_method_ = cmd.value("output", config_.output.default_method);
    }

    uint64_t serial = clients_.contains(client_fd) ? clients_[client_fd] : 0;
    recorder_->toggle_recording([this, client_fd, serial] {
        reply_later(client_fd, serial, state_response());
    });
}

std::optional<nlohmann::json> DaemonCore::handle_start(int client_fd, const nlohmann::json& cmd) {
    auto state = recorder_->state();
    if (state == LifecycleState::Recording || state == LifecycleState::Starting) {
        return nlohmann::json{{"status", "error"}, {"message", "already recording"}};
    }
    // Idle, or Stopping: the queued toggle starts once the old session settles.
    queue_toggle(client_fd, cmd);
    return std::nullopt;
}

std::optional<nlohmann::json> DaemonCore::handle_stop(int client_fd, const nlohmann::json& cmd) {
    switch (recorder_->state()) {
        case LifecycleState::Recording:
            queue_toggle(client_fd, cmd);
            return std::nullopt;
        case LifecycleState::Starting:
            surface_.trigger_stop();
            return state_response();
        case LifecycleState::Idle:
        case LifecycleState::Stopping:
            break;
    }
    return nlohmann::json{{"status", "error"}, {"message", "not recording"}};
}

nlohmann::json DaemonCore::handle_status() {
    auto snap = surface_.snapshot();
    auto resp = state_response();

    resp["surface"] = {
        {"visible", snap.visible},
        {"recording", snap.recording},
        {"status", snap.status},
        {"linger", snap.linger_message},
        {"elapsed", snap.elapsed_s},
    };
    if (snap.stream) {
        resp["surface"]["stream"] = {
            {"node", snap.stream->node_name},
            {"sample_rate", snap.stream->sample_rate},
        };
    }
    resp["offline"] = recorder_->offline_recordings().size();
    resp["unsaved"] = recorder_->unpersisted_count();
    resp["pending"] = recorder_->session_pending();
    if (auto& path = recorder_->last_recording_path()) {
        resp["last_recording"] = *path;
    }
    return resp;
}

nlohmann::json DaemonCore::handle_history(const nlohmann::json& cmd) {
    int limit = cmd.value("limit", DEFAULT_HISTORY_LIMIT);
    auto entries = history_db_.recent(limit);

    nlohmann::json resp = {{"status", "ok"}, {"entries", nlohmann::json::array()}};
    for (auto& e : entries) {
        resp["entries"].push_back({
            {"id", e.id},
            {"timestamp", e.timestamp},
            {"path", e.path},
            {"duration_ms", e.duration_ms},
            {"stop_reason", e.stop_reason},
            {"text", e.transcript},
            {"backend", e.backend},
            {"audio_kept", e.audio_kept},
        });
    }
    return resp;
}

nlohmann::json DaemonCore::handle_recover() {
    size_t recovered = recorder_->recover_offline();
    return {
        {"status", "ok"},
        {"recovered", recovered},
        {"unsaved", recorder_->unpersisted_count()},
    };
}

nlohmann::json DaemonCore::handle_subscribe(int client_fd) {
    if (std::ranges::find(subscribers_, client_fd) == subscribers_.end()) {
        subscribers_.push_back(client_fd);
    }
    auto resp = state_response();
    resp["recording"] = recorder_->is_recording();
    return resp;
}

void DaemonCore::handle_wait(int client_fd) {
    uint64_t serial = clients_.contains(client_fd) ? clients_[client_fd] : 0;
    recorder_->wait_for_session_lifecycle([this, client_fd, serial] {
        auto resp = state_response();
        auto& path = recorder_->last_recording_path();
        if (path) resp["path"] = *path;
        if (last_transcript_ && path && last_transcript_path_ == path) {
            resp["text"] = *last_transcript_;
        }
        reply_later(client_fd, serial, resp);
    });
}

void DaemonCore::deliver_transcript(const std::string& text) {
    last_transcript_ = text;
    last_transcript_path_ = recorder_->last_recording_path();
    log(std::format("Transcript ready, {} chars", text.size()));

    auto method = std::exchange(pending_output_method_, config_.output.default_method);
    if (text.empty() || method == "none") return;

    auto output = output_factory_(method);
    if (!output) return;

    auto res = output->deliver(text);
    if (!res) {
        // Surfaced by the recorder as a failed transcription hand-off.
        throw std::runtime_error(std::format("{} delivery failed: {}", method, res.error()));
    }
}

void DaemonCore::broadcast_recording(bool recording) {
    nlohmann::json event = {
        {"event", "recording"},
        {"recording", recording},
        {"state", std::string(to_string(recorder_->state()))},
    };
    for (int fd : subscribers_) {
        if (!ipc_.send_response(fd, event)) {
            log(std::format("subscriber {} not reachable", fd));
        }
    }
}

nlohmann::json DaemonCore::state_response() const {
    return {
        {"status", "ok"},
        {"state", std::string(to_string(recorder_->state()))},
    };
}

void DaemonCore::reply_later(int client_fd, uint64_t serial, const nlohmann::json& response) {
    auto it = clients_.find(client_fd);
    if (it == clients_.end() || it->second != serial) {
        log(std::format("client {} left before its reply", client_fd));
        return;
    }
    ipc_.send_response(client_fd, response);
}

void DaemonCore::shutdown() {
    if (!recorder_) return;
    recorder_->unload();
    if (transcriber_) {
        log("Waiting for pending transcription to complete...");
        transcriber_->join();
    }
}

void DaemonCore::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[tapedeck] {}", msg);
    }
}
