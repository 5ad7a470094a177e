#include <catch2/catch_test_macros.hpp>

#include "daemon_core.hpp"
#include "manual_dispatcher.hpp"

#include <cstdlib>
#include <filesystem>
#include <string>
#include <unistd.h>
#include <utility>
#include <vector>

using json = nlohmann::json;

namespace {

// Puts a tenth of a second of tone into the ring whenever capture starts.
class MockAudioCapture : public AudioCapture {
public:
    explicit MockAudioCapture(RingBuffer& ring) : ring_(ring) {}

    bool fail_start = false;

    bool start() override {
        if (fail_start) return false;
        std::vector<int16_t> samples(1600, 1200);
        ring_.write(samples.data(), samples.size() * sizeof(int16_t));
        capturing_ = true;
        return true;
    }
    void stop() override { capturing_ = false; }
    bool is_capturing() const override { return capturing_; }
    void set_interrupt_callback(InterruptCallback cb) override { on_interrupt_ = std::move(cb); }
    std::string node_name() const override { return "mock-mic"; }
    uint32_t sample_rate() const override { return 16000; }

    void interrupt(StopReason reason) {
        capturing_ = false;
        if (on_interrupt_) on_interrupt_(reason, "device removed");
    }

private:
    RingBuffer& ring_;
    bool capturing_ = false;
    InterruptCallback on_interrupt_;
};

class FakeIpcServer : public IpcServer {
public:
    std::vector<std::pair<int, json>> sent;

    bool start(const std::string&) override { return true; }
    void stop() override {}
    int server_fd() const override { return -1; }
    int accept_client() override { return -1; }
    std::optional<std::vector<json>> read_commands(int) override { return std::vector<json>{}; }
    bool send_response(int client_fd, const json& response) override {
        sent.emplace_back(client_fd, response);
        return true;
    }
    void close_client(int) override {}

    std::vector<json> to(int fd) const {
        std::vector<json> out;
        for (auto& [f, j] : sent) {
            if (f == fd) out.push_back(j);
        }
        return out;
    }
};

class FakeBackend : public WhisperBackend {
public:
    std::expected<TranscriptResult, std::string>
    transcribe(std::span<const uint8_t>) override {
        return TranscriptResult{.text = "hello there", .duration_s = 0.1, .processing_s = 0.0};
    }
    std::string name() const override { return "fake"; }
};

struct Delivered {
    std::vector<std::pair<std::string, std::string>> items;
    bool fail = false;
};

class FakeOutput : public OutputMethod {
public:
    FakeOutput(Delivered& log, std::string method) : log_(log), method_(std::move(method)) {}

    std::expected<void, std::string> deliver(const std::string& text) override {
        if (log_.fail) return std::unexpected("wl-copy not found");
        log_.items.emplace_back(method_, text);
        return {};
    }

private:
    Delivered& log_;
    std::string method_;
};

struct TmpDir {
    std::string path = std::filesystem::temp_directory_path() /
                       ("td_test_core_" + std::to_string(getpid()));
    TmpDir() { std::filesystem::create_directories(path); }
    ~TmpDir() { std::filesystem::remove_all(path); }
};

constexpr int CLIENT = 5;
constexpr int OTHER = 6;

struct CoreFixture {
    TmpDir tmp;
    ManualDispatcher dispatcher;
    RingBuffer ring{1 << 20};
    MockAudioCapture audio{ring};
    StatusSurface surface;
    FakeIpcServer ipc;
    Delivered delivered;
    std::unique_ptr<DaemonCore> core;

    explicit CoreFixture(bool auto_transcribe) {
        ::setenv("XDG_DATA_HOME", tmp.path.c_str(), 1);

        Config config;
        config.recorder.recordings_dir = tmp.path + "/rec";
        config.recorder.auto_transcribe = auto_transcribe;

        core = std::make_unique<DaemonCore>(
            config, false, dispatcher, ring, audio, surface, ipc,
            [this](const std::string& method) -> std::unique_ptr<OutputMethod> {
                if (method == "none") return nullptr;
                return std::make_unique<FakeOutput>(delivered, method);
            });
        REQUIRE(core->init(std::make_unique<FakeBackend>()));
        core->add_client(CLIENT);
        core->add_client(OTHER);
    }

    ~CoreFixture() {
        core->shutdown();
        dispatcher.run_all();
        core.reset();
    }

    std::optional<json> send(int fd, json cmd) {
        auto resp = core->handle_command(fd, cmd);
        dispatcher.run_all();
        return resp;
    }

    // Runs loop tasks, including ones posted by the transcription worker,
    // until fd has received count replies.
    void wait_for_replies(int fd, size_t count) {
        for (int i = 0; i < 20 && ipc.to(fd).size() < count; ++i) {
            dispatcher.wait_and_run(std::chrono::milliseconds(500));
        }
    }
};

} // namespace

TEST_CASE("DaemonCore commands", "[daemon]") {
    CoreFixture f(false);

    SECTION("ToggleRepliesOnceSettled") {
        REQUIRE_FALSE(f.core->handle_command(CLIENT, {{"cmd", "toggle"}}).has_value());
        REQUIRE(f.core->recorder().state() == LifecycleState::Starting);
        REQUIRE(f.ipc.sent.empty());

        f.dispatcher.run_all();
        auto replies = f.ipc.to(CLIENT);
        REQUIRE(replies.size() == 1);
        REQUIRE(replies[0]["status"] == "ok");
        REQUIRE(replies[0]["state"] == "recording");

        REQUIRE_FALSE(f.send(CLIENT, {{"cmd", "toggle"}}).has_value());
        replies = f.ipc.to(CLIENT);
        REQUIRE(replies.size() == 2);
        REQUIRE(replies[1]["state"] == "idle");

        auto& path = f.core->recorder().last_recording_path();
        REQUIRE(path.has_value());
        REQUIRE(std::filesystem::exists(*path));
        REQUIRE(std::filesystem::path(*path).parent_path() == f.tmp.path + "/rec");
    }

    SECTION("StartAndStopReportMisuse") {
        auto resp = f.send(CLIENT, {{"cmd", "stop"}});
        REQUIRE(resp.has_value());
        REQUIRE((*resp)["status"] == "error");
        REQUIRE((*resp)["message"] == "not recording");

        REQUIRE_FALSE(f.send(CLIENT, {{"cmd", "start"}}).has_value());
        REQUIRE(f.core->recorder().is_recording());

        resp = f.send(CLIENT, {{"cmd", "start"}});
        REQUIRE((*resp)["message"] == "already recording");

        REQUIRE_FALSE(f.send(CLIENT, {{"cmd", "stop"}}).has_value());
        REQUIRE(f.core->recorder().state() == LifecycleState::Idle);
        REQUIRE(f.ipc.to(CLIENT).size() == 2);
    }

    SECTION("StopWhileStartingIsHonouredAfterStart") {
        REQUIRE_FALSE(f.core->handle_command(CLIENT, {{"cmd", "toggle"}}).has_value());
        REQUIRE(f.core->recorder().state() == LifecycleState::Starting);

        auto resp = f.core->handle_command(OTHER, {{"cmd", "stop"}});
        REQUIRE(resp.has_value());
        REQUIRE((*resp)["state"] == "starting");

        f.dispatcher.run_all();
        REQUIRE(f.core->recorder().state() == LifecycleState::Idle);
        auto replies = f.ipc.to(CLIENT);
        REQUIRE(replies.size() == 1);
        REQUIRE(replies[0]["state"] == "idle");
        REQUIRE(f.core->recorder().last_recording_path().has_value());
    }

    SECTION("StatusDescribesSurfaceAndStream") {
        f.send(CLIENT, {{"cmd", "toggle"}});
        auto resp = f.send(OTHER, {{"cmd", "status"}});
        REQUIRE(resp.has_value());
        REQUIRE((*resp)["state"] == "recording");
        REQUIRE((*resp)["surface"]["visible"] == true);
        REQUIRE((*resp)["surface"]["recording"] == true);
        REQUIRE((*resp)["surface"]["stream"]["node"] == "mock-mic");
        REQUIRE((*resp)["surface"]["stream"]["sample_rate"] == 16000);
        REQUIRE((*resp)["unsaved"] == 0);
        REQUIRE((*resp)["pending"] == true);

        f.send(CLIENT, {{"cmd", "toggle"}});
        resp = f.send(OTHER, {{"cmd", "status"}});
        REQUIRE((*resp)["state"] == "idle");
        REQUIRE((*resp)["offline"] == 1);
        REQUIRE((*resp)["pending"] == false);
        REQUIRE((*resp)["surface"]["linger"].get<std::string>().starts_with("Saved to "));
        REQUIRE((*resp)["last_recording"] == *f.core->recorder().last_recording_path());
    }

    SECTION("HistoryListsSavedRecordings") {
        f.send(CLIENT, {{"cmd", "toggle"}});
        f.send(CLIENT, {{"cmd", "toggle"}});

        auto resp = f.send(OTHER, {{"cmd", "history"}, {"limit", 5}});
        REQUIRE(resp.has_value());
        REQUIRE((*resp)["entries"].size() == 1);
        auto& entry = (*resp)["entries"][0];
        REQUIRE(entry["path"] == *f.core->recorder().last_recording_path());
        REQUIRE(entry["duration_ms"] == 100);
        REQUIRE(entry["stop_reason"] == "manual");
        REQUIRE(entry["audio_kept"] == true);
    }

    SECTION("RecoverWithNothingUnsaved") {
        auto resp = f.send(CLIENT, {{"cmd", "recover"}});
        REQUIRE((*resp)["status"] == "ok");
        REQUIRE((*resp)["recovered"] == 0);
        REQUIRE((*resp)["unsaved"] == 0);
    }

    SECTION("SubscribersSeeRecordingEvents") {
        auto resp = f.send(OTHER, {{"cmd", "subscribe"}});
        REQUIRE((*resp)["recording"] == false);

        f.send(CLIENT, {{"cmd", "toggle"}});
        auto events = f.ipc.to(OTHER);
        REQUIRE_FALSE(events.empty());
        REQUIRE(events.back()["event"] == "recording");
        REQUIRE(events.back()["recording"] == true);

        f.core->remove_client(OTHER);
        size_t before = f.ipc.to(OTHER).size();
        f.send(CLIENT, {{"cmd", "toggle"}});
        REQUIRE(f.ipc.to(OTHER).size() == before);
    }

    SECTION("InterruptedCaptureStillSaves") {
        f.send(OTHER, {{"cmd", "subscribe"}});
        f.send(CLIENT, {{"cmd", "toggle"}});
        f.audio.interrupt(StopReason::BackgroundHidden);
        f.dispatcher.run_all();

        REQUIRE(f.core->recorder().state() == LifecycleState::Idle);
        REQUIRE(f.ipc.to(OTHER).back()["recording"] == false);
        auto resp = f.send(OTHER, {{"cmd", "history"}});
        REQUIRE((*resp)["entries"][0]["stop_reason"] == "background-hidden");
    }

    SECTION("CaptureFailureReportsIdle") {
        f.audio.fail_start = true;
        f.send(CLIENT, {{"cmd", "toggle"}});

        auto replies = f.ipc.to(CLIENT);
        REQUIRE(replies.size() == 1);
        REQUIRE(replies[0]["state"] == "idle");
        REQUIRE(f.surface.snapshot().status.starts_with("Recording error: Failed to start recording"));
    }

    SECTION("DepartedClientGetsNoReply") {
        REQUIRE_FALSE(f.core->handle_command(CLIENT, {{"cmd", "toggle"}}).has_value());
        f.core->remove_client(CLIENT);
        // Same descriptor number, different connection.
        f.core->add_client(CLIENT);
        f.dispatcher.run_all();

        REQUIRE(f.ipc.to(CLIENT).empty());
        REQUIRE(f.core->recorder().is_recording());
    }

    SECTION("WaitRepliesImmediatelyWhenIdle") {
        REQUIRE_FALSE(f.core->handle_command(CLIENT, {{"cmd", "wait"}}).has_value());
        auto replies = f.ipc.to(CLIENT);
        REQUIRE(replies.size() == 1);
        REQUIRE(replies[0]["state"] == "idle");
        REQUIRE_FALSE(replies[0].contains("path"));
    }

    SECTION("UnknownCommand") {
        auto resp = f.send(CLIENT, {{"cmd", "rewind"}});
        REQUIRE((*resp)["status"] == "error");
        REQUIRE((*resp)["message"] == "unknown command");

        resp = f.send(CLIENT, json::object());
        REQUIRE((*resp)["message"] == "unknown command");

        resp = f.send(CLIENT, json::array({1, 2}));
        REQUIRE((*resp)["message"] == "unknown command");
    }

    SECTION("MistypedFieldsAreRejected") {
        auto resp = f.send(CLIENT, {{"cmd", 5}});
        REQUIRE(resp.has_value());
        REQUIRE((*resp)["status"] == "error");
        REQUIRE((*resp)["message"].get<std::string>().starts_with("bad request: "));

        resp = f.send(CLIENT, {{"cmd", "history"}, {"limit", "x"}});
        REQUIRE((*resp)["status"] == "error");

        resp = f.send(CLIENT, {{"cmd", "toggle"}, {"output", 3}});
        REQUIRE((*resp)["status"] == "error");
        REQUIRE(f.core->recorder().state() == LifecycleState::Idle);
        REQUIRE(f.core->recorder().queued_toggles() == 0);

        // Still serving afterwards.
        resp = f.send(CLIENT, {{"cmd", "status"}});
        REQUIRE((*resp)["status"] == "ok");
    }
}

TEST_CASE("DaemonCore transcription hand-off", "[daemon]") {
    CoreFixture f(true);

    SECTION("TranscriptGoesToRequestedOutput") {
        f.send(CLIENT, {{"cmd", "toggle"}, {"output", "type"}});
        REQUIRE_FALSE(f.core->handle_command(CLIENT, {{"cmd", "toggle"}}).has_value());
        REQUIRE_FALSE(f.core->handle_command(OTHER, {{"cmd", "wait"}}).has_value());

        f.wait_for_replies(CLIENT, 2);
        f.wait_for_replies(OTHER, 1);

        REQUIRE(f.delivered.items.size() == 1);
        REQUIRE(f.delivered.items[0].first == "type");
        REQUIRE(f.delivered.items[0].second == "hello there");
        REQUIRE(f.core->last_transcript() == "hello there");

        auto waited = f.ipc.to(OTHER);
        REQUIRE(waited.size() == 1);
        REQUIRE(waited[0]["text"] == "hello there");
        REQUIRE(waited[0]["path"] == *f.core->recorder().last_recording_path());

        auto history = f.send(OTHER, {{"cmd", "history"}});
        REQUIRE((*history)["entries"][0]["text"] == "hello there");
        REQUIRE((*history)["entries"][0]["backend"] == "fake");
    }

    SECTION("OutputMethodResetsAfterEachTranscript") {
        f.send(CLIENT, {{"cmd", "toggle"}, {"output", "none"}});
        f.core->handle_command(CLIENT, {{"cmd", "toggle"}});
        f.wait_for_replies(CLIENT, 2);
        REQUIRE(f.delivered.items.empty());
        REQUIRE(f.core->last_transcript() == "hello there");

        f.send(CLIENT, {{"cmd", "toggle"}});
        f.core->handle_command(CLIENT, {{"cmd", "toggle"}});
        f.wait_for_replies(CLIENT, 4);
        REQUIRE(f.delivered.items.size() == 1);
        REQUIRE(f.delivered.items[0].first == "clipboard");
    }

    SECTION("DeliveryFailureShownOnSurface") {
        f.delivered.fail = true;
        f.send(CLIENT, {{"cmd", "toggle"}});
        f.core->handle_command(CLIENT, {{"cmd", "toggle"}});
        f.wait_for_replies(CLIENT, 2);

        auto snap = f.surface.snapshot();
        REQUIRE(snap.linger_message == "Transcription failed");
        REQUIRE(f.core->recorder().state() == LifecycleState::Idle);
    }
}
