#include <catch2/catch_test_macros.hpp>

#include "manual_dispatcher.hpp"
#include "transcription/chat_post_processor.hpp"
#include "transcription/lan_backend.hpp"
#include "transcription/transcription_coordinator.hpp"
#include "wav_encoder.hpp"

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace {

class FakeBackend : public WhisperBackend {
public:
    std::expected<TranscriptResult, std::string> result = TranscriptResult{"raw text", 1.0, 0.1};
    size_t last_payload_size = 0;

    std::expected<TranscriptResult, std::string> transcribe(std::span<const uint8_t> wav_payload) override {
        last_payload_size = wav_payload.size();
        return result;
    }
    std::string name() const override { return "fake"; }
};

class FakePostProcessor : public PostProcessor {
public:
    std::expected<std::string, std::string> result = std::string("clean text");

    std::expected<std::string, std::string> process(const std::string&) override { return result; }
};

class RecordingFakeStore : public RecordingStore {
public:
    std::vector<std::pair<std::string, std::string>> transcripts;
    std::vector<std::string> discarded;
    bool fail_attach = false;

    std::expected<void, std::string> ensure_directory(const std::string&) override { return {}; }
    std::expected<void, std::string> persist(const RecordingResult&) override { return {}; }
    std::expected<void, std::string> attach_transcript(const std::string& path, const std::string& text,
                                                       const std::string& backend) override {
        if (fail_attach) return std::unexpected("no row");
        transcripts.emplace_back(path, text + "@" + backend);
        return {};
    }
    std::expected<void, std::string> discard_audio(const std::string& path) override {
        discarded.push_back(path);
        return {};
    }
};

TranscriptionRequest make_request(bool post_process = false, bool keep_audio = true) {
    return {
        .payload = std::vector<uint8_t>(100, 0),
        .output_path = "/rec/a.wav",
        .options = {.post_process = post_process, .keep_audio = keep_audio},
    };
}

} // namespace

TEST_CASE("ThreadedTranscriptionCoordinator", "[transcription]") {
    ManualDispatcher dispatcher;
    FakeBackend backend;
    FakePostProcessor post;
    RecordingFakeStore store;

    std::vector<std::string> statuses;
    std::optional<std::expected<std::string, std::string>> outcome;
    auto on_status = [&](const std::string& s) { statuses.push_back(s); };
    auto done = [&](std::expected<std::string, std::string> r) { outcome = std::move(r); };

    auto run_until_done = [&] {
        for (int i = 0; i < 10 && !outcome; ++i) dispatcher.wait_and_run();
    };

    SECTION("DeliversTextAndRecordsIt") {
        ThreadedTranscriptionCoordinator coord(dispatcher, backend, nullptr, store);
        coord.start(make_request(), on_status, done);
        REQUIRE(coord.busy());
        REQUIRE(statuses == std::vector<std::string>{"Transcribing..."});

        run_until_done();
        coord.join();
        REQUIRE(outcome.has_value());
        REQUIRE(outcome->value() == "raw text");
        REQUIRE_FALSE(coord.busy());
        REQUIRE(backend.last_payload_size == 100);
        REQUIRE(store.transcripts.size() == 1);
        REQUIRE(store.transcripts[0].second == "raw text@fake");
        REQUIRE(store.discarded.empty());
    }

    SECTION("PostProcessingReplacesText") {
        ThreadedTranscriptionCoordinator coord(dispatcher, backend, &post, store);
        coord.start(make_request(true), on_status, done);
        run_until_done();
        coord.join();
        dispatcher.run_all();

        REQUIRE(outcome->value() == "clean text");
        REQUIRE(statuses.back() == "Post-processing...");
    }

    SECTION("PostProcessingFailureKeepsRawText") {
        post.result = std::unexpected("model offline");
        ThreadedTranscriptionCoordinator coord(dispatcher, backend, &post, store);
        coord.start(make_request(true), on_status, done);
        run_until_done();
        coord.join();

        REQUIRE(outcome->value() == "raw text");
    }

    SECTION("PostProcessingSkippedWhenNotRequested") {
        ThreadedTranscriptionCoordinator coord(dispatcher, backend, &post, store);
        coord.start(make_request(false), on_status, done);
        run_until_done();
        coord.join();

        REQUIRE(outcome->value() == "raw text");
    }

    SECTION("BackendFailurePropagates") {
        backend.result = std::unexpected("connection refused");
        ThreadedTranscriptionCoordinator coord(dispatcher, backend, nullptr, store);
        coord.start(make_request(), on_status, done);
        run_until_done();
        coord.join();

        REQUIRE_FALSE(outcome->has_value());
        REQUIRE(outcome->error() == "connection refused");
        REQUIRE(store.transcripts.empty());
    }

    SECTION("DiscardsAudioWhenNotKept") {
        ThreadedTranscriptionCoordinator coord(dispatcher, backend, nullptr, store);
        coord.start(make_request(false, false), on_status, done);
        run_until_done();
        coord.join();

        REQUIRE(store.discarded == std::vector<std::string>{"/rec/a.wav"});
    }

    SECTION("AudioKeptWhenTranscriptNotSaved") {
        store.fail_attach = true;
        ThreadedTranscriptionCoordinator coord(dispatcher, backend, nullptr, store);
        coord.start(make_request(false, false), on_status, done);
        run_until_done();
        coord.join();

        REQUIRE(outcome->has_value());
        REQUIRE(store.discarded.empty());
    }

    SECTION("SecondRequestWhileBusyRejected") {
        ThreadedTranscriptionCoordinator coord(dispatcher, backend, nullptr, store);
        coord.start(make_request(), on_status, done);

        std::optional<std::expected<std::string, std::string>> second;
        coord.start(make_request(), {}, [&](std::expected<std::string, std::string> r) { second = std::move(r); });

        run_until_done();
        coord.join();
        dispatcher.run_all();

        REQUIRE(second.has_value());
        REQUIRE_FALSE(second->has_value());
        REQUIRE(outcome->has_value());
    }
}

TEST_CASE("LanBackend", "[transcription]") {

    SECTION("ParseWhisperCppResponse") {
        auto text = LanBackend::parse_response(R"({"text": "  hello world \n"})");
        REQUIRE(text.has_value());
        REQUIRE(*text == "hello world");
    }

    SECTION("ParseOpenAiError") {
        auto text = LanBackend::parse_response(R"({"error": {"message": "bad file"}})");
        REQUIRE_FALSE(text.has_value());
        REQUIRE(text.error() == "server error: bad file");
    }

    SECTION("ParseStringError") {
        auto text = LanBackend::parse_response(R"({"error": "model not loaded"})");
        REQUIRE(text.error() == "server error: model not loaded");
    }

    SECTION("ParseGarbage") {
        REQUIRE_FALSE(LanBackend::parse_response("<html>").has_value());
        REQUIRE_FALSE(LanBackend::parse_response(R"({"other": 1})").has_value());
    }

    SECTION("RejectsNonWavWithoutNetwork") {
        LanBackend backend("http://127.0.0.1:9");
        std::vector<uint8_t> junk(64, 'x');
        auto res = backend.transcribe(junk);
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error() == "payload is not a PCM WAV recording");
    }

    SECTION("RejectsEmptyWav") {
        LanBackend backend("http://127.0.0.1:9");
        std::vector<int16_t> none;
        auto encoded = wav::encode(none, 16000);
        auto res = backend.transcribe(encoded);
        REQUIRE(res.error() == "empty audio");
    }
}

TEST_CASE("ChatPostProcessor", "[transcription]") {
    ChatPostProcessor processor("http://127.0.0.1:9", "small", "Tidy this up.");

    SECTION("RequestBodyCarriesPromptAndTranscript") {
        auto body = nlohmann::json::parse(processor.request_body("um hello"));
        REQUIRE(body["model"] == "small");
        REQUIRE(body["messages"].size() == 2);
        REQUIRE(body["messages"][0]["role"] == "system");
        REQUIRE(body["messages"][0]["content"] == "Tidy this up.");
        REQUIRE(body["messages"][1]["role"] == "user");
        REQUIRE(body["messages"][1]["content"] == "um hello");
    }

    SECTION("ParseCompletion") {
        auto text = ChatPostProcessor::parse_response(
            R"({"choices": [{"message": {"role": "assistant", "content": " Hello. "}}]})");
        REQUIRE(text.has_value());
        REQUIRE(*text == "Hello.");
    }

    SECTION("EmptyCompletionIsError") {
        auto text = ChatPostProcessor::parse_response(R"({"choices": [{"message": {"content": "  "}}]})");
        REQUIRE_FALSE(text.has_value());
    }

    SECTION("ErrorObject") {
        auto text = ChatPostProcessor::parse_response(R"({"error": {"message": "overloaded"}})");
        REQUIRE(text.error() == "server error: overloaded");
    }

    SECTION("EmptyTranscriptPassesThrough") {
        auto text = processor.process("");
        REQUIRE(text.has_value());
        REQUIRE(text->empty());
    }
}
