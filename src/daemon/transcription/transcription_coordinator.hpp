#pragma once

#include "dispatcher.hpp"
#include "storage/recording_store.hpp"
#include "transcription/backend.hpp"

#include <atomic>
#include <cstdint>
#include <expected>
#include <functional>
#include <string>
#include <thread>
#include <vector>

struct TranscriptionOptions {
    bool post_process = false;
    bool keep_audio = true;
};

struct TranscriptionRequest {
    std::vector<uint8_t> payload;
    std::string output_path;
    TranscriptionOptions options;
};

// Turns a finished recording into text. Callbacks run on the loop thread.
class TranscriptionCoordinator {
public:
    using StatusCallback = std::function<void(const std::string&)>;
    using DoneCallback = std::function<void(std::expected<std::string, std::string>)>;

    virtual ~TranscriptionCoordinator() = default;
    virtual void start(TranscriptionRequest request, StatusCallback on_status, DoneCallback done) = 0;
    virtual bool busy() const = 0;
};

// Runs the backend (and the optional post-processor) on a worker thread and
// records the result in the store once it lands back on the loop thread.
class ThreadedTranscriptionCoordinator : public TranscriptionCoordinator {
public:
    ThreadedTranscriptionCoordinator(Dispatcher& dispatcher, WhisperBackend& backend,
                                     PostProcessor* post_processor, RecordingStore& store);
    ~ThreadedTranscriptionCoordinator() override;

    ThreadedTranscriptionCoordinator(const ThreadedTranscriptionCoordinator&) = delete;
    ThreadedTranscriptionCoordinator& operator=(const ThreadedTranscriptionCoordinator&) = delete;

    void start(TranscriptionRequest request, StatusCallback on_status, DoneCallback done) override;
    bool busy() const override { return busy_; }

    // Blocks until the worker thread has exited. Used on shutdown.
    void join();

private:
    struct WorkerResult {
        std::expected<TranscriptResult, std::string> result;
        std::string post_processing_error;
    };

    WorkerResult run_worker(const TranscriptionRequest& request, const StatusCallback& on_status);
    void finish(const TranscriptionRequest& request, WorkerResult worker, const DoneCallback& done);

    Dispatcher& dispatcher_;
    WhisperBackend& backend_;
    PostProcessor* post_processor_;
    RecordingStore& store_;

    bool busy_ = false;
    std::jthread worker_;
};
