#include "transcription/transcription_coordinator.hpp"

#include <print>

ThreadedTranscriptionCoordinator::ThreadedTranscriptionCoordinator(
    Dispatcher& dispatcher, WhisperBackend& backend,
    PostProcessor* post_processor, RecordingStore& store)
    : dispatcher_(dispatcher), backend_(backend),
      post_processor_(post_processor), store_(store) {}

ThreadedTranscriptionCoordinator::~ThreadedTranscriptionCoordinator() {
    join();
}

void ThreadedTranscriptionCoordinator::join() {
    if (worker_.joinable()) {
        worker_.join();
    }
}

void ThreadedTranscriptionCoordinator::start(TranscriptionRequest request,
                                             StatusCallback on_status, DoneCallback done) {
    if (busy_) {
        dispatcher_.post([done = std::move(done)] {
            if (done) done(std::unexpected("a transcription is already running"));
        });
        return;
    }

    busy_ = true;
    if (on_status) on_status("Transcribing...");

    // The previous worker already posted its result; joining is immediate.
    join();
    worker_ = std::jthread([this, request = std::move(request), on_status = std::move(on_status),
                            done = std::move(done)](std::stop_token) mutable {
        auto worker = run_worker(request, on_status);
        dispatcher_.post([this, request = std::move(request), worker = std::move(worker),
                          done = std::move(done)]() mutable {
            finish(request, std::move(worker), done);
        });
    });
}

ThreadedTranscriptionCoordinator::WorkerResult
ThreadedTranscriptionCoordinator::run_worker(const TranscriptionRequest& request,
                                             const StatusCallback& on_status) {
    WorkerResult worker{.result = backend_.transcribe(request.payload), .post_processing_error = {}};
    if (!worker.result || !request.options.post_process || !post_processor_) {
        return worker;
    }

    if (on_status) {
        dispatcher_.post([on_status] { on_status("Post-processing..."); });
    }

    auto processed = post_processor_->process(worker.result->text);
    if (processed) {
        worker.result->text = std::move(*processed);
    } else {
        worker.post_processing_error = processed.error();
    }
    return worker;
}

void ThreadedTranscriptionCoordinator::finish(const TranscriptionRequest& request,
                                              WorkerResult worker, const DoneCallback& done) {
    busy_ = false;

    if (!worker.result) {
        if (done) done(std::unexpected(worker.result.error()));
        return;
    }

    auto& transcript = worker.result.value();
    if (!worker.post_processing_error.empty()) {
        std::println(stderr, "transcription: post-processing failed, keeping raw text: {}",
                     worker.post_processing_error);
    }

    auto attached = store_.attach_transcript(request.output_path, transcript.text, backend_.name());
    if (!attached) {
        std::println(stderr, "transcription: transcript for {} not saved: {}",
                     request.output_path, attached.error());
    } else if (!request.options.keep_audio) {
        auto discarded = store_.discard_audio(request.output_path);
        if (!discarded) {
            std::println(stderr, "transcription: {}", discarded.error());
        }
    }

    if (done) done(std::move(transcript.text));
}
