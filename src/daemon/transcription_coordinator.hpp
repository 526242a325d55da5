#pragma once

#include "capture_session.hpp"
#include "task_queue.hpp"
#include "whisper/inference_engine.hpp"

#include <atomic>
#include <cstddef>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <thread>

enum class CoordinatorState { Ready, Validating, Resampling, Transcribing };

struct TranscriptionOutcome {
    std::string text;          // transcription, or a placeholder when !ok
    double duration_s = 0.0;   // recording start to transcription completion
    double sample_rate = 16000.0;
    bool ok = false;           // true when the engine produced `text`
};

// Runs one capture -> resample -> transcribe cycle at a time. The coordinator
// itself rejects overlapping clips; it does not rely on callers to.
class TranscriptionCoordinator {
public:
    using OutcomeConsumer = std::function<void(const TranscriptionOutcome&)>;

    static constexpr size_t kMaxSamples = 10'000'000;
    static constexpr float kSilenceThreshold = 0.0001f;

    static constexpr std::string_view kNoAudioPlaceholder = "No audio detected";
    static constexpr std::string_view kTooLongPlaceholder = "Recording too long (max 3 minutes)";
    static constexpr std::string_view kTooQuietPlaceholder = "Audio too quiet - try speaking louder";
    static constexpr std::string_view kBadRatePlaceholder = "Invalid audio sample rate";
    static constexpr std::string_view kModelNotLoadedPlaceholder = "Transcription failed: Model not loaded";
    static constexpr std::string_view kEngineFailedPlaceholder = "Transcription failed";

    TranscriptionCoordinator(InferenceEngine& engine, TaskQueue& tasks);
    ~TranscriptionCoordinator();

    TranscriptionCoordinator(const TranscriptionCoordinator&) = delete;
    TranscriptionCoordinator& operator=(const TranscriptionCoordinator&) = delete;

    void set_consumer(OutcomeConsumer consumer) { consumer_ = std::move(consumer); }

    // Daemon thread only. Returns false, without delivering anything, when a
    // cycle is already in flight. Otherwise exactly one outcome is delivered
    // later through the task queue.
    bool submit(AudioClip clip);

    CoordinatorState state() const { return state_.load(std::memory_order_acquire); }
    bool is_ready() const { return state() == CoordinatorState::Ready; }

    // Blocks until the worker thread has exited. Its outcome, if any, is
    // still waiting in the task queue afterwards.
    void join();

    // Placeholder text when the clip must not reach the engine.
    static std::optional<std::string_view> validate(std::span<const float> samples,
                                                    double sample_rate);

private:
    void run(AudioClip clip);
    void finish(const TranscriptionOutcome& outcome);

    InferenceEngine& engine_;
    TaskQueue& tasks_;
    OutcomeConsumer consumer_;

    std::atomic<CoordinatorState> state_{CoordinatorState::Ready};
    std::jthread worker_;
};
