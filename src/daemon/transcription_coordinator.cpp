#include "transcription_coordinator.hpp"

#include "resampler.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <print>

namespace {

double seconds_since(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
}

} // namespace

TranscriptionCoordinator::TranscriptionCoordinator(InferenceEngine& engine, TaskQueue& tasks)
    : engine_(engine), tasks_(tasks) {}

TranscriptionCoordinator::~TranscriptionCoordinator() {
    join();
}

bool TranscriptionCoordinator::submit(AudioClip clip) {
    auto expected = CoordinatorState::Ready;
    if (!state_.compare_exchange_strong(expected, CoordinatorState::Validating,
                                        std::memory_order_acq_rel)) {
        std::println(stderr, "coordinator: transcription in flight, ignoring {} samples",
                     clip.samples.size());
        return false;
    }

    if (auto placeholder = validate(clip.samples, clip.sample_rate)) {
        std::println(stderr, "coordinator: rejected {} samples at {}Hz: {}",
                     clip.samples.size(), clip.sample_rate, *placeholder);
        TranscriptionOutcome outcome{
            .text = std::string(*placeholder),
            .duration_s = seconds_since(clip.started_at),
            .ok = false,
        };
        tasks_.post([this, outcome = std::move(outcome)] { finish(outcome); });
        return true;
    }

    // The previous worker already posted its outcome; it is at most unwinding.
    join();

    state_.store(CoordinatorState::Resampling, std::memory_order_release);
    worker_ = std::jthread([this, clip = std::move(clip)]() mutable {
        run(std::move(clip));
    });
    return true;
}

void TranscriptionCoordinator::join() {
    if (worker_.joinable()) {
        worker_.join();
    }
}

std::optional<std::string_view>
TranscriptionCoordinator::validate(std::span<const float> samples, double sample_rate) {
    if (samples.empty()) return kNoAudioPlaceholder;
    if (samples.size() >= kMaxSamples) return kTooLongPlaceholder;

    float peak = 0.0f;
    for (float s : samples) {
        peak = std::max(peak, std::abs(s));
    }
    if (!(peak > kSilenceThreshold)) return kTooQuietPlaceholder;

    if (!std::isfinite(sample_rate) || sample_rate <= 0.0) return kBadRatePlaceholder;
    return std::nullopt;
}

void TranscriptionCoordinator::run(AudioClip clip) {
    auto pcm = resample::to_16k(clip.samples, clip.sample_rate);
    clip.samples = {};

    state_.store(CoordinatorState::Transcribing, std::memory_order_release);
    auto result = engine_.transcribe(pcm);

    TranscriptionOutcome outcome{
        .duration_s = seconds_since(clip.started_at),
        .sample_rate = resample::kTargetRate,
    };

    if (result) {
        outcome.text = std::move(*result);
        outcome.ok = true;
    } else if (result.error().kind == EngineError::Kind::NotLoaded) {
        outcome.text = kModelNotLoadedPlaceholder;
    } else {
        outcome.text = kEngineFailedPlaceholder;
    }

    tasks_.post([this, outcome = std::move(outcome)] { finish(outcome); });
}

void TranscriptionCoordinator::finish(const TranscriptionOutcome& outcome) {
    if (consumer_) {
        consumer_(outcome);
    }
    state_.store(CoordinatorState::Ready, std::memory_order_release);
}
