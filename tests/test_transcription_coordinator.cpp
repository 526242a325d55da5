#include <catch2/catch_test_macros.hpp>

#include "capture_session.hpp"
#include "task_queue.hpp"
#include "test_mocks.hpp"
#include "transcription_coordinator.hpp"
#include "whisper/inference_engine.hpp"

#include <atomic>
#include <chrono>
#include <cmath>
#include <memory>
#include <numbers>
#include <string>
#include <thread>
#include <vector>

namespace {

using namespace std::chrono_literals;
using LoadResult = std::expected<std::unique_ptr<AcousticModel>, EngineError>;

AudioClip make_clip(std::vector<float> samples, double rate,
                    std::chrono::milliseconds age = 0ms) {
    return AudioClip{
        .samples = std::move(samples),
        .sample_rate = rate,
        .started_at = std::chrono::steady_clock::now() - age,
    };
}

std::vector<float> sine(double seconds, double rate, float amplitude) {
    std::vector<float> out(static_cast<size_t>(seconds * rate));
    for (size_t i = 0; i < out.size(); ++i) {
        out[i] = amplitude * static_cast<float>(
            std::sin(2.0 * std::numbers::pi * 440.0 * static_cast<double>(i) / rate));
    }
    return out;
}

// Runs queued work until the coordinator has delivered.
void settle(TranscriptionCoordinator& coordinator, TaskQueue& tasks) {
    for (int i = 0; i < 100 && !coordinator.is_ready(); ++i) {
        coordinator.join();
        tasks.run_pending();
    }
}

} // namespace

TEST_CASE("Clip validation", "[coordinator]") {
    using C = TranscriptionCoordinator;

    SECTION("EmptyIsNoAudio") {
        REQUIRE(C::validate({}, 48000.0) == C::kNoAudioPlaceholder);
    }

    SECTION("LengthBoundary") {
        std::vector<float> samples(C::kMaxSamples, 0.5f);
        REQUIRE(C::validate(samples, 48000.0) == C::kTooLongPlaceholder);

        samples.pop_back();
        REQUIRE_FALSE(C::validate(samples, 48000.0).has_value());
    }

    SECTION("SilenceBoundary") {
        std::vector<float> zeros(48000, 0.0f);
        REQUIRE(C::validate(zeros, 48000.0) == C::kTooQuietPlaceholder);

        std::vector<float> at_threshold(100, 0.0001f);
        REQUIRE(C::validate(at_threshold, 48000.0) == C::kTooQuietPlaceholder);

        std::vector<float> just_above(100, 0.0f);
        just_above[50] = -0.0002f;
        REQUIRE_FALSE(C::validate(just_above, 48000.0).has_value());
    }

    SECTION("BadSampleRate") {
        std::vector<float> loud(100, 0.5f);
        REQUIRE(C::validate(loud, 0.0) == C::kBadRatePlaceholder);
        REQUIRE(C::validate(loud, -44100.0) == C::kBadRatePlaceholder);
        REQUIRE(C::validate(loud, std::nan("")) == C::kBadRatePlaceholder);
    }
}

TEST_CASE("TranscriptionCoordinator", "[coordinator]") {
    TaskQueue tasks;
    FakeModel* model = nullptr;
    InferenceEngine engine([&model](const std::string&) -> LoadResult {
        auto m = std::make_unique<FakeModel>("hello world");
        model = m.get();
        return std::unique_ptr<AcousticModel>(std::move(m));
    }, 2);
    REQUIRE(engine.load("fake.bin").has_value());

    TranscriptionCoordinator coordinator(engine, tasks);
    std::vector<TranscriptionOutcome> outcomes;
    coordinator.set_consumer([&outcomes](const TranscriptionOutcome& o) { outcomes.push_back(o); });

    SECTION("SpokenSineIsTranscribed") {
        REQUIRE(coordinator.submit(make_clip(sine(2.0, 44100.0, 0.5f), 44100.0, 2000ms)));
        settle(coordinator, tasks);

        REQUIRE(coordinator.is_ready());
        REQUIRE(outcomes.size() == 1);
        REQUIRE(outcomes[0].ok);
        REQUIRE(outcomes[0].text == "hello world");
        REQUIRE(outcomes[0].sample_rate == 16000.0);
        REQUIRE(outcomes[0].duration_s >= 2.0);
        REQUIRE(outcomes[0].duration_s < 10.0);

        REQUIRE(model->calls == 1);
        REQUIRE(model->last_samples == 32000);
    }

    SECTION("SilenceNeverReachesEngine") {
        REQUIRE(coordinator.submit(make_clip(std::vector<float>(24000, 0.0f), 48000.0, 500ms)));

        // The placeholder is delivered on the daemon thread, not inline.
        REQUIRE(outcomes.empty());
        tasks.run_pending();

        REQUIRE(outcomes.size() == 1);
        REQUIRE_FALSE(outcomes[0].ok);
        REQUIRE(outcomes[0].text == TranscriptionCoordinator::kTooQuietPlaceholder);
        REQUIRE(outcomes[0].duration_s >= 0.5);
        REQUIRE(model->calls == 0);
        REQUIRE(coordinator.is_ready());
    }

    SECTION("EmptyClip") {
        REQUIRE(coordinator.submit(make_clip({}, 48000.0)));
        settle(coordinator, tasks);
        REQUIRE(outcomes.size() == 1);
        REQUIRE(outcomes[0].text == TranscriptionCoordinator::kNoAudioPlaceholder);
    }

    SECTION("ShortSpeechIsEmptySuccess") {
        REQUIRE(coordinator.submit(make_clip(sine(0.5, 16000.0, 0.5f), 16000.0)));
        settle(coordinator, tasks);

        REQUIRE(outcomes.size() == 1);
        REQUIRE(outcomes[0].ok);
        REQUIRE(outcomes[0].text.empty());
        REQUIRE(model->calls == 0);
    }

    SECTION("EngineFailureBecomesPlaceholder") {
        model->fail = true;
        REQUIRE(coordinator.submit(make_clip(sine(1.5, 16000.0, 0.5f), 16000.0)));
        settle(coordinator, tasks);

        REQUIRE(outcomes.size() == 1);
        REQUIRE_FALSE(outcomes[0].ok);
        REQUIRE(outcomes[0].text == TranscriptionCoordinator::kEngineFailedPlaceholder);
    }

    SECTION("UnloadedModelPlaceholder") {
        engine.unload();
        REQUIRE(coordinator.submit(make_clip(sine(1.5, 16000.0, 0.5f), 16000.0)));
        settle(coordinator, tasks);

        REQUIRE(outcomes.size() == 1);
        REQUIRE_FALSE(outcomes[0].ok);
        REQUIRE(outcomes[0].text == TranscriptionCoordinator::kModelNotLoadedPlaceholder);
    }

    SECTION("SecondClipIgnoredWhileTranscribing") {
        std::atomic<bool> in_call{false};
        std::atomic<bool> release{false};
        model->during_transcribe = [&]() {
            in_call = true;
            while (!release) std::this_thread::sleep_for(1ms);
        };

        REQUIRE(coordinator.submit(make_clip(sine(1.5, 16000.0, 0.5f), 16000.0)));
        while (!in_call) std::this_thread::sleep_for(1ms);
        REQUIRE(coordinator.state() == CoordinatorState::Transcribing);

        REQUIRE_FALSE(coordinator.submit(make_clip(sine(1.5, 16000.0, 0.5f), 16000.0)));

        release = true;
        settle(coordinator, tasks);

        REQUIRE(outcomes.size() == 1);
        REQUIRE(model->calls == 1);
        REQUIRE(coordinator.is_ready());
    }

    SECTION("SecondClipIgnoredWhilePlaceholderPending") {
        REQUIRE(coordinator.submit(make_clip({}, 48000.0)));
        REQUIRE(coordinator.state() == CoordinatorState::Validating);
        REQUIRE_FALSE(coordinator.submit(make_clip(sine(1.5, 16000.0, 0.5f), 16000.0)));

        tasks.run_pending();
        REQUIRE(outcomes.size() == 1);
        REQUIRE(coordinator.is_ready());
    }

    SECTION("BackToBackCycles") {
        for (int i = 0; i < 3; ++i) {
            REQUIRE(coordinator.submit(make_clip(sine(1.5, 48000.0, 0.3f), 48000.0)));
            settle(coordinator, tasks);
        }
        REQUIRE(outcomes.size() == 3);
        REQUIRE(model->calls == 3);
    }
}
