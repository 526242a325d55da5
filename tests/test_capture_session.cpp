#include <catch2/catch_test_macros.hpp>

#include "capture_session.hpp"
#include "ring_buffer.hpp"
#include "task_queue.hpp"
#include "test_mocks.hpp"

#include <limits>
#include <optional>
#include <vector>

TEST_CASE("CaptureSession state machine", "[session]") {
    RingBuffer ring(1024);
    MockAudioCapture capture(ring, 44100.0);
    MockRecordingTimer timer;
    TaskQueue tasks;
    CaptureSession session(ring, capture, timer, tasks);

    std::vector<AudioClip> delivered;
    session.set_consumer([&delivered](AudioClip clip) { delivered.push_back(std::move(clip)); });

    SECTION("InitialStateIdle") {
        REQUIRE(session.state() == CaptureState::Idle);
        REQUIRE(session.recording_duration() == 0.0);
        REQUIRE(session.level() == 0.0f);
        REQUIRE(session.max_duration() == 60.0);
    }

    SECTION("StartArmsTimer") {
        REQUIRE(session.start_recording());
        REQUIRE(session.state() == CaptureState::Recording);
        REQUIRE(capture.is_capturing());
        REQUIRE(timer.armed);
        REQUIRE(timer.last_timeout == std::chrono::milliseconds(60000));
        REQUIRE(session.level() == 0.25f);
    }

    SECTION("StartWhileRecordingIsNoop") {
        REQUIRE(session.start_recording());
        REQUIRE(session.start_recording());
        REQUIRE(capture.starts == 1);
    }

    SECTION("StartFailureStaysIdle") {
        capture.fail_start = true;
        REQUIRE_FALSE(session.start_recording());
        REQUIRE(session.state() == CaptureState::Idle);
        REQUIRE_FALSE(timer.armed);
    }

    SECTION("StopWhenIdleDeliversNothing") {
        REQUIRE_FALSE(session.stop_recording());
        tasks.run_pending();
        REQUIRE(delivered.empty());
    }

    SECTION("StopDeliversClipOnce") {
        REQUIRE(session.start_recording());
        capture.feed({0.1f, 0.2f, 0.3f});

        REQUIRE(session.stop_recording());
        REQUIRE(session.state() == CaptureState::Idle);
        REQUIRE_FALSE(capture.is_capturing());
        REQUIRE_FALSE(timer.armed);

        // Delivery goes through the task queue, never inline.
        REQUIRE(delivered.empty());
        REQUIRE(tasks.run_pending() == 1);
        REQUIRE(delivered.size() == 1);
        REQUIRE(delivered[0].samples == std::vector<float>{0.1f, 0.2f, 0.3f});
        REQUIRE(delivered[0].sample_rate == 44100.0);

        REQUIRE_FALSE(session.stop_recording());
        REQUIRE(tasks.run_pending() == 0);
        REQUIRE(delivered.size() == 1);
    }

    SECTION("EmptyRecordingStillDelivers") {
        REQUIRE(session.start_recording());
        REQUIRE(session.stop_recording());
        tasks.run_pending();
        REQUIRE(delivered.size() == 1);
        REQUIRE(delivered[0].samples.empty());
    }

    SECTION("RestartDiscardsOldSamples") {
        REQUIRE(session.start_recording());
        capture.feed({0.9f, 0.9f});
        REQUIRE(session.stop_recording());
        tasks.run_pending();

        capture.feed({0.5f});
        REQUIRE(session.start_recording());
        capture.feed({0.1f});
        REQUIRE(session.stop_recording());
        tasks.run_pending();

        REQUIRE(delivered.size() == 2);
        REQUIRE(delivered[1].samples == std::vector<float>{0.1f});
    }

    SECTION("RecordingDurationAdvances") {
        REQUIRE(session.start_recording());
        REQUIRE(session.recording_duration() >= 0.0);
        REQUIRE(session.recording_duration() < 5.0);
    }
}

TEST_CASE("CaptureSession max duration", "[session]") {
    RingBuffer ring(16);
    MockAudioCapture capture(ring);
    MockRecordingTimer timer;
    TaskQueue tasks;

    SECTION("ClampedToRange") {
        REQUIRE(CaptureSession::clamp_duration(0.0) == 1.0);
        REQUIRE(CaptureSession::clamp_duration(-5.0) == 1.0);
        REQUIRE(CaptureSession::clamp_duration(45.0) == 45.0);
        REQUIRE(CaptureSession::clamp_duration(301.0) == 300.0);
        REQUIRE(CaptureSession::clamp_duration(std::numeric_limits<double>::quiet_NaN()) == 60.0);
    }

    SECTION("ConstructorClamps") {
        CaptureSession session(ring, capture, timer, tasks, 1000.0);
        REQUIRE(session.max_duration() == 300.0);
    }

    SECTION("SetterDrivesTimer") {
        CaptureSession session(ring, capture, timer, tasks);
        session.set_max_duration(2.5);
        REQUIRE(session.max_duration() == 2.5);

        REQUIRE(session.start_recording());
        REQUIRE(timer.last_timeout == std::chrono::milliseconds(2500));
    }
}
