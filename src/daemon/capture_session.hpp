#pragma once

#include "platform/audio_capture.hpp"
#include "platform/recording_timer.hpp"
#include "ring_buffer.hpp"
#include "task_queue.hpp"

#include <chrono>
#include <functional>
#include <vector>

enum class CaptureState { Idle, Recording };

// One recording: the samples exactly as the device produced them.
struct AudioClip {
    std::vector<float> samples;
    double sample_rate = 0.0;
    std::chrono::steady_clock::time_point started_at;
};

class CaptureSession {
public:
    using ClipConsumer = std::function<void(AudioClip clip)>;

    static constexpr double kDefaultMaxSeconds = 60.0;
    static constexpr double kMinMaxSeconds = 1.0;
    static constexpr double kMaxMaxSeconds = 300.0;

    CaptureSession(RingBuffer& ring_buf, AudioCapture& capture, RecordingTimer& timer,
                   TaskQueue& tasks, double max_seconds = kDefaultMaxSeconds);

    CaptureSession(const CaptureSession&) = delete;
    CaptureSession& operator=(const CaptureSession&) = delete;

    void set_consumer(ClipConsumer consumer) { consumer_ = std::move(consumer); }

    // No-op returning true when already recording. False if the audio input
    // could not be opened; the session stays idle.
    bool start_recording();

    // No-op returning false when idle. Otherwise closes the input and posts
    // the captured clip (possibly empty) to the consumer through the task
    // queue, exactly once.
    bool stop_recording();

    void set_max_duration(double seconds);
    double max_duration() const { return max_seconds_; }

    CaptureState state() const { return state_; }
    double recording_duration() const;
    float level() const;

    static double clamp_duration(double seconds);

private:
    RingBuffer& ring_buf_;
    AudioCapture& capture_;
    RecordingTimer& timer_;
    TaskQueue& tasks_;
    double max_seconds_;

    ClipConsumer consumer_;
    CaptureState state_ = CaptureState::Idle;
    std::chrono::steady_clock::time_point record_start_;
};
