#include "capture_session.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <print>

CaptureSession::CaptureSession(RingBuffer& ring_buf, AudioCapture& capture,
                               RecordingTimer& timer, TaskQueue& tasks, double max_seconds)
    : ring_buf_(ring_buf), capture_(capture), timer_(timer), tasks_(tasks),
      max_seconds_(clamp_duration(max_seconds)) {}

bool CaptureSession::start_recording() {
    if (state_ == CaptureState::Recording) {
        std::println(stderr, "session: already recording, ignoring start");
        return true;
    }

    ring_buf_.reset();
    if (!capture_.start()) {
        std::println(stderr, "session: failed to start audio capture");
        return false;
    }

    auto timeout = std::chrono::milliseconds(static_cast<int64_t>(max_seconds_ * 1000.0));
    if (!timer_.arm(timeout)) {
        std::println(stderr, "session: could not arm the {}s recording limit", max_seconds_);
    }

    record_start_ = std::chrono::steady_clock::now();
    state_ = CaptureState::Recording;
    return true;
}

bool CaptureSession::stop_recording() {
    if (state_ != CaptureState::Recording) {
        return false;
    }

    capture_.stop();
    timer_.disarm();
    state_ = CaptureState::Idle;

    AudioClip clip{
        .samples = ring_buf_.drain_all(),
        .sample_rate = capture_.sample_rate(),
        .started_at = record_start_,
    };

    tasks_.post([this, clip = std::move(clip)]() mutable {
        if (consumer_) {
            consumer_(std::move(clip));
        } else {
            std::println(stderr, "session: no consumer for {} captured samples", clip.samples.size());
        }
    });
    return true;
}

void CaptureSession::set_max_duration(double seconds) {
    max_seconds_ = clamp_duration(seconds);
}

double CaptureSession::recording_duration() const {
    if (state_ != CaptureState::Recording) return 0.0;
    auto now = std::chrono::steady_clock::now();
    return std::chrono::duration<double>(now - record_start_).count();
}

float CaptureSession::level() const {
    if (state_ != CaptureState::Recording) return 0.0f;
    return capture_.level();
}

double CaptureSession::clamp_duration(double seconds) {
    if (!std::isfinite(seconds)) return kDefaultMaxSeconds;
    return std::clamp(seconds, kMinMaxSeconds, kMaxMaxSeconds);
}
