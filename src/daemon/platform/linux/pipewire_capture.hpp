#pragma once

#include "platform/audio_capture.hpp"
#include "ring_buffer.hpp"

#include <atomic>
#include <cstdint>
#include <pipewire/pipewire.h>
#include <spa/param/audio/format-utils.h>

// Captures mono float32 at whatever rate the PipeWire graph runs at. The rate
// is learned from format negotiation and resampled later.
class PipeWireCapture : public AudioCapture {
public:
    PipeWireCapture(RingBuffer& ring_buf, LimitCallback on_limit);
    ~PipeWireCapture() override;

    PipeWireCapture(const PipeWireCapture&) = delete;
    PipeWireCapture& operator=(const PipeWireCapture&) = delete;

    bool start() override;
    void stop() override;
    bool is_capturing() const override { return capturing_.load(std::memory_order_relaxed); }
    double sample_rate() const override { return rate_.load(std::memory_order_acquire); }
    float level() const override { return level_.load(std::memory_order_relaxed); }

private:
    static void on_process(void* userdata);
    static void on_param_changed(void* userdata, uint32_t id, const spa_pod* param);
    static void on_state_changed(void* userdata, enum pw_stream_state old,
                                 enum pw_stream_state state, const char* error);

    void teardown();

    RingBuffer& ring_buf_;
    LimitCallback on_limit_;

    std::atomic<bool> capturing_{false};
    std::atomic<bool> limit_reported_{false};
    std::atomic<uint32_t> rate_{0};
    std::atomic<float> level_{0.0f};

    pw_thread_loop* loop_ = nullptr;
    pw_stream* stream_ = nullptr;

    static constexpr pw_stream_events stream_events_ = {
        .version = PW_VERSION_STREAM_EVENTS,
        .state_changed = on_state_changed,
        .param_changed = on_param_changed,
        .process = on_process,
    };
};
