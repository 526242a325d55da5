#include "platform/linux/pipewire_capture.hpp"

#include <cmath>
#include <print>
#include <span>
#include <spa/param/audio/format-utils.h>
#include <spa/utils/result.h>

PipeWireCapture::PipeWireCapture(RingBuffer& ring_buf, LimitCallback on_limit)
    : ring_buf_(ring_buf), on_limit_(std::move(on_limit)) {
    pw_init(nullptr, nullptr);
}

PipeWireCapture::~PipeWireCapture() {
    stop();
    pw_deinit();
}

bool PipeWireCapture::start() {
    if (capturing_.load(std::memory_order_relaxed)) return true;

    loop_ = pw_thread_loop_new("quickscribe", nullptr);
    if (!loop_) {
        std::println(stderr, "audio: failed to create thread loop");
        return false;
    }

    auto* props = pw_properties_new(
        PW_KEY_MEDIA_TYPE, "Audio",
        PW_KEY_MEDIA_CATEGORY, "Capture",
        PW_KEY_MEDIA_ROLE, "Communication",
        PW_KEY_NODE_NAME, "quickscribe",
        PW_KEY_APP_NAME, "quickscribe",
        nullptr
    );

    stream_ = pw_stream_new_simple(
        pw_thread_loop_get_loop(loop_),
        "quickscribe-capture",
        props,
        &stream_events_,
        this
    );

    if (!stream_) {
        std::println(stderr, "audio: failed to create stream");
        teardown();
        return false;
    }

    // F32 mono; rate left open so the device runs at its native rate.
    uint8_t buf[1024];
    spa_pod_builder b = SPA_POD_BUILDER_INIT(buf, sizeof(buf));
    auto info = SPA_AUDIO_INFO_RAW_INIT(
        .format = SPA_AUDIO_FORMAT_F32,
        .channels = 1
    );
    const spa_pod* params[1];
    params[0] = spa_format_audio_raw_build(&b, SPA_PARAM_EnumFormat, &info);

    ring_buf_.reset();
    rate_.store(0, std::memory_order_relaxed);
    level_.store(0.0f, std::memory_order_relaxed);
    limit_reported_.store(false, std::memory_order_relaxed);
    capturing_.store(true, std::memory_order_release);

    int ret = pw_stream_connect(
        stream_,
        PW_DIRECTION_INPUT,
        PW_ID_ANY,
        static_cast<pw_stream_flags>(
            PW_STREAM_FLAG_AUTOCONNECT | PW_STREAM_FLAG_MAP_BUFFERS | PW_STREAM_FLAG_RT_PROCESS
        ),
        params, 1
    );

    if (ret < 0) {
        std::println(stderr, "audio: stream connect failed: {}", spa_strerror(ret));
        capturing_.store(false, std::memory_order_release);
        teardown();
        return false;
    }

    ret = pw_thread_loop_start(loop_);
    if (ret < 0) {
        std::println(stderr, "audio: thread loop start failed: {}", spa_strerror(ret));
        capturing_.store(false, std::memory_order_release);
        teardown();
        return false;
    }

    return true;
}

void PipeWireCapture::stop() {
    if (!capturing_.load(std::memory_order_relaxed)) return;

    capturing_.store(false, std::memory_order_release);
    teardown();
    level_.store(0.0f, std::memory_order_relaxed);
}

void PipeWireCapture::teardown() {
    if (loop_) {
        pw_thread_loop_stop(loop_);
    }
    if (stream_) {
        pw_stream_destroy(stream_);
        stream_ = nullptr;
    }
    if (loop_) {
        pw_thread_loop_destroy(loop_);
        loop_ = nullptr;
    }
}

void PipeWireCapture::on_process(void* userdata) {
    auto* self = static_cast<PipeWireCapture*>(userdata);

    auto* buf = pw_stream_dequeue_buffer(self->stream_);
    if (!buf) return;

    auto* d = &buf->buffer->datas[0];
    if (!d->data || !self->capturing_.load(std::memory_order_relaxed)) {
        pw_stream_queue_buffer(self->stream_, buf);
        return;
    }

    auto* bytes = static_cast<const uint8_t*>(d->data) + d->chunk->offset;
    std::span<const float> frame(reinterpret_cast<const float*>(bytes),
                                 d->chunk->size / sizeof(float));

    if (!frame.empty()) {
        float sum = 0.0f;
        for (float s : frame) sum += std::fabs(s);
        self->level_.store(sum / static_cast<float>(frame.size()), std::memory_order_relaxed);
    }

    size_t written = self->ring_buf_.write(frame);
    if (written < frame.size() && !self->limit_reported_.exchange(true)) {
        if (self->on_limit_) self->on_limit_();
    }

    pw_stream_queue_buffer(self->stream_, buf);
}

void PipeWireCapture::on_param_changed(void* userdata, uint32_t id, const spa_pod* param) {
    auto* self = static_cast<PipeWireCapture*>(userdata);
    if (!param || id != SPA_PARAM_Format) return;

    spa_audio_info_raw info{};
    if (spa_format_audio_raw_parse(param, &info) < 0) {
        std::println(stderr, "audio: could not parse negotiated format");
        return;
    }
    if (info.channels != 1) {
        std::println(stderr, "audio: negotiated {} channels, expected mono", info.channels);
    }
    self->rate_.store(info.rate, std::memory_order_release);
}

void PipeWireCapture::on_state_changed(void* /*userdata*/, enum pw_stream_state old,
                                       enum pw_stream_state state, const char* error) {
    if (error) {
        std::println(stderr, "audio: stream state {} -> {}: {}",
                     pw_stream_state_as_string(old),
                     pw_stream_state_as_string(state),
                     error);
    }
}
