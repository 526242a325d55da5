#pragma once

#include "platform/audio_capture.hpp"
#include "platform/ipc_server.hpp"
#include "platform/recording_timer.hpp"
#include "ring_buffer.hpp"
#include "whisper/acoustic_model.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <span>
#include <string>
#include <vector>

// Audio input that produces nothing by itself; tests push samples through feed().
class MockAudioCapture : public AudioCapture {
public:
    explicit MockAudioCapture(RingBuffer& ring, double rate = 48000.0)
        : ring_(ring), rate_(rate) {}

    bool start() override {
        ++starts;
        if (fail_start) return false;
        capturing_ = true;
        return true;
    }
    void stop() override { capturing_ = false; }
    bool is_capturing() const override { return capturing_; }
    double sample_rate() const override { return rate_; }
    float level() const override { return 0.25f; }

    size_t feed(const std::vector<float>& samples) { return ring_.write(samples); }

    bool fail_start = false;
    int starts = 0;

private:
    RingBuffer& ring_;
    double rate_;
    bool capturing_ = false;
};

class MockRecordingTimer : public RecordingTimer {
public:
    bool arm(std::chrono::milliseconds timeout) override {
        armed = true;
        last_timeout = timeout;
        return true;
    }
    void disarm() override { armed = false; }

    bool armed = false;
    std::chrono::milliseconds last_timeout{0};
};

// Acoustic model returning canned text, with hooks to observe calls.
class FakeModel : public AcousticModel {
public:
    explicit FakeModel(std::string text, std::atomic<int>* live = nullptr)
        : text_(std::move(text)), live_(live) {
        if (live_) ++*live_;
    }
    ~FakeModel() override {
        if (on_destroy) on_destroy();
        if (live_) --*live_;
    }

    std::expected<std::string, EngineError>
    transcribe(std::span<const float> pcm16k, int n_threads) override {
        ++calls;
        last_samples = pcm16k.size();
        last_threads = n_threads;
        if (during_transcribe) during_transcribe();
        if (fail) {
            return std::unexpected(EngineError{
                .kind = EngineError::Kind::TranscriptionFailed,
                .code = -7,
                .message = "decoder failure",
            });
        }
        return text_;
    }

    std::function<void()> during_transcribe;
    std::function<void()> on_destroy;
    bool fail = false;
    std::atomic<int> calls{0};
    size_t last_samples = 0;
    int last_threads = 0;

private:
    std::string text_;
    std::atomic<int>* live_;
};

// Records responses instead of writing to sockets.
class RecordingIpcServer : public IpcServer {
public:
    bool start(const std::string&) override { return true; }
    void stop() override {}
    int server_fd() const override { return -1; }
    int accept_client() override { return -1; }
    bool read_commands(int, std::vector<nlohmann::json>&) override { return true; }
    bool send_response(int client_fd, const nlohmann::json& response) override {
        sent.push_back({client_fd, response});
        return true;
    }
    void close_client(int) override {}

    struct Sent {
        int fd;
        nlohmann::json response;
    };
    std::vector<Sent> sent;
};
