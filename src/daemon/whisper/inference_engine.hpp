#pragma once

#include "acoustic_model.hpp"

#include <cstddef>
#include <expected>
#include <functional>
#include <memory>
#include <mutex>
#include <span>
#include <string>
#include <thread>

// Owns the loaded acoustic model and serializes all access to it.
// whisper.cpp must never be entered from two threads with the same context,
// so transcribe() and the handle swap in load() share one mutex.
class InferenceEngine {
public:
    using Loader = std::function<
        std::expected<std::unique_ptr<AcousticModel>, EngineError>(const std::string& path)>;

    // whisper needs at least one second of 16 kHz audio.
    static constexpr size_t kMinSamples = 16000;

    // Logical cores minus two, clamped to [1, 8].
    static int recommended_threads(unsigned hardware_threads = std::thread::hardware_concurrency());

    explicit InferenceEngine(Loader loader, int n_threads = recommended_threads());
    ~InferenceEngine();

    InferenceEngine(const InferenceEngine&) = delete;
    InferenceEngine& operator=(const InferenceEngine&) = delete;

    // Loads the model at `path` and swaps it in. A transcription running on the
    // previous model finishes before that model is released. On failure the
    // previous model stays loaded.
    std::expected<void, EngineError> load(const std::string& path);
    void unload();

    // Blocks until any other call has finished. Returns an empty string without
    // touching the model when pcm16k is shorter than kMinSamples.
    std::expected<std::string, EngineError> transcribe(std::span<const float> pcm16k);

    bool is_loaded() const;
    std::string model_path() const;
    int n_threads() const { return n_threads_; }

private:
    Loader loader_;
    int n_threads_;

    mutable std::mutex mu_;
    std::unique_ptr<AcousticModel> model_;
    std::string model_path_;
};
