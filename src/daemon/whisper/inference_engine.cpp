#include "inference_engine.hpp"

#include <algorithm>
#include <print>
#include <utility>

InferenceEngine::InferenceEngine(Loader loader, int n_threads)
    : loader_(std::move(loader)), n_threads_(std::max(1, n_threads)) {}

InferenceEngine::~InferenceEngine() {
    unload();
}

std::expected<void, EngineError> InferenceEngine::load(const std::string& path) {
    auto fresh = loader_(path);
    if (!fresh) {
        std::println(stderr, "engine: failed to load {}: {}", path, fresh.error().message);
        return std::unexpected(std::move(fresh.error()));
    }

    std::unique_ptr<AcousticModel> old;
    {
        // Waits for an in-flight transcribe() on the old model.
        std::lock_guard lock(mu_);
        old = std::exchange(model_, std::move(*fresh));
        model_path_ = path;
    }
    // The old model is released here, outside the lock; nothing else can
    // reach it any more.
    return {};
}

void InferenceEngine::unload() {
    std::unique_ptr<AcousticModel> old;
    {
        std::lock_guard lock(mu_);
        old = std::move(model_);
        model_path_.clear();
    }
}

std::expected<std::string, EngineError>
InferenceEngine::transcribe(std::span<const float> pcm16k) {
    if (pcm16k.size() < kMinSamples) {
        std::println(stderr, "engine: not enough audio ({} < {} samples), skipping",
                     pcm16k.size(), kMinSamples);
        return std::string{};
    }

    std::lock_guard lock(mu_);
    if (!model_) {
        return std::unexpected(EngineError{
            .kind = EngineError::Kind::NotLoaded,
            .message = "model not loaded",
        });
    }

    auto result = model_->transcribe(pcm16k, n_threads_);
    if (!result) {
        std::println(stderr, "engine: transcription failed (code {}): {}",
                     result.error().code, result.error().message);
    }
    return result;
}

bool InferenceEngine::is_loaded() const {
    std::lock_guard lock(mu_);
    return model_ != nullptr;
}

std::string InferenceEngine::model_path() const {
    std::lock_guard lock(mu_);
    return model_path_;
}

int InferenceEngine::recommended_threads(unsigned hardware_threads) {
    int n = static_cast<int>(hardware_threads) - 2;
    return std::clamp(n, 1, 8);
}
