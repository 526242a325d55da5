#pragma once

#include "acoustic_model.hpp"

#include <expected>
#include <memory>
#include <string>

struct whisper_context;

class WhisperModel : public AcousticModel {
    struct Key {
        explicit Key() = default;
    };

public:
    // Fails with ModelNotFound when `path` does not exist and with
    // InitializationFailed when whisper.cpp rejects the file.
    static std::expected<std::unique_ptr<AcousticModel>, EngineError>
        load(const std::string& path, const std::string& language = "en");

    // Only reachable through load(); Key is private.
    WhisperModel(Key, whisper_context* ctx, std::string language);
    ~WhisperModel() override;

    WhisperModel(const WhisperModel&) = delete;
    WhisperModel& operator=(const WhisperModel&) = delete;

    std::expected<std::string, EngineError>
        transcribe(std::span<const float> pcm16k, int n_threads) override;

private:
    whisper_context* ctx_;
    std::string language_;
};
