#pragma once

#include <expected>
#include <span>
#include <string>

struct EngineError {
    enum class Kind {
        ModelNotFound,
        InitializationFailed,
        TranscriptionFailed,
        NotLoaded,
    };

    Kind kind;
    int code = 0; // whisper_full() return value for TranscriptionFailed
    std::string message;
};

// A loaded speech model. Destroying the object releases the model context.
// Implementations are not thread-safe; InferenceEngine serializes every call.
class AcousticModel {
public:
    virtual ~AcousticModel() = default;

    // pcm16k: mono float samples at 16 kHz.
    virtual std::expected<std::string, EngineError>
        transcribe(std::span<const float> pcm16k, int n_threads) = 0;
};
