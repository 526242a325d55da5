#include "whisper_model.hpp"

#include <filesystem>
#include <print>
#include <whisper.h>

namespace fs = std::filesystem;

WhisperModel::WhisperModel(Key, whisper_context* ctx, std::string language)
    : ctx_(ctx), language_(std::move(language)) {}

WhisperModel::~WhisperModel() {
    if (ctx_) {
        whisper_free(ctx_);
        ctx_ = nullptr;
    }
}

std::expected<std::unique_ptr<AcousticModel>, EngineError>
WhisperModel::load(const std::string& path, const std::string& language) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return std::unexpected(EngineError{
            .kind = EngineError::Kind::ModelNotFound,
            .message = "model file not found: " + path,
        });
    }

    whisper_context_params cparams = whisper_context_default_params();
    whisper_context* ctx = whisper_init_from_file_with_params(path.c_str(), cparams);
    if (!ctx) {
        return std::unexpected(EngineError{
            .kind = EngineError::Kind::InitializationFailed,
            .message = "whisper could not initialize a context from " + path,
        });
    }

    std::println(stderr, "engine: loaded model {}", path);
    return std::make_unique<WhisperModel>(Key{}, ctx, language);
}

std::expected<std::string, EngineError>
WhisperModel::transcribe(std::span<const float> pcm16k, int n_threads) {
    whisper_full_params wparams = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);

    wparams.language         = language_.c_str();
    wparams.translate        = false;
    wparams.n_threads        = n_threads;
    wparams.temperature      = 0.0f;
    wparams.no_context       = true;
    wparams.single_segment   = false;
    wparams.no_timestamps    = true;
    wparams.suppress_blank   = true;
    wparams.max_initial_ts   = 1.0f;
    wparams.print_progress   = false;
    wparams.print_special    = false;
    wparams.print_realtime   = false;
    wparams.print_timestamps = false;

    whisper_reset_timings(ctx_);

    int ret = whisper_full(ctx_, wparams, pcm16k.data(), static_cast<int>(pcm16k.size()));
    if (ret != 0) {
        return std::unexpected(EngineError{
            .kind = EngineError::Kind::TranscriptionFailed,
            .code = ret,
            .message = "whisper_full failed",
        });
    }

    std::string text;
    const int n_segments = whisper_full_n_segments(ctx_);
    for (int i = 0; i < n_segments; ++i) {
        if (const char* segment = whisper_full_get_segment_text(ctx_, i)) {
            text += segment;
        }
    }

    auto start = text.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) return std::string{};
    auto end = text.find_last_not_of(" \t\n\r");
    return text.substr(start, end - start + 1);
}
