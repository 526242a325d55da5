#include "daemon_core.hpp"

#include <algorithm>
#include <cstdint>
#include <format>
#include <print>

DaemonCore::DaemonCore(Config config, bool verbose,
                       RingBuffer& ring_buf, AudioCapture& audio, RecordingTimer& timer,
                       IpcServer& ipc, TaskQueue& tasks,
                       InferenceEngine::Loader model_loader, OutputFactory output_factory)
    : config_(std::move(config)), verbose_(verbose),
      ring_buf_(ring_buf), audio_(audio), ipc_(ipc), tasks_(tasks),
      output_factory_(std::move(output_factory)),
      history_(settings_, config_.history.max_entries),
      engine_(std::move(model_loader)),
      session_(ring_buf_, audio_, timer, tasks_, config_.audio.max_seconds),
      coordinator_(engine_, tasks_) {
    session_.set_consumer([this](AudioClip clip) { on_clip(std::move(clip)); });
    coordinator_.set_consumer([this](const TranscriptionOutcome& outcome) { on_outcome(outcome); });
}

DaemonCore::~DaemonCore() = default;

bool DaemonCore::init(const std::string& settings_path, std::vector<std::string> model_dirs) {
    model_dirs_ = std::move(model_dirs);

    if (!settings_.open(settings_path)) {
        std::println(stderr, "Warning: settings DB failed to open, history will not persist");
    }
    history_.load();
    log(std::format("Loaded {} history entries", history_.size()));

    auto tier_name = config_.model.tier;
    if (auto stored = settings_.get(kModelSettingKey)) {
        tier_name = *stored;
    }
    if (!models::tier_from_string(tier_name)) {
        std::println(stderr, "engine: unknown model tier '{}', using {}", tier_name,
                     models::tier_name(models::kFallbackTier));
    }

    if (!load_model(models::parse_tier(tier_name))) {
        std::println(stderr, "Warning: no whisper model loaded, transcriptions will fail "
                             "(run quickscribe-ctl download-model {})",
                     models::tier_name(models::kFallbackTier));
    }

    log(std::format("Engine using {} threads", engine_.n_threads()));
    return true;
}

nlohmann::json DaemonCore::handle_command(const nlohmann::json& cmd) {
    auto it = cmd.find("cmd");
    if (it == cmd.end() || !it->is_string()) {
        return {{"status", "error"}, {"message", "missing cmd"}};
    }

    try {
        return handle_command(it->get<std::string>(), cmd);
    } catch (const nlohmann::json::exception& e) {
        std::println(stderr, "ipc: bad {} command: {}", it->get<std::string>(), e.what());
        return {{"status", "error"}, {"message", "invalid command arguments"}};
    }
}

nlohmann::json DaemonCore::handle_command(const std::string& cmd_str,
                                          const nlohmann::json& cmd) {
    if (cmd_str == "start") return handle_start(cmd);
    if (cmd_str == "stop" || cmd_str == "cancel") return handle_stop(cmd);
    if (cmd_str == "toggle") return handle_toggle(cmd);
    if (cmd_str == "status") return handle_status(cmd);
    if (cmd_str == "history") return handle_history(cmd);
    if (cmd_str == "history-remove") return handle_history_remove(cmd);
    if (cmd_str == "history-clear") return handle_history_clear(cmd);
    if (cmd_str == "history-copy") return handle_history_copy(cmd);
    if (cmd_str == "set-model") return handle_set_model(cmd);
    if (cmd_str == "set-max-duration") return handle_set_max_duration(cmd);
    return {{"status", "error"}, {"message", "unknown command"}};
}

nlohmann::json DaemonCore::handle_start(const nlohmann::json& /*cmd*/) {
    if (!is_idle()) {
        return {{"status", "error"}, {"message", "already recording or transcribing"}};
    }

    if (!session_.start_recording()) {
        return {{"status", "error"}, {"message", "failed to start recording"}};
    }

    log(std::format("Recording started (limit {:.0f}s)", session_.max_duration()));
    return {{"status", "ok"}, {"message", "recording"}};
}

nlohmann::json DaemonCore::handle_stop(const nlohmann::json& /*cmd*/) {
    if (session_.state() != CaptureState::Recording) {
        return {{"status", "error"}, {"message", "not recording"}};
    }

    double duration = session_.recording_duration();
    end_recording("stop requested");
    return {{"status", "transcribing"}, {"duration", duration}};
}

nlohmann::json DaemonCore::handle_toggle(const nlohmann::json& cmd) {
    if (session_.state() == CaptureState::Recording) {
        return handle_stop(cmd);
    }
    return handle_start(cmd);
}

nlohmann::json DaemonCore::handle_status(const nlohmann::json& /*cmd*/) {
    nlohmann::json resp = {{"status", "ok"}};
    if (session_.state() == CaptureState::Recording) {
        resp["state"] = "recording";
        resp["duration"] = session_.recording_duration();
        resp["level"] = session_.level();
    } else if (!is_idle()) {
        resp["state"] = "transcribing";
    } else {
        resp["state"] = "idle";
    }

    resp["model"] = active_tier_ ? std::string(models::tier_name(*active_tier_)) : "none";
    resp["max_duration"] = session_.max_duration();
    resp["history_size"] = history_.size();
    return resp;
}

nlohmann::json DaemonCore::handle_history(const nlohmann::json& cmd) {
    size_t limit = 10;
    if (auto it = cmd.find("limit"); it != cmd.end()) {
        if (!it->is_number_integer()) {
            return {{"status", "error"}, {"message", "limit must be an integer"}};
        }
        uint64_t requested = 0;
        if (it->is_number_unsigned()) {
            requested = it->get<uint64_t>();
        } else if (auto n = it->get<int64_t>(); n > 0) {
            requested = static_cast<uint64_t>(n);
        }
        limit = static_cast<size_t>(std::min<uint64_t>(requested, history_.capacity()));
    }
    auto entries = history_.recent(limit);

    nlohmann::json resp = {{"status", "ok"}, {"entries", nlohmann::json::array()}};
    for (auto& e : entries) {
        resp["entries"].push_back({
            {"id", e.id},
            {"timestamp", e.timestamp},
            {"text", e.text},
            {"duration", e.duration},
            {"sample_rate", e.sample_rate},
        });
    }
    return resp;
}

nlohmann::json DaemonCore::handle_history_remove(const nlohmann::json& cmd) {
    auto it = cmd.find("id");
    if (it == cmd.end() || !it->is_string()) {
        return {{"status", "error"}, {"message", "missing id"}};
    }

    bool removed = history_.remove(it->get<std::string>());
    return {{"status", "ok"}, {"removed", removed}};
}

nlohmann::json DaemonCore::handle_history_clear(const nlohmann::json& /*cmd*/) {
    auto count = history_.size();
    if (history_.clear()) {
        log(std::format("Cleared {} history entries", count));
    }
    return {{"status", "ok"}, {"removed", count}};
}

nlohmann::json DaemonCore::handle_history_copy(const nlohmann::json& cmd) {
    auto it = cmd.find("id");
    if (it == cmd.end() || !it->is_string()) {
        return {{"status", "error"}, {"message", "missing id"}};
    }

    const auto* entry = history_.find(it->get<std::string>());
    if (!entry) {
        return {{"status", "error"}, {"message", "no such history entry"}};
    }

    auto output = output_factory_("clipboard");
    if (!output) {
        return {{"status", "error"}, {"message", "clipboard unavailable"}};
    }
    if (auto res = output->deliver(entry->text); !res) {
        return {{"status", "error"}, {"message", res.error()}};
    }

    log(std::format("Copied history entry {} to the clipboard", entry->id));
    return {{"status", "ok"}, {"text", entry->text}};
}

nlohmann::json DaemonCore::handle_set_model(const nlohmann::json& cmd) {
    auto it = cmd.find("tier");
    if (it == cmd.end() || !it->is_string()) {
        return {{"status", "error"}, {"message", "missing tier"}};
    }

    auto tier = models::tier_from_string(it->get<std::string>());
    if (!tier) {
        return {{"status", "error"}, {"message", "unknown tier (expected tiny, base or small)"}};
    }

    if (!load_model(*tier)) {
        return {{"status", "error"},
                {"message", std::format("{} not found", models::model_filename(*tier))}};
    }

    if (!settings_.set(kModelSettingKey, std::string(models::tier_name(*tier)))) {
        log("Model choice not persisted");
    }
    return {{"status", "ok"}, {"model", std::string(models::tier_name(*active_tier_))}};
}

nlohmann::json DaemonCore::handle_set_max_duration(const nlohmann::json& cmd) {
    auto it = cmd.find("seconds");
    if (it == cmd.end() || !it->is_number()) {
        return {{"status", "error"}, {"message", "missing seconds"}};
    }

    session_.set_max_duration(it->get<double>());
    log(std::format("Max recording duration set to {:.0f}s", session_.max_duration()));
    return {{"status", "ok"}, {"seconds", session_.max_duration()}};
}

void DaemonCore::on_capture_limit() {
    if (session_.state() != CaptureState::Recording) return;
    end_recording(std::format("sample limit of {} reached", ring_buf_.capacity()));
}

void DaemonCore::on_timer_expired() {
    if (session_.state() != CaptureState::Recording) return;
    end_recording(std::format("max duration of {:.0f}s reached", session_.max_duration()));
}

void DaemonCore::end_recording(const std::string& reason) {
    log(std::format("Recording stopped ({}), {:.1f}s", reason, session_.recording_duration()));
    if (session_.stop_recording()) {
        awaiting_clip_ = true;
    }
}

void DaemonCore::on_clip(AudioClip clip) {
    awaiting_clip_ = false;
    log(std::format("Captured {} samples at {}Hz, transcribing...",
                    clip.samples.size(), clip.sample_rate));

    if (!coordinator_.submit(std::move(clip))) {
        reply_waiting({{"status", "error"}, {"message", "transcription already in progress"}});
    }
}

void DaemonCore::on_outcome(const TranscriptionOutcome& outcome) {
    nlohmann::json response;

    if (outcome.ok) {
        log(std::format("Transcription complete: {:.1f}s, {} chars",
                        outcome.duration_s, outcome.text.size()));

        if (!outcome.text.empty()) {
            history_.append(outcome.text, outcome.duration_s, outcome.sample_rate);

            if (auto output = output_factory_(config_.output.method)) {
                auto res = output->deliver(outcome.text);
                if (!res) {
                    log("Output delivery failed: " + res.error());
                }
            }
        }

        response = {
            {"status", "ok"},
            {"text", outcome.text},
            {"duration", outcome.duration_s},
        };
    } else {
        log("Transcription failed: " + outcome.text);
        response = {{"status", "error"}, {"message", outcome.text}, {"duration", outcome.duration_s}};
    }

    reply_waiting(response);
}

void DaemonCore::reply_waiting(const nlohmann::json& response) {
    for (int fd : waiting_clients_) {
        ipc_.send_response(fd, response);
    }
    waiting_clients_.clear();
}

bool DaemonCore::load_model(models::ModelTier tier) {
    auto resolved = models::resolve(tier, model_dirs_);
    if (!resolved) return false;

    log("Loading model " + resolved->path);
    auto loaded = engine_.load(resolved->path);
    if (!loaded) return false;

    active_tier_ = resolved->tier;
    return true;
}

void DaemonCore::add_waiting_client(int fd) {
    waiting_clients_.push_back(fd);
}

void DaemonCore::remove_waiting_client(int fd) {
    std::erase(waiting_clients_, fd);
}

bool DaemonCore::is_idle() const {
    return session_.state() == CaptureState::Idle && !awaiting_clip_ && coordinator_.is_ready();
}

void DaemonCore::shutdown() {
    if (session_.state() == CaptureState::Recording) {
        end_recording("shutting down");
    }

    if (!is_idle()) {
        log("Waiting for pending transcription to complete...");
    }
    while (!is_idle()) {
        coordinator_.join();
        if (tasks_.run_pending() == 0 && !is_idle()) {
            std::println(stderr, "Warning: transcription did not settle before shutdown");
            break;
        }
    }

    coordinator_.join();
    engine_.unload();
}

void DaemonCore::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[quickscribe] {}", msg);
    }
}
