#pragma once

#include "capture_session.hpp"
#include "config.hpp"
#include "output/output.hpp"
#include "platform/audio_capture.hpp"
#include "platform/ipc_server.hpp"
#include "platform/recording_timer.hpp"
#include "ring_buffer.hpp"
#include "storage/history_store.hpp"
#include "storage/settings_store.hpp"
#include "task_queue.hpp"
#include "transcription_coordinator.hpp"
#include "whisper/inference_engine.hpp"
#include "whisper/model_locator.hpp"

#include <functional>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

// Portable daemon logic. Every method runs on the daemon thread; work from
// the capture and transcription threads arrives through the TaskQueue.
class DaemonCore {
public:
    // Returns nullptr for "none" and for unknown methods.
    using OutputFactory = std::function<std::unique_ptr<OutputMethod>(const std::string&)>;

    static constexpr const char* kModelSettingKey = "whisper_model";

    DaemonCore(Config config, bool verbose,
               RingBuffer& ring_buf, AudioCapture& audio, RecordingTimer& timer,
               IpcServer& ipc, TaskQueue& tasks,
               InferenceEngine::Loader model_loader, OutputFactory output_factory);
    ~DaemonCore();

    DaemonCore(const DaemonCore&) = delete;
    DaemonCore& operator=(const DaemonCore&) = delete;

    // Opens the settings database, loads history and the model. Failures are
    // logged; the daemon runs without persistence or without a model.
    bool init(const std::string& settings_path, std::vector<std::string> model_dirs);

    // A response with status "transcribing" means the reply is deferred until
    // the cycle delivers; the caller must register the client as waiting.
    // Badly typed fields produce an error response, never an exception.
    nlohmann::json handle_command(const nlohmann::json& cmd);
    nlohmann::json handle_command(const std::string& cmd_str, const nlohmann::json& cmd);

    void add_waiting_client(int fd);
    void remove_waiting_client(int fd);

    // The ring buffer filled up, or the max-duration timer fired.
    void on_capture_limit();
    void on_timer_expired();

    bool is_idle() const;
    std::optional<models::ModelTier> active_tier() const { return active_tier_; }
    const HistoryStore& history() const { return history_; }

    // Ends an active recording and delivers any in-flight cycle, so waiting
    // clients are answered and the model is released exactly once.
    void shutdown();

private:
    nlohmann::json handle_start(const nlohmann::json& cmd);
    nlohmann::json handle_stop(const nlohmann::json& cmd);
    nlohmann::json handle_toggle(const nlohmann::json& cmd);
    nlohmann::json handle_status(const nlohmann::json& cmd);
    nlohmann::json handle_history(const nlohmann::json& cmd);
    nlohmann::json handle_history_remove(const nlohmann::json& cmd);
    nlohmann::json handle_history_clear(const nlohmann::json& cmd);
    nlohmann::json handle_history_copy(const nlohmann::json& cmd);
    nlohmann::json handle_set_model(const nlohmann::json& cmd);
    nlohmann::json handle_set_max_duration(const nlohmann::json& cmd);

    void end_recording(const std::string& reason);
    void on_clip(AudioClip clip);
    void on_outcome(const TranscriptionOutcome& outcome);
    void reply_waiting(const nlohmann::json& response);

    bool load_model(models::ModelTier tier);

    void log(const std::string& msg);

    Config config_;
    bool verbose_;

    RingBuffer& ring_buf_;
    AudioCapture& audio_;
    IpcServer& ipc_;
    TaskQueue& tasks_;

    OutputFactory output_factory_;

    SettingsStore settings_;
    HistoryStore history_;
    InferenceEngine engine_;
    CaptureSession session_;
    TranscriptionCoordinator coordinator_;

    std::vector<std::string> model_dirs_;
    std::optional<models::ModelTier> active_tier_;

    // A stopped recording whose clip has not reached the coordinator yet.
    bool awaiting_clip_ = false;
    std::vector<int> waiting_clients_;
};
