#include "model_downloader.hpp"
#include "platform/linux/unix_socket_client.hpp"
#include "platform/platform_paths.hpp"
#include "whisper/model_locator.hpp"

#include <cstdlib>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <print>
#include <string>

using json = nlohmann::json;

static void usage(const char* prog) {
    std::println(stderr, "Usage: {} <command> [options]", prog);
    std::println(stderr, "Commands:");
    std::println(stderr, "  start                         Start recording");
    std::println(stderr, "  stop                          Stop recording and print the transcription");
    std::println(stderr, "  cancel                        Same as stop");
    std::println(stderr, "  toggle                        Start, or stop when recording");
    std::println(stderr, "  status                        Show daemon status");
    std::println(stderr, "  history [--limit N]           Show recent transcriptions");
    std::println(stderr, "  history-remove <id>           Delete one history entry");
    std::println(stderr, "  history-clear                 Delete all history entries");
    std::println(stderr, "  history-copy <id>             Copy a past transcription to the clipboard");
    std::println(stderr, "  set-model <tiny|base|small>   Switch the whisper model");
    std::println(stderr, "  set-max-duration <seconds>    Limit recording length (1-300)");
    std::println(stderr, "  download-model <tiny|base|small>");
    std::println(stderr, "                                Fetch a model into the data directory");
}

static int download_model(const std::string& tier_name) {
    auto tier = models::tier_from_string(tier_name);
    if (!tier) {
        std::println(stderr, "Unknown model tier: {} (expected tiny, base or small)", tier_name);
        return 1;
    }

    auto data = platform::data_dir();
    if (data.empty()) {
        std::println(stderr, "Cannot determine the data directory (HOME unset)");
        return 1;
    }
    auto dest_dir = (std::filesystem::path(data) / "models").string();

    std::println(stderr, "Downloading {} from {}", models::model_filename(*tier), models::model_url(*tier));

    int last_percent = -1;
    ModelDownloader downloader;
    auto res = downloader.download(*tier, dest_dir, [&last_percent](uint64_t received, uint64_t total) {
        if (total == 0) return;
        int percent = static_cast<int>(received * 100 / total);
        if (percent != last_percent) {
            last_percent = percent;
            std::print(stderr, "\r  {:3}%  {:.1f} / {:.1f} MB", percent,
                       static_cast<double>(received) / 1e6, static_cast<double>(total) / 1e6);
        }
    });
    if (last_percent >= 0) std::println(stderr, "");

    if (!res) {
        std::println(stderr, "Download failed: {}", res.error());
        return 1;
    }
    std::println("{}", *res);
    return 0;
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        usage(argv[0]);
        return 1;
    }

    std::string command = argv[1];
    std::string positional;
    int limit = 10;

    // Parse optional args
    for (int i = 2; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--limit" && i + 1 < argc) {
            limit = std::atoi(argv[++i]);
        } else if (positional.empty()) {
            positional = arg;
        }
    }

    if (command == "download-model") {
        if (positional.empty()) {
            usage(argv[0]);
            return 1;
        }
        return download_model(positional);
    }

    // Build command JSON
    json cmd;
    int timeout_ms = IpcClient::kDefaultTimeoutMs;
    if (command == "start" || command == "status" || command == "history-clear") {
        cmd = {{"cmd", command}};
    } else if (command == "stop" || command == "cancel" || command == "toggle") {
        cmd = {{"cmd", command}};
        timeout_ms = IpcClient::kTranscribeTimeoutMs;
    } else if (command == "history") {
        cmd = {{"cmd", "history"}, {"limit", limit}};
    } else if (command == "history-remove" && !positional.empty()) {
        cmd = {{"cmd", "history-remove"}, {"id", positional}};
    } else if (command == "history-copy" && !positional.empty()) {
        cmd = {{"cmd", "history-copy"}, {"id", positional}};
    } else if (command == "set-model" && !positional.empty()) {
        cmd = {{"cmd", "set-model"}, {"tier", positional}};
        timeout_ms = IpcClient::kModelLoadTimeoutMs;
    } else if (command == "set-max-duration" && !positional.empty()) {
        cmd = {{"cmd", "set-max-duration"}, {"seconds", std::atof(positional.c_str())}};
    } else {
        std::println(stderr, "Unknown command or missing argument: {}", command);
        usage(argv[0]);
        return 1;
    }

    // Connect and send
    UnixSocketClient client;
    auto sock_path = platform::ipc_endpoint();

    if (!client.connect(sock_path)) {
        std::println(stderr, "Failed to connect to daemon at {}", sock_path);
        std::println(stderr, "Is quickscribe running?");
        return 1;
    }

    if (!client.send(cmd)) {
        std::println(stderr, "Failed to send command");
        return 1;
    }

    json response;
    if (!client.recv(response, timeout_ms)) {
        std::println(stderr, "No response from daemon (timeout)");
        return 1;
    }

    // Display response
    auto status = response.value("status", "");

    if (status == "error") {
        std::println(stderr, "Error: {}", response.value("message", "unknown error"));
        return 1;
    }

    if (command == "status") {
        std::println("State: {}", response.value("state", "unknown"));
        std::println("Model: {}", response.value("model", "none"));
        if (response.contains("duration")) {
            std::println("Recording duration: {:.1f}s", response["duration"].get<double>());
            std::println("Level: {:.4f}", response.value("level", 0.0));
        }
        std::println("Max duration: {:.0f}s", response.value("max_duration", 0.0));
    } else if (command == "history") {
        if (response.contains("entries")) {
            for (auto& entry : response["entries"]) {
                std::println("[{}] ({:.1f}s) {}", entry.value("timestamp", ""),
                             entry.value("duration", 0.0), entry.value("text", ""));
                std::println("  id: {}", entry.value("id", ""));
            }
        }
    } else if (response.contains("text")) {
        std::println("{}", response["text"].get<std::string>());
    } else if (status == "ok") {
        if (response.contains("message")) {
            std::println("{}", response["message"].get<std::string>());
        } else {
            std::println("OK");
        }
    } else {
        std::println("{}", response.dump(2));
    }

    return 0;
}
