#include "config.hpp"

#include "capture_session.hpp"
#include "platform/platform_paths.hpp"

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return cfg;
    }

    try {
        auto j = json::parse(f);

        if (j.contains("model")) {
            auto& m = j["model"];
            if (m.contains("tier")) cfg.model.tier = m["tier"].get<std::string>();
            if (m.contains("dir")) cfg.model.dir = m["dir"].get<std::string>();
            if (m.contains("language")) cfg.model.language = m["language"].get<std::string>();
        }

        if (j.contains("audio")) {
            auto& a = j["audio"];
            if (a.contains("max_seconds")) cfg.audio.max_seconds = a["max_seconds"].get<double>();
            if (a.contains("max_samples")) cfg.audio.max_samples = a["max_samples"].get<size_t>();
        }

        if (j.contains("output")) {
            auto& o = j["output"];
            if (o.contains("method")) cfg.output.method = o["method"].get<std::string>();
        }

        if (j.contains("history")) {
            auto& h = j["history"];
            if (h.contains("max_entries")) cfg.history.max_entries = h["max_entries"].get<size_t>();
        }

    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
    }

    cfg.audio.max_seconds = CaptureSession::clamp_duration(cfg.audio.max_seconds);
    if (cfg.audio.max_samples == 0) {
        std::println(stderr, "config: audio.max_samples must be positive, using default");
        cfg.audio.max_samples = Audio{}.max_samples;
    }
    if (cfg.history.max_entries == 0) {
        std::println(stderr, "config: history.max_entries must be positive, using default");
        cfg.history.max_entries = History{}.max_entries;
    }

    return cfg;
}

Config Config::load_default() {
    auto dir = platform::config_dir();
    if (dir.empty()) return Config{};

    auto config_path = fs::path(dir) / "config.json";
    if (fs::exists(config_path)) {
        return load(config_path.string());
    }
    return Config{};
}
