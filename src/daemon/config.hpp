#pragma once

#include <cstddef>
#include <string>

struct Config {
    struct Model {
        std::string tier = "tiny";
        std::string dir;             // extra directory searched first
        std::string language = "en";
    } model;

    struct Audio {
        double max_seconds = 60.0;   // clamped to [1, 300]
        size_t max_samples = 5'000'000;
    } audio;

    struct Output {
        std::string method = "paste"; // "paste", "clipboard" or "none"
    } output;

    struct History {
        size_t max_entries = 50;
    } history;

    static Config load(const std::string& path);
    static Config load_default();
};
