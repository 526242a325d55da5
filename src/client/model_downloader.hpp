#pragma once

#include "whisper/model_locator.hpp"

#include <cstdint>
#include <expected>
#include <functional>
#include <string>

// Fetches ggml whisper models over HTTPS into a local models directory.
class ModelDownloader {
public:
    using ProgressCallback = std::function<void(uint64_t received, uint64_t total)>;

    ModelDownloader();
    ~ModelDownloader();

    ModelDownloader(const ModelDownloader&) = delete;
    ModelDownloader& operator=(const ModelDownloader&) = delete;

    // Returns the final path. An already present model is not fetched again.
    std::expected<std::string, std::string> download(models::ModelTier tier,
                                                     const std::string& dest_dir,
                                                     ProgressCallback progress = {});

    // Streams `url` into `dest_path` + ".part" and renames it on HTTP 200.
    std::expected<void, std::string> fetch(const std::string& url, const std::string& dest_path,
                                           ProgressCallback progress = {});
};
