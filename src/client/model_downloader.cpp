#include "model_downloader.hpp"

#include <curl/curl.h>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace {

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* out = static_cast<std::ofstream*>(userdata);
    out->write(ptr, static_cast<std::streamsize>(size * nmemb));
    return out->good() ? size * nmemb : 0;
}

int progress_callback(void* userdata, curl_off_t dltotal, curl_off_t dlnow,
                      curl_off_t /*ultotal*/, curl_off_t /*ulnow*/) {
    auto* progress = static_cast<ModelDownloader::ProgressCallback*>(userdata);
    if (*progress) {
        (*progress)(static_cast<uint64_t>(dlnow), static_cast<uint64_t>(dltotal));
    }
    return 0;
}

} // namespace

ModelDownloader::ModelDownloader() {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

ModelDownloader::~ModelDownloader() {
    curl_global_cleanup();
}

std::expected<std::string, std::string>
ModelDownloader::download(models::ModelTier tier, const std::string& dest_dir,
                          ProgressCallback progress) {
    std::error_code ec;
    fs::create_directories(dest_dir, ec);
    if (ec) {
        return std::unexpected("cannot create " + dest_dir + ": " + ec.message());
    }

    auto dest = (fs::path(dest_dir) / models::model_filename(tier)).string();
    if (fs::is_regular_file(dest, ec)) {
        return dest;
    }

    auto res = fetch(models::model_url(tier), dest, std::move(progress));
    if (!res) return std::unexpected(res.error());
    return dest;
}

std::expected<void, std::string>
ModelDownloader::fetch(const std::string& url, const std::string& dest_path,
                       ProgressCallback progress) {
    auto part_path = dest_path + ".part";
    std::ofstream out(part_path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        return std::unexpected("cannot write " + part_path);
    }

    CURL* curl = curl_easy_init();
    if (!curl) {
        return std::unexpected("curl_easy_init failed");
    }

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &out);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progress_callback);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &progress);
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 10L);
    curl_easy_setopt(curl, CURLOPT_FAILONERROR, 0L);

    CURLcode res = curl_easy_perform(curl);

    long http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
    curl_easy_cleanup(curl);
    out.close();

    std::error_code ec;
    if (res != CURLE_OK) {
        fs::remove(part_path, ec);
        return std::unexpected(std::string("curl error: ") + curl_easy_strerror(res));
    }
    if (http_code != 200) {
        fs::remove(part_path, ec);
        return std::unexpected("HTTP " + std::to_string(http_code) + " for " + url);
    }

    if (!out) {
        fs::remove(part_path, ec);
        return std::unexpected("write to " + part_path + " failed");
    }

    fs::rename(part_path, dest_path, ec);
    if (ec) {
        auto reason = ec.message();
        fs::remove(part_path, ec);
        return std::unexpected("cannot move download into place: " + reason);
    }
    return {};
}
