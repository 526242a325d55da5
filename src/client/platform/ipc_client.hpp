#pragma once

#include <nlohmann/json.hpp>
#include <string>

// One newline-delimited JSON request, one reply. stop, cancel and toggle
// (when it stops) are answered only after the transcription finishes, so
// callers pass kTranscribeTimeoutMs to recv for those.
class IpcClient {
public:
    static constexpr int kDefaultTimeoutMs = 30000;
    static constexpr int kTranscribeTimeoutMs = 300000;
    static constexpr int kModelLoadTimeoutMs = 120000;

    virtual ~IpcClient() = default;
    virtual bool connect(const std::string& endpoint) = 0;
    virtual bool send(const nlohmann::json& cmd) = 0;
    virtual bool recv(nlohmann::json& response, int timeout_ms = kDefaultTimeoutMs) = 0;
    virtual void close() = 0;
};
