#pragma once

#include "platform/ipc_client.hpp"

// Client end of the daemon socket (platform::ipc_endpoint()).
class UnixSocketClient : public IpcClient {
public:
    UnixSocketClient();
    ~UnixSocketClient() override;

    UnixSocketClient(const UnixSocketClient&) = delete;
    UnixSocketClient& operator=(const UnixSocketClient&) = delete;

    bool connect(const std::string& endpoint) override;
    bool send(const nlohmann::json& cmd) override;
    bool recv(nlohmann::json& response, int timeout_ms = kDefaultTimeoutMs) override;
    void close() override;

private:
    int fd_ = -1;
};
