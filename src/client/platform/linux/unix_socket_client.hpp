#pragma once

#include "platform/ipc_client.hpp"

#include <string>

class UnixSocketClient : public IpcClient {
public:
    UnixSocketClient();
    ~UnixSocketClient() override;

    UnixSocketClient(const UnixSocketClient&) = delete;
    UnixSocketClient& operator=(const UnixSocketClient&) = delete;

    // On failure errno describes the cause.
    bool connect(const std::string& endpoint) override;
    bool send(const nlohmann::json& cmd) override;
    bool recv(nlohmann::json& response, int timeout_ms = 30000) override;
    void close() override;

private:
    // Larger than any man page the daemon will send.
    static constexpr size_t MAX_RESPONSE_BYTES = 16 * 1024 * 1024;

    int fd_ = -1;
    std::string pending_; // bytes past the last complete line
};
