#pragma once

#include "platform/ipc_server.hpp"

#include <string>
#include <vector>

class UnixSocketServer : public IpcServer {
public:
    UnixSocketServer();
    ~UnixSocketServer() override;

    UnixSocketServer(const UnixSocketServer&) = delete;
    UnixSocketServer& operator=(const UnixSocketServer&) = delete;

    bool start(const std::string& endpoint) override;
    void stop() override;
    int server_fd() const override { return server_fd_; }
    int accept_client() override;
    ReadResult read_command(int client_fd, nlohmann::json& cmd) override;
    bool send_response(int client_fd, const nlohmann::json& response) override;
    void close_client(int client_fd) override;

private:
    // Commands are small; anything longer is dropped.
    static constexpr size_t MAX_LINE_BYTES = 64 * 1024;
    // How long a stalled reader may block a documentation response.
    static constexpr int SEND_TIMEOUT_MS = 2000;

    int server_fd_ = -1;
    std::string socket_path_;

    // Accepted connection and its partial input line.
    struct Connection {
        int fd;
        std::string pending;
    };
    std::vector<Connection> connections_;

    Connection* find_connection(int fd);
};
