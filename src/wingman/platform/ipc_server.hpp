#pragma once

#include <nlohmann/json.hpp>
#include <string>

// Control channel of the daemon: one JSON object per line in each direction.
// All fds are non-blocking and driven by the event loop.
class IpcServer {
public:
    enum class ReadResult {
        Command,    // cmd holds a JSON object
        Incomplete, // no full line yet
        Invalid,    // a line arrived but was not a JSON object, or overflowed
        Closed,     // peer hung up or the read failed
    };

    virtual ~IpcServer() = default;

    virtual bool start(const std::string& endpoint) = 0;
    virtual void stop() = 0;
    virtual int server_fd() const = 0;

    // Returns the new client fd, or -1 when nothing is pending.
    virtual int accept_client() = 0;

    // Consumes at most one line per call.
    virtual ReadResult read_command(int client_fd, nlohmann::json& cmd) = 0;

    // Documentation responses can be large; implementations must deliver the
    // whole line or fail.
    virtual bool send_response(int client_fd, const nlohmann::json& response) = 0;
    virtual void close_client(int client_fd) = 0;
};
